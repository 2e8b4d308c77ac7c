/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_INTERVAL_H__
#define __ALIGN_KIT_INTERVAL_H__

#include "defines.h"
#include "ak_assert.h"

#include <climits>
#include <fmt/format.h>
#include <string>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::vector;

using pos_t    = int32_t;  // 1-based position on a reference sequence
using refidx_t = int32_t;  // Index of a reference sequence in the sequence dictionary

constexpr refidx_t no_ref_index       = -1; // Record is not placed on any reference
constexpr pos_t    no_alignment_start = 0;
constexpr pos_t    max_pos            = INT32_MAX;

/////////////////////////////////////////////////////////////////
// query_interval_t
//
// A genomic region in 1-based, fully closed coordinates. An end of 0
// means "to the end of the reference" and behaves as +infinity both
// when ordering and when testing for overlap.
/////////////////////////////////////////////////////////////////

struct query_interval_t {
	refidx_t ref_index{};
	pos_t    start{};
	pos_t    end{};

	query_interval_t() = default;
	query_interval_t(refidx_t ref_index, pos_t start, pos_t end = 0);

	INLINE bool  unbounded()  const { return end == 0; }
	INLINE pos_t end_or_max() const { return unbounded() ? max_pos : end; }

	INLINE bool abuts(const query_interval_t& i) const { return ref_index == i.ref_index && end == i.start; }
	INLINE bool overlaps(const query_interval_t& i) const
	{
		return ref_index == i.ref_index && start <= i.end_or_max() && i.start <= end_or_max();
	}

	// Tests against an alignment spanning [first, last] on reference ref.
	INLINE bool overlaps(refidx_t ref, pos_t first, pos_t last) const
	{
		return ref == ref_index && first <= end_or_max() && start <= last;
	}
	INLINE bool contains(refidx_t ref, pos_t first, pos_t last) const
	{
		return ref == ref_index && start <= first && last <= end_or_max();
	}

	string as_str() const;
};

// Orders by (ref_index, start, end) with an unbounded end after every bounded one.
int compare(const query_interval_t& a, const query_interval_t& b);

INLINE bool operator==(const query_interval_t& a, const query_interval_t& b)
{
	return a.ref_index == b.ref_index && a.start == b.start && a.end == b.end;
}
INLINE bool operator!=(const query_interval_t& a, const query_interval_t& b) { return !(a == b); }
INLINE bool operator< (const query_interval_t& a, const query_interval_t& b) { return compare(a, b) < 0; }

// Sorts the intervals and coalesces every overlapping or abutting run of them,
// so the result is ascending, pairwise disjoint, non-abutting, and covers
// exactly the positions the input covered.
vector<query_interval_t> optimize_intervals(vector<query_interval_t> intervals);

END_NAMESPACE_AK

template <>
struct fmt::formatter<ak::query_interval_t> : fmt::formatter<std::string> {
	template <typename FormatCtx>
	auto format(const ak::query_interval_t& x, FormatCtx& ctx) const
	{
		return fmt::formatter<std::string>::format(x.as_str(), ctx);
	}
};

#endif // __ALIGN_KIT_INTERVAL_H__
