/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_MATE_FIXER_H__
#define __ALIGN_KIT_MATE_FIXER_H__

#include "align_record.h"
#include "record_iterator.h"
#include "util.h"

BEGIN_NAMESPACE_AK

// Insert size of a pair measured between the 5' ends of the two reads;
// positive when rec2's 5' end lies at or after rec1's. 0 if either read
// is unmapped or the two are on different references.
int32_t compute_insert_size(const align_record_t& rec1, const align_record_t& rec2);

// Rewrites the mate fields of the two primary records of one pair from
// each other's current alignment: mate reference, start and strand, the
// mate-unmapped and proper-pair flags, the MQ tag and the insert size.
// An unmapped read with a mapped mate is placed at its mate's position.
void set_mate_info(align_record_t& rec1, align_record_t& rec2);

struct mate_fix_counters {
	long long records{};
	long long pairs_fixed{};
	long long orphans{};
	long long passed_through{};  // secondary and supplementary records
};

/////////////////////////////////////////////////////////////////
// mate_fixer
//
// One pass over a stream in which records sharing a read name are
// adjacent. Secondary and supplementary records pass through unchanged.
// Each primary record is paired with the next primary record if that
// one has the same name; both are then written with consistent mate
// fields. A primary with no such partner is written unchanged.
// Records come out in input order, except that a pair is written as
// an adjacent unit after any secondary records that sat between them.
/////////////////////////////////////////////////////////////////

class mate_fixer {
public:
	explicit mate_fixer(long long progress_interval = default_progress_interval);

	void run(record_iterator_ptr records, record_sink& out);

	INLINE const mate_fix_counters& counters() const { return _counters; }

private:
	void count_record();

	long long         _progress_interval;
	mate_fix_counters _counters;
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_MATE_FIXER_H__
