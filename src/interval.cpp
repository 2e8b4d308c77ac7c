/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "interval.h"

#include <algorithm>
#include <vector>

BEGIN_NAMESPACE_AK

query_interval_t::query_interval_t(refidx_t ref_index, pos_t start, pos_t end)
: ref_index(ref_index), start(start), end(end)
{
	AK_CHECK(ref_index >= 0, invalid_interval, "Invalid reference index {}", ref_index);
}

string query_interval_t::as_str() const
{
	return fmt::format("{}:{}-{}", ref_index, start, end);
}

int compare(const query_interval_t& a, const query_interval_t& b)
{
	if (a.ref_index != b.ref_index) return a.ref_index < b.ref_index ? -1 : 1;
	if (a.start != b.start)         return a.start < b.start ? -1 : 1;
	if (a.end == b.end)             return 0;
	if (a.unbounded())              return 1;
	if (b.unbounded())              return -1;
	return a.end < b.end ? -1 : 1;
}

vector<query_interval_t> optimize_intervals(vector<query_interval_t> intervals)
{
	vector<query_interval_t> unique;
	if (intervals.empty())
		return unique;

	// Fields are public, so intervals built without the constructor are validated here too
	for (const auto& i : intervals)
		AK_CHECK(i.ref_index >= 0, invalid_interval, "Invalid reference index {} in query interval {}", i.ref_index, i);

	std::stable_sort(intervals.begin(), intervals.end());

	query_interval_t acc = intervals[0];
	for (size_t i = 1; i < intervals.size(); ++i) {
		const auto& next = intervals[i];
		if (acc.abuts(next) || acc.overlaps(next)) {
			acc.end = (acc.unbounded() || next.unbounded()) ? 0 : std::max(acc.end, next.end);
		} else {
			unique.push_back(acc);
			acc = next;
		}
	}
	unique.push_back(acc);
	return unique;
}

END_NAMESPACE_AK
