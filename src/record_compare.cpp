/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "record_compare.h"

#include "util.h"

BEGIN_NAMESPACE_AK

// Records without a reference sort after every placed record
static INLINE refidx_t ref_rank(refidx_t ref) { return ref == no_ref_index ? max_pos : ref; }

int compare_coordinate(const align_record_t& a, const align_record_t& b)
{
	if (int c = compare3(ref_rank(a.ref_index), ref_rank(b.ref_index))) return c;
	if (int c = compare3(a.pos, b.pos)) return c;
	if (a.is_reverse() != b.is_reverse()) return a.is_reverse() ? 1 : -1;
	if (int c = a.qname.compare(b.qname)) return c < 0 ? -1 : 1;
	if (int c = compare3(a.flag, b.flag)) return c;
	if (int c = compare3(a.mapq, b.mapq)) return c;
	if (int c = compare3(ref_rank(a.mate_ref_index), ref_rank(b.mate_ref_index))) return c;
	if (int c = compare3(a.mate_pos, b.mate_pos)) return c;
	return compare3(a.tlen, b.tlen);
}

int compare_queryname(const align_record_t& a, const align_record_t& b)
{
	if (int c = a.qname.compare(b.qname)) return c < 0 ? -1 : 1;

	if (a.is_paired() || b.is_paired()) {
		if (!a.is_paired()) return 1;
		if (!b.is_paired()) return -1;
		if (a.is_first() && b.is_second()) return -1;
		if (a.is_second() && b.is_first()) return 1;
	}
	if (a.is_reverse() != b.is_reverse()) return a.is_reverse() ? 1 : -1;
	if (a.is_secondary() != b.is_secondary()) return a.is_secondary() ? 1 : -1;
	if (a.is_supplementary() != b.is_supplementary()) return a.is_supplementary() ? 1 : -1;
	return compare3(a.flag, b.flag);
}

record_comparator comparator_for(sort_order_t order)
{
	switch (order) {
	case sort_order_t::unsorted:   return nullptr;
	case sort_order_t::queryname:  return &compare_queryname;
	case sort_order_t::coordinate: return &compare_coordinate;
	}
	AK_UNREACHABLE();
}

///////////////////////////////////////////////////////////////

int file_order_compare_coordinate(const align_record_t& a, const align_record_t& b)
{
	if (int c = compare3(ref_rank(a.ref_index), ref_rank(b.ref_index))) return c;
	return compare3(a.pos, b.pos);
}

int file_order_compare_queryname(const align_record_t& a, const align_record_t& b)
{
	int c = a.qname.compare(b.qname);
	return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

record_comparator file_order_comparator_for(sort_order_t order)
{
	switch (order) {
	case sort_order_t::unsorted:   return nullptr;
	case sort_order_t::queryname:  return &file_order_compare_queryname;
	case sort_order_t::coordinate: return &file_order_compare_coordinate;
	}
	AK_UNREACHABLE();
}

END_NAMESPACE_AK
