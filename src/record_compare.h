/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_RECORD_COMPARE_H__
#define __ALIGN_KIT_RECORD_COMPARE_H__

#include "align_record.h"
#include "sam_header.h"

BEGIN_NAMESPACE_AK

// Three-way comparators over records; negative, zero or positive like strcmp.
using record_comparator = int (*)(const align_record_t& a, const align_record_t& b);

// Reference index (unplaced records last), start, strand, then the
// remaining fields so that the order is total.
int compare_coordinate(const align_record_t& a, const align_record_t& b);

// Read name byte order, then paired before unpaired, first mate before
// second, forward before reverse, primary before secondary and
// supplementary, then flag.
int compare_queryname(const align_record_t& a, const align_record_t& b);

// Comparator that defines the given order; nullptr for unsorted.
record_comparator comparator_for(sort_order_t order);

// Weaker comparators that only look at the fields a file's declared order
// constrains: reference index and start for coordinate, read name for
// queryname. Records equal under these may appear in any order in a
// sorted file.
int file_order_compare_coordinate(const align_record_t& a, const align_record_t& b);
int file_order_compare_queryname(const align_record_t& a, const align_record_t& b);

// File-order comparator for the given order; nullptr for unsorted.
record_comparator file_order_comparator_for(sort_order_t order);

END_NAMESPACE_AK

#endif // __ALIGN_KIT_RECORD_COMPARE_H__
