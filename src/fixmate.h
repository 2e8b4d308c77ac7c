/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_FIXMATE_H__
#define __ALIGN_KIT_FIXMATE_H__

#include "alignment_reader.h"
#include "mate_fixer.h"
#include "sam_header.h"
#include "sorting_collection.h"
#include <optional>
#include <string>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::vector;

struct fixmate_options {
	vector<string>              inputs;
	string                      output;      // Empty to fix a single input in place
	std::optional<sort_order_t> sort_order;  // Defaults to the sort order of the first input
	size_t                      max_records_in_ram{ default_max_records_in_ram };
	string                      tmp_dir;     // Empty for default_tmp_dir()
	reader_options              reader;
	long long                   progress_interval{ default_progress_interval };
};

// Makes the mate information of every pair in the inputs consistent and
// writes the result as SAM text.
//
// Inputs are brought into query name order first: merged if they are all
// queryname-sorted, otherwise concatenated and sorted. The output is
// re-sorted when the requested order is coordinate.
//
// Without an output path the single input is replaced by the result,
// going through "<input>.old"; if anything fails the input is left (or
// put back) in place and the partial result is removed.
mate_fix_counters fix_mate_information(const fixmate_options& options);

END_NAMESPACE_AK

#endif // __ALIGN_KIT_FIXMATE_H__
