/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "fixmate.h"

#include "ak_assert.h"
#include "ak_time.h"
#include "file.h"
#include "record_compare.h"
#include "sam_io.h"
#include "util.h"
#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>

using namespace std;

BEGIN_NAMESPACE_AK

// Puts `fixed` in place of `input`, going through "<input>.old".
// On failure the input is left at, or moved back to, its original path.
static void replace_input(const string& input, const string& fixed)
{
	const string old = input + ".old";

	if (is_file(old)) {
		remove_file(fixed);
		AK_THROW(file, "Could not move input file {} out of the way: {} already exists", input, old);
	}
	if (!rename_file(input, old)) {
		int err = errno;
		remove_file(fixed);
		AK_THROW(file, "Could not move input file {} out of the way ({})", input, strerror(err));
	}
	if (!rename_file(fixed, input)) {
		int err = errno;
		AK_CHECK(rename_file(old, input), file,
				 "Could not move new file to {} ({}) nor restore the input; input preserved as {}, new file preserved as {}",
				 input, strerror(err), old, fixed);
		remove_file(fixed);
		AK_THROW(file, "Could not move new file to {} ({}); the input was left unchanged", input, strerror(err));
	}
	if (!remove_file(old))
		warn("Could not delete old file {} ({}).", old, strerror(errno));
}

// Concatenation, or a query name merge, of the inputs.
static record_iterator_ptr open_inputs(vector<unique_ptr<alignment_reader>>& readers, bool all_queryname)
{
	vector<record_iterator_ptr> sources;
	for (auto& reader : readers)
		sources.push_back(reader->iterate());
	if (sources.size() == 1)
		return std::move(sources[0]);
	if (all_queryname)
		return make_unique<merging_iterator>(std::move(sources), &compare_queryname);
	return make_unique<concat_iterator>(std::move(sources));
}

mate_fix_counters fix_mate_information(const fixmate_options& options)
{
	AK_CHECK(!options.inputs.empty(), value, "No input files given");
	const bool in_place = options.output.empty();
	AK_CHECK(!in_place || options.inputs.size() == 1, value,
			 "Must specify either an output file or a single input file to be overwritten");
	const string tmp_dir = options.tmp_dir.empty() ? default_tmp_dir() : options.tmp_dir;

	stopwatch_t timer;
	timer.tic();

	vector<unique_ptr<alignment_reader>> readers;
	bool all_queryname = true;
	for (const auto& path : options.inputs) {
		readers.push_back(make_unique<alignment_reader>(path, string{}, options.reader));
		const auto& header = readers.back()->header();
		if (header.sort_order() != sort_order_t::queryname)
			all_queryname = false;
		AK_CHECK(header.dict().same_as(readers[0]->header().dict()), value,
				 "Input {} has a different sequence dictionary than {}", path, options.inputs[0]);
	}
	AK_CHECK(!in_place || !readers[0]->is_binary(), value,
			 "Cannot fix ALN file {} in place; give an output path", options.inputs[0]);

	sam_header header = readers[0]->header();
	const sort_order_t out_order = options.sort_order.value_or(header.sort_order());
	header.set_sort_order(out_order);
	if (is_verbose())
		println("Output will be sorted by {}", sort_order_name(out_order));

	string out_path = options.output;
	if (in_place) {
		const auto& input = options.inputs[0];
		out_path = make_temp_file(dir_name(input), base_name(input) + ".being_fixed.", ".sam");
	}

	mate_fix_counters counters;
	try {
		auto input = open_inputs(readers, all_queryname);

		unique_ptr<sorting_collection<align_record_t>> sorter;
		if (!all_queryname) {
			if (is_verbose())
				println("Sorting input into queryname order.");
			sorter = make_unique<sorting_collection<align_record_t>>(&compare_queryname, options.max_records_in_ram, tmp_dir);
			align_record_t rec;
			while (input->next(rec))
				sorter->add(std::move(rec));
			input->close();
			input = sorter->iterate();
			if (is_verbose())
				println("Sorting by queryname complete.");
		}

		sam_writer writer(out_path, header);
		unique_ptr<sorting_sink> resort;
		if (out_order == sort_order_t::coordinate)
			resort = make_unique<sorting_sink>(writer, out_order, options.max_records_in_ram, tmp_dir);
		record_sink& sink = resort ? static_cast<record_sink&>(*resort) : static_cast<record_sink&>(writer);

		if (is_verbose())
			println("Traversing query name sorted records and fixing up mate pair information.");
		mate_fixer fixer(options.progress_interval);
		fixer.run(std::move(input), sink);
		if (sorter)
			sorter->cleanup();

		if (is_verbose()) {
			if (resort)
				println("Finished processing reads; re-sorting output file.");
			else
				println("Closing output file.");
		}
		sink.close();
		counters = fixer.counters();
	} catch (const std::exception&) {
		if (in_place)
			remove_file(out_path);
		throw;
	}

	for (auto& reader : readers)
		reader->close();

	timer.toc();
	if (is_verbose())
		println("Fixed {} pairs; {} orphans; {} secondary or supplementary records passed through ({:.1f}s)",
				counters.pairs_fixed, counters.orphans, counters.passed_through, timer.duration());

	if (in_place) {
		if (is_verbose())
			println("Replacing input file with fixed file.");
		replace_input(options.inputs[0], out_path);
	}
	return counters;
}

END_NAMESPACE_AK
