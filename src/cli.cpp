/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
// Command-line front end: alignkit <fixmate|index|view> [options]
#include "ak_assert.h"
#include "ak_time.h"
#include "alignment_reader.h"
#include "aln_file.h"
#include "fixmate.h"
#include "record_iterator.h"
#include "sam_header.h"
#include "sam_io.h"
#include "strutil.h"
#include "util.h"
#include <cstdio>
#include <exception>
#include <getopt.h>
#include <optional>
#include <string>
#include <vector>

USING_NAMESPACE_AK

using std::optional;
using std::string;
using std::string_view;
using std::vector;

static void usage()
{
	std::fputs(
		"Usage: alignkit <command> [options]\n"
		"\n"
		"Commands:\n"
		"  fixmate  make mate-pair information consistent between the reads of each pair\n"
		"  index    convert a coordinate-sorted SAM file to an indexed ALN file\n"
		"  view     print records, optionally restricted to regions, as SAM text\n"
		"\n"
		"alignkit fixmate -i IN [-i IN ...] [-o OUT] [-s SORT_ORDER] [-m MAX_RECORDS] [-t TMP_DIR] [-S STRINGENCY]\n"
		"  -i, --input             input SAM or ALN file; may be given several times\n"
		"  -o, --output            output SAM file (default: replace the single input)\n"
		"  -s, --sort_order        output sort order: unsorted|queryname|coordinate (default: that of the first input)\n"
		"  -m, --max_records       records held in memory while sorting (default: 500000)\n"
		"  -t, --tmp_dir           directory for temporary sort files (default: $TMPDIR or /tmp)\n"
		"  -S, --stringency        strict|lenient|silent handling of malformed records (default: strict)\n"
		"\n"
		"alignkit index -i IN.sam -o OUT.aln [-x OUT.aln.idx] [-b BLOCK_RECORDS]\n"
		"  -i, --input             coordinate-sorted SAM file\n"
		"  -o, --output            ALN file to write\n"
		"  -x, --index             index file to write (default: OUT.aln.idx)\n"
		"  -b, --block_records     records per index block (default: 256)\n"
		"\n"
		"alignkit view -i IN [-x INDEX] [-r REF:START-END ...] [-c] [-u] [-a SORT_ORDER] [-o OUT] [-S STRINGENCY]\n"
		"  -i, --input             input SAM or ALN file\n"
		"  -x, --index             index of an ALN input (default: IN.idx)\n"
		"  -r, --region            REF, REF:START or REF:START-END; may be given several times (requires an index)\n"
		"  -c, --contained         only records lying entirely within a region\n"
		"  -u, --unmapped          only records placed on no reference (requires an index)\n"
		"  -a, --assert_sorted     fail if the records are not in this sort order\n"
		"  -o, --output            output SAM file (default: stdout)\n"
		"  -S, --stringency        strict|lenient|silent handling of malformed records (default: strict)\n"
		"\n"
		"Set ALIGNKIT_QUIET to silence progress messages.\n",
		stderr);
}

static validation_stringency parse_stringency(string_view name)
{
	if (name == "strict")  return validation_stringency::strict;
	if (name == "lenient") return validation_stringency::lenient;
	if (name == "silent")  return validation_stringency::silent;
	AK_THROW(value, "Unknown validation stringency '{}'; expected one of strict, lenient, silent", name);
}

// Parses "REF", "REF:START" or "REF:START-END" into an interval of the reader's dictionary.
static query_interval_t parse_region(const alignment_reader& reader, string_view region)
{
	auto colon = region.rfind(':');
	if (colon == string_view::npos || reader.header().dict().index_of(region) != no_ref_index)
		return reader.make_query_interval(region, 1, 0);

	auto name  = region.substr(0, colon);
	auto range = region.substr(colon + 1);
	auto dash  = range.find('-');
	pos_t start = as_int(range.substr(0, dash));
	pos_t end   = dash == string_view::npos ? 0 : as_int(range.substr(dash + 1));
	return reader.make_query_interval(name, start, end);
}

// getopt_long parses the options after the command name
static void reset_getopt() { optind = 1; }

/////////////////////////////////////////////////////////////////

static int fixmate_main(int argc, char* argv[])
{
	fixmate_options options;

	const char* optstring = "i:o:s:m:t:S:h";
	struct option longopts[] = {
		{"input",       required_argument, nullptr, 'i'},
		{"output",      required_argument, nullptr, 'o'},
		{"sort_order",  required_argument, nullptr, 's'},
		{"max_records", required_argument, nullptr, 'm'},
		{"tmp_dir",     required_argument, nullptr, 't'},
		{"stringency",  required_argument, nullptr, 'S'},
		{"help",        no_argument,       nullptr, 'h'},
		{nullptr,       0,                 nullptr,  0 }
	};

	int c;
	reset_getopt();
	while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
		switch (c) {
		case 'i': options.inputs.emplace_back(optarg);                            break;
		case 'o': options.output             = optarg;                            break;
		case 's': options.sort_order         = parse_sort_order(optarg);          break;
		case 'm': options.max_records_in_ram = int_cast<size_t>(as_int64(optarg)); break;
		case 't': options.tmp_dir            = optarg;                            break;
		case 'S': options.reader.stringency  = parse_stringency(optarg);          break;
		case 'h': usage();                                                        return 0;
		default:  usage();                                                        return 1;
		}
	}
	if (options.inputs.empty()) {
		fmt::print(stderr, "[ERROR] at least one --input is required\n\n");
		usage();
		return 1;
	}

	fix_mate_information(options);
	return 0;
}

static int index_main(int argc, char* argv[])
{
	string input, output, index_path;
	index_options options;

	const char* optstring = "i:o:x:b:h";
	struct option longopts[] = {
		{"input",         required_argument, nullptr, 'i'},
		{"output",        required_argument, nullptr, 'o'},
		{"index",         required_argument, nullptr, 'x'},
		{"block_records", required_argument, nullptr, 'b'},
		{"help",          no_argument,       nullptr, 'h'},
		{nullptr,         0,                 nullptr,  0 }
	};

	int c;
	reset_getopt();
	while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
		switch (c) {
		case 'i': input                 = optarg;         break;
		case 'o': output                = optarg;         break;
		case 'x': index_path            = optarg;         break;
		case 'b': options.block_records = as_int(optarg); break;
		case 'h': usage();                                return 0;
		default:  usage();                                return 1;
		}
	}
	if (input.empty() || output.empty()) {
		fmt::print(stderr, "[ERROR] --input and --output are required\n\n");
		usage();
		return 1;
	}
	if (index_path.empty())
		index_path = default_index_path(output);

	stopwatch_t timer;
	timer.tic();
	alignment_reader reader(input);
	auto num_records = build_aln(reader.iterate(), reader.header(), output, index_path, options);
	reader.close();
	timer.toc();
	if (is_verbose())
		println("Wrote {} records to {} and its index {} ({:.1f}s)", num_records, output, index_path, timer.duration());
	return 0;
}

static int view_main(int argc, char* argv[])
{
	string input, index_path, output = stdin_path;
	vector<string> regions;
	bool contained = false;
	bool unmapped  = false;
	optional<sort_order_t> order;
	reader_options options;

	const char* optstring = "i:x:r:cua:o:S:h";
	struct option longopts[] = {
		{"input",         required_argument, nullptr, 'i'},
		{"index",         required_argument, nullptr, 'x'},
		{"region",        required_argument, nullptr, 'r'},
		{"contained",     no_argument,       nullptr, 'c'},
		{"unmapped",      no_argument,       nullptr, 'u'},
		{"assert_sorted", required_argument, nullptr, 'a'},
		{"output",        required_argument, nullptr, 'o'},
		{"stringency",    required_argument, nullptr, 'S'},
		{"help",          no_argument,       nullptr, 'h'},
		{nullptr,         0,                 nullptr,  0 }
	};

	int c;
	reset_getopt();
	while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
		switch (c) {
		case 'i': input      = optarg;                   break;
		case 'x': index_path = optarg;                   break;
		case 'r': regions.emplace_back(optarg);          break;
		case 'c': contained  = true;                     break;
		case 'u': unmapped   = true;                     break;
		case 'a': order      = parse_sort_order(optarg); break;
		case 'o': output     = optarg;                   break;
		case 'S': options.stringency = parse_stringency(optarg); break;
		case 'h': usage();                               return 0;
		default:  usage();                               return 1;
		}
	}
	if (input.empty()) {
		fmt::print(stderr, "[ERROR] --input is required\n\n");
		usage();
		return 1;
	}
	if (unmapped && !regions.empty()) {
		fmt::print(stderr, "[ERROR] --unmapped cannot be combined with --region\n\n");
		usage();
		return 1;
	}

	alignment_reader reader(input, index_path, options);
	record_iterator_ptr records;
	if (!regions.empty()) {
		vector<query_interval_t> intervals;
		for (const auto& region : regions)
			intervals.push_back(parse_region(reader, region));
		records = reader.query(intervals, contained);
	} else if (unmapped) {
		records = reader.query_unmapped();
	} else {
		records = reader.iterate();
	}
	if (order)
		records = assert_sorted(std::move(records), *order);

	sam_writer out(output, reader.header());
	align_record_t rec;
	while (records->next(rec))
		out.add_record(rec);
	records->close();
	out.close();
	return 0;
}

/////////////////////////////////////////////////////////////////

int main(int argc, char* argv[])
{
	if (argc < 2) {
		usage();
		return 1;
	}
	string_view command = argv[1];
	try {
		// Each command parses its own options from argv[1:], so argv[0] of the subcommand is its name
		if (command == "fixmate") return fixmate_main(argc - 1, argv + 1);
		if (command == "index")   return index_main(argc - 1, argv + 1);
		if (command == "view")    return view_main(argc - 1, argv + 1);
		if (command == "-h" || command == "--help") {
			usage();
			return 0;
		}
	} catch (const std::exception& e) {
		print_exception_chain(e);
		return 1;
	}
	fmt::print(stderr, "[ERROR] unknown command '{}'\n\n", command);
	usage();
	return 1;
}
