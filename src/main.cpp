/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
// This file is only compiled into the alignkit_test executable.
// It runs the built-in C++ unit tests from the source directory,
// reading fixtures under tests/data/ and writing scratch files to $TMPDIR.
#ifdef _WANT_MAIN

#include "ak_assert.h"
#include "ak_time.h"
#include "alignment_reader.h"
#include "aln_file.h"
#include "file.h"
#include "fixmate.h"
#include "interval.h"
#include "mate_fixer.h"
#include "record_compare.h"
#include "record_iterator.h"
#include "sam_header.h"
#include "sam_io.h"
#include "sorting_collection.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

USING_NAMESPACE_AK

using std::make_unique;
using std::string;
using std::vector;

static const string coord_sam       = "tests/data/coord.sam";
static const string qname_sam       = "tests/data/qname.sam";
static const string qname_extra_sam = "tests/data/qname_extra.sam";
static const string malformed_sam   = "tests/data/malformed.sam";
static const string other_dict_sam  = "tests/data/other_dict.sam";
static const string not_alignments  = "tests/data/not_alignments.txt";

template <typename E, typename F>
void assert_throws(F&& f, const char* what)
{
	try {
		f();
	} catch (const E&) {
		return;
	}
	AK_THROW(assertion, "Expected {} to throw", what);
}

static vector<align_record_t> collect(record_iterator_ptr it)
{
	vector<align_record_t> recs;
	align_record_t rec;
	while (it->next(rec))
		recs.push_back(rec);
	it->close();
	return recs;
}

static vector<align_record_t> read_all(const string& path)
{
	alignment_reader reader(path);
	return collect(reader.iterate());
}

// The primary record of `qname` that is first (or second) of its pair.
static const align_record_t& find_read(const vector<align_record_t>& recs, string_view qname, uint16_t which)
{
	for (const auto& rec : recs)
		if (rec.qname == qname && rec.has_flag(which) && rec.is_primary())
			return rec;
	AK_THROW(assertion, "No primary record {} with flag {:#x}", qname, which);
}

static align_record_t make_record(string_view qname, uint16_t flag, refidx_t ref_index, pos_t pos, string_view cigar = "10M")
{
	align_record_t rec;
	rec.qname     = qname;
	rec.flag      = flag;
	rec.ref_index = ref_index;
	rec.pos       = pos;
	rec.cigar     = cigar;
	return rec;
}

static string scratch_file(std::string_view prefix, std::string_view suffix)
{
	return make_temp_file(default_tmp_dir(), prefix, suffix);
}

static void copy_file(const string& from, const string& to)
{
	string contents = read_file_prefix(from, 1 << 20);
	binary_file out(to, "w");
	out.write_text(contents);
	out.close();
}

// Collects everything written to it.
class vector_sink : public record_sink {
public:
	void add_record(const align_record_t& rec) override { records.push_back(rec); }
	void close() override { closed = true; }

	vector<align_record_t> records;
	bool                   closed{};
};

/////////////////////////////////////////////////////////////////

void optimize_intervals_test()
{
	print("optimize_intervals_test ... ");

	// Abutting intervals merge; disjoint ones stay apart
	auto merged = optimize_intervals({ { 0, 10, 20 }, { 0, 20, 30 }, { 0, 50, 60 } });
	AK_ASSERT(merged.size() == 2);
	AK_ASSERT(merged[0] == query_interval_t(0, 10, 30));
	AK_ASSERT(merged[1] == query_interval_t(0, 50, 60));

	// An unbounded interval absorbs bounded ones it overlaps
	merged = optimize_intervals({ { 0, 100, 0 }, { 0, 150, 200 } });
	AK_ASSERT(merged.size() == 1);
	AK_ASSERT(merged[0] == query_interval_t(0, 100, 0));

	merged = optimize_intervals({ { 1, 5, 8 }, { 0, 40, 50 }, { 0, 1, 3 }, { 1, 1, 2 } });
	AK_ASSERT(merged.size() == 4);
	AK_ASSERT(merged[0] == query_interval_t(0, 1, 3));
	AK_ASSERT(merged[3] == query_interval_t(1, 5, 8));

	AK_ASSERT(optimize_intervals({}).empty());

	// Idempotent over arbitrary input
	for (int trial = 0; trial < 200; ++trial) {
		vector<query_interval_t> intervals;
		int n = rand() % 12;
		for (int i = 0; i < n; ++i) {
			pos_t start = 1 + rand() % 100;
			pos_t end   = rand() % 8 == 0 ? 0 : start + rand() % 20;
			intervals.emplace_back(rand() % 3, start, end);
		}
		auto once  = optimize_intervals(intervals);
		auto twice = optimize_intervals(once);
		AK_ASSERT(once == twice, "trial {}", trial);
		for (size_t i = 1; i < once.size(); ++i)
			AK_ASSERT(once[i - 1] < once[i] && !once[i - 1].overlaps(once[i]) && !once[i - 1].abuts(once[i]));
	}

	assert_throws<invalid_interval_error>([] { query_interval_t(-1, 10, 20); }, "negative reference index");
	assert_throws<invalid_interval_error>([] {
		query_interval_t bad;
		bad.ref_index = -2;
		optimize_intervals({ { 0, 1, 2 }, bad });
	}, "optimize_intervals with a negative reference index");

	AK_ASSERT(query_interval_t(2, 7, 0).as_str() == "2:7-0");
	println("OK");
}

void record_test()
{
	print("record_test ... ");

	AK_ASSERT(cigar_ref_length("10M") == 10);
	AK_ASSERT(cigar_ref_length("3S5M2I4M1D6M") == 16);
	AK_ASSERT(cigar_ref_length("5M1000N5M") == 1010);
	AK_ASSERT(cigar_ref_length("*") == 0);
	assert_throws<format_error>([] { cigar_ref_length("10Q"); }, "unknown CIGAR op");
	assert_throws<format_error>([] { cigar_ref_length("M"); }, "CIGAR op without length");

	auto rec = make_record("r", sam_flag::paired | sam_flag::first, 0, 100, "10M");
	AK_ASSERT(rec.alignment_end() == 109);
	rec.set_flag(sam_flag::unmapped, true);
	AK_ASSERT(rec.alignment_end() == 100);
	AK_ASSERT(rec.is_unmapped() && rec.is_first() && !rec.is_second() && rec.is_primary());

	rec.set_int_tag("MQ", 30);
	rec.set_tag("RG", 'Z', "lane1");
	AK_ASSERT(rec.get_tag("MQ") == "30");
	rec.set_int_tag("MQ", 12);
	AK_ASSERT(rec.tags.size() == 2 && rec.get_tag("MQ") == "12");
	AK_ASSERT(rec.remove_tag("MQ"));
	AK_ASSERT(!rec.remove_tag("MQ"));
	AK_ASSERT(!rec.has_tag("MQ") && rec.has_tag("RG"));
	println("OK");
}

void header_test()
{
	print("header_test ... ");

	auto header = sam_header::parse("@HD\tVN:1.5\tSO:queryname\tGO:query\n"
									"@SQ\tSN:chr1\tLN:1000\tM5:abc\n"
									"@SQ\tSN:chr2\tLN:500\n"
									"@RG\tID:lane1\n");
	AK_ASSERT(header.sort_order() == sort_order_t::queryname);
	AK_ASSERT(header.dict().size() == 2);
	AK_ASSERT(header.dict().index_of("chr2") == 1);
	AK_ASSERT(header.dict().index_of("chrX") == no_ref_index);
	AK_ASSERT(header.dict().name_of(no_ref_index) == "*");
	AK_ASSERT(header.other_lines().size() == 1);

	header.set_sort_order(sort_order_t::coordinate);
	AK_ASSERT(header.as_str() == "@HD\tVN:1.5\tGO:query\tSO:coordinate\n"
								 "@SQ\tSN:chr1\tLN:1000\tM5:abc\n"
								 "@SQ\tSN:chr2\tLN:500\n"
								 "@RG\tID:lane1\n");

	AK_ASSERT(as_sort_order("coordinate") == sort_order_t::coordinate);
	AK_ASSERT(as_sort_order("by_colour") == sort_order_t::unsorted);
	AK_ASSERT(parse_sort_order("unsorted") == sort_order_t::unsorted);
	assert_throws<value_error>([] { parse_sort_order("by_colour"); }, "unknown sort order option");
	assert_throws<format_error>([] { sam_header::parse("@SQ\tSN:chr1\tLN:1\n@SQ\tSN:chr1\tLN:2\n"); }, "duplicate @SQ");
	println("OK");
}

void compare_test()
{
	print("compare_test ... ");

	auto a = make_record("x", 0, 0, 50);
	auto b = make_record("x", 0, 0, 60);
	auto u = make_record("x", sam_flag::unmapped, no_ref_index, 0);
	AK_ASSERT(compare_coordinate(a, b) < 0 && compare_coordinate(b, a) > 0);
	AK_ASSERT(compare_coordinate(b, u) < 0);  // unplaced records last
	AK_ASSERT(compare_coordinate(a, a) == 0);
	auto a_rev = a;
	a_rev.set_flag(sam_flag::reverse, true);
	AK_ASSERT(compare_coordinate(a, a_rev) < 0);
	auto other_ref = make_record("a", 0, 1, 1);
	AK_ASSERT(compare_coordinate(b, other_ref) < 0);

	auto first     = make_record("q", sam_flag::paired | sam_flag::first, 1, 500);
	auto second    = make_record("q", sam_flag::paired | sam_flag::second, 0, 10);
	auto secondary = make_record("q", sam_flag::paired | sam_flag::first | sam_flag::secondary, 0, 1);
	auto unpaired  = make_record("q", 0, 0, 1);
	auto earlier   = make_record("p", sam_flag::paired | sam_flag::second, 0, 1);
	AK_ASSERT(compare_queryname(earlier, first) < 0);
	AK_ASSERT(compare_queryname(first, second) < 0);
	AK_ASSERT(compare_queryname(first, secondary) < 0);
	AK_ASSERT(compare_queryname(second, unpaired) < 0);
	AK_ASSERT(compare_queryname(secondary, second) < 0);

	AK_ASSERT(comparator_for(sort_order_t::unsorted) == nullptr);
	AK_ASSERT(comparator_for(sort_order_t::queryname) == &compare_queryname);
	println("OK");
}

void sam_codec_test()
{
	print("sam_codec_test ... ");

	sequence_dictionary dict;
	dict.add("chr1", 10000);
	dict.add("chr2", 5000);

	const string line = "r1\t99\tchr1\t100\t60\t10M\t=\t300\t210\tACGTACGTAC\tIIIIIIIIII\tNM:i:0\tRG:Z:lane1";
	align_record_t rec;
	parse_sam_record(line, dict, rec);
	AK_ASSERT(rec.qname == "r1" && rec.flag == 99 && rec.ref_index == 0 && rec.pos == 100 && rec.mapq == 60);
	AK_ASSERT(rec.mate_ref_index == 0 && rec.mate_pos == 300 && rec.tlen == 210);
	AK_ASSERT(rec.tags.size() == 2 && rec.get_tag("RG") == "lane1");

	string out;
	format_sam_record(rec, dict, out);
	AK_ASSERT(out == line + "\n");

	parse_sam_record("u\t4\t*\t0\t0\t*\tchr2\t7\t0\t*\t*", dict, rec);
	AK_ASSERT(rec.ref_index == no_ref_index && rec.mate_ref_index == 1 && rec.tags.empty());

	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchr1\t1\t60\t4M\t*\t0\t0\tACGT", dict, rec); }, "ten columns");
	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchrX\t1\t60\t4M\t*\t0\t0\tACGT\tIIII", dict, rec); }, "unknown reference");
	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchr1\t1\t300\t4M\t*\t0\t0\tACGT\tIIII", dict, rec); }, "MAPQ out of range");
	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchr1\tx\t60\t4M\t*\t0\t0\tACGT\tIIII", dict, rec); }, "non-numeric POS");
	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchr1\t1\t60\t4Q\t*\t0\t0\tACGT\tIIII", dict, rec); }, "bad CIGAR");
	assert_throws<format_error>([&] { parse_sam_record("r\t0\tchr1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\tNM", dict, rec); }, "bad tag");

	// Stringency decides what happens to a malformed record line
	reader_options lenient{ validation_stringency::lenient };
	reader_options silent{ validation_stringency::silent };
	AK_ASSERT(collect(alignment_reader(malformed_sam, {}, lenient).iterate()).size() == 2);
	auto recs = collect(alignment_reader(malformed_sam, {}, silent).iterate());
	AK_ASSERT(recs.size() == 2 && recs[0].qname == "good1" && recs[1].qname == "good2");
	assert_throws<format_error>([] { read_all(malformed_sam); }, "strict read of a malformed record");

	// Written SAM reads back identically
	auto original = read_all(coord_sam);
	auto path     = scratch_file("alignkit_test.", ".sam");
	{
		alignment_reader reader(coord_sam);
		sam_writer writer(path, reader.header());
		for (const auto& r : original)
			writer.add_record(r);
		writer.close();
		AK_ASSERT(writer.num_written() == 10);
	}
	auto reread = read_all(path);
	AK_ASSERT(reread.size() == original.size());
	for (size_t i = 0; i < reread.size(); ++i)
		AK_ASSERT(compare_coordinate(reread[i], original[i]) == 0 && reread[i].tags == original[i].tags);
	remove_file(path);
	println("OK");
}

void classify_test()
{
	print("classify_test ... ");

	AK_ASSERT(classify(coord_sam) == source_format::text);
	assert_throws<unrecognized_format_error>([] { classify(not_alignments); }, "classify of plain text");
	assert_throws<unrecognized_format_error>([] { alignment_reader reader(not_alignments); }, "open of plain text");
	assert_throws<file_error>([] { classify("tests/data/no_such_file.sam"); }, "classify of a missing file");

	// Header-less SAM is recognized by its columns
	auto headerless = scratch_file("alignkit_test.", ".sam");
	{
		binary_file out(headerless, "w");
		out.write_text("r\t4\t*\t0\t0\t*\t*\t0\t0\tACGT\tIIII\n");
		out.close();
	}
	AK_ASSERT(classify(headerless) == source_format::text);
	AK_ASSERT(read_all(headerless).size() == 1);
	remove_file(headerless);

	auto empty = scratch_file("alignkit_test.", ".sam");
	AK_ASSERT(classify(empty) == source_format::text);
	AK_ASSERT(read_all(empty).empty());
	remove_file(empty);

	// Gzipped SAM reads transparently
	auto gz = scratch_file("alignkit_test.", ".sam.gz");
	{
		string text = read_file_prefix(coord_sam, 1 << 20);
		gzFile zf   = gzopen(gz.c_str(), "wb");
		AK_ASSERT(zf != nullptr);
		AK_ASSERT(gzwrite(zf, text.data(), (unsigned)text.size()) == (int)text.size());
		AK_ASSERT(gzclose(zf) == Z_OK);
	}
	AK_ASSERT(classify(gz) == source_format::text);
	alignment_reader gz_reader(gz);
	AK_ASSERT(gz_reader.header().dict().size() == 2);
	AK_ASSERT(collect(gz_reader.iterate()).size() == 10);
	gz_reader.close();
	remove_file(gz);
	println("OK");
}

void assert_sorted_test()
{
	print("assert_sorted_test ... ");

	vector<align_record_t> recs = { make_record("a", 0, 0, 50), make_record("b", 0, 0, 10) };
	auto it = assert_sorted(make_unique<vector_iterator<align_record_t>>(recs), sort_order_t::coordinate);
	align_record_t rec;
	AK_ASSERT(it->next(rec) && rec.pos == 50);
	assert_throws<sort_order_error>([&] { it->next(rec); }, "out-of-order record");

	// Unsorted asserts nothing
	auto unchecked = assert_sorted(make_unique<vector_iterator<align_record_t>>(recs), sort_order_t::unsorted);
	AK_ASSERT(collect(std::move(unchecked)).size() == 2);

	// Only the fields the declared order constrains are checked: records at the
	// same start may come in any name order, and R2 may precede R1
	vector<align_record_t> tied = { make_record("b", 0, 0, 50), make_record("a", sam_flag::reverse, 0, 50),
									make_record("a", 0, 0, 50), make_record("c", 0, 1, 5) };
	AK_ASSERT(collect(assert_sorted(make_unique<vector_iterator<align_record_t>>(tied), sort_order_t::coordinate)).size() == 4);
	vector<align_record_t> same_name = { make_record("x", sam_flag::paired | sam_flag::second, 0, 10),
										 make_record("x", sam_flag::paired | sam_flag::first, 0, 5),
										 make_record("y", 0, no_ref_index, 0) };
	AK_ASSERT(collect(assert_sorted(make_unique<vector_iterator<align_record_t>>(same_name), sort_order_t::queryname)).size() == 3);
	std::swap(same_name[0], same_name[2]);
	assert_throws<sort_order_error>([&] {
		collect(assert_sorted(make_unique<vector_iterator<align_record_t>>(same_name), sort_order_t::queryname));
	}, "read names out of order");

	// The same tied records can be indexed
	const string tied_aln = scratch_file("alignkit_test.", ".aln");
	const string tied_idx = default_index_path(tied_aln);
	AK_ASSERT(build_aln(make_unique<vector_iterator<align_record_t>>(tied), alignment_reader(coord_sam).header(),
						tied_aln, tied_idx) == 4);
	remove_file(tied_aln);
	remove_file(tied_idx);

	AK_ASSERT(collect(assert_sorted(alignment_reader(coord_sam).iterate(), sort_order_t::coordinate)).size() == 10);
	assert_throws<sort_order_error>([] {
		collect(assert_sorted(alignment_reader(coord_sam).iterate(), sort_order_t::queryname));
	}, "coordinate-sorted file checked for queryname order");
	println("OK");
}

static int compare_int(const int& a, const int& b) { return compare3(a, b); }

void sorting_collection_test()
{
	print("sorting_collection_test ... ");

	const vector<int> input    = { 5, 3, 5, 1, 9, 2, 8 };
	const vector<int> expected = { 1, 2, 3, 5, 5, 8, 9 };

	for (size_t max_in_ram : { 3, 100, 1 }) {
		sorting_collection<int> sorter(&compare_int, max_in_ram);
		for (int x : input)
			sorter.add(x);
		AK_ASSERT(sorter.size() == input.size());
		auto runs = sorter.run_paths();
		AK_ASSERT((max_in_ram < input.size()) == !runs.empty());
		for (const auto& path : runs)
			AK_ASSERT(is_file(path));

		vector<int> sorted;
		auto it = sorter.iterate();
		int x;
		while (it->next(x))
			sorted.push_back(x);
		AK_ASSERT(sorted == expected, "max_records_in_ram={}", max_in_ram);
		assert_throws<value_error>([&] { sorter.add(4); }, "add after iterate");
		assert_throws<value_error>([&] { sorter.iterate(); }, "second iterate");

		// cleanup removes every run and may be repeated
		sorter.cleanup();
		for (const auto& path : runs)
			AK_ASSERT(!is_file(path));
		sorter.cleanup();
		AK_ASSERT(sorter.num_runs() == 0);
		assert_throws<value_error>([&] { it->next(x); }, "read after cleanup");
	}

	// Abandoning a merge part way through still lets cleanup remove every run
	{
		sorting_collection<int> sorter(&compare_int, 2);
		for (int x : input)
			sorter.add(x);
		auto it   = sorter.iterate();
		auto runs = sorter.run_paths();
		AK_ASSERT(runs.size() == 4);
		int x;
		AK_ASSERT(it->next(x) && x == 1);
		it->close();
		AK_ASSERT(!it->next(x));
		sorter.cleanup();
		AK_ASSERT(sorter.num_runs() == 0);
		for (const auto& path : runs)
			AK_ASSERT(!is_file(path));
		AK_ASSERT(!it->next(x));
	}

	assert_throws<value_error>([] { sorting_collection<int> sorter(&compare_int, 0); }, "zero capacity");

	// Records through spilled runs keep their order among equals
	sorting_collection<align_record_t> records(&compare_queryname, 2);
	for (const auto& rec : read_all(coord_sam))
		records.add(rec);
	AK_ASSERT(records.num_runs() == 5);
	auto sorted = collect(records.iterate());
	AK_ASSERT(sorted.size() == 10);
	for (size_t i = 1; i < sorted.size(); ++i)
		AK_ASSERT(compare_queryname(sorted[i - 1], sorted[i]) <= 0);
	AK_ASSERT(sorted[1].qname == "dup" && sorted[1].mapq == 10 && sorted[2].mapq == 20);
	records.cleanup();

	// The sorting sink hands its records on in order when closed
	vector_sink out;
	sorting_sink sink(out, sort_order_t::coordinate, 3);
	for (auto& rec : read_all(qname_sam))
		sink.add_record(rec);
	AK_ASSERT(out.records.empty());
	sink.close();
	AK_ASSERT(out.closed && out.records.size() == 10);
	for (size_t i = 1; i < out.records.size(); ++i)
		AK_ASSERT(compare_coordinate(out.records[i - 1], out.records[i]) <= 0);
	println("OK");
}

void iterator_test()
{
	print("iterator_test ... ");

	auto qname = read_all(qname_sam);
	auto extra = read_all(qname_extra_sam);

	vector<record_iterator_ptr> sources;
	sources.push_back(make_unique<vector_iterator<align_record_t>>(extra));
	sources.push_back(make_unique<vector_iterator<align_record_t>>(qname));
	auto merged = collect(make_unique<merging_iterator>(std::move(sources), &compare_queryname));
	AK_ASSERT(merged.size() == 12);
	AK_ASSERT(merged.front().qname == "a" && merged.back().qname == "f");

	sources.clear();
	sources.push_back(make_unique<vector_iterator<align_record_t>>(extra));
	sources.push_back(make_unique<vector_iterator<align_record_t>>(qname));
	auto concatenated = collect(make_unique<concat_iterator>(std::move(sources)));
	AK_ASSERT(concatenated.size() == 12);
	AK_ASSERT(concatenated.front().qname == "f" && concatenated.back().qname == "e");

	peekable_iterator it(make_unique<vector_iterator<align_record_t>>(extra));
	AK_ASSERT(it.has_next() && it.peek().flag == 99);
	AK_ASSERT(it.next().flag == 99);
	AK_ASSERT(it.next().flag == 147);
	AK_ASSERT(!it.has_next());
	assert_throws<value_error>([&] { it.peek(); }, "peek past the end");
	it.close();
	println("OK");
}

void mate_fixer_test()
{
	print("mate_fixer_test ... ");

	// One read unmapped: it is placed at its mapped mate
	{
		vector<align_record_t> recs = {
			make_record("r1", sam_flag::paired | sam_flag::first | sam_flag::unmapped, no_ref_index, 0, "*"),
			make_record("r1", sam_flag::paired | sam_flag::second | sam_flag::proper_pair, 5, 100),
		};
		recs[1].mapq = 37;
		recs[1].set_int_tag("MQ", 1);
		vector_sink out;
		mate_fixer fixer;
		fixer.run(make_unique<vector_iterator<align_record_t>>(recs), out);
		AK_ASSERT(out.records.size() == 2);
		const auto& a = out.records[0];
		const auto& b = out.records[1];
		AK_ASSERT(a.mate_ref_index == 5 && a.mate_pos == 100 && !a.is_mate_unmapped());
		AK_ASSERT(a.ref_index == 5 && a.pos == 100 && a.get_tag("MQ") == "37");
		AK_ASSERT(b.is_mate_unmapped() && b.mate_ref_index == 5 && b.mate_pos == 100 && !b.has_tag("MQ"));
		AK_ASSERT(a.tlen == 0 && b.tlen == 0 && !b.is_proper_pair());
		AK_ASSERT(fixer.counters().pairs_fixed == 1 && fixer.counters().orphans == 0);
	}

	// A primary without a partner of the same name is an orphan
	{
		vector<align_record_t> recs = {
			make_record("r2", sam_flag::paired | sam_flag::first, 0, 10),
			make_record("r2", sam_flag::paired | sam_flag::second | sam_flag::secondary, 0, 900),
			make_record("r3", sam_flag::paired | sam_flag::first, 0, 20),
		};
		recs[0].mate_pos = 77;
		vector_sink out;
		mate_fixer fixer;
		fixer.run(make_unique<vector_iterator<align_record_t>>(recs), out);
		AK_ASSERT(out.records.size() == 3);
		AK_ASSERT(out.records[0].is_secondary());
		AK_ASSERT(out.records[1].qname == "r2" && out.records[1].mate_pos == 77 && out.records[1].flag == recs[0].flag);
		AK_ASSERT(fixer.counters().orphans == 2 && fixer.counters().passed_through == 1 && fixer.counters().records == 3);
	}

	// Both mapped: mate fields, MQ and insert size from the 5' ends
	{
		auto fwd = make_record("p", sam_flag::paired | sam_flag::first, 0, 100, "10M");
		auto rev = make_record("p", sam_flag::paired | sam_flag::second | sam_flag::reverse, 0, 300, "10M");
		fwd.mapq = 60;
		rev.mapq = 50;
		set_mate_info(fwd, rev);
		AK_ASSERT(fwd.tlen == 210 && rev.tlen == -210);
		AK_ASSERT(fwd.is_mate_reverse() && !rev.is_mate_reverse());
		AK_ASSERT(fwd.mate_pos == 300 && rev.mate_pos == 100);
		AK_ASSERT(fwd.get_tag("MQ") == "50" && rev.get_tag("MQ") == "60");
		AK_ASSERT(compute_insert_size(rev, fwd) == -210);
	}

	// Two primaries of one name that are not first and second of a pair
	{
		vector<align_record_t> recs = {
			make_record("z", sam_flag::paired | sam_flag::first, 0, 10),
			make_record("z", sam_flag::paired | sam_flag::first, 0, 20),
		};
		vector_sink out;
		mate_fixer fixer;
		assert_throws<format_error>([&] { fixer.run(make_unique<vector_iterator<align_record_t>>(recs), out); },
									"pair of two first reads");
	}

	assert_throws<value_error>([] { mate_fixer fixer(0); }, "zero progress interval");
	println("OK");
}

void indexed_reader_test()
{
	print("indexed_reader_test ... ");

	const string aln = scratch_file("alignkit_test.", ".aln");
	const string idx = default_index_path(aln);
	{
		alignment_reader reader(coord_sam);
		index_options options;
		options.block_records = 2;
		AK_ASSERT(build_aln(reader.iterate(), reader.header(), aln, idx, options) == 10);
	}
	AK_ASSERT(classify(aln) == source_format::indexed_binary);

	alignment_reader reader(aln);
	AK_ASSERT(reader.is_binary() && reader.has_index());
	AK_ASSERT(reader.header().sort_order() == sort_order_t::coordinate);
	AK_ASSERT(reader.header().other_lines().size() == 1);

	auto all = collect(reader.iterate());
	auto sam = read_all(coord_sam);
	AK_ASSERT(all.size() == sam.size());
	for (size_t i = 0; i < all.size(); ++i)
		AK_ASSERT(compare_coordinate(all[i], sam[i]) == 0 && all[i].seq == sam[i].seq && all[i].tags == sam[i].tags);

	auto recs = collect(reader.query_overlapping("chr1", 100, 300));
	AK_ASSERT(recs.size() == 3);
	AK_ASSERT(recs[0].pos == 100 && recs[1].pos == 150 && recs[2].pos == 300);

	recs = collect(reader.query_contained("chr1", 100, 200));
	AK_ASSERT(recs.size() == 2);

	// A spliced read overlaps its intron but is not contained in its first exon
	AK_ASSERT(collect(reader.query_overlapping("chr1", 1500, 1600)).size() == 1);
	AK_ASSERT(collect(reader.query_contained("chr1", 800, 900)).empty());
	AK_ASSERT(collect(reader.query_overlapping("chr1", 5000, 0)).empty());

	// Overlapping query intervals yield each record once
	auto i1 = reader.make_query_interval("chr1", 100, 110);
	auto i2 = reader.make_query_interval("chr1", 105, 160);
	auto i3 = reader.make_query_interval("chr2", 1);
	recs = collect(reader.query({ i2, i1, i3 }, false));
	AK_ASSERT(recs.size() == 3);
	AK_ASSERT(recs[0].pos == 100 && recs[1].pos == 150 && recs[2].ref_index == 1);

	recs = collect(reader.query_unmapped());
	AK_ASSERT(recs.size() == 2 && recs[0].qname == "u1" && recs[1].qname == "u1");

	recs = collect(reader.query_alignment_start("chr1", 700));
	AK_ASSERT(recs.size() == 2 && recs[0].qname == "dup");
	AK_ASSERT(collect(reader.query_alignment_start(0, 701)).empty());

	assert_throws<value_error>([&] { reader.make_query_interval("chrX", 1); }, "unknown reference name");
	assert_throws<value_error>([&] { reader.make_query_interval("chr1", 0, 10); }, "query start 0");

	// Mates
	const auto& r1 = find_read(all, "r1", sam_flag::first);
	auto mate = reader.query_mate(r1);
	AK_ASSERT(mate && mate->qname == "r1" && mate->is_second() && mate->pos == 300);

	mate = reader.query_mate(find_read(all, "r2", sam_flag::first));
	AK_ASSERT(mate && mate->ref_index == 1 && mate->pos == 400);

	mate = reader.query_mate(find_read(all, "u1", sam_flag::second));
	AK_ASSERT(mate && mate->is_first());

	auto stranger = r1;
	stranger.qname = "stranger";
	AK_ASSERT(!reader.query_mate(stranger));

	const auto& dup = find_read(all, "dup", sam_flag::first);
	assert_throws<ambiguous_mate_error>([&] { reader.query_mate(dup); }, "mate lookup with two candidates");

	auto unpaired = make_record("long", 0, 0, 800);
	assert_throws<value_error>([&] { reader.query_mate(unpaired); }, "mate lookup for an unpaired read");

	// One live iterator per reader; a mate lookup does not count
	{
		auto it = reader.iterate();
		AK_ASSERT(reader.is_iterating());
		assert_throws<resource_busy_error>([&] { reader.iterate(); }, "second iterator");
		assert_throws<resource_busy_error>([&] { reader.query_unmapped(); }, "query while iterating");
		align_record_t rec;
		AK_ASSERT(it->next(rec) && rec.qname == "r1");
		AK_ASSERT(reader.query_mate(rec));
		AK_ASSERT(it->next(rec) && rec.qname == "r2");
		it->close();
		AK_ASSERT(!reader.is_iterating());
		auto again = reader.query_overlapping("chr2", 1, 0);
	}
	AK_ASSERT(!reader.is_iterating());
	AK_ASSERT(collect(reader.iterate()).size() == 10);

	// An iterator outlives the reader that made it
	auto it = reader.query_unmapped();
	reader.close();
	reader.close();
	AK_ASSERT(collect(std::move(it)).size() == 2);
	assert_throws<value_error>([&] { reader.iterate(); }, "iterate on a closed reader");

	// Without an index only sequential access is possible
	const string moved_idx = aln + ".elsewhere";
	AK_ASSERT(rename_file(idx, moved_idx));
	{
		alignment_reader bare(aln);
		AK_ASSERT(bare.is_binary() && !bare.has_index());
		AK_ASSERT(collect(bare.iterate()).size() == 10);
		assert_throws<query_unsupported_error>([&] { bare.query_overlapping("chr1", 1, 0); }, "query without index");
		assert_throws<query_unsupported_error>([&] { bare.query_unmapped(); }, "unmapped query without index");
		assert_throws<query_unsupported_error>([&] { bare.query_mate(r1); }, "mate lookup without index");

		alignment_reader explicit_idx(aln, moved_idx);
		AK_ASSERT(explicit_idx.has_index());
		AK_ASSERT(collect(explicit_idx.query_overlapping("chr2", 1, 0)).size() == 1);
	}

	alignment_reader text(coord_sam);
	AK_ASSERT(!text.is_binary() && !text.has_index());
	assert_throws<query_unsupported_error>([&] { text.query_overlapping("chr1", 1, 0); }, "query on SAM text");
	assert_throws<value_error>([] { alignment_reader reader(coord_sam, "tests/data/coord.sam.idx"); }, "index for SAM text");

	// Building from records out of coordinate order fails and leaves nothing behind
	const string bad_aln = scratch_file("alignkit_test.", ".aln");
	const string bad_idx = default_index_path(bad_aln);
	assert_throws<sort_order_error>([&] {
		alignment_reader qnames(qname_sam);
		build_aln(qnames.iterate(), qnames.header(), bad_aln, bad_idx);
	}, "building from queryname-sorted records");
	AK_ASSERT(!is_file(bad_aln) && !is_file(bad_idx));

	// A supplementary copy of the mate at the mate position is a second candidate
	{
		const string supp_aln = scratch_file("alignkit_test.", ".aln");
		const string supp_idx = default_index_path(supp_aln);
		auto q1 = make_record("q", sam_flag::paired | sam_flag::first, 0, 10);
		q1.mate_ref_index = 0;
		q1.mate_pos       = 100;
		auto q2 = make_record("q", sam_flag::paired | sam_flag::second, 0, 100);
		q2.mate_ref_index = 0;
		q2.mate_pos       = 10;
		auto q2_supp = q2;
		q2_supp.flag |= sam_flag::supplementary;
		vector<align_record_t> recs = { q1, q2, q2_supp };
		build_aln(make_unique<vector_iterator<align_record_t>>(recs), alignment_reader(coord_sam).header(), supp_aln, supp_idx);

		alignment_reader supp(supp_aln);
		assert_throws<ambiguous_mate_error>([&] { supp.query_mate(q1); }, "mate lookup with a supplementary copy");
		auto first = supp.query_mate(q2);
		AK_ASSERT(first && first->pos == 10 && first->is_first());
		supp.close();
		remove_file(supp_aln);
		remove_file(supp_idx);
	}

	remove_file(aln);
	remove_file(moved_idx);
	println("OK");
}

void fixmate_test()
{
	print("fixmate_test ... ");

	// Queryname-sorted input, queryname-sorted output
	const string out_path = scratch_file("alignkit_test.", ".sam");
	fixmate_options options;
	options.inputs = { qname_sam };
	options.output = out_path;
	auto counters  = fix_mate_information(options);
	AK_ASSERT(counters.records == 10 && counters.pairs_fixed == 4);
	AK_ASSERT(counters.orphans == 1 && counters.passed_through == 1);

	alignment_reader out_reader(out_path);
	AK_ASSERT(out_reader.header().sort_order() == sort_order_t::queryname);
	AK_ASSERT(out_reader.header().other_lines().size() == 1);
	auto fixed = collect(out_reader.iterate());
	out_reader.close();
	AK_ASSERT(fixed.size() == 10);

	const auto& a1 = find_read(fixed, "a", sam_flag::first);
	const auto& a2 = find_read(fixed, "a", sam_flag::second);
	AK_ASSERT(a1.flag == 99 && a2.flag == 147);
	AK_ASSERT(a1.mate_ref_index == 0 && a1.mate_pos == 300 && a2.mate_pos == 100);
	AK_ASSERT(a1.tlen == 210 && a2.tlen == -210);
	AK_ASSERT(a1.get_tag("MQ") == "50" && a2.get_tag("MQ") == "60" && a1.get_tag("RG") == "lane1");

	const auto& b1 = find_read(fixed, "b", sam_flag::first);
	const auto& b2 = find_read(fixed, "b", sam_flag::second);
	AK_ASSERT(b1.is_mate_unmapped() && b1.mate_ref_index == 0 && b1.mate_pos == 500 && !b1.has_tag("MQ"));
	AK_ASSERT(b2.is_unmapped() && b2.ref_index == 0 && b2.pos == 500 && !b2.is_mate_unmapped());
	AK_ASSERT(b2.mate_ref_index == 0 && b2.mate_pos == 500 && b2.get_tag("MQ") == "40");

	const auto& c = find_read(fixed, "c", sam_flag::first);
	AK_ASSERT(c.flag == 65 && c.mate_ref_index == 0 && c.mate_pos == 1 && !c.has_tag("MQ"));

	const auto& d1 = find_read(fixed, "d", sam_flag::first);
	const auto& d2 = find_read(fixed, "d", sam_flag::second);
	AK_ASSERT(d1.mate_ref_index == 1 && d1.mate_pos == 200 && d1.tlen == 0);
	AK_ASSERT(d2.mate_ref_index == 0 && d2.mate_pos == 1000 && d2.tlen == 0);
	AK_ASSERT(!d2.is_proper_pair() && d2.flag == 129);

	const auto& e1 = find_read(fixed, "e", sam_flag::first);
	const auto& e2 = find_read(fixed, "e", sam_flag::second);
	for (const auto* e : { &e1, &e2 }) {
		AK_ASSERT(e->ref_index == no_ref_index && e->pos == 0);
		AK_ASSERT(e->mate_ref_index == no_ref_index && e->mate_pos == 0 && e->is_mate_unmapped() && e->tlen == 0);
	}

	// Two queryname-sorted inputs are merged
	options.inputs = { qname_sam, qname_extra_sam };
	counters       = fix_mate_information(options);
	AK_ASSERT(counters.records == 12 && counters.pairs_fixed == 5);
	auto merged = read_all(out_path);
	AK_ASSERT(merged.back().qname == "f" && merged.back().get_tag("MQ") == "60");

	// Coordinate-sorted input is sorted by name through spilled runs, then re-sorted
	const string sort_dir = default_tmp_dir();
	options.inputs             = { coord_sam };
	options.max_records_in_ram = 3;
	options.tmp_dir            = sort_dir;
	counters = fix_mate_information(options);
	AK_ASSERT(counters.records == 10 && counters.pairs_fixed == 4 && counters.orphans == 2);
	{
		alignment_reader reader(out_path);
		AK_ASSERT(reader.header().sort_order() == sort_order_t::coordinate);
		auto recs = collect(assert_sorted(reader.iterate(), sort_order_t::coordinate));
		AK_ASSERT(recs.size() == 10);
		const auto& r2 = find_read(recs, "r2", sam_flag::second);
		AK_ASSERT(r2.mate_ref_index == 0 && r2.mate_pos == 150 && r2.tlen == 0 && r2.get_tag("MQ") == "30");
	}

	// An explicit output order overrides the input's
	options.sort_order = sort_order_t::queryname;
	fix_mate_information(options);
	AK_ASSERT(collect(assert_sorted(alignment_reader(out_path).iterate(), sort_order_t::queryname)).size() == 10);
	options.sort_order.reset();
	options.max_records_in_ram = default_max_records_in_ram;

	// ALN input
	const string aln = scratch_file("alignkit_test.", ".aln");
	{
		alignment_reader reader(coord_sam);
		build_aln(reader.iterate(), reader.header(), aln, default_index_path(aln));
	}
	options.inputs = { aln };
	counters       = fix_mate_information(options);
	AK_ASSERT(counters.pairs_fixed == 4);

	options.output.clear();
	assert_throws<value_error>([&] { fix_mate_information(options); }, "fixing an ALN file in place");

	options.inputs = { qname_sam, qname_extra_sam };
	assert_throws<value_error>([&] { fix_mate_information(options); }, "in place with two inputs");

	options.output = out_path;
	options.inputs = { coord_sam, other_dict_sam };
	assert_throws<value_error>([&] { fix_mate_information(options); }, "inputs with different dictionaries");

	options.inputs.clear();
	assert_throws<value_error>([&] { fix_mate_information(options); }, "no inputs");

	// In place: the input is replaced and nothing is left beside it
	const string in_place = scratch_file("alignkit_test.", ".sam");
	copy_file(qname_sam, in_place);
	options.inputs = { in_place };
	options.output.clear();
	counters = fix_mate_information(options);
	AK_ASSERT(counters.pairs_fixed == 4);
	AK_ASSERT(!is_file(in_place + ".old"));
	auto replaced = read_all(in_place);
	AK_ASSERT(replaced.size() == 10 && find_read(replaced, "a", sam_flag::first).tlen == 210);

	// A failed in-place fix leaves the input untouched
	const string broken = scratch_file("alignkit_test.", ".sam");
	copy_file(malformed_sam, broken);
	const string before = read_file_prefix(broken, 1 << 20);
	options.inputs      = { broken };
	assert_throws<format_error>([&] { fix_mate_information(options); }, "in-place fix of a malformed file");
	AK_ASSERT(read_file_prefix(broken, 1 << 20) == before);
	AK_ASSERT(!is_file(broken + ".old"));

	remove_file(broken);
	remove_file(in_place);
	remove_file(aln);
	remove_file(default_index_path(aln));
	remove_file(out_path);
	println("OK");
}

int main(int argc, char* argv[])
{
	try {
		setenv("ALIGNKIT_QUIET", "1", 1);
		srand(18);

		stopwatch_t t;
		t.tic();
		optimize_intervals_test();
		record_test();
		header_test();
		compare_test();
		sam_codec_test();
		classify_test();
		assert_sorted_test();
		sorting_collection_test();
		iterator_test();
		mate_fixer_test();
		indexed_reader_test();
		fixmate_test();
		t.toc();
		println("All tests passed in {:.03f} sec", t.duration());

	} catch (const std::exception& e) {
		print_exception_chain(e);
		return -1;
	}
	return 0;
}

#endif // _WANT_MAIN
