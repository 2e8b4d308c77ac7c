/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "sam_io.h"

#include "ak_assert.h"
#include "strutil.h"
#include "util.h"
#include <cerrno>
#include <cstring>
#include <exception>
#include <fmt/format.h>
#include <iterator>

using namespace std;

BEGIN_NAMESPACE_AK

const char* stringency_name(validation_stringency stringency)
{
	switch (stringency) {
	case validation_stringency::strict:  return "strict";
	case validation_stringency::lenient: return "lenient";
	case validation_stringency::silent:  return "silent";
	}
	AK_UNREACHABLE();
}

///////////////////////////////////////////////////////////////
// PARSE SAM RECORD
//
// The mandatory SAM fields are
// [0] QNAME
// [1] FLAG
// [2] RNAME
// [3] POS (1-based, leftmost mapping; 0 if none)
// [4] MAPQ
// [5] CIGAR
// [6] RNEXT ('=' for same as RNAME)
// [7] PNEXT
// [8] TLEN
// [9] SEQ
// [10] QUAL
// followed by any number of optional TAG:TYPE:VALUE fields.
///////////////////////////////////////////////////////////////

static constexpr int num_mandatory_cols = 11;

static int as_column_int(string_view s, const char* column)
{
	try {
		return as_int(s);
	} catch (const value_error&) {
		AK_THROW(format, "Invalid {} column '{}'", column, s);
	}
}

static refidx_t as_ref_index(string_view name, const sequence_dictionary& dict)
{
	if (name == "*")
		return no_ref_index;
	refidx_t index = dict.index_of(name);
	AK_CHECK(index != no_ref_index, format, "Reference '{}' is not in the sequence dictionary", name);
	return index;
}

void parse_sam_record(string_view line, const sequence_dictionary& dict, align_record_t& rec)
{
	vector<string_view> cols;
	split_view(line, '\t', cols);
	AK_CHECK(int_cast<int>(cols.size()) >= num_mandatory_cols, format, "Expected at least {} tab-separated columns but found {}",
			 num_mandatory_cols, cols.size());

	AK_CHECK(!cols[0].empty(), format, "Empty QNAME column");
	rec.qname = cols[0];

	int flag = as_column_int(cols[1], "FLAG");
	AK_CHECK(flag >= 0 && flag <= 0xffff, format, "FLAG {} out of range", flag);
	rec.flag = scast<uint16_t>(flag);

	rec.ref_index = as_ref_index(cols[2], dict);
	rec.pos       = as_column_int(cols[3], "POS");
	AK_CHECK(rec.pos >= 0, format, "Negative POS {}", rec.pos);

	int mapq = as_column_int(cols[4], "MAPQ");
	AK_CHECK(mapq >= 0 && mapq <= 255, format, "MAPQ {} out of range", mapq);
	rec.mapq = scast<uint8_t>(mapq);

	rec.cigar = cols[5];
	cigar_ref_length(rec.cigar);  // throws on a malformed CIGAR

	rec.mate_ref_index = cols[6] == "=" ? rec.ref_index : as_ref_index(cols[6], dict);
	rec.mate_pos       = as_column_int(cols[7], "PNEXT");
	AK_CHECK(rec.mate_pos >= 0, format, "Negative PNEXT {}", rec.mate_pos);
	rec.tlen = as_column_int(cols[8], "TLEN");
	rec.seq  = cols[9];
	rec.qual = cols[10];

	rec.tags.clear();
	for (size_t i = num_mandatory_cols; i < cols.size(); ++i) {
		auto tag = cols[i];
		AK_CHECK(size(tag) >= 5 && tag[2] == ':' && tag[4] == ':', format, "Malformed tag field '{}'", tag);
		rec.tags.emplace_back(tag);
	}
}

void format_sam_record(const align_record_t& rec, const sequence_dictionary& dict, string& out)
{
	string_view rnext = rec.mate_ref_index != no_ref_index && rec.mate_ref_index == rec.ref_index
						  ? string_view("=")
						  : dict.name_of(rec.mate_ref_index);
	fmt::format_to(back_inserter(out), "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}", rec.qname, rec.flag,
				   dict.name_of(rec.ref_index), rec.pos, scast<int>(rec.mapq), rec.cigar, rnext, rec.mate_pos, rec.tlen,
				   rec.seq, rec.qual);
	for (const auto& tag : rec.tags) {
		out += '\t';
		out += tag;
	}
	out += '\n';
}

sam_header read_sam_header(const string& path)
{
	sam_header header;
	try {
		for (zline_reader lr(path); !lr.done(); ++lr) {
			auto line = lr.line();
			if (!startswith(line, "@"))
				break;
			header.add_line(line);
		}
	}
	AK_RETHROW("In header of SAM file {}", path);
	return header;
}

///////////////////////////////////////////////////////////////

sam_text_iterator::sam_text_iterator(const string& path, std::shared_ptr<const sam_header> header,
									 validation_stringency stringency)
: _path(path), _lines(make_unique<zline_reader>(path)), _header(std::move(header)), _stringency(stringency)
{
}

bool sam_text_iterator::next(align_record_t& rec)
{
	while (_lines && !_lines->done()) {
		auto line     = _lines->line();
		auto line_num = _lines->line_num();
		if (line.empty() || line[0] == '@') {
			++*_lines;
			continue;
		}
		try {
			parse_sam_record(line, _header->dict(), rec);
		} catch (const format_error& e) {
			if (_stringency == validation_stringency::strict)
				std::throw_with_nested(AK_MAKE_ERROR(format, "In SAM file {}:{}", _path, line_num));
			if (_stringency == validation_stringency::lenient)
				warn("Skipping malformed record at {}:{}: {}", _path, line_num, e.what());
			++_num_skipped;
			++*_lines;
			continue;
		}
		++*_lines;
		return true;
	}
	return false;
}

void sam_text_iterator::close()
{
	_lines.reset();
}

///////////////////////////////////////////////////////////////

sam_writer::sam_writer(const string& path, const sam_header& header)
: _path(path), _dict(header.dict())
{
	_fh = path != stdin_path ? unique_file{ std::fopen(path.c_str(), "wb"), &std::fclose }
							 : unique_file{ stdout, [](auto) { return 0; } };
	AK_CHECK(_fh, file, "Could not open {} for writing ({}).", path, strerror(errno));
	_buf = header.as_str();
}

void sam_writer::add_record(const align_record_t& rec)
{
	AK_CHECK(_fh, value, "Cannot add records to closed SAM writer for {}", _path);
	format_sam_record(rec, _dict, _buf);
	++_num_written;
	if (_buf.size() >= (1 << 16))
		flush_buffer();
}

void sam_writer::flush_buffer()
{
	if (_buf.empty())
		return;
	size_t n = std::fwrite(_buf.data(), 1, _buf.size(), _fh.get());
	AK_CHECK(n == _buf.size(), file, "Error writing to {} ({}).", _path, strerror(errno));
	_buf.clear();
}

void sam_writer::close()
{
	if (!_fh)
		return;
	flush_buffer();
	AK_CHECK(std::fflush(_fh.get()) == 0, file, "Error flushing {} ({}).", _path, strerror(errno));
	std::FILE* fh = _fh.release();
	if (fh != stdout)
		AK_CHECK(std::fclose(fh) == 0, file, "Error closing {} ({}).", _path, strerror(errno));
}

END_NAMESPACE_AK
