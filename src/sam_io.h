/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_SAM_IO_H__
#define __ALIGN_KIT_SAM_IO_H__

#include "align_record.h"
#include "file.h"
#include "record_iterator.h"
#include "sam_header.h"
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

BEGIN_NAMESPACE_AK
using std::string;
using std::string_view;

// How a reader treats a malformed record: strict throws format_error,
// lenient warns and skips it, silent just skips it.
enum class validation_stringency : uint8_t { strict, lenient, silent };

constexpr validation_stringency default_validation_stringency = validation_stringency::strict;

const char* stringency_name(validation_stringency stringency);

/////////////////////////////////////////////////////////////////
// SAM text records
/////////////////////////////////////////////////////////////////

// Parses one record line. Reference names are resolved through `dict`.
// Throws format_error if the line is not a well-formed record.
void parse_sam_record(string_view line, const sequence_dictionary& dict, align_record_t& rec);

// Appends the record as one SAM line, including the trailing newline.
void format_sam_record(const align_record_t& rec, const sequence_dictionary& dict, string& out);

// Reads the leading '@' lines of a plain or gzipped SAM file.
sam_header read_sam_header(const string& path);

/////////////////////////////////////////////////////////////////
// sam_text_iterator
//
// Sequential scan over the records of a plain or gzipped SAM file.
// Header lines are skipped. Malformed record lines are handled
// according to the validation stringency.
/////////////////////////////////////////////////////////////////

class sam_text_iterator : public record_iterator {
public:
	sam_text_iterator(const string& path, std::shared_ptr<const sam_header> header, validation_stringency stringency);

	bool next(align_record_t& rec) override;
	void close() override;

	INLINE long long num_skipped() const { return _num_skipped; }

private:
	string                            _path;
	std::unique_ptr<zline_reader>     _lines;
	std::shared_ptr<const sam_header> _header;
	validation_stringency             _stringency;
	long long                         _num_skipped{};
};

/////////////////////////////////////////////////////////////////
// sam_writer
//
// Writes a header followed by one SAM text line per record.
// The path "-" writes to stdout.
/////////////////////////////////////////////////////////////////

class sam_writer : public record_sink {
public:
	sam_writer(const string& path, const sam_header& header);

	void add_record(const align_record_t& rec) override;
	void close() override;

	INLINE long long num_written() const { return _num_written; }

private:
	void flush_buffer();

	using unique_file = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

	string              _path;
	unique_file         _fh{ nullptr, [](auto) { return 0; } };
	sequence_dictionary _dict;
	string              _buf;
	long long           _num_written{};
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_SAM_IO_H__
