/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_ALIGNMENT_READER_H__
#define __ALIGN_KIT_ALIGNMENT_READER_H__

#include "align_record.h"
#include "aln_file.h"
#include "interval.h"
#include "record_iterator.h"
#include "sam_header.h"
#include "sam_io.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::string_view;
using std::vector;

enum class source_format : uint8_t { text, indexed_binary };

// Decides from the leading bytes whether `path` is SAM text (plain or
// gzipped) or an ALN file. Throws unrecognized_format_error otherwise.
source_format classify(const string& path);

struct reader_options {
	validation_stringency stringency{ default_validation_stringency };
};

// Ascending, disjoint union of the given byte spans.
vector<byte_span_t> merge_spans(vector<byte_span_t> spans);

/////////////////////////////////////////////////////////////////
// alignment_reader
//
// Uniform sequential and indexed access to an alignment file. The
// representation is chosen once, when the file is opened:
//
//   text_source    SAM text; sequential iteration only
//   binary_source  ALN file; indexed queries too when an index is present
//
// A reader hands out at most one live iterator at a time. Asking for
// another while one is live throws resource_busy_error; closing or
// destroying the live iterator makes the reader idle again.
/////////////////////////////////////////////////////////////////

class alignment_reader {
public:
	alignment_reader() = default;
	explicit alignment_reader(const string& path, const string& index_path = {}, const reader_options& options = {});
	NOCOPY(alignment_reader)

	// An empty index_path looks for "<path>.idx" beside an ALN file.
	void open(const string& path, const string& index_path = {}, const reader_options& options = {});
	void close();

	INLINE bool                  is_open() const { return !std::holds_alternative<std::monostate>(_source); }
	INLINE bool                  is_binary() const { return std::holds_alternative<binary_source>(_source); }
	bool                         has_index() const;
	INLINE bool                  is_iterating() const { return _state && *_state == reader_state::iterating; }
	INLINE const string&         path() const { return _path; }
	INLINE const reader_options& options() const { return _options; }
	const sam_header&            header() const;

	// Every record, in file order.
	record_iterator_ptr iterate();

	// Records overlapping (or, if contained, lying entirely within) any of
	// the intervals, in file order, each record at most once.
	record_iterator_ptr query(const vector<query_interval_t>& intervals, bool contained);
	record_iterator_ptr query_overlapping(string_view ref_name, pos_t start, pos_t end);
	record_iterator_ptr query_contained(string_view ref_name, pos_t start, pos_t end);

	// Records placed on no reference.
	record_iterator_ptr query_unmapped();

	// Records whose alignment starts exactly at `start` on the reference.
	record_iterator_ptr query_alignment_start(string_view ref_name, pos_t start);
	record_iterator_ptr query_alignment_start(refidx_t ref_index, pos_t start);

	// Interval on the named reference. Throws value_error for an unknown
	// name or a start before 1.
	query_interval_t make_query_interval(string_view ref_name, pos_t start, pos_t end = 0) const;

	// The mate of a paired record, looked up with an iteration of its own,
	// so it can be called while another iterator is live. Returns nullopt
	// when the mate is not in the file; throws ambiguous_mate_error when
	// more than one record at the mate position has the read's name and
	// the opposite of-pair flag, secondary and supplementary copies included.
	std::optional<align_record_t> query_mate(const align_record_t& rec);

private:
	enum class reader_state : uint8_t { idle, iterating };

	struct text_source {
		string path;
	};

	struct binary_source {
		aln_file                 file;
		std::optional<aln_index> index;
	};

	const binary_source& require_index(const char* operation) const;
	void                 require_idle() const;
	record_iterator_ptr  lease(record_iterator_ptr it);

	record_iterator_ptr open_query(const vector<query_interval_t>& intervals, bool contained) const;
	record_iterator_ptr open_unmapped() const;
	record_iterator_ptr open_alignment_start(refidx_t ref_index, pos_t start) const;

	string                                                   _path;
	reader_options                                           _options;
	std::shared_ptr<const sam_header>                        _header;
	std::variant<std::monostate, text_source, binary_source> _source;
	std::shared_ptr<reader_state>                            _state;
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_ALIGNMENT_READER_H__
