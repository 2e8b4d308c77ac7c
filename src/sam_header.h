/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_SAM_HEADER_H__
#define __ALIGN_KIT_SAM_HEADER_H__

#include "defines.h"
#include "interval.h"
#include "strutil.h"
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::string_view;
using std::vector;

enum class sort_order_t : uint8_t { unsorted, queryname, coordinate };

const char* sort_order_name(sort_order_t order);

// Value of an @HD SO: field. Anything not recognized is unsorted.
sort_order_t as_sort_order(string_view name);

// Same, but an unknown name is an error. For user-supplied option values.
sort_order_t parse_sort_order(string_view name);

/////////////////////////////////////////////////////////////////
// sequence dictionary (@SQ lines)
/////////////////////////////////////////////////////////////////

struct sequence_record_t {
	string name;
	pos_t  length{};
	string extra;  // Remaining @SQ fields, verbatim, each preceded by a tab
};

class sequence_dictionary {
public:
	void add(string name, pos_t length, string extra = {});

	INLINE size_t size()  const { return _seqs.size(); }
	INLINE bool   empty() const { return _seqs.empty(); }
	INLINE const sequence_record_t& operator[](refidx_t i) const { return _seqs[i]; }
	INLINE const vector<sequence_record_t>& sequences() const { return _seqs; }

	// Index of the named sequence, or no_ref_index if it is not in the dictionary.
	refidx_t index_of(string_view name) const;

	// Name of the indexed sequence; "*" for no_ref_index.
	string_view name_of(refidx_t index) const;

	// Same sequence names and lengths in the same order.
	bool same_as(const sequence_dictionary& other) const;

private:
	vector<sequence_record_t>   _seqs;
	string_map<string, refidx_t> _index;
};

/////////////////////////////////////////////////////////////////
// sam_header
//
// Keeps the sort order and sequence dictionary in parsed form; every
// other header line (@RG, @PG, @CO, ...) is carried through verbatim.
/////////////////////////////////////////////////////////////////

class sam_header {
public:
	// Parses a whole header, one line per '\n'.
	static sam_header parse(string_view text);

	// Adds one header line (starting with '@').
	void add_line(string_view line);

	INLINE sort_order_t sort_order() const { return _sort_order; }
	INLINE void set_sort_order(sort_order_t order) { _sort_order = order; }

	INLINE const sequence_dictionary& dict() const { return _dict; }
	INLINE sequence_dictionary&       dict()       { return _dict; }

	INLINE const vector<string>& other_lines() const { return _other_lines; }

	// Header text with @HD first (SO reflecting sort_order()), then @SQ, then
	// all other lines in their original order. Every line ends with '\n'.
	string as_str() const;

private:
	sort_order_t        _sort_order{sort_order_t::unsorted};
	string              _version;
	vector<string>      _hd_extra;    // @HD fields other than VN and SO
	sequence_dictionary _dict;
	vector<string>      _other_lines;
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_SAM_HEADER_H__
