/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_ALN_FILE_H__
#define __ALIGN_KIT_ALN_FILE_H__

#include "align_record.h"
#include "file.h"
#include "interval.h"
#include "record_iterator.h"
#include "sam_header.h"
#include "util.h"
#include <memory>
#include <string>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::vector;

extern const unsigned short c_aln_sig;
extern const unsigned short c_aln_ver;
extern const unsigned short c_alnidx_sig;
extern const unsigned short c_alnidx_ver;

// Index path used when none is given: "<aln_path>.idx".
string default_index_path(const string& aln_path);

/////////////////////////////////////////////////////////////////
// ALN file layout
//
//   u16  signature (c_aln_sig)
//   u16  version
//   str  SAM header text
//   u64  number of records
//   ...  records, encoded back to back in coordinate order
//   u32  checkpoint
//
// ALN.IDX file layout
//
//   u16  signature (c_alnidx_sig)
//   u16  version
//   u32  number of references
//   for each reference:
//     u32  number of blocks
//     for each block: u64 byte_begin, u64 byte_end, i32 min_start, i32 max_end
//   u64  unmapped byte_begin, u64 unmapped byte_end
//   u32  checkpoint
//
// A block is a run of consecutive records of one reference. Its
// [min_start, max_end] covers every record in it, so a lookup may
// return blocks that hold no matching record but never misses one.
/////////////////////////////////////////////////////////////////

struct byte_span_t {
	uint64_t begin{};
	uint64_t end{};

	INLINE bool empty() const { return begin >= end; }
};

INLINE bool operator==(const byte_span_t& a, const byte_span_t& b) { return a.begin == b.begin && a.end == b.end; }

struct aln_block_t {
	byte_span_t span;
	pos_t       min_start{};
	pos_t       max_end{};
};

struct index_options {
	int block_records{ 256 };  // Records per block; smaller blocks give tighter lookups and a larger index
	long long progress_interval{ default_progress_interval };
};

/////////////////////////////////////////////////////////////////
// aln_index
/////////////////////////////////////////////////////////////////

class aln_index {
public:
	void open(const string& path);

	INLINE const string& path()     const { return _path; }
	INLINE size_t        num_refs() const { return _blocks.size(); }

	// Byte spans of every block on the interval's reference that may hold
	// a record overlapping it, in file order.
	vector<byte_span_t> lookup_spans(const query_interval_t& interval) const;

	// Byte span of the records that are placed on no reference.
	vector<byte_span_t> lookup_unmapped_spans() const;

private:
	string                      _path;
	vector<vector<aln_block_t>> _blocks;  // [ref_index][block]
	byte_span_t                 _unmapped;
};

/////////////////////////////////////////////////////////////////
// aln_file
//
// Read side of an ALN file. The file is memory-mapped; records are
// decoded straight out of the mapping by aln_span_iterator.
/////////////////////////////////////////////////////////////////

class aln_file {
public:
	void open(const string& path);
	void close();

	INLINE bool              is_open()     const { return _fmap && _fmap->is_open(); }
	INLINE const string&     path()        const { return _path; }
	INLINE const sam_header& header()      const { return _header; }
	INLINE uint64_t          num_records() const { return _num_records; }

	// Span of the whole record section.
	INLINE byte_span_t all_records() const { return { _data_begin, _data_end }; }

	// Decodes every record in `spans`, which must be ascending and disjoint.
	record_iterator_ptr decode(vector<byte_span_t> spans) const;

private:
	string                     _path;
	std::shared_ptr<mmap_file> _fmap;
	sam_header                 _header;
	uint64_t                   _num_records{};
	uint64_t                   _data_begin{};
	uint64_t                   _data_end{};
};

// Decodes records sequentially out of a list of byte spans of a mapped ALN file.
// Holds its own reference to the mapping, so it stays valid after the
// aln_file that created it is closed.
class aln_span_iterator : public record_iterator {
public:
	aln_span_iterator(std::shared_ptr<mmap_file> fmap, vector<byte_span_t> spans);

	bool next(align_record_t& rec) override;
	void close() override;

private:
	std::shared_ptr<mmap_file> _fmap;
	vector<byte_span_t>        _spans;
	size_t                     _curr{};
	uint64_t                   _offset{};  // next record within _spans[_curr]
};

/////////////////////////////////////////////////////////////////
// build_aln
//
// Writes the records of a coordinate-sorted stream to an ALN file and
// its index. Records out of coordinate order raise sort_order_error.
// Returns the number of records written.
/////////////////////////////////////////////////////////////////

long long build_aln(record_iterator_ptr records, const sam_header& header, const string& aln_path,
					const string& index_path, const index_options& options = {});

END_NAMESPACE_AK

#endif // __ALIGN_KIT_ALN_FILE_H__
