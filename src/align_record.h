/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_ALIGN_RECORD_H__
#define __ALIGN_KIT_ALIGN_RECORD_H__

#include "defines.h"
#include "file.h"
#include "interval.h"
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::string_view;
using std::vector;

// SAM FLAG column bits
namespace sam_flag {
	constexpr uint16_t paired        = 0x001;
	constexpr uint16_t proper_pair   = 0x002;
	constexpr uint16_t unmapped      = 0x004;
	constexpr uint16_t mate_unmapped = 0x008;
	constexpr uint16_t reverse       = 0x010;
	constexpr uint16_t mate_reverse  = 0x020;
	constexpr uint16_t first         = 0x040;
	constexpr uint16_t second        = 0x080;
	constexpr uint16_t secondary     = 0x100;
	constexpr uint16_t qc_fail       = 0x200;
	constexpr uint16_t duplicate     = 0x400;
	constexpr uint16_t supplementary = 0x800;
}

/////////////////////////////////////////////////////////////////
// align_record_t
//
// One alignment record with all eleven mandatory SAM columns and the
// optional tags. Tags are kept in their SAM text form "KK:T:value",
// since nothing but MQ is ever inspected or rewritten.
/////////////////////////////////////////////////////////////////

struct align_record_t {
	string         qname;
	uint16_t       flag{};
	refidx_t       ref_index{no_ref_index};
	pos_t          pos{no_alignment_start};
	uint8_t        mapq{};
	string         cigar{"*"};
	refidx_t       mate_ref_index{no_ref_index};
	pos_t          mate_pos{no_alignment_start};
	int32_t        tlen{};
	string         seq{"*"};
	string         qual{"*"};
	vector<string> tags;

	INLINE bool has_flag(uint16_t bits) const { return (flag & bits) != 0; }
	INLINE void set_flag(uint16_t bits, bool on) { flag = on ? scast<uint16_t>(flag | bits) : scast<uint16_t>(flag & ~bits); }

	INLINE bool is_paired()        const { return has_flag(sam_flag::paired); }
	INLINE bool is_proper_pair()   const { return has_flag(sam_flag::proper_pair); }
	INLINE bool is_unmapped()      const { return has_flag(sam_flag::unmapped); }
	INLINE bool is_mate_unmapped() const { return has_flag(sam_flag::mate_unmapped); }
	INLINE bool is_reverse()       const { return has_flag(sam_flag::reverse); }
	INLINE bool is_mate_reverse()  const { return has_flag(sam_flag::mate_reverse); }
	INLINE bool is_first()         const { return has_flag(sam_flag::first); }
	INLINE bool is_second()        const { return has_flag(sam_flag::second); }
	INLINE bool is_secondary()     const { return has_flag(sam_flag::secondary); }
	INLINE bool is_supplementary() const { return has_flag(sam_flag::supplementary); }
	INLINE bool is_primary()       const { return !has_flag(sam_flag::secondary | sam_flag::supplementary); }

	// Last reference position covered by the alignment, from the CIGAR.
	// An unmapped or CIGAR-less record ends at its start.
	pos_t alignment_end() const;

	// Value part of tag `key`, or empty if the record has no such tag.
	string_view get_tag(string_view key) const;
	bool        has_tag(string_view key) const;
	void        set_tag(string_view key, char type, string_view value);
	void        set_int_tag(string_view key, long long value);
	bool        remove_tag(string_view key);

	// Short identity for error messages: "name flag=N ref:pos".
	string as_str() const;
};

// Number of reference bases consumed by a CIGAR string ("*" consumes none).
int cigar_ref_length(string_view cigar);

/////////////////////////////////////////////////////////////////
// Binary encoding
//
// Field-by-field little-endian image of a record, used both by the
// sort runs of sorting_collection and by the record blocks of an .aln
// file. Works with any source that provides read<T>() and read_str(),
// i.e. binary_file and mmap_file.
/////////////////////////////////////////////////////////////////

void encode_record(binary_file& out, const align_record_t& rec);

template <typename Src>
void decode_record(Src& in, align_record_t& rec)
{
	in.read_str(rec.qname);
	rec.flag           = in.template read<uint16_t>();
	rec.ref_index      = in.template read<int32_t>();
	rec.pos            = in.template read<int32_t>();
	rec.mapq           = in.template read<uint8_t>();
	in.read_str(rec.cigar);
	rec.mate_ref_index = in.template read<int32_t>();
	rec.mate_pos       = in.template read<int32_t>();
	rec.tlen           = in.template read<int32_t>();
	in.read_str(rec.seq);
	in.read_str(rec.qual);
	auto num_tags = in.template read<uint16_t>();
	rec.tags.resize(num_tags);
	for (auto& tag : rec.tags)
		in.read_str(tag);
}

END_NAMESPACE_AK

#endif // __ALIGN_KIT_ALIGN_RECORD_H__
