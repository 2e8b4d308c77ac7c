/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "align_record.h"

#include "ak_assert.h"
#include "strutil.h"
#include "util.h"

using namespace std;

BEGIN_NAMESPACE_AK

//////////////////////////////////////////////////////////////////////
// CIGAR reference length
//
//      consumes query  consumes reference  description
//  M       yes             yes             alignment match (sequence match or mismatch)
//  I       yes             no              insertion to reference
//  D       no              yes             deletion from reference
//  N       no              yes             skipped region from reference
//  S       yes             no              soft clipping (clipped sequence in SEQ)
//  H       no              no              hard clipping
//  P       no              no              padding
//  =       yes             yes             sequence match
//  X       yes             yes             sequence mismatch
//
//////////////////////////////////////////////////////////////////////
int cigar_ref_length(string_view cigar)
{
	if (cigar == "*" || empty(cigar))
		return 0;

	int ref_len = 0;
	while (!empty(cigar)) {
		auto op = cigar.find_first_not_of("0123456789");
		AK_CHECK(op != string_view::npos && op > 0, format, "Malformed CIGAR string '{}'", cigar);
		int len = as_int(cigar.substr(0, op));
		switch (cigar[op]) {
		case 'M': case 'D': case 'N': case '=': case 'X':
			ref_len += len;
			break;
		case 'I': case 'S': case 'H': case 'P':
			break;
		default:
			AK_THROW(format, "Unrecognized code '{}' in CIGAR string", cigar[op]);
		}
		cigar.remove_prefix(op + 1);
	}
	return ref_len;
}

pos_t align_record_t::alignment_end() const
{
	if (is_unmapped())
		return pos;
	int ref_len = cigar_ref_length(cigar);
	return ref_len > 0 ? pos + ref_len - 1 : pos;
}

//////////////////////////////////////////////////////////////////////

static INLINE bool tag_matches(string_view tag, string_view key)
{
	return size(tag) >= 5 && tag[2] == ':' && tag.substr(0, 2) == key;
}

string_view align_record_t::get_tag(string_view key) const
{
	for (const auto& tag : tags)
		if (tag_matches(tag, key))
			return string_view(tag).substr(5);
	return {};
}

bool align_record_t::has_tag(string_view key) const
{
	return any_of(begin(tags), end(tags), [key](const string& tag) { return tag_matches(tag, key); });
}

void align_record_t::set_tag(string_view key, char type, string_view value)
{
	AK_CHECK(size(key) == 2, value, "SAM tag key must have two characters, not '{}'", key);
	auto text = fmt::format("{}:{}:{}", key, type, value);
	for (auto& tag : tags) {
		if (tag_matches(tag, key)) {
			tag = std::move(text);
			return;
		}
	}
	tags.push_back(std::move(text));
}

void align_record_t::set_int_tag(string_view key, long long value)
{
	set_tag(key, 'i', fmt::format("{}", value));
}

bool align_record_t::remove_tag(string_view key)
{
	auto it = find_if(begin(tags), end(tags), [key](const string& tag) { return tag_matches(tag, key); });
	if (it == end(tags))
		return false;
	tags.erase(it);
	return true;
}

string align_record_t::as_str() const
{
	return fmt::format("{} flag={} {}:{}", qname, flag, ref_index, pos);
}

//////////////////////////////////////////////////////////////////////

void encode_record(binary_file& out, const align_record_t& rec)
{
	out.write_str(rec.qname);
	out.write(rec.flag);
	out.write(rec.ref_index);
	out.write(rec.pos);
	out.write(rec.mapq);
	out.write_str(rec.cigar);
	out.write(rec.mate_ref_index);
	out.write(rec.mate_pos);
	out.write(rec.tlen);
	out.write_str(rec.seq);
	out.write_str(rec.qual);
	out.write(int_cast<uint16_t>(rec.tags.size()));
	for (const auto& tag : rec.tags)
		out.write_str(tag);
}

END_NAMESPACE_AK
