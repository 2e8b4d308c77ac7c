/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "sam_header.h"

#include "ak_assert.h"
#include "util.h"
#include <fmt/format.h>

using namespace std;

BEGIN_NAMESPACE_AK

static const char* const default_sam_version = "1.6";

const char* sort_order_name(sort_order_t order)
{
	switch (order) {
	case sort_order_t::unsorted:   return "unsorted";
	case sort_order_t::queryname:  return "queryname";
	case sort_order_t::coordinate: return "coordinate";
	}
	AK_UNREACHABLE();
}

sort_order_t as_sort_order(string_view name)
{
	if (name == "queryname")  return sort_order_t::queryname;
	if (name == "coordinate") return sort_order_t::coordinate;
	return sort_order_t::unsorted;
}

sort_order_t parse_sort_order(string_view name)
{
	AK_CHECK(name == "queryname" || name == "coordinate" || name == "unsorted", value,
			 "Unknown sort order '{}'; expected one of unsorted, queryname, coordinate", name);
	return as_sort_order(name);
}

///////////////////////////////////////////////////////////////

void sequence_dictionary::add(string name, pos_t length, string extra)
{
	AK_CHECK(!name.empty(), format, "Sequence dictionary entry without a name");
	AK_CHECK(_index.find(name) == _index.end(), format, "Sequence '{}' appears twice in the sequence dictionary", name);
	_index.emplace(name, int_cast<refidx_t>(_seqs.size()));
	_seqs.push_back({ std::move(name), length, std::move(extra) });
}

refidx_t sequence_dictionary::index_of(string_view name) const
{
	auto it = _index.find(name);
	return it != _index.end() ? it->second : no_ref_index;
}

string_view sequence_dictionary::name_of(refidx_t index) const
{
	if (index == no_ref_index)
		return "*";
	AK_CHECK(index >= 0 && index < int_cast<refidx_t>(_seqs.size()), value, "Reference index {} not in sequence dictionary of {} sequences",
			 index, _seqs.size());
	return _seqs[index].name;
}

bool sequence_dictionary::same_as(const sequence_dictionary& other) const
{
	if (size() != other.size())
		return false;
	for (size_t i = 0; i < size(); ++i)
		if (_seqs[i].name != other._seqs[i].name || _seqs[i].length != other._seqs[i].length)
			return false;
	return true;
}

///////////////////////////////////////////////////////////////

sam_header sam_header::parse(string_view text)
{
	sam_header header;
	while (!text.empty()) {
		auto nl   = text.find('\n');
		auto line = text.substr(0, nl);
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		if (!line.empty())
			header.add_line(line);
		if (nl == string_view::npos)
			break;
		text.remove_prefix(nl + 1);
	}
	return header;
}

void sam_header::add_line(string_view line)
{
	AK_CHECK(startswith(line, "@"), format, "Header line does not start with '@': {}", line);

	vector<string_view> fields;
	split_view(line, '\t', fields);

	if (fields[0] == "@HD") {
		_hd_extra.clear();
		for (size_t i = 1; i < fields.size(); ++i) {
			if (startswith(fields[i], "SO:"))
				_sort_order = as_sort_order(fields[i].substr(3));
			else if (startswith(fields[i], "VN:"))
				_version = fields[i].substr(3);
			else
				_hd_extra.emplace_back(fields[i]);
		}
	} else if (fields[0] == "@SQ") {
		string name;
		pos_t  length = 0;
		string extra;
		for (size_t i = 1; i < fields.size(); ++i) {
			if (startswith(fields[i], "SN:")) {
				name = fields[i].substr(3);
			} else if (startswith(fields[i], "LN:")) {
				length = as_int(fields[i].substr(3));
			} else {
				extra += '\t';
				extra += fields[i];
			}
		}
		AK_CHECK(!name.empty(), format, "@SQ line without SN field: {}", line);
		_dict.add(std::move(name), length, std::move(extra));
	} else {
		_other_lines.emplace_back(line);
	}
}

string sam_header::as_str() const
{
	string out = fmt::format("@HD\tVN:{}", _version.empty() ? default_sam_version : _version);
	for (const auto& field : _hd_extra) {
		out += '\t';
		out += field;
	}
	out += fmt::format("\tSO:{}\n", sort_order_name(_sort_order));
	for (const auto& seq : _dict.sequences())
		out += fmt::format("@SQ\tSN:{}\tLN:{}{}\n", seq.name, seq.length, seq.extra);
	for (const auto& line : _other_lines) {
		out += line;
		out += '\n';
	}
	return out;
}

END_NAMESPACE_AK
