/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "alignment_reader.h"

#include "ak_assert.h"
#include "file.h"
#include "strutil.h"
#include <algorithm>
#include <cstring>
#include <functional>

using namespace std;

BEGIN_NAMESPACE_AK

source_format classify(const string& path)
{
	AK_CHECK(is_file(path), file, "Could not find alignment file {}", path);
	string prefix = read_file_prefix(path, 4096);

	if (prefix.empty())
		return source_format::text;
	if (prefix.size() >= 2 && scast<uint8_t>(prefix[0]) == 0x1f && scast<uint8_t>(prefix[1]) == 0x8b)
		return source_format::text;  // gzip
	if (prefix.size() >= sizeof(c_aln_sig)) {
		unsigned short sig;
		memcpy(&sig, prefix.data(), sizeof(sig));
		if (sig == c_aln_sig)
			return source_format::indexed_binary;
	}
	if (prefix[0] == '@')
		return source_format::text;

	auto line = string_view(prefix).substr(0, prefix.find('\n'));
	if (count(begin(line), end(line), '\t') >= 10)
		return source_format::text;

	AK_THROW(unrecognized_format, "Could not recognize {} as SAM text or an ALN file", path);
}

vector<byte_span_t> merge_spans(vector<byte_span_t> spans)
{
	vector<byte_span_t> merged;
	sort(begin(spans), end(spans), [](const byte_span_t& a, const byte_span_t& b) {
		return a.begin != b.begin ? a.begin < b.begin : a.end < b.end;
	});
	for (const auto& span : spans) {
		if (span.empty())
			continue;
		if (!merged.empty() && span.begin <= merged.back().end)
			merged.back().end = max(merged.back().end, span.end);
		else
			merged.push_back(span);
	}
	return merged;
}

/////////////////////////////////////////////////////////////////

namespace {

// Passes through only the records accepted by a predicate.
class filter_iterator : public record_iterator {
public:
	using predicate = function<bool(const align_record_t&)>;

	filter_iterator(record_iterator_ptr inner, predicate accept): _inner(std::move(inner)), _accept(std::move(accept)) { }

	bool next(align_record_t& rec) override
	{
		while (_inner->next(rec))
			if (_accept(rec))
				return true;
		return false;
	}
	void close() override { _inner->close(); }

private:
	record_iterator_ptr _inner;
	predicate           _accept;
};

// Holds the reader in the iterating state for as long as it is open.
template <typename State>
class leased_iterator : public record_iterator {
public:
	leased_iterator(record_iterator_ptr inner, shared_ptr<State> state, State idle)
	: _inner(std::move(inner)), _state(std::move(state)), _idle(idle)
	{
	}
	~leased_iterator() override { release(); }

	bool next(align_record_t& rec) override { return _inner && _inner->next(rec); }
	void close() override
	{
		if (_inner) {
			_inner->close();
			_inner.reset();
		}
		release();
	}

private:
	void release()
	{
		if (_state) {
			*_state = _idle;
			_state.reset();
		}
	}

	record_iterator_ptr _inner;
	shared_ptr<State>   _state;
	State               _idle;
};

}  // namespace

/////////////////////////////////////////////////////////////////

alignment_reader::alignment_reader(const string& path, const string& index_path, const reader_options& options)
{
	open(path, index_path, options);
}

void alignment_reader::open(const string& path, const string& index_path, const reader_options& options)
{
	AK_CHECK(!is_open(), value, "Reader for {} is already open", _path);

	try {
		if (classify(path) == source_format::text) {
			AK_CHECK(index_path.empty(), value, "Index {} given for SAM text file; only ALN files are indexed", index_path);
			_header = make_shared<const sam_header>(read_sam_header(path));
			_source = text_source{ path };
		} else {
			binary_source bin;
			bin.file.open(path);
			string idx_path = index_path.empty() ? default_index_path(path) : index_path;
			if (!index_path.empty() || is_file(idx_path)) {
				bin.index.emplace();
				bin.index->open(idx_path);
				AK_CHECK(bin.index->num_refs() == bin.file.header().dict().size(), file,
						 "Index {} covers {} references but the file has {}", idx_path, bin.index->num_refs(),
						 bin.file.header().dict().size());
			}
			_header = make_shared<const sam_header>(bin.file.header());
			_source = std::move(bin);
		}
	}
	AK_RETHROW("In alignment file {}", path);

	_path    = path;
	_options = options;
	_state   = make_shared<reader_state>(reader_state::idle);
}

void alignment_reader::close()
{
	// A live iterator keeps its own handles and its own lease on the old state
	_source = monostate{};
	_header.reset();
	_state.reset();
}

bool alignment_reader::has_index() const
{
	auto* bin = get_if<binary_source>(&_source);
	return bin && bin->index.has_value();
}

const sam_header& alignment_reader::header() const
{
	AK_CHECK(is_open(), value, "Reader is not open");
	return *_header;
}

void alignment_reader::require_idle() const
{
	AK_CHECK(is_open(), value, "Reader is not open");
	AK_CHECK(!is_iterating(), resource_busy,
			 "Reader for {} already has an open iterator; close it before starting another", _path);
}

const alignment_reader::binary_source& alignment_reader::require_index(const char* operation) const
{
	AK_CHECK(is_open(), value, "Reader is not open");
	auto* bin = get_if<binary_source>(&_source);
	AK_CHECK(bin && bin->index, query_unsupported, "Cannot {} on {}: it has no index", operation, _path);
	return *bin;
}

record_iterator_ptr alignment_reader::lease(record_iterator_ptr it)
{
	*_state = reader_state::iterating;
	return make_unique<leased_iterator<reader_state>>(std::move(it), _state, reader_state::idle);
}

/////////////////////////////////////////////////////////////////

record_iterator_ptr alignment_reader::iterate()
{
	require_idle();
	if (auto* text = get_if<text_source>(&_source))
		return lease(make_unique<sam_text_iterator>(text->path, _header, _options.stringency));
	const auto& bin = get<binary_source>(_source);
	return lease(bin.file.decode({ bin.file.all_records() }));
}

record_iterator_ptr alignment_reader::open_query(const vector<query_interval_t>& intervals, bool contained) const
{
	const auto& bin = require_index("query intervals");

	vector<byte_span_t> spans;
	for (const auto& interval : optimize_intervals(intervals)) {
		auto found = bin.index->lookup_spans(interval);
		spans.insert(end(spans), begin(found), end(found));
	}

	// Blocks over-approximate, so every record is tested against the
	// intervals as given, which matters for containment
	return make_unique<filter_iterator>(bin.file.decode(merge_spans(std::move(spans))),
										[intervals, contained](const align_record_t& rec) {
		if (rec.ref_index == no_ref_index)
			return false;
		auto last = rec.alignment_end();
		for (const auto& i : intervals)
			if (contained ? i.contains(rec.ref_index, rec.pos, last) : i.overlaps(rec.ref_index, rec.pos, last))
				return true;
		return false;
	});
}

record_iterator_ptr alignment_reader::open_unmapped() const
{
	const auto& bin = require_index("query unmapped reads");
	return bin.file.decode(bin.index->lookup_unmapped_spans());
}

record_iterator_ptr alignment_reader::open_alignment_start(refidx_t ref_index, pos_t start) const
{
	const auto& bin = require_index("query alignment start");
	query_interval_t point(ref_index, start, start);
	return make_unique<filter_iterator>(bin.file.decode(merge_spans(bin.index->lookup_spans(point))),
										[ref_index, start](const align_record_t& rec) {
		return rec.ref_index == ref_index && rec.pos == start;
	});
}

record_iterator_ptr alignment_reader::query(const vector<query_interval_t>& intervals, bool contained)
{
	require_idle();
	return lease(open_query(intervals, contained));
}

record_iterator_ptr alignment_reader::query_overlapping(string_view ref_name, pos_t start, pos_t end)
{
	return query({ make_query_interval(ref_name, start, end) }, false);
}

record_iterator_ptr alignment_reader::query_contained(string_view ref_name, pos_t start, pos_t end)
{
	return query({ make_query_interval(ref_name, start, end) }, true);
}

record_iterator_ptr alignment_reader::query_unmapped()
{
	require_idle();
	return lease(open_unmapped());
}

record_iterator_ptr alignment_reader::query_alignment_start(string_view ref_name, pos_t start)
{
	return query_alignment_start(make_query_interval(ref_name, start).ref_index, start);
}

record_iterator_ptr alignment_reader::query_alignment_start(refidx_t ref_index, pos_t start)
{
	require_idle();
	return lease(open_alignment_start(ref_index, start));
}

query_interval_t alignment_reader::make_query_interval(string_view ref_name, pos_t start, pos_t end) const
{
	refidx_t index = header().dict().index_of(ref_name);
	AK_CHECK(index != no_ref_index, value, "Unknown reference '{}' in query", ref_name);
	AK_CHECK(start >= 1, value, "Query start must be at least 1, not {}", start);
	AK_CHECK(end >= 0, value, "Query end must be 0 or positive, not {}", end);
	return query_interval_t(index, start, end);
}

/////////////////////////////////////////////////////////////////

std::optional<align_record_t> alignment_reader::query_mate(const align_record_t& rec)
{
	AK_CHECK(rec.is_paired(), value, "Cannot look up the mate of unpaired read {}", rec.qname);
	AK_CHECK(rec.is_first() != rec.is_second(), value,
			 "Read {} must be exactly one of first or second of pair to look up its mate", rec.qname);

	// Not leased: this iteration is independent of any the caller holds open
	auto it = rec.mate_ref_index == no_ref_index ? open_unmapped() : open_alignment_start(rec.mate_ref_index, rec.mate_pos);

	std::optional<align_record_t> mate;
	align_record_t candidate;
	while (it->next(candidate)) {
		if (!candidate.is_paired()) {
			AK_CHECK(candidate.qname != rec.qname, format, "Paired and unpaired reads with the same name {}", rec.qname);
			continue;
		}
		// Secondary and supplementary copies of the mate count as matches too
		if (candidate.qname != rec.qname || (rec.is_first() ? !candidate.is_second() : !candidate.is_first()))
			continue;
		AK_CHECK(!mate, ambiguous_mate, "More than one mate found for read {} at {}", rec.qname, candidate.as_str());
		mate = std::move(candidate);
	}
	it->close();
	return mate;
}

END_NAMESPACE_AK
