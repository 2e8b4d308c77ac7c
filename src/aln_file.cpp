/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "aln_file.h"

#include "ak_assert.h"
#include "strutil.h"
#include <algorithm>

using namespace std;

BEGIN_NAMESPACE_AK

const unsigned short c_aln_sig    = 0x41ad;
const unsigned short c_aln_ver    = 0x0001;
const unsigned short c_alnidx_sig = 0x41ae;
const unsigned short c_alnidx_ver = 0x0001;
// versions:
//   0001: initial format
//   <--- INSERT VERSION CHANGE SUMMARIES HERE

static const unsigned c_aln_checkpoint    = 0x85420a1d;
static const unsigned c_alnidx_checkpoint = 0x85420a1e;

string default_index_path(const string& aln_path) { return aln_path + ".idx"; }

////////////////////////////////////////////////////////////////
// aln_index
////////////////////////////////////////////////////////////////

void aln_index::open(const string& path)
{
	try {
		mmap_file fmap(path);

		unsigned short sig, ver;
		fmap.read(sig);
		fmap.read(ver);
		AK_CHECK(sig == c_alnidx_sig, file, "Expected valid ALN index signature {:x} but found {:x}.", c_alnidx_sig, sig);
		AK_CHECK(ver == c_alnidx_ver, file, "Expected ALN index version {:x} but found {:x}.", c_alnidx_ver, ver);

		_blocks.resize(fmap.read<uint32_t>());
		for (auto& blocks : _blocks) {
			blocks.resize(fmap.read<uint32_t>());
			for (auto& block : blocks) {
				block.span.begin = fmap.read<uint64_t>();
				block.span.end   = fmap.read<uint64_t>();
				block.min_start  = fmap.read<int32_t>();
				block.max_end    = fmap.read<int32_t>();
			}
		}
		_unmapped.begin = fmap.read<uint64_t>();
		_unmapped.end   = fmap.read<uint64_t>();
		fmap.read_checkpoint(c_alnidx_checkpoint);
	}
	AK_RETHROW("In ALN index {}", path);
	_path = path;
}

vector<byte_span_t> aln_index::lookup_spans(const query_interval_t& interval) const
{
	vector<byte_span_t> spans;
	if (interval.ref_index < 0 || interval.ref_index >= int_cast<refidx_t>(_blocks.size()))
		return spans;

	// Blocks are in coordinate order, so none past the first one starting
	// beyond the interval can overlap it
	const auto& blocks = _blocks[interval.ref_index];
	auto stop = upper_bound(begin(blocks), end(blocks), interval.end_or_max(),
							[](pos_t end, const aln_block_t& block) { return end < block.min_start; });
	for (auto it = begin(blocks); it != stop; ++it)
		if (interval.start <= it->max_end)
			spans.push_back(it->span);
	return spans;
}

vector<byte_span_t> aln_index::lookup_unmapped_spans() const
{
	if (_unmapped.empty())
		return {};
	return { _unmapped };
}

////////////////////////////////////////////////////////////////
// aln_file
////////////////////////////////////////////////////////////////

void aln_file::open(const string& path)
{
	AK_CHECK(!is_open(), value, "ALN file {} already open", _path);
	auto fmap = make_shared<mmap_file>(path);

	try {
		unsigned short sig, ver;
		fmap->read(sig);
		fmap->read(ver);
		AK_CHECK(sig == c_aln_sig, file, "Expected valid ALN file signature {:x} but found {:x}.", c_aln_sig, sig);
		AK_CHECK(ver == c_aln_ver, file, "Expected ALN file version {:x} but found {:x}.", c_aln_ver, ver);

		string text;
		fmap->read_str(text);
		_header      = sam_header::parse(text);
		_num_records = fmap->read<uint64_t>();
		_data_begin  = fmap->curr_seek();

		AK_CHECK(fmap->size() >= _data_begin + sizeof(unsigned), file, "ALN file is truncated");
		_data_end = fmap->size() - sizeof(unsigned);
		fmap->set_seek(_data_end);
		fmap->read_checkpoint(c_aln_checkpoint);
	}
	AK_RETHROW("In ALN file {}", path);

	_fmap = std::move(fmap);
	_path = path;
}

void aln_file::close()
{
	// Iterators still holding the mapping keep it alive until they are closed
	_fmap.reset();
}

record_iterator_ptr aln_file::decode(vector<byte_span_t> spans) const
{
	AK_CHECK(is_open(), value, "ALN file is not open");
	for (const auto& span : spans)
		AK_CHECK(span.begin >= _data_begin && span.end <= _data_end, value,
				 "Span [{}, {}) is outside the record section of {}", span.begin, span.end, _path);
	return make_unique<aln_span_iterator>(_fmap, std::move(spans));
}

////////////////////////////////////////////////////////////////

aln_span_iterator::aln_span_iterator(std::shared_ptr<mmap_file> fmap, vector<byte_span_t> spans)
: _fmap(std::move(fmap)), _spans(std::move(spans))
{
	if (!_spans.empty())
		_offset = _spans[0].begin;
}

bool aln_span_iterator::next(align_record_t& rec)
{
	if (!_fmap)
		return false;
	while (_curr < _spans.size()) {
		const auto& span = _spans[_curr];
		if (_offset < span.end) {
			// The mapping's seek position may be shared with other iterators of
			// the same file, so always seek to this iterator's own offset
			_fmap->set_seek(_offset);
			decode_record(*_fmap, rec);
			_offset = _fmap->curr_seek();
			AK_CHECK(_offset <= span.end, file, "Record at byte {} runs past the end of its block at byte {}",
					 span.begin, span.end);
			return true;
		}
		if (++_curr < _spans.size())
			_offset = _spans[_curr].begin;
	}
	return false;
}

void aln_span_iterator::close()
{
	_fmap.reset();
	_spans.clear();
	_curr = 0;
}

////////////////////////////////////////////////////////////////
// build_aln
////////////////////////////////////////////////////////////////

static void write_index(const string& path, const vector<vector<aln_block_t>>& blocks, const byte_span_t& unmapped)
{
	binary_file out(path, "w");
	out.write(c_alnidx_sig);
	out.write(c_alnidx_ver);
	out.write(int_cast<uint32_t>(blocks.size()));
	for (const auto& ref_blocks : blocks) {
		out.write(int_cast<uint32_t>(ref_blocks.size()));
		for (const auto& block : ref_blocks) {
			out.write(block.span.begin);
			out.write(block.span.end);
			out.write(block.min_start);
			out.write(block.max_end);
		}
	}
	out.write(unmapped.begin);
	out.write(unmapped.end);
	out.write_checkpoint(c_alnidx_checkpoint);
	out.close();
}

long long build_aln(record_iterator_ptr records, const sam_header& source_header, const string& aln_path,
					const string& index_path, const index_options& options)
{
	AK_CHECK(options.block_records >= 1, value, "Records per index block must be at least 1, not {}", options.block_records);

	sam_header header = source_header;
	header.set_sort_order(sort_order_t::coordinate);
	const auto num_refs = int_cast<refidx_t>(header.dict().size());

	auto sorted = assert_sorted(std::move(records), sort_order_t::coordinate);

	vector<vector<aln_block_t>> blocks(num_refs);
	byte_span_t unmapped;
	long long   num_records = 0;

	try {
		binary_file out(aln_path, "w");
		out.write(c_aln_sig);
		out.write(c_aln_ver);
		out.write_str(header.as_str());
		auto count_offset = out.tell();
		out.write(uint64_t{0});  // patched once the count is known

		aln_block_t block;
		refidx_t    block_ref   = no_ref_index;
		int         in_block    = 0;
		bool        in_unmapped = false;
		auto finish_block = [&](uint64_t end) {
			if (in_block > 0) {
				block.span.end = end;
				blocks[block_ref].push_back(block);
				in_block = 0;
			}
		};

		align_record_t rec;
		while (sorted->next(rec)) {
			auto offset = int_cast<uint64_t>(out.tell());
			if (rec.ref_index == no_ref_index) {
				if (!in_unmapped) {
					finish_block(offset);
					unmapped.begin = offset;
					in_unmapped    = true;
				}
			} else {
				AK_CHECK(rec.ref_index < num_refs, format, "Record {} refers to reference index {} but the dictionary has {} sequences",
						 rec.as_str(), rec.ref_index, num_refs);
				if (in_block > 0 && (rec.ref_index != block_ref || in_block >= options.block_records))
					finish_block(offset);
				if (in_block == 0) {
					block           = {};
					block.span.begin = offset;
					block.min_start  = rec.pos;
					block.max_end    = rec.pos;
					block_ref        = rec.ref_index;
				}
				block.max_end = max(block.max_end, rec.alignment_end());
				++in_block;
			}
			encode_record(out, rec);
			if (++num_records % options.progress_interval == 0 && is_verbose())
				println("Indexed {} records", num_records);
		}

		auto data_end = int_cast<uint64_t>(out.tell());
		finish_block(data_end);
		unmapped.end = data_end;
		if (!in_unmapped)
			unmapped.begin = data_end;
		out.write_checkpoint(c_aln_checkpoint);

		out.set_seek(int_cast<size_t>(count_offset));
		out.write(int_cast<uint64_t>(num_records));
		out.close();

		write_index(index_path, blocks, unmapped);
	} catch (const ak::runtime_error&) {
		// Remove partial outputs
		remove_file(aln_path);
		remove_file(index_path);
		throw;
	}
	return num_records;
}

END_NAMESPACE_AK
