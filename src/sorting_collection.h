/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_SORTING_COLLECTION_H__
#define __ALIGN_KIT_SORTING_COLLECTION_H__

#include "align_record.h"
#include "ak_assert.h"
#include "file.h"
#include "record_iterator.h"
#include "util.h"
#include <algorithm>
#include <memory>
#include <string>
#include <variant>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::vector;

constexpr size_t default_max_records_in_ram = 500000;

/////////////////////////////////////////////////////////////////
// run_codec
//
// How one item is written to and read back from a sort run.
/////////////////////////////////////////////////////////////////

template <typename T>
struct run_codec;

template <serializable T>
struct run_codec<T> {
	static void encode(binary_file& out, const T& item) { out.write(item); }
	static void decode(binary_file& in, T& item)        { in.read(item); }
};

template <>
struct run_codec<align_record_t> {
	static void encode(binary_file& out, const align_record_t& rec) { encode_record(out, rec); }
	static void decode(binary_file& in, align_record_t& rec)        { decode_record(in, rec); }
};

/////////////////////////////////////////////////////////////////
// sorting_collection
//
// Accepts any number of items and later yields them all in comparator
// order while holding at most max_records_in_ram of them in memory.
// Every time the buffer fills it is sorted and spilled to a temporary
// run file; iterate() then merges the runs. If nothing was ever
// spilled, iterate() sorts the buffer and reads straight from memory.
//
// The sort is stable: equal items come out in the order they were added.
//
// Run files belong to this collection alone and are deleted by
// cleanup(), which the destructor also calls. An iterator obtained
// from iterate() must not be read after cleanup().
/////////////////////////////////////////////////////////////////

template <typename T, typename Codec = run_codec<T>>
class sorting_collection {
public:
	using comparator   = int (*)(const T& a, const T& b);
	using iterator_ptr = std::unique_ptr<item_iterator<T>>;

	sorting_collection(comparator cmp, size_t max_records_in_ram, string tmp_dir = default_tmp_dir());
	~sorting_collection();
	NOCOPY(sorting_collection)

	void         add(T item);
	iterator_ptr iterate();
	void         cleanup();

	INLINE size_t                size()      const { return _num_added; }
	INLINE size_t                num_runs()  const { return _run_paths.size(); }
	INLINE const vector<string>& run_paths() const { return _run_paths; }

private:
	static constexpr unsigned run_magic = 0xa1c0ffee;

	struct in_memory_sorted {
		vector<T> items;
		size_t    pos{};
	};

	struct run_cursor {
		binary_file file;
		uint64_t    remaining{};
		T           head{};
	};

	struct merged_runs {
		vector<run_cursor> cursors;
		vector<int>        heap;  // indices of cursors holding a head, as a min-heap
	};

	using read_state = std::variant<in_memory_sorted, merged_runs>;

	class iterator : public item_iterator<T> {
	public:
		iterator(std::weak_ptr<read_state> state, comparator cmp): _state(std::move(state)), _cmp(cmp) { }
		bool next(T& item) override;
		void close() override;

	private:
		std::weak_ptr<read_state> _state;
		comparator                _cmp;
		bool                      _closed{};
	};

	void spill();
	static bool advance(run_cursor& cursor);

	comparator                  _cmp;
	size_t                      _max_records_in_ram;
	string                      _tmp_dir;
	vector<T>                   _buffer;
	vector<string>              _run_paths;
	size_t                      _num_added{};
	bool                        _finalized{};
	std::shared_ptr<read_state> _reading;
};

/////////////////////////////////////////////////////////////////

template <typename T, typename Codec>
sorting_collection<T, Codec>::sorting_collection(comparator cmp, size_t max_records_in_ram, string tmp_dir)
: _cmp(cmp), _max_records_in_ram(max_records_in_ram), _tmp_dir(std::move(tmp_dir))
{
	AK_CHECK(_cmp != nullptr, value, "sorting_collection requires a comparator");
	AK_CHECK(_max_records_in_ram >= 1, value, "max_records_in_ram must be at least 1, not {}", _max_records_in_ram);
	if (_tmp_dir.empty())
		_tmp_dir = default_tmp_dir();
}

template <typename T, typename Codec>
sorting_collection<T, Codec>::~sorting_collection()
{
	cleanup();
}

template <typename T, typename Codec>
void sorting_collection<T, Codec>::add(T item)
{
	AK_CHECK(!_finalized, value, "Cannot add to a sorting_collection after iterate() was called");
	_buffer.push_back(std::move(item));
	++_num_added;
	if (_buffer.size() >= _max_records_in_ram)
		spill();
}

template <typename T, typename Codec>
void sorting_collection<T, Codec>::spill()
{
	if (_buffer.empty())
		return;

	auto cmp = _cmp;
	std::stable_sort(_buffer.begin(), _buffer.end(), [cmp](const T& a, const T& b) { return cmp(a, b) < 0; });

	// Registered before writing; cleanup() also removes a partially written run
	_run_paths.push_back(make_temp_file(_tmp_dir, "alignkit_sort.", ".run"));
	const string& path = _run_paths.back();
	try {
		binary_file out(path, "w");
		out.write(int_cast<uint64_t>(_buffer.size()));
		for (const auto& item : _buffer)
			Codec::encode(out, item);
		out.write_checkpoint(run_magic);
		out.close();
	}
	AK_RETHROW("While spilling {} records to sort run {}", _buffer.size(), path);

	_buffer.clear();
}

template <typename T, typename Codec>
bool sorting_collection<T, Codec>::advance(run_cursor& cursor)
{
	if (cursor.remaining == 0) {
		if (cursor.file.is_open()) {
			cursor.file.read_checkpoint(run_magic);
			cursor.file.close();
		}
		return false;
	}
	Codec::decode(cursor.file, cursor.head);
	--cursor.remaining;
	return true;
}

template <typename T, typename Codec>
typename sorting_collection<T, Codec>::iterator_ptr sorting_collection<T, Codec>::iterate()
{
	AK_CHECK(!_finalized, value, "iterate() can only be called once per sorting_collection");
	_finalized = true;

	if (_run_paths.empty()) {
		auto cmp = _cmp;
		std::stable_sort(_buffer.begin(), _buffer.end(), [cmp](const T& a, const T& b) { return cmp(a, b) < 0; });
		_reading = std::make_shared<read_state>(in_memory_sorted{ std::move(_buffer), 0 });
		_buffer.clear();
		return std::make_unique<iterator>(_reading, _cmp);
	}

	spill();

	merged_runs merge;
	merge.cursors.resize(_run_paths.size());
	for (size_t i = 0; i < _run_paths.size(); ++i) {
		auto& cursor = merge.cursors[i];
		try {
			cursor.file.open(_run_paths[i], "r");
			cursor.remaining = cursor.file.template read<uint64_t>();
			if (advance(cursor))
				merge.heap.push_back(int_cast<int>(i));
		}
		AK_RETHROW("While opening sort run {}", _run_paths[i]);
	}
	_reading = std::make_shared<read_state>(std::move(merge));
	auto& m  = std::get<merged_runs>(*_reading);

	auto cmp = _cmp;
	auto& cursors = m.cursors;
	std::make_heap(m.heap.begin(), m.heap.end(), [cmp, &cursors](int a, int b) {
		int c = cmp(cursors[a].head, cursors[b].head);
		return c != 0 ? c > 0 : a > b;
	});
	return std::make_unique<iterator>(_reading, _cmp);
}

template <typename T, typename Codec>
bool sorting_collection<T, Codec>::iterator::next(T& item)
{
	if (_closed)
		return false;
	auto state = _state.lock();
	AK_CHECK(state, value, "Sorted iterator read after its sorting_collection was cleaned up");

	if (auto* mem = std::get_if<in_memory_sorted>(state.get())) {
		if (mem->pos >= mem->items.size())
			return false;
		item = std::move(mem->items[mem->pos++]);
		return true;
	}

	// k-way merge: the heap top is the cursor with the smallest head, ties
	// going to the run that was spilled first.
	auto& m       = std::get<merged_runs>(*state);
	auto& cursors = m.cursors;
	if (m.heap.empty())
		return false;
	auto cmp         = _cmp;
	auto greater_than = [cmp, &cursors](int a, int b) {
		int c = cmp(cursors[a].head, cursors[b].head);
		return c != 0 ? c > 0 : a > b;
	};
	std::pop_heap(m.heap.begin(), m.heap.end(), greater_than);
	int top = m.heap.back();
	item = std::move(cursors[top].head);
	try {
		if (advance(cursors[top]))
			std::push_heap(m.heap.begin(), m.heap.end(), greater_than);
		else
			m.heap.pop_back();
	}
	AK_RETHROW("While merging sort run {} of {}", top + 1, cursors.size());
	return true;
}

template <typename T, typename Codec>
void sorting_collection<T, Codec>::iterator::close()
{
	_closed = true;
	auto state = _state.lock();
	if (!state)
		return;
	if (auto* m = std::get_if<merged_runs>(state.get())) {
		// Release the run file handles now; the files themselves go in cleanup()
		for (auto& cursor : m->cursors)
			if (cursor.file.is_open())
				cursor.file.close();
		m->heap.clear();
	} else {
		std::get<in_memory_sorted>(*state).items.clear();
	}
}

template <typename T, typename Codec>
void sorting_collection<T, Codec>::cleanup()
{
	_reading.reset();  // closes any run file still open for merging
	_buffer.clear();
	for (const auto& path : _run_paths)
		if (!remove_file(path))
			warn("Could not delete temporary sort run {} ({}).", path, strerror(errno));
	_run_paths.clear();
}

/////////////////////////////////////////////////////////////////
// sorting_sink
//
// Record sink that collects records, sorts them by the given order
// and passes them on to `out` when closed.
/////////////////////////////////////////////////////////////////

class sorting_sink : public record_sink {
public:
	sorting_sink(record_sink& out, sort_order_t order, size_t max_records_in_ram, string tmp_dir = default_tmp_dir());

	void add_record(const align_record_t& rec) override;
	void close() override;

private:
	record_sink&                       _out;
	sorting_collection<align_record_t> _sorter;
	bool                               _closed{};
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_SORTING_COLLECTION_H__
