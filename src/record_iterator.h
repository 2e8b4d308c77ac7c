/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_RECORD_ITERATOR_H__
#define __ALIGN_KIT_RECORD_ITERATOR_H__

#include "align_record.h"
#include "ak_assert.h"
#include "record_compare.h"
#include <memory>
#include <utility>
#include <vector>

BEGIN_NAMESPACE_AK
using std::unique_ptr;
using std::vector;

/////////////////////////////////////////////////////////////////
// item_iterator
//
// Pull-style stream of items. next() fills `item` and returns true,
// or returns false once the stream is exhausted. close() releases any
// file handles immediately; after it, next() returns false. Both
// close() and destruction are safe at any point mid-stream.
/////////////////////////////////////////////////////////////////

template <typename T>
class item_iterator {
public:
	virtual ~item_iterator() = default;
	virtual bool next(T& item) = 0;
	virtual void close() { }
};

using record_iterator     = item_iterator<align_record_t>;
using record_iterator_ptr = unique_ptr<record_iterator>;

// Yields the items of a vector it owns.
template <typename T>
class vector_iterator : public item_iterator<T> {
public:
	explicit vector_iterator(vector<T> items): _items(std::move(items)) { }

	bool next(T& item) override
	{
		if (_pos >= _items.size())
			return false;
		item = std::move(_items[_pos++]);
		return true;
	}
	void close() override { _items.clear(); _pos = 0; }

private:
	vector<T> _items;
	size_t    _pos{};
};

/////////////////////////////////////////////////////////////////
// peekable_iterator
//
// One-record lookahead over a record_iterator.
/////////////////////////////////////////////////////////////////

class peekable_iterator {
public:
	explicit peekable_iterator(record_iterator_ptr src): _src(std::move(src)) { }
	NOCOPY(peekable_iterator)

	bool                  has_next();
	const align_record_t& peek();
	align_record_t        next();
	void                  close();

private:
	record_iterator_ptr _src;
	align_record_t      _peeked;
	bool                _have_peeked{};
};

/////////////////////////////////////////////////////////////////
// sorted_order_validator
//
// Passes records through unchanged, throwing sort_order_error as soon
// as a record comes before the one yielded before it in file order
// (reference and start for coordinate, read name for queryname).
/////////////////////////////////////////////////////////////////

class sorted_order_validator : public record_iterator {
public:
	sorted_order_validator(record_iterator_ptr inner, sort_order_t order);

	bool next(align_record_t& rec) override;
	void close() override;

private:
	record_iterator_ptr _inner;
	sort_order_t        _order;
	record_comparator   _cmp;
	align_record_t      _prior;
	bool                _have_prior{};
};

// Wraps `it` in a sorted_order_validator, or returns it unchanged for unsorted.
record_iterator_ptr assert_sorted(record_iterator_ptr it, sort_order_t order);

/////////////////////////////////////////////////////////////////
// Combining several streams
/////////////////////////////////////////////////////////////////

// Yields every record of the first source, then of the second, and so on.
class concat_iterator : public record_iterator {
public:
	explicit concat_iterator(vector<record_iterator_ptr> sources): _sources(std::move(sources)) { }

	bool next(align_record_t& rec) override;
	void close() override;

private:
	vector<record_iterator_ptr> _sources;
	size_t                      _curr{};
};

// Merges sources that are each sorted by `cmp` into one sorted stream.
// Ties go to the source listed first.
class merging_iterator : public record_iterator {
public:
	merging_iterator(vector<record_iterator_ptr> sources, record_comparator cmp);

	bool next(align_record_t& rec) override;
	void close() override;

private:
	struct head_t {
		align_record_t rec;
		bool           live{};
	};
	vector<record_iterator_ptr> _sources;
	vector<head_t>              _heads;
	record_comparator           _cmp;
};

/////////////////////////////////////////////////////////////////
// record_sink
//
// Destination for records. close() flushes and finalizes the output;
// a sink that was not closed discards what it has not yet written.
/////////////////////////////////////////////////////////////////

class record_sink {
public:
	virtual ~record_sink() = default;
	virtual void add_record(const align_record_t& rec) = 0;
	virtual void close() = 0;
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_RECORD_ITERATOR_H__
