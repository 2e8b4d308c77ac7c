/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "record_iterator.h"
#include "util.h"

using namespace std;

BEGIN_NAMESPACE_AK

bool peekable_iterator::has_next()
{
	if (!_have_peeked && _src)
		_have_peeked = _src->next(_peeked);
	return _have_peeked;
}

const align_record_t& peekable_iterator::peek()
{
	AK_CHECK(has_next(), value, "Cannot peek past the end of a record stream");
	return _peeked;
}

align_record_t peekable_iterator::next()
{
	AK_CHECK(has_next(), value, "Cannot read past the end of a record stream");
	_have_peeked = false;
	return std::move(_peeked);
}

void peekable_iterator::close()
{
	_have_peeked = false;
	if (_src)
		_src->close();
}

///////////////////////////////////////////////////////////////

sorted_order_validator::sorted_order_validator(record_iterator_ptr inner, sort_order_t order)
: _inner(std::move(inner)), _order(order), _cmp(file_order_comparator_for(order))
{
	AK_ASSERT(_cmp != nullptr, "No comparator for sort order {}", sort_order_name(order));
}

bool sorted_order_validator::next(align_record_t& rec)
{
	if (!_inner->next(rec))
		return false;
	if (_have_prior)
		AK_CHECK(_cmp(_prior, rec) <= 0, sort_order, "Record {} should come after {} when sorting by {}",
				 _prior.as_str(), rec.as_str(), sort_order_name(_order));
	_prior      = rec;
	_have_prior = true;
	return true;
}

void sorted_order_validator::close()
{
	_have_prior = false;
	_inner->close();
}

record_iterator_ptr assert_sorted(record_iterator_ptr it, sort_order_t order)
{
	if (order == sort_order_t::unsorted)
		return it;
	return make_unique<sorted_order_validator>(std::move(it), order);
}

///////////////////////////////////////////////////////////////

bool concat_iterator::next(align_record_t& rec)
{
	while (_curr < _sources.size()) {
		if (_sources[_curr]->next(rec))
			return true;
		_sources[_curr++]->close();
	}
	return false;
}

void concat_iterator::close()
{
	for (auto& src : _sources)
		src->close();
	_curr = _sources.size();
}

///////////////////////////////////////////////////////////////

merging_iterator::merging_iterator(vector<record_iterator_ptr> sources, record_comparator cmp)
: _sources(std::move(sources)), _heads(_sources.size()), _cmp(cmp)
{
	AK_ASSERT(_cmp != nullptr);
	for (size_t i = 0; i < _sources.size(); ++i)
		_heads[i].live = _sources[i]->next(_heads[i].rec);
}

bool merging_iterator::next(align_record_t& rec)
{
	// Linear scan for the smallest live head; the first source wins ties
	int best = -1;
	for (int i = 0; i < int_cast<int>(_heads.size()); ++i) {
		if (!_heads[i].live)
			continue;
		if (best < 0 || _cmp(_heads[i].rec, _heads[best].rec) < 0)
			best = i;
	}
	if (best < 0)
		return false;
	rec = std::move(_heads[best].rec);
	_heads[best].live = _sources[best]->next(_heads[best].rec);
	if (!_heads[best].live)
		_sources[best]->close();
	return true;
}

void merging_iterator::close()
{
	for (size_t i = 0; i < _sources.size(); ++i) {
		_heads[i].live = false;
		_sources[i]->close();
	}
}

END_NAMESPACE_AK
