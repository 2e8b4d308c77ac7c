/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "sorting_collection.h"

using namespace std;

BEGIN_NAMESPACE_AK

static sorting_collection<align_record_t>::comparator require_comparator(sort_order_t order)
{
	auto cmp = comparator_for(order);
	AK_CHECK(cmp, value, "Cannot sort records into {} order", sort_order_name(order));
	return cmp;
}

sorting_sink::sorting_sink(record_sink& out, sort_order_t order, size_t max_records_in_ram, string tmp_dir)
: _out(out), _sorter(require_comparator(order), max_records_in_ram, std::move(tmp_dir))
{
}

void sorting_sink::add_record(const align_record_t& rec)
{
	AK_CHECK(!_closed, value, "Cannot add records to a closed sorting_sink");
	_sorter.add(rec);
}

void sorting_sink::close()
{
	if (_closed)
		return;
	_closed = true;

	auto it = _sorter.iterate();
	align_record_t rec;
	while (it->next(rec))
		_out.add_record(rec);
	it->close();
	_sorter.cleanup();
	_out.close();
}

END_NAMESPACE_AK
