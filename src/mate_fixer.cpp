/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "mate_fixer.h"

#include "ak_assert.h"

using namespace std;

BEGIN_NAMESPACE_AK

static const char* const mate_mapq_tag = "MQ";

int32_t compute_insert_size(const align_record_t& rec1, const align_record_t& rec2)
{
	if (rec1.is_unmapped() || rec2.is_unmapped())
		return 0;
	if (rec1.ref_index != rec2.ref_index)
		return 0;

	pos_t end5_1 = rec1.is_reverse() ? rec1.alignment_end() : rec1.pos;
	pos_t end5_2 = rec2.is_reverse() ? rec2.alignment_end() : rec2.pos;
	int adjustment = end5_2 >= end5_1 ? 1 : -1;
	return end5_2 - end5_1 + adjustment;
}

// Points rec's mate fields at `mate`, which is at (ref_index, pos).
static void point_at_mate(align_record_t& rec, const align_record_t& mate, refidx_t ref_index, pos_t pos, bool mate_unmapped)
{
	rec.mate_ref_index = ref_index;
	rec.mate_pos       = pos;
	rec.set_flag(sam_flag::mate_reverse, mate.is_reverse());
	rec.set_flag(sam_flag::mate_unmapped, mate_unmapped);
}

void set_mate_info(align_record_t& rec1, align_record_t& rec2)
{
	if (!rec1.is_unmapped() && !rec2.is_unmapped()) {
		point_at_mate(rec1, rec2, rec2.ref_index, rec2.pos, false);
		point_at_mate(rec2, rec1, rec1.ref_index, rec1.pos, false);
		rec1.set_int_tag(mate_mapq_tag, rec2.mapq);
		rec2.set_int_tag(mate_mapq_tag, rec1.mapq);

		int32_t insert_size = compute_insert_size(rec1, rec2);
		rec1.tlen = insert_size;
		rec2.tlen = -insert_size;

		if (rec1.ref_index != rec2.ref_index) {
			rec1.set_flag(sam_flag::proper_pair, false);
			rec2.set_flag(sam_flag::proper_pair, false);
		}
	} else if (rec1.is_unmapped() && rec2.is_unmapped()) {
		// Any coordinates the pair carried only placed it for sorting; drop them
		for (auto* rec : { &rec1, &rec2 }) {
			auto& mate = rec == &rec1 ? rec2 : rec1;
			rec->ref_index = no_ref_index;
			rec->pos       = no_alignment_start;
			point_at_mate(*rec, mate, no_ref_index, no_alignment_start, true);
			rec->remove_tag(mate_mapq_tag);
			rec->tlen = 0;
			rec->set_flag(sam_flag::proper_pair, false);
		}
	} else {
		auto& mapped   = rec1.is_unmapped() ? rec2 : rec1;
		auto& unmapped = rec1.is_unmapped() ? rec1 : rec2;

		unmapped.ref_index = mapped.ref_index;
		unmapped.pos       = mapped.pos;

		point_at_mate(mapped, unmapped, unmapped.ref_index, unmapped.pos, true);
		mapped.remove_tag(mate_mapq_tag);
		mapped.tlen = 0;

		point_at_mate(unmapped, mapped, mapped.ref_index, mapped.pos, false);
		unmapped.set_int_tag(mate_mapq_tag, mapped.mapq);
		unmapped.tlen = 0;

		mapped.set_flag(sam_flag::proper_pair, false);
		unmapped.set_flag(sam_flag::proper_pair, false);
	}
}

/////////////////////////////////////////////////////////////////

static bool is_complementary_pair(const align_record_t& rec1, const align_record_t& rec2)
{
	bool first1 = rec1.is_first() && !rec1.is_second();
	bool second1 = rec1.is_second() && !rec1.is_first();
	bool first2 = rec2.is_first() && !rec2.is_second();
	bool second2 = rec2.is_second() && !rec2.is_first();
	return (first1 && second2) || (second1 && first2);
}

mate_fixer::mate_fixer(long long progress_interval)
: _progress_interval(progress_interval)
{
	AK_CHECK(_progress_interval >= 1, value, "Progress interval must be at least 1, not {}", _progress_interval);
}

void mate_fixer::count_record()
{
	if (++_counters.records % _progress_interval == 0 && is_verbose())
		println("Fixed mate information in {} records ({} pairs, {} orphans)", _counters.records,
				_counters.pairs_fixed, _counters.orphans);
}

void mate_fixer::run(record_iterator_ptr records, record_sink& out)
{
	peekable_iterator it(std::move(records));

	while (it.has_next()) {
		align_record_t rec1 = it.next();
		if (!rec1.is_primary()) {
			out.add_record(rec1);
			++_counters.passed_through;
			count_record();
			continue;
		}

		// Write out secondary and supplementary records until the next primary
		bool have_rec2 = false;
		while (it.has_next()) {
			if (it.peek().is_primary()) {
				have_rec2 = true;
				break;
			}
			out.add_record(it.next());
			++_counters.passed_through;
			count_record();
		}

		if (have_rec2 && it.peek().qname == rec1.qname) {
			align_record_t rec2 = it.next();
			AK_CHECK(is_complementary_pair(rec1, rec2), format,
					 "Primary records {} and {} share a name but are not first and second of one pair",
					 rec1.as_str(), rec2.as_str());
			set_mate_info(rec1, rec2);
			out.add_record(rec1);
			out.add_record(rec2);
			++_counters.pairs_fixed;
			count_record();
			count_record();
		} else {
			out.add_record(rec1);
			++_counters.orphans;
			count_record();
		}
	}
	it.close();
}

END_NAMESPACE_AK
