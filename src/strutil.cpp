/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "strutil.h"
#include "ak_assert.h"
#include <algorithm>
#include <charconv>
#include <iterator>
#include <string>
#include <system_error>

using namespace std;

BEGIN_NAMESPACE_AK

/////////////////////////////////////////////

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols)
{
	out.clear();
	while (!empty(s)) {
		if ((int)size(out) + 1 < max_cols) {
			auto pos = s.find(delim);
			out.push_back(s.substr(0, pos));
			if (pos != string_view::npos) {
				s.remove_prefix(pos + 1);
			} else{
				break;
			}
		} else {
			out.push_back(s);
			break;
		}
	}
}

/////////////////////////////////////////////

template <class T>
T as_number(string_view s, const char* type_name)
{
	if (s.starts_with("+"))
		s.remove_prefix(1);

	T    val{};
	auto stop      = s.data() + s.size();
	auto [ptr, ec] = from_chars(s.data(), stop, val);
	if (ptr == stop && ec == errc{})
		return val;

	AK_CHECK(ec != errc::result_out_of_range, value, "Overflow detected when parsing \"{}\" as {}.", s,
			 type_name);
	AK_THROW(value, "Failed to parse \"{}\" as {}.", s, type_name);
	return val;
}

int       as_int(string_view s)   { return as_number<int>(s, "integer"); }
long long as_int64(string_view s) { return as_number<long long>(s, "64-bit integer"); }

END_NAMESPACE_AK
