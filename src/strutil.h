/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_STRUTIL_H__
#define __ALIGN_KIT_STRUTIL_H__

#include "defines.h"
#include <algorithm>
#include <cstring>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

BEGIN_NAMESPACE_AK
using std::string;
using std::string_view;
using std::vector;

///////////////////////////////////////////////////

inline bool startswith(string_view s, string_view start)
{
	return s.starts_with(start);
}
inline bool endswith(string_view s, string_view end)
{
	return s.ends_with(end);
}

///////////////////////////////////////////////////

INLINE char* find_delim(char* begin, char* end, char delim)
{
	char* p = (char*)::memchr(begin, delim, end-begin);
	return p ? p : end;
}

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols=0x7fffffff);

struct string_hash {
	using hash_type      = std::hash<std::string_view>;
	using is_transparent = void;

	std::size_t operator()(const char* str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(std::string_view str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(const std::string& str) const noexcept { return hash_type{}(str); }
};

template <class Key, class T, class Allocator = std::allocator<std::pair<const Key, T>>>
using string_map = std::unordered_map<Key, T, string_hash, std::equal_to<>, Allocator>;

/////////////////////////////////////////////////////

int       as_int(string_view s);
long long as_int64(string_view s);

END_NAMESPACE_AK

#endif // __ALIGN_KIT_STRUTIL_H__
