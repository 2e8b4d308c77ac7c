/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_UTIL_H__
#define __ALIGN_KIT_UTIL_H__

#include "defines.h"
#include "ak_assert.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <type_traits>
#include <utility>

BEGIN_NAMESPACE_AK

// All diagnostic output goes to stderr so that records written to
// stdout (e.g. by `alignkit view`) are never interleaved with it.
template <typename... T>
void print(fmt::format_string<T...> format_str, T&&... args)
{
	fmt::print(stderr, format_str, std::forward<T>(args)...);
}

template <typename... T>
void println(fmt::format_string<T...> format_str, T&&... args)
{
	fmt::print(stderr, format_str, std::forward<T>(args)...);
	std::fputc('\n', stderr);
}

template <typename... T>
void warn(fmt::format_string<T...> format_str, T&&... args)
{
	std::fputs("WARNING: ", stderr);
	println(format_str, std::forward<T>(args)...);
}

// Progress output is suppressed when ALIGNKIT_QUIET is set.
bool is_verbose();

// Default number of records between two progress messages.
constexpr long long default_progress_interval = 1000000;

///////////////////////////////////////////////////

template <typename Y, typename X>
INLINE Y int_cast(X x)
{
	AK_CHECK(std::in_range<Y>(x), value, "int_cast: integer overflow when casting {}.", x);
	return Y(x);
}

// Returns -1, 0 or +1 in the manner of strcmp.
template <typename T>
INLINE int compare3(const T& a, const T& b)
{
	return a < b ? -1 : (b < a ? 1 : 0);
}

END_NAMESPACE_AK

#endif // __ALIGN_KIT_UTIL_H__
