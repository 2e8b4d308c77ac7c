/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_DEFINES_H__
#define __ALIGN_KIT_DEFINES_H__

#if defined(__APPLE__)
#include <machine/endian.h>
#elif defined(__GLIBC__)
#include <endian.h>
#endif
#if defined(__BYTE_ORDER) && __BYTE_ORDER == __BIG_ENDIAN
#define _BIGENDIAN
#endif

#ifndef NDEBUG
#ifndef AK_DEBUG
#define AK_DEBUG
#endif
#endif

#if (defined __GNUC__)
#define INLINE inline __attribute__((always_inline))
#define RESTRICT __restrict__
#define LIKELY(exp) __builtin_expect(!!(exp), 1)
#define UNLIKELY(exp) __builtin_expect(!!(exp), 0)
#else
#error Unsupported compiler.
#endif

#include <cstdint>

#define NOCOPY(C) C(const C&) = delete; C& operator=(const C&) = delete;

#define BEGIN_NAMESPACE_AK namespace ak {
#define END_NAMESPACE_AK   }
#define USING_NAMESPACE_AK using namespace ak;

#define AK_EXPAND(x) x
#define AK_EXPAND_STR(x) #x

#define AK_VA_HEAD(head, ...)  head
#define AK_VA_COMMA_TAIL(head, ...)  __VA_OPT__(,) __VA_ARGS__

// Shorthand so that casting is not so verbose
#define rcast reinterpret_cast
#define scast static_cast
#define ccast const_cast

#endif // __ALIGN_KIT_DEFINES_H__
