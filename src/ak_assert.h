/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_ASSERT_H__
#define __ALIGN_KIT_ASSERT_H__

#include "defines.h"
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

#define AK_ENABLE_DEBUGBREAK  // Uncomment this to enable debugbreak at outset of every AK_THROW or failed AK_ASSERT/AK_CHECK

BEGIN_NAMESPACE_AK

static const auto ak_debugbreak = getenv("ALIGNKIT_DEBUGBREAK") != nullptr;

class runtime_error : public std::runtime_error {
public:
	runtime_error(const char* msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	runtime_error(const std::string& msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	const char* what() const noexcept;

private:
	std::string buf;
	const char* file;
	int         line;
};

#define AK_DECL_ERROR_CLASS(error_class, base_class) \
	class error_class : public base_class { \
	public: \
		error_class(const char* msg, const char* file, int line): base_class(msg, file, line) { } \
		error_class(const std::string& msg, const char* file, int line): base_class(msg, file, line) { } \
	};

AK_DECL_ERROR_CLASS(assertion_error,          runtime_error)
AK_DECL_ERROR_CLASS(file_error,               runtime_error)  // I/O failure on a source, index, sink or sort run
AK_DECL_ERROR_CLASS(value_error,              runtime_error)  // Invalid argument
AK_DECL_ERROR_CLASS(invalid_interval_error,   value_error)
AK_DECL_ERROR_CLASS(resource_busy_error,      runtime_error)  // Reader already has a live iterator
AK_DECL_ERROR_CLASS(query_unsupported_error,  runtime_error)  // Indexed query against a source without an index
AK_DECL_ERROR_CLASS(sort_order_error,         runtime_error)  // Records out of their declared order
AK_DECL_ERROR_CLASS(ambiguous_mate_error,     runtime_error)
AK_DECL_ERROR_CLASS(format_error,             runtime_error)  // Record contents contradict the format, e.g. pairing flags
AK_DECL_ERROR_CLASS(unrecognized_format_error, runtime_error)
AK_DECL_ERROR_CLASS(not_implemented_error,    runtime_error)
AK_DECL_ERROR_CLASS(unreachable_code_error,   runtime_error)

extern bool is_debugger_running();

// Prints e and every exception nested inside it to stderr, one per line, innermost last.
void print_exception_chain(const std::exception& e, int level = 0);

#ifdef AK_ENABLE_DEBUGBREAK
// When a debugger is running, AK_THROW, AK_CHECK, and AK_ASSERT
	// will all trigger a debug break before throwing an exception,
	// giving the programmer a chance to inspect program state conveniently.
	#if defined(__clang__)
		#define AK_DEBUGBREAK { if (ak_debugbreak && ak::is_debugger_running()) __builtin_debugtrap(); }
	#elif defined(__GNUC__)
		#define AK_DEBUGBREAK { if (ak_debugbreak && ak::is_debugger_running()) __builtin_trap(); }
	#else
		#error Unsupported compiler.
	#endif
#else
	#define AK_DEBUGBREAK // disabled
#endif

//! \brief Throw an AK exception of the specified type.
//!
//! AK_THROW(etype, msg) throws an exception with a custom
//! string appended to the error message.
//!
//! AK_THROW(etype, msg, ...) throws an exception with a custom
//! formatted string appended to the error message. The format
//! for the message is the same as fmt::format(msg, ...).
//!
#define AK_MAKE_ERROR(etype, msg, ...) \
	ak::etype##_error(fmt::format(msg __VA_OPT__(, ) __VA_ARGS__), __FILE__, __LINE__)
#define AK_THROW(etype, ...) throw AK_MAKE_ERROR(etype, __VA_ARGS__)
#define AK_CATCH_THROW_NESTED(etype, ...) \
	catch (const ak::etype##_error&) \
	{ \
		std::throw_with_nested(AK_MAKE_ERROR(etype, __VA_ARGS__)); \
	}
#define AK_DEBUGBREAK_THROW(etype, ...) \
	AK_DEBUGBREAK; \
	AK_THROW(etype, __VA_ARGS__)
#define AK_LIKELY_OR(cond, expr) \
	do { \
		if (LIKELY(cond)) { \
		} else { \
			expr; \
		} \
	} while (0)

// ordered from derived -> base
#define AK_RETHROW(...) \
	AK_CATCH_THROW_NESTED(assertion, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(file, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(invalid_interval, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(value, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(resource_busy, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(query_unsupported, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(sort_order, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(ambiguous_mate, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(format, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(unrecognized_format, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(not_implemented, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(unreachable_code, __VA_ARGS__) \
	AK_CATCH_THROW_NESTED(runtime, __VA_ARGS__)

//! \brief If expr is false, throw an assertion_error.
//!
//! AK_ASSERT(expr) throws an assertion_error if expr evaluates to
//! false. The failed expression is appended to the error message.
//!
//! AK_ASSERT(expr, msg, ...) throws if expr fails, but appends
//! a custom formatted string to the error message.
//!
#define AK_ASSERT(expr, ...) AK_LIKELY_OR(expr, AK_DEBUGBREAK_THROW(assertion, "({}): " AK_VA_HEAD(__VA_ARGS__), #expr AK_VA_COMMA_TAIL(__VA_ARGS__)))

//! \brief If expr is false, throw a specific type of exception.
//!
//! AK_CHECK(expr, etype, msg, ...) throws etype##_error if expr fails,
//! with a custom formatted error message.
//!
#define AK_CHECK(expr, etype, ...)  AK_LIKELY_OR(expr, AK_DEBUGBREAK_THROW(etype, __VA_ARGS__))

//! \brief Throw an unreachable_code_error exception.
#define AK_UNREACHABLE()            do { AK_DEBUGBREAK_THROW(unreachable_code, ""); } while (0)

//! \brief Throw a not_implemented_error exception.
#define AK_NOT_IMPLEMENTED()        do { AK_DEBUGBREAK_THROW(not_implemented, ""); } while (0)

#ifdef AK_DEBUG
#ifndef AK_ENABLE_DBASSERT
#define AK_ENABLE_DBASSERT
#endif
#endif

#ifdef AK_ENABLE_DBASSERT
#define AK_DBASSERT(...)      AK_ASSERT(__VA_ARGS__)
#else
#define AK_DBASSERT(...)      { }
#endif

END_NAMESPACE_AK

#endif  // __ALIGN_KIT_ASSERT_H__
