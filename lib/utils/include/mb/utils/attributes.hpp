/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the inlining and branch hints used on the cache and key hashing paths.
- Unifies spelling across MSVC, Clang, and GCC so call sites stay portable.

Provided Macros:
- MB_FORCE_INLINE, MB_NOINLINE
- MB_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// MB_FORCE_INLINE
#if !defined(MB_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define MB_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define MB_FORCE_INLINE inline __attribute__((always_inline))
#else
#define MB_FORCE_INLINE inline
#endif
#else
#define MB_FORCE_INLINE inline
#endif
#else
#define MB_FORCE_INLINE inline
#endif

// MB_NOINLINE
#if defined(_MSC_VER)
#define MB_NOINLINE __declspec(noinline)
#elif defined(__clang__) || defined(__GNUC__)
#define MB_NOINLINE __attribute__((noinline))
#else
#define MB_NOINLINE
#endif

// MB_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define MB_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define MB_UNLIKELY(x) (x)
#endif
