#pragma once

#include <cassert>
#include <cstdlib>

#if defined(_MSC_VER) && !defined(__clang__)
#define BENC_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define BENC_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define BENC_ALWAYS_INLINE inline
#endif

#ifndef BENC_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(BENC_SHARED_BUILD)
#define BENC_API __declspec(dllexport)
#elif defined(BENC_SHARED)
#define BENC_API __declspec(dllimport)
#else
#define BENC_API
#endif
#define BENC_LOCAL
#else
#if defined(BENC_SHARED_BUILD) || defined(BENC_SHARED)
#define BENC_API __attribute__((visibility("default")))
#else
#define BENC_API
#endif
#define BENC_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef BENC_LOCAL
#define BENC_LOCAL
#endif

#if defined(__GNUC__) || defined(__clang__)
#define BENC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define BENC_UNLIKELY(x) (x)
#endif

#define BENC_ASSERT(expr) assert(expr)
#define BENC_ABORT(message) ::std::abort()

namespace BENC
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace BENC
