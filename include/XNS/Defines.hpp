#pragma once

#include <cstdio>
#include <cstdlib>

#ifndef XNS_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(XNS_SHARED_BUILD)
#define XNS_API __declspec(dllexport)
#elif defined(XNS_SHARED)
#define XNS_API __declspec(dllimport)
#else
#define XNS_API
#endif
#define XNS_LOCAL
#else
#if defined(XNS_SHARED_BUILD) || defined(XNS_SHARED)
#define XNS_API __attribute__((visibility("default")))
#else
#define XNS_API
#endif
#define XNS_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef XNS_LOCAL
#define XNS_LOCAL
#endif

#define XNS_ABORT(message)                                                                  \
    do                                                                                      \
    {                                                                                       \
        std::fprintf(stderr, "XNS fatal: %s (%s:%d)\n", (message), __FILE__, __LINE__); \
        std::abort();                                                                       \
    } while (false)

#if !defined(NDEBUG)
#define XNS_ASSERT(expression)                           \
    do                                                   \
    {                                                    \
        if (!(expression))                               \
            XNS_ABORT("assertion failed: " #expression); \
    } while (false)
#else
#define XNS_ASSERT(expression) ((void) 0)
#endif

namespace XNS
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace XNS
