#pragma once

/// Macros for Clang Thread Safety Analysis (TSA). They can be safely ignored by other compilers.
#if defined(__clang__)
#    define TSA_GUARDED_BY(...) __attribute__((guarded_by(__VA_ARGS__)))
#else
#    define TSA_GUARDED_BY(...)
#endif
