// branch_hints.hpp
// Branch Prediction Hints for the column-scan hot paths

#pragma once

// ============================================================================
// Branch Prediction Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define EQUITYBT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define EQUITYBT_UNLIKELY(x) (x)
#endif

// Force inline for per-row kernels
#if defined(__GNUC__) || defined(__clang__)
    #define EQUITYBT_FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
    #define EQUITYBT_FORCE_INLINE __forceinline
#else
    #define EQUITYBT_FORCE_INLINE inline
#endif
