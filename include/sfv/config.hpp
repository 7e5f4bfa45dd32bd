#pragma once

/// @file config.hpp
/// @brief Configuration macros for the sfv library.

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SFV_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SFV_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define SFV_LIKELY(x)   (x)
    #define SFV_UNLIKELY(x) (x)
#endif
