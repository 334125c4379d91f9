/**
 * @file config.hpp
 * @brief numscan platform detection and compiler hints
 *
 * License: MIT
 */

#ifndef NUMSCAN_CONFIG_HPP
#define NUMSCAN_CONFIG_HPP

#include <memory_resource>
#include <vector>

// ============================================================================
// Language Level
// ============================================================================

#if __cplusplus < 202002L
#error "numscan requires a C++20 compatible compiler."
#endif

// ============================================================================
// Compiler Intrinsics & Branching Hints
// ============================================================================

#ifdef __GNUC__
#define NUMSCAN_INLINE __attribute__((always_inline)) inline
#define NUMSCAN_LIKELY(x) __builtin_expect(!!(x), 1)
#define NUMSCAN_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define NUMSCAN_INLINE inline
#define NUMSCAN_LIKELY(x) (x)
#define NUMSCAN_UNLIKELY(x) (x)
#endif

namespace numscan {

template <typename T> using Vector = std::pmr::vector<T>;
using Allocator = std::pmr::polymorphic_allocator<char>;

} // namespace numscan

#endif // NUMSCAN_CONFIG_HPP
