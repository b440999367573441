/*
 * chunkiter_tools.hpp
 *
 * Tiny portability helpers shared by the chunkiter headers.
 * - Zero dependencies, header-only, safe for inclusion from multiple TUs.
 * - Force-inline / branch-hint tokens.
 * - try/catch wrappers that collapse in no-exceptions builds.
 * - Misuse hook (loud in every build).
 * - C++20 <span> detection.
 */

#ifndef CHUNKITER_TOOLS_HPP_
#define CHUNKITER_TOOLS_HPP_

#include "chunkiter_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef CHUNKITER_ASSERT
#  define CHUNKITER_ASSERT(x)
#endif /* CHUNKITER_ASSERT */

/* ---------------------------------------------------------------------------
 * RB_FORCEINLINE: "strong" inlining hint for headers
 * - One macro that maps to the compiler's force-inline attribute.
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. Keep the definition in the header if you expect inlining.
 * ------------------------------------------------------------------------- */
#ifndef RB_FORCEINLINE
#  if defined(_MSC_VER)
#    define RB_FORCEINLINE __forceinline
  /* Clang/GCC style (Clang also defines __GNUC__, so check __clang__ first) */
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define RB_FORCEINLINE inline
#  endif
#endif /* RB_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * RB_NOINLINE: prevent inlining
 * - Keeps the cold paths (end of production, teardown) out of the hot loop.
 * ------------------------------------------------------------------------- */
#ifndef RB_NOINLINE
#  if defined(_MSC_VER)
#    define RB_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_NOINLINE __attribute__((noinline))
#  else
#    define RB_NOINLINE
#  endif
#endif /* RB_NOINLINE */

/* ---------------------------------------------------------------------------
 * Local fallbacks for branch prediction hints.
 * Separate guards prevent losing RB_UNLIKELY if RB_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef RB_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define RB_LIKELY(x)   (x)
#  endif
#endif /* RB_LIKELY */

#ifndef RB_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define RB_UNLIKELY(x) (x)
#  endif
#endif /* RB_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

// If the user forces 1 but the compiler clearly has no exceptions,
// fail at compile-time instead of pretending everything is fine.
#if CHUNKITER_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
		!(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "CHUNKITER_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* CHUNKITER_ENABLE_EXCEPTIONS */

#if !defined(CHUNKITER_TRY)
#  if CHUNKITER_ENABLE_EXCEPTIONS
#    define CHUNKITER_TRY       try
#    define CHUNKITER_CATCH_ALL catch (...)
#    define CHUNKITER_RETHROW   throw
#  else
#    define CHUNKITER_TRY
#    define CHUNKITER_CATCH_ALL if constexpr (false)
#    define CHUNKITER_RETHROW
#  endif
#endif /* CHUNKITER_TRY */

// ============================================================================
// Misuse hook
// ============================================================================
#if !defined(CHUNKITER_ON_MISUSE)
#  if CHUNKITER_ENABLE_EXCEPTIONS
#    include <stdexcept>
#    define CHUNKITER_ON_MISUSE(msg) throw std::logic_error(msg)
#  else
#    include <cstdlib>
#    define CHUNKITER_ON_MISUSE(msg) std::abort()
#  endif
#endif /* CHUNKITER_ON_MISUSE */

// ============================================================================
// C++20 SPAN
// ============================================================================
#if defined(__has_include)
#  if __has_include(<span>) && (__cplusplus >= 202002L)
#    include <span>
#    define CHUNKITER_HAS_SPAN 1
#  else
#    define CHUNKITER_HAS_SPAN 0
#  endif
#else
#  define CHUNKITER_HAS_SPAN 0
#endif/* CHUNKITER_HAS_SPAN */

#endif /* CHUNKITER_TOOLS_HPP_ */
