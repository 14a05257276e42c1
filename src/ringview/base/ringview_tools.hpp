/*
 * ringview_tools.hpp
 *
 * Tiny portability helpers shared by the ringview headers.
 * - Inlining and branch-prediction hints (RB_FORCEINLINE, RB_NOINLINE, RB_UNLIKELY).
 * - Exception helpers used on contract violations.
 *
 * Usage:
 *   RB_FORCEINLINE reg add(reg a, reg b) { return a + b; }
 *   if (RB_UNLIKELY(i >= size())) { ::ringview::detail::throw_out_of_range("..."); }
 */

#ifndef RINGVIEW_TOOLS_HPP_
#define RINGVIEW_TOOLS_HPP_

#include <stdexcept> // std::out_of_range

#include "ringview_config.hpp"

/* ---------------------------------------------------------------------------
 * RB_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef RB_FORCEINLINE
#  if defined(_MSC_VER)
#    define RB_FORCEINLINE __forceinline
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define RB_FORCEINLINE inline
#  endif
#endif /* RB_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * RB_NOINLINE: keep cold paths (throw sites) out of the hot functions.
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
 * Local fallback for the branch prediction hint.
 * ------------------------------------------------------------------------- */
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

// Index faults are reported with exceptions; refuse to build without them.
#if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
    !(defined(_MSC_VER) && defined(_CPPUNWIND))
#  error "ringview requires C++ exceptions (index faults are reported with std::out_of_range)"
#endif

namespace ringview::detail {

[[noreturn]] RB_NOINLINE inline void throw_out_of_range(const char* what)
{
    throw std::out_of_range(what);
}

} // namespace ringview::detail

#endif /* RINGVIEW_TOOLS_HPP_ */
