/*
 * ringview_capacity.hpp
 *
 * Capacity arithmetic for mask-indexed rings:
 *   - power-of-two tests and rounding
 *   - growth step for a full ring_buffer
 *
 * Capacities are always 0 (no storage) or a power of two within the
 * "unambiguous" range (<= 2^(bits(reg)-1)), so `index & (capacity - 1)`
 * maps any logical index onto a slot.
 */

#ifndef RINGVIEW_CAPACITY_HPP_
#define RINGVIEW_CAPACITY_HPP_

#include <limits>
#include <type_traits>

#include "basic_types.h"        // reg
#include "ringview_tools.hpp"   // RB_FORCEINLINE

/* -------------------- Feature tests --------------------
 * Detect availability of <bit> and int_pow2 facility (C++20).
 * Falls back to custom helpers when not available.
 */
#if defined(__has_include)
#  if __has_include(<bit>)
#    include <bit>
#    define RINGVIEW_HAS_BIT_HEADER 1
#  else
#    define RINGVIEW_HAS_BIT_HEADER 0
#  endif
#else
#  define RINGVIEW_HAS_BIT_HEADER 0
#endif /* RINGVIEW_HAS_BIT_HEADER */

#if RINGVIEW_HAS_BIT_HEADER && defined(__cpp_lib_int_pow2) && (__cpp_lib_int_pow2 >= 201902L)
#  define RINGVIEW_HAS_INT_POW2 1
#else
#  define RINGVIEW_HAS_INT_POW2 0
#endif /* RINGVIEW_HAS_INT_POW2 */

namespace ringview::cap {

/* ---------- Shared constants ----------
 * RB_REG_BITS:         bit-width of 'reg'
 * RB_MAX_UNAMBIGUOUS:  largest capacity a ring may grow to.
 */
constexpr unsigned RB_REG_BITS        = std::numeric_limits<reg>::digits;
constexpr reg      RB_MAX_UNAMBIGUOUS = reg(1) << (RB_REG_BITS - 1);
constexpr reg      RB_MIN_CAPACITY    = reg(RINGVIEW_MIN_CAPACITY);

/* True if x is a non-zero power of two. */
RB_FORCEINLINE constexpr bool rb_is_pow2(const reg x) noexcept {
    return x && ((x & (x - 1u)) == 0u);
}

/* Propagate highest set bit to all lower bits (unrolled, width-aware). */
RB_FORCEINLINE constexpr reg rb_fold_ones(reg v) noexcept {
    if constexpr (RB_REG_BITS > 1)  v |= (v >> 1);
    if constexpr (RB_REG_BITS > 2)  v |= (v >> 2);
    if constexpr (RB_REG_BITS > 4)  v |= (v >> 4);
    if constexpr (RB_REG_BITS > 8)  v |= (v >> 8);
    if constexpr (RB_REG_BITS > 16) v |= (v >> 16);
    if constexpr (RB_REG_BITS > 32) v |= (v >> 32);
    return v;
}

/* Next power-of-two.
 * n == 0                     -> 1
 * Otherwise ceil to the next power-of-two (keeps n when already pow2).
 */
#if RINGVIEW_HAS_INT_POW2
RB_FORCEINLINE constexpr reg rb_next_power2(reg n) noexcept {
    if (n == 0) return 1;
    return std::bit_ceil(n);
}
#else
RB_FORCEINLINE constexpr reg rb_next_power2(reg n) noexcept {
    if (n == 0) return 1;
    return rb_fold_ones(n - 1) + 1;
}
#endif /* RINGVIEW_HAS_INT_POW2 */

/* Capacity to allocate so that `required` elements fit.
 * Never below RB_MIN_CAPACITY, never above RB_MAX_UNAMBIGUOUS.
 * Returns 0 when `required` cannot be represented at all.
 */
RB_FORCEINLINE constexpr reg rb_capacity_for(const reg required) noexcept {
    if (required > RB_MAX_UNAMBIGUOUS) {
        return 0u;
    }
    const reg want = (required < RB_MIN_CAPACITY) ? RB_MIN_CAPACITY : required;
    return rb_next_power2(want);
}

/* Growth step for a full ring of capacity `current`. */
RB_FORCEINLINE constexpr reg rb_grow(const reg current) noexcept {
    if (current == 0u) {
        return RB_MIN_CAPACITY;
    }
    if (current > (RB_MAX_UNAMBIGUOUS >> RINGVIEW_GROWTH_SHIFT)) {
        return (current < RB_MAX_UNAMBIGUOUS) ? RB_MAX_UNAMBIGUOUS : 0u;
    }
    return current << RINGVIEW_GROWTH_SHIFT;
}

/* Sanity checks (compile-time only) to guard regressions in helpers. */
static_assert(rb_is_pow2(reg{1}) && rb_is_pow2(reg{8}) && !rb_is_pow2(reg{6}), "rb_is_pow2 sanity");
static_assert(rb_next_power2(reg{0}) == 1,  "next_pow2(0)");
static_assert(rb_next_power2(reg{3}) == 4,  "next_pow2(3)");
static_assert(rb_next_power2(reg{8}) == 8,  "next_pow2(8)");
static_assert(rb_is_pow2(RB_MIN_CAPACITY), "RB_MIN_CAPACITY must be power of two");
static_assert(rb_is_pow2(RB_MAX_UNAMBIGUOUS), "RB_MAX_UNAMBIGUOUS must be power of two");
static_assert(rb_next_power2(RB_MAX_UNAMBIGUOUS) == RB_MAX_UNAMBIGUOUS, "next_pow2 at limit");
static_assert(rb_capacity_for(reg{0}) == RB_MIN_CAPACITY, "capacity_for(0)");
static_assert(rb_capacity_for(RB_MIN_CAPACITY + 1u) == (RB_MIN_CAPACITY << 1), "capacity_for rounds up");
static_assert(rb_grow(reg{0}) == RB_MIN_CAPACITY, "grow(0)");
static_assert(rb_grow(RB_MAX_UNAMBIGUOUS) == 0u, "grow at limit");

} // namespace ringview::cap

#endif /* RINGVIEW_CAPACITY_HPP_ */
