/*
 * basic_types.h: Platform-independent size and token aliases
 *
 * The ringview headers only need the native word for indices, counts and
 * capacities (`reg`) and a fixed 64-bit type for subscription tokens.
 *
 * ────────────────────────────────────────────────────────────────────────────
 *  Alias  │ Underlying type    │ Used for
 * ────────┼────────────────────┼──────────────────────────────────────────────
 *  reg    │ std::size_t        │ ring indices, sizes, capacities, masks
 *  u64    │ std::uint64_t      │ subscription tokens
 * ────────────────────────────────────────────────────────────────────────────
 *
 * Platform assumptions:
 *     - 8-bit bytes.
 *     - `reg` is pointer-sized and unsigned (mask-based ring indexing relies
 *       on unsigned wrap-around).
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstddef>   /* size_t */
#include <cstdint>   /* fixed-width integers */
#include <type_traits>

/* Native register-size type (matches pointer size) */
using reg = std::size_t;       /* unsigned native word (for indices/capacities) */

/* Exact-width integer types */
using u64 = std::uint64_t;

/* ------------------------------ Sanity checks ------------------------------- */
static_assert(std::is_unsigned_v<reg>, "reg must be unsigned");
static_assert(sizeof(reg) == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");

#endif /* BASIC_TYPES_H_ */
