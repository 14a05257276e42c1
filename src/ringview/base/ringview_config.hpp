/*
 * ringview_config.hpp
 *
 * Compile-time configuration for the ringview headers.
 * Every macro may be predefined by the user (before inclusion or via the
 * build system) to override the default.
 */

#ifndef RINGVIEW_CONFIG_HPP_
#define RINGVIEW_CONFIG_HPP_

/*
 * Mirror buffer settings
 * Build toggles:
 *   - RINGVIEW_MIN_CAPACITY (default: 8)
 *       First allocation made by an empty ring_buffer. Must be a power of two
 *       and >= 2 (mask-based indexing).
 *
 *   - RINGVIEW_GROWTH_SHIFT (default: 1)
 *       Growth factor exponent when a full ring_buffer needs one more slot.
 *       1 -> double, 2 -> quadruple.
 */
#ifndef RINGVIEW_MIN_CAPACITY
#  define RINGVIEW_MIN_CAPACITY 8u
#endif /* RINGVIEW_MIN_CAPACITY */

#if ((RINGVIEW_MIN_CAPACITY) < 2u) || (((RINGVIEW_MIN_CAPACITY) & ((RINGVIEW_MIN_CAPACITY) - 1u)) != 0u)
#  error "RINGVIEW_MIN_CAPACITY must be a power-of-two >= 2"
#endif

#ifndef RINGVIEW_GROWTH_SHIFT
#  define RINGVIEW_GROWTH_SHIFT 1u
#endif /* RINGVIEW_GROWTH_SHIFT */


// assert ------------------------
#ifndef RINGVIEW_ASSERT
#  define RINGVIEW_ASSERT(x)
#endif /* RINGVIEW_ASSERT */


/*
 * Default lock policy for views and observable sources.
 *   0 = recursive mutex (filter hooks and subscribers may call back into the
 *       same view or source on the notifying thread)
 *   1 = plain mutex (cheaper, but re-entrant calls deadlock)
 */
#ifndef RINGVIEW_DEFAULT_LOCK_POLICY
#  define RINGVIEW_DEFAULT_LOCK_POLICY 0
#endif /* RINGVIEW_DEFAULT_LOCK_POLICY */

// ============================================================================
// Logging configuration
// ============================================================================
//
//   - RINGVIEW_ENABLE_LOGGING == 1 : diagnostics go to Qt logging categories
//                                    "ringview.view" and "ringview.source".
//   - RINGVIEW_ENABLE_LOGGING == 0 : diagnostics are compiled out.
//
// Default: 1. Debug output is still filtered by QT_LOGGING_RULES at runtime
// (categories are created with QtWarningMsg as their threshold).
//
#ifndef RINGVIEW_ENABLE_LOGGING
#  define RINGVIEW_ENABLE_LOGGING 1
#endif /* RINGVIEW_ENABLE_LOGGING */


#endif /* RINGVIEW_CONFIG_HPP_ */
