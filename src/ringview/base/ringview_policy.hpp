/*
 * ringview_policy.hpp
 *
 * Zero-runtime lock policy traits for views and observable sources.
 *
 * Purpose:
 *   - Provide a single place where ringview learns which mutex guards a
 *     source's mutations and which one guards a view's mirror.
 *
 * Layers:
 *   1) Base Lock<Mutex>
 *        - Just picks the mutex and the matching guard types.
 *
 *   2) Ready-made aliases:
 *        - R : std::recursive_mutex. Hooks and subscribers may re-enter the
 *              same view or source on the notifying thread.
 *        - M : std::mutex. Cheaper; re-entrant calls deadlock.
 *        - N : no locking at all (single-threaded use, benchmarks).
 *
 *   3) default_policy:
 *        - Controlled via RINGVIEW_DEFAULT_LOCK_POLICY:
 *            0 → R
 *            1 → M
 *
 * Usage examples:
 *
 *   ringview::observable_ring_buffer<int, ringview::policy::M> source;
 *   auto view = source.create_view([](int v) { return v * 2; });
 *
 * Lock ordering (all policies): source lock first, view lock second.
 * A view never takes its source's lock while holding its own.
 */

#ifndef RINGVIEW_POLICY_HPP_
#define RINGVIEW_POLICY_HPP_

#include <mutex>
#include <type_traits>

#include "ringview_tools.hpp"

namespace ringview::policy {

namespace detail {

/* Lockable that does nothing. Satisfies the Lockable named requirement. */
struct null_mutex {
    void lock() noexcept {}
    void unlock() noexcept {}
    [[nodiscard]] bool try_lock() noexcept { return true; }
};

/* Helper trait: detect a Lockable (lock/unlock/try_lock). */
template <typename T, typename = void>
struct is_lockable : std::false_type {};

template <typename T>
struct is_lockable<
    T, std::void_t<decltype(std::declval<T &>().lock()),
                   decltype(std::declval<T &>().unlock()),
                   decltype(std::declval<T &>().try_lock())>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_lockable_v = is_lockable<T>::value;

} // namespace detail

/* ------------------------------ Lock ----------------------------------
 * Base policy:
 *   - Mutex: lock type stored once per source and once per view.
 * --------------------------------------------------------------------- */
template <class Mutex>
struct Lock {
    static_assert(detail::is_lockable_v<Mutex>,
                  "[policy::Lock]: Mutex must provide lock/unlock/try_lock");

    using mutex_type  = Mutex;
    using guard_type  = std::lock_guard<Mutex>;
    using unique_type = std::unique_lock<Mutex>;

    static constexpr bool is_synchronized =
        !std::is_same_v<Mutex, detail::null_mutex>;
};

/* Ready-made aliases */
using R = Lock<std::recursive_mutex>;
using M = Lock<std::mutex>;
using N = Lock<detail::null_mutex>;

/* Helper trait: detect a lock policy. */
template <typename P, typename = void>
struct is_lock_policy : std::false_type {};

template <typename P>
struct is_lock_policy<
    P, std::void_t<typename P::mutex_type, typename P::guard_type,
                   typename P::unique_type, decltype(P::is_synchronized)>>
    : std::true_type {};

template <typename P>
inline constexpr bool is_lock_policy_v = is_lock_policy<P>::value;

static_assert(is_lock_policy_v<R> && is_lock_policy_v<M> && is_lock_policy_v<N>,
              "[policy]: ready-made aliases must be lock policies");

#if (RINGVIEW_DEFAULT_LOCK_POLICY == 0)
using default_policy = R;
#elif (RINGVIEW_DEFAULT_LOCK_POLICY == 1)
using default_policy = M;
#else
#  error "RINGVIEW_DEFAULT_LOCK_POLICY must be 0 (recursive) or 1 (mutex)"
#endif /* RINGVIEW_DEFAULT_LOCK_POLICY */

} // namespace ringview::policy

#endif /* RINGVIEW_POLICY_HPP_ */
