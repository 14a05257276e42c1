/*
 * observable_ring_buffer.hpp
 *
 * Double-ended ring that reports every structural change.
 *
 * Each mutation takes sync_root(), applies the change to the ring and raises
 * exactly one collection_changed_event per structural change on
 * collection_changed(), still holding the lock. Subscribers therefore run
 * inside the mutation (source lock held) and see the events in mutation
 * order. Bad indices throw std::out_of_range before anything is changed or
 * raised.
 *
 * Fixed-size mode keeps at most `capacity` elements: a full ring evicts the
 * opposite end (one remove event) before adding.
 *
 * Views are created with create_view(); they snapshot the ring and subscribe
 * inside one critical section on sync_root().
 */

#ifndef RINGVIEW_OBSERVABLE_RING_BUFFER_HPP_
#define RINGVIEW_OBSERVABLE_RING_BUFFER_HPP_

#include <initializer_list>
#include <memory>       // std::shared_ptr, std::unique_ptr
#include <stdexcept>    // std::invalid_argument
#include <type_traits>
#include <utility>      // std::move, std::forward
#include <vector>

#include "basic_types.h"                // reg
#include "macro.h"                      // RINGVIEW_DELETE_COPY_MOVE
#include "base/ringview_log.hpp"        // RINGVIEW_LOG_DEBUG
#include "base/ringview_policy.hpp"     // ::ringview::policy
#include "base/ringview_tools.hpp"      // RB_UNLIKELY, throw_out_of_range
#include "collection_changed.hpp"
#include "event.hpp"
#include "ring_buffer.hpp"
#include "synchronized_view.hpp"

namespace ringview {

template <class T, class LockPolicy = policy::default_policy>
class observable_ring_buffer {
    static_assert(policy::is_lock_policy_v<LockPolicy>,
                  "[observable_ring_buffer]: LockPolicy must be a ringview::policy::Lock<>");

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type = T;
    using size_type = reg;
    using buffer_type = ring_buffer<T>;
    using change_type = collection_changed_event<T>;
    using span_type = typename change_type::span_type;
    using event_type = event<const change_type &>;

    using lock_policy = LockPolicy;
    using mutex_type = typename LockPolicy::mutex_type;
    using guard_type = typename LockPolicy::guard_type;

    template <class TView>
    using view_type = ring_buffer_view<T, TView, LockPolicy>;

    static constexpr size_type npos = buffer_type::npos;

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------
    observable_ring_buffer()
        : changed_(std::make_shared<event_type>())
    {}

    // `capacity` is a reservation hint, or the hard limit when `fixed_size`.
    explicit observable_ring_buffer(const size_type capacity, const bool fixed_size = false)
        : changed_(std::make_shared<event_type>())
        , limit_(fixed_size ? capacity : 0u)
    {
        if (RB_UNLIKELY(fixed_size && capacity == 0u)) {
            throw std::invalid_argument("[observable_ring_buffer]: fixed size requires capacity > 0");
        }
        items_.reserve(capacity);
    }

    observable_ring_buffer(std::initializer_list<T> init)
        : items_(init)
        , changed_(std::make_shared<event_type>())
    {}

    ~observable_ring_buffer() = default;

    RINGVIEW_DELETE_COPY_MOVE(observable_ring_buffer);

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] size_type count() const {
        guard_type lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const { return count() == 0u; }

    [[nodiscard]] bool is_fixed_size() const noexcept { return limit_ != 0u; }

    // 0 when not fixed-size.
    [[nodiscard]] size_type max_count() const noexcept { return limit_; }

    [[nodiscard]] T at(const size_type i) const {
        guard_type lock(mutex_);
        return items_.at(i);
    }

    [[nodiscard]] size_type index_of(const T &v) const {
        guard_type lock(mutex_);
        return items_.index_of(v);
    }

    [[nodiscard]] std::vector<T> to_vector() const {
        guard_type lock(mutex_);
        return items_.to_vector();
    }

    [[nodiscard]] mutex_type &sync_root() const noexcept { return mutex_; }

    [[nodiscard]] event_type &collection_changed() noexcept { return *changed_; }

    // ------------------------------------------------------------------------------------------
    // Additions
    // ------------------------------------------------------------------------------------------
    void add_first(const T &v) {
        guard_type lock(mutex_);
        if (is_full()) {
            evict_last();
        }
        items_.push_front(v);
        changed_->raise(change_type::add(v, 0u));
    }

    void add_last(const T &v) {
        guard_type lock(mutex_);
        if (is_full()) {
            evict_first();
        }
        items_.push_back(v);
        changed_->raise(change_type::add(v, items_.size() - 1u));
    }

    // One batch add event at index == old count.
    void add_last_range(const T *first, const size_type n) {
        if (n == 0u) {
            return;
        }

        guard_type lock(mutex_);
        const T *added = first;
        size_type len = n;

        if (limit_ != 0u) {
            if (len > limit_) {
                RINGVIEW_LOG_DEBUG(source, "range of %llu exceeds fixed size %llu, keeping its tail",
                                   static_cast<unsigned long long>(len),
                                   static_cast<unsigned long long>(limit_));
                added += (len - limit_);
                len = limit_;
            }
            const size_type room = limit_ - items_.size();
            if (len > room) {
                evict_front_range(len - room);
            }
        }

        const size_type index = items_.size();
        for (size_type k = 0; k < len; ++k) {
            items_.push_back(added[k]);
        }
        changed_->raise(change_type::add(span_type{added, len}, index));
    }

    void add_last_range(const std::vector<T> &items) {
        add_last_range(items.data(), static_cast<size_type>(items.size()));
    }

    void add_last_range(std::initializer_list<T> items) {
        add_last_range(items.begin(), static_cast<size_type>(items.size()));
    }

    // ------------------------------------------------------------------------------------------
    // Removals
    // ------------------------------------------------------------------------------------------
    T remove_first() {
        guard_type lock(mutex_);
        if (RB_UNLIKELY(items_.empty())) {
            detail::throw_out_of_range("[observable_ring_buffer]: remove_first() on empty ring");
        }
        T removed(std::move(items_.front()));
        items_.pop_front();
        changed_->raise(change_type::remove(removed, 0u));
        return removed;
    }

    T remove_last() {
        guard_type lock(mutex_);
        if (RB_UNLIKELY(items_.empty())) {
            detail::throw_out_of_range("[observable_ring_buffer]: remove_last() on empty ring");
        }
        T removed(std::move(items_.back()));
        items_.pop_back();
        changed_->raise(change_type::remove(removed, items_.size()));
        return removed;
    }

    T remove_at(const size_type i) {
        guard_type lock(mutex_);
        T removed(std::move(items_.at(i)));
        items_.remove_at(i);
        changed_->raise(change_type::remove(removed, i));
        return removed;
    }

    // One batch remove event for [start, start + len).
    void remove_range(const size_type start, const size_type len) {
        guard_type lock(mutex_);
        if (RB_UNLIKELY(start > items_.size() || len > items_.size() - start)) {
            detail::throw_out_of_range("[observable_ring_buffer]: remove_range() outside [0, count)");
        }
        if (len == 0u) {
            return;
        }
        const std::vector<T> removed = slice(start, len);
        items_.remove_range(start, len);
        changed_->raise(change_type::remove(span_type{removed.data(), len}, start));
    }

    // ------------------------------------------------------------------------------------------
    // Replace / Move / Clear
    // ------------------------------------------------------------------------------------------

    // Returns the replaced value.
    T set(const size_type i, const T &v) {
        guard_type lock(mutex_);
        T old = items_.set(i, v);
        changed_->raise(change_type::replace(v, old, i));
        return old;
    }

    // Removes the element at `old_index` and re-inserts it so that it ends
    // up at `new_index`.
    void move(const size_type old_index, const size_type new_index) {
        guard_type lock(mutex_);
        items_.move(old_index, new_index);
        const T &moved = items_[new_index];
        changed_->raise(change_type::move(moved, new_index, old_index));
    }

    void clear() {
        guard_type lock(mutex_);
        items_.clear();
        changed_->raise(change_type::reset());
    }

    // ------------------------------------------------------------------------------------------
    // Views
    // ------------------------------------------------------------------------------------------
    template <class Transform,
             class TView = std::decay_t<std::invoke_result_t<Transform &, const T &>>>
    [[nodiscard]] std::unique_ptr<view_type<TView>> create_view(Transform &&transform,
                                                                const bool reverse = false) {
        guard_type lock(mutex_);
        return std::make_unique<view_type<TView>>(
            items_, changed_,
            typename view_type<TView>::transform_type(std::forward<Transform>(transform)),
            reverse);
    }

private:
    [[nodiscard]] bool is_full() const noexcept {
        return limit_ != 0u && items_.size() >= limit_;
    }

    [[nodiscard]] std::vector<T> slice(const size_type start, const size_type len) const {
        std::vector<T> out;
        out.reserve(static_cast<std::size_t>(len));
        for (size_type k = 0; k < len; ++k) {
            out.push_back(items_[start + k]);
        }
        return out;
    }

    void evict_first() {
        T removed(std::move(items_.front()));
        items_.pop_front();
        RINGVIEW_LOG_DEBUG(source, "fixed size %llu reached, evicting first",
                           static_cast<unsigned long long>(limit_));
        changed_->raise(change_type::remove(removed, 0u));
    }

    void evict_last() {
        T removed(std::move(items_.back()));
        items_.pop_back();
        RINGVIEW_LOG_DEBUG(source, "fixed size %llu reached, evicting last",
                           static_cast<unsigned long long>(limit_));
        changed_->raise(change_type::remove(removed, items_.size()));
    }

    void evict_front_range(const size_type len) {
        const std::vector<T> removed = slice(0u, len);
        items_.remove_range(0u, len);
        RINGVIEW_LOG_DEBUG(source, "fixed size %llu reached, evicting %llu from the front",
                           static_cast<unsigned long long>(limit_),
                           static_cast<unsigned long long>(len));
        changed_->raise(change_type::remove(span_type{removed.data(), len}, 0u));
    }

private:
    mutable mutex_type mutex_;
    buffer_type items_;
    std::shared_ptr<event_type> changed_;
    size_type limit_{0u};
};

} // namespace ringview

#endif /* RINGVIEW_OBSERVABLE_RING_BUFFER_HPP_ */
