/*
 * synchronized_view_enumerator.hpp
 *
 * Lock-holding, filtered traversal of a view's mirror.
 *
 * The enumerator acquires the view's lock in its constructor and releases it
 * in its destructor, so the mirror cannot change while it is alive (on other
 * threads; with the recursive default policy the owning thread still can).
 * Keep enumerators short-lived.
 *
 * - Yields `const std::pair<T, TView>&` for every entry accepted by the
 *   active filter's is_match(value, projection).
 * - Direction is fixed at creation: source order, or its exact reverse.
 * - begin() may be called any number of times; each pass starts over.
 * - Movable, not copyable (owns the lock).
 */

#ifndef RINGVIEW_SYNCHRONIZED_VIEW_ENUMERATOR_HPP_
#define RINGVIEW_SYNCHRONIZED_VIEW_ENUMERATOR_HPP_

#include <cstddef>   // std::ptrdiff_t
#include <iterator>  // std::forward_iterator_tag
#include <memory>    // std::addressof
#include <utility>   // std::pair

#include "basic_types.h"                // reg
#include "base/ringview_policy.hpp"     // ::ringview::policy
#include "base/ringview_tools.hpp"      // RINGVIEW_ASSERT
#include "ring_buffer.hpp"
#include "synchronized_view_filter.hpp"

namespace ringview {

template <class T, class TView, class LockPolicy = policy::default_policy>
class synchronized_view_enumerator {
    static_assert(policy::is_lock_policy_v<LockPolicy>,
                  "[synchronized_view_enumerator]: LockPolicy must be a ringview::policy::Lock<>");

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using entry_type = std::pair<T, TView>;
    using buffer_type = ring_buffer<entry_type>;
    using filter_type = synchronized_view_filter<T, TView>;
    using mutex_type = typename LockPolicy::mutex_type;
    using unique_type = typename LockPolicy::unique_type;
    using size_type = reg;

    class const_iterator {
    public:
        using value_type = entry_type;
        using difference_type = std::ptrdiff_t;
        using reference = const entry_type &;
        using pointer = const entry_type *;
        using iterator_category = std::forward_iterator_tag;

        const_iterator() noexcept = default;

        reference operator*() const noexcept {
            RINGVIEW_ASSERT(pos_ < buffer_->size());
            return (*buffer_)[reverse_ ? (buffer_->size() - 1u - pos_) : pos_];
        }

        pointer operator->() const noexcept { return std::addressof(**this); }

        const_iterator &operator++() {
            ++pos_;
            skip_rejected();
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp(*this);
            ++(*this);
            return tmp;
        }

        friend bool operator==(const const_iterator &a, const const_iterator &b) noexcept {
            return a.buffer_ == b.buffer_ && a.pos_ == b.pos_;
        }

        friend bool operator!=(const const_iterator &a, const const_iterator &b) noexcept {
            return !(a == b);
        }

    private:
        friend class synchronized_view_enumerator;

        const_iterator(const buffer_type *buffer, const filter_type *filter,
                       const size_type pos, const bool reverse)
            : buffer_(buffer), filter_(filter), pos_(pos), reverse_(reverse) {
            skip_rejected();
        }

        // Advances to the next accepted entry, or to the end position.
        void skip_rejected() {
            if (buffer_ == nullptr || filter_ == nullptr) {
                return;
            }
            while (pos_ < buffer_->size()) {
                const entry_type &e = **this;
                if (filter_->is_match(e.first, e.second)) {
                    return;
                }
                ++pos_;
            }
        }

        const buffer_type *buffer_{nullptr};
        const filter_type *filter_{nullptr};
        size_type pos_{0u};
        bool reverse_{false};
    };

    using iterator = const_iterator;

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------

    // `*active_filter` is read after the lock is taken (member order), so the
    // enumerator sees the filter that is active once it owns the mirror.
    synchronized_view_enumerator(mutex_type &mutex, const buffer_type &buffer,
                                 const filter_type *const *active_filter, const bool reverse)
        : lock_(mutex)
        , buffer_(std::addressof(buffer))
        , filter_(*active_filter)
        , reverse_(reverse)
    {
        RINGVIEW_ASSERT(filter_ != nullptr);
    }

    ~synchronized_view_enumerator() = default;

    synchronized_view_enumerator(const synchronized_view_enumerator &) = delete;
    synchronized_view_enumerator &operator=(const synchronized_view_enumerator &) = delete;

    synchronized_view_enumerator(synchronized_view_enumerator &&other) noexcept
        : lock_(std::move(other.lock_))
        , buffer_(other.buffer_)
        , filter_(other.filter_)
        , reverse_(other.reverse_)
    {
        other.buffer_ = nullptr;
        other.filter_ = nullptr;
    }

    synchronized_view_enumerator &operator=(synchronized_view_enumerator &&other) noexcept {
        if (this != &other) {
            lock_ = std::move(other.lock_);
            buffer_ = other.buffer_;
            filter_ = other.filter_;
            reverse_ = other.reverse_;
            other.buffer_ = nullptr;
            other.filter_ = nullptr;
        }
        return *this;
    }

    // ------------------------------------------------------------------------------------------
    // Traversal
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] const_iterator begin() const {
        return const_iterator(buffer_, filter_, 0u, reverse_);
    }

    [[nodiscard]] const_iterator end() const noexcept {
        const size_type n = (buffer_ != nullptr) ? buffer_->size() : 0u;
        const_iterator it;
        it.buffer_ = buffer_;
        it.filter_ = filter_;
        it.pos_ = n;
        it.reverse_ = reverse_;
        return it;
    }

    [[nodiscard]] bool is_reverse() const noexcept { return reverse_; }

    // False once moved from.
    [[nodiscard]] bool owns_lock() const noexcept { return buffer_ != nullptr; }

private:
    unique_type lock_;
    const buffer_type *buffer_{nullptr};
    const filter_type *filter_{nullptr};
    bool reverse_{false};
};

} // namespace ringview

#endif /* RINGVIEW_SYNCHRONIZED_VIEW_ENUMERATOR_HPP_ */
