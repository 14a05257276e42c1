/*
 * ring_buffer.hpp
 *
 * Growable double-ended ring (owning). Storage of the view's mirror.
 *
 * Design goals:
 * - O(1) amortized push/pop at both ends (mask-indexed, power-of-two storage).
 * - O(1) indexed read and replace.
 * - O(k) removal of a contiguous slice, O(n) arbitrary insert/remove; both
 *   shift whichever side of the hole is shorter.
 * - Only live slots hold constructed objects (placement construction), so T
 *   does not need a default constructor.
 *
 * Indexing model:
 * - head_ is a free-running logical index of element 0. push_front simply
 *   decrements it; unsigned wrap-around is harmless because the capacity
 *   divides 2^bits(reg).
 * - Element i lives in storage_[(head_ + i) & (capacity - 1)].
 *
 * Error model:
 * - at(), set(), remove_at(), remove_range(), insert_at(), pop_front() and
 *   pop_back() throw std::out_of_range on a bad index / empty ring.
 * - operator[], front() and back() are unchecked (RINGVIEW_ASSERT only).
 * - Growth is strongly exception-safe: if allocation or relocation throws,
 *   the ring is left unchanged.
 *
 * Concurrency model:
 * - None. The owner (synchronized view) serializes every access.
 */

#ifndef RINGVIEW_RING_BUFFER_HPP_
#define RINGVIEW_RING_BUFFER_HPP_

#include <cstddef>          // std::ptrdiff_t
#include <initializer_list>
#include <iterator>         // std::reverse_iterator
#include <limits>
#include <memory>           // std::allocator, std::allocator_traits
#include <type_traits>
#include <utility>          // std::move, std::swap, std::forward
#include <vector>

#include "basic_types.h"                // reg
#include "base/ringview_capacity.hpp"   // ::ringview::cap::rb_grow, rb_capacity_for
#include "base/ringview_object.hpp"     // ::ringview::detail::construct_at, destroy_at
#include "base/ringview_snapshot.hpp"   // ::ringview::const_snapshot_view, snapshot_traits
#include "base/ringview_tools.hpp"      // RB_FORCEINLINE, RB_UNLIKELY, RINGVIEW_ASSERT

namespace ringview {

/* =======================================================================
 * ring_buffer<T, Alloc>
 *
 * Owning double-ended ring buffer with random access.
 * ======================================================================= */
template <class T, typename Alloc = std::allocator<T>>
class ring_buffer {
public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type = T;
    using pointer = value_type *;
    using const_pointer = const value_type *;
    using reference = value_type &;
    using const_reference = const value_type &;

    using size_type = reg;
    using difference_type = std::ptrdiff_t;

    // Allocator types
    using allocator_type = typename std::allocator_traits<Alloc>::template rebind_alloc<value_type>;
    using alloc_traits = std::allocator_traits<allocator_type>;

    // Iterator types
    using iterator = ::ringview::detail::ring_iterator<value_type, size_type, false>;
    using const_iterator = ::ringview::detail::ring_iterator<value_type, size_type, true>;
    using reverse_iterator = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    // Snapshot types
    using snapshot_traits = ::ringview::snapshot_traits<value_type, size_type>;
    using const_snapshot = typename snapshot_traits::const_snapshot;

    static constexpr size_type npos = std::numeric_limits<size_type>::max();

    // ------------------------------------------------------------------------------------------
    // Static Assertions
    // ------------------------------------------------------------------------------------------
    static_assert(alloc_traits::is_always_equal::value,
                  "[ringview::ring_buffer]: requires an always_equal allocator (stateless).");
    static_assert(std::is_default_constructible_v<allocator_type>,
                  "[ringview::ring_buffer]: requires a default-constructible allocator.");
    static_assert(std::is_same_v<typename alloc_traits::pointer, pointer>,
                  "[ringview::ring_buffer]: requires allocator pointer type T*.");
    static_assert(!std::is_const_v<value_type>,
                  "[ringview::ring_buffer]: const T does not make sense for a writable ring.");
    static_assert(std::is_move_constructible_v<value_type>,
                  "[ringview::ring_buffer]: value_type must be move-constructible (growth relocates).");
    static_assert(std::is_move_assignable_v<value_type> || std::is_copy_assignable_v<value_type>,
                  "[ringview::ring_buffer]: value_type must be move- or copy-assignable (middle insert/remove shifts).");
    static_assert(std::is_nothrow_destructible_v<value_type>,
                  "[ringview::ring_buffer]: value_type must have a noexcept destructor.");

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------
    ring_buffer() noexcept = default;

    explicit ring_buffer(const size_type initial_capacity) { reserve(initial_capacity); }

    ring_buffer(std::initializer_list<value_type> init) {
        assign_range(init.begin(), init.end(), static_cast<size_type>(init.size()));
    }

    // Bulk construction from any input range, preserving order.
    template <class InputIt,
             typename = std::enable_if_t<!std::is_integral_v<InputIt>>>
    ring_buffer(InputIt first, InputIt last) {
        assign_range(first, last, 0u);
    }

    ~ring_buffer() noexcept { release(); }

    ring_buffer(const ring_buffer &other) { copy_from(other); }

    ring_buffer &operator=(const ring_buffer &other) {
        if (this != &other) {
            ring_buffer tmp(other);
            swap(tmp);
        }
        return *this;
    }

    ring_buffer(ring_buffer &&other) noexcept
        : storage_(other.storage_), capacity_(other.capacity_),
          head_(other.head_), size_(other.size_) {
        other.detach();
    }

    ring_buffer &operator=(ring_buffer &&other) noexcept {
        if (this != &other) {
            release();
            storage_ = other.storage_;
            capacity_ = other.capacity_;
            head_ = other.head_;
            size_ = other.size_;
            other.detach();
        }
        return *this;
    }

    void swap(ring_buffer &other) noexcept {
        std::swap(storage_, other.storage_);
        std::swap(capacity_, other.capacity_);
        std::swap(head_, other.head_);
        std::swap(size_, other.size_);
    }

    friend void swap(ring_buffer &a, ring_buffer &b) noexcept { a.swap(b); }

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE size_type size() const noexcept { return size_; }
    [[nodiscard]] RB_FORCEINLINE size_type count() const noexcept { return size_; }
    [[nodiscard]] RB_FORCEINLINE bool empty() const noexcept { return size_ == 0u; }
    [[nodiscard]] RB_FORCEINLINE size_type capacity() const noexcept { return capacity_; }
    [[nodiscard]] allocator_type get_allocator() const noexcept { return {}; }

    // ------------------------------------------------------------------------------------------
    // Element Access
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE reference operator[](const size_type i) noexcept {
        RINGVIEW_ASSERT(i < size_);
        return slot(i);
    }

    [[nodiscard]] RB_FORCEINLINE const_reference operator[](const size_type i) const noexcept {
        RINGVIEW_ASSERT(i < size_);
        return slot(i);
    }

    [[nodiscard]] reference at(const size_type i) {
        check_index(i);
        return slot(i);
    }

    [[nodiscard]] const_reference at(const size_type i) const {
        check_index(i);
        return slot(i);
    }

    // Replace element i. Returns the previous value.
    template <class U,
             typename = std::enable_if_t<std::is_assignable_v<reference, U &&>>>
    value_type set(const size_type i, U &&v) {
        check_index(i);
        value_type old(std::move(slot(i)));
        slot(i) = std::forward<U>(v);
        return old;
    }

    [[nodiscard]] RB_FORCEINLINE reference front() noexcept {
        RINGVIEW_ASSERT(!empty());
        return slot(0u);
    }

    [[nodiscard]] RB_FORCEINLINE const_reference front() const noexcept {
        RINGVIEW_ASSERT(!empty());
        return slot(0u);
    }

    [[nodiscard]] RB_FORCEINLINE reference back() noexcept {
        RINGVIEW_ASSERT(!empty());
        return slot(size_ - 1u);
    }

    [[nodiscard]] RB_FORCEINLINE const_reference back() const noexcept {
        RINGVIEW_ASSERT(!empty());
        return slot(size_ - 1u);
    }

    // Linear search. Returns npos when absent.
    template <class U>
    [[nodiscard]] size_type index_of(const U &v) const {
        for (size_type i = 0; i < size_; ++i) {
            if (slot(i) == v) {
                return i;
            }
        }
        return npos;
    }

    [[nodiscard]] std::vector<value_type> to_vector() const {
        std::vector<value_type> out;
        out.reserve(static_cast<std::size_t>(size_));
        for (size_type i = 0; i < size_; ++i) {
            out.push_back(slot(i));
        }
        return out;
    }

    // ------------------------------------------------------------------------------------------
    // Iteration API
    // ------------------------------------------------------------------------------------------
    iterator begin() noexcept { return iterator(storage_, mask(), head_); }
    iterator end() noexcept { return iterator(storage_, mask(), head_ + size_); }

    const_iterator begin() const noexcept { return cbegin(); }
    const_iterator end() const noexcept { return cend(); }

    const_iterator cbegin() const noexcept { return const_iterator(storage_, mask(), head_); }
    const_iterator cend() const noexcept { return const_iterator(storage_, mask(), head_ + size_); }

    reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
    reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }
    const_reverse_iterator crbegin() const noexcept { return const_reverse_iterator(cend()); }
    const_reverse_iterator crend() const noexcept { return const_reverse_iterator(cbegin()); }

    // ------------------------------------------------------------------------------------------
    // Snapshots
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] const_snapshot make_snapshot() const noexcept {
        return const_snapshot(cbegin(), cend());
    }

    // ------------------------------------------------------------------------------------------
    // Ends (O(1) amortized)
    // ------------------------------------------------------------------------------------------
    template <class... Args>
    reference emplace_back(Args &&...args) {
        static_assert(std::is_constructible_v<value_type, Args &&...>,
                      "[ring_buffer]: T must be constructible from Args...");
        if (RB_UNLIKELY(size_ == capacity_)) {
            // Build first: args may alias an element that growth relocates.
            value_type tmp(std::forward<Args>(args)...);
            grow_to(::ringview::cap::rb_grow(capacity_));
            pointer p = detail::construct_at(std::addressof(raw(head_ + size_)), std::move(tmp));
            ++size_;
            return *p;
        }

        pointer p = detail::construct_at(std::addressof(raw(head_ + size_)),
                                         std::forward<Args>(args)...);
        ++size_;
        return *p;
    }

    template <class... Args>
    reference emplace_front(Args &&...args) {
        static_assert(std::is_constructible_v<value_type, Args &&...>,
                      "[ring_buffer]: T must be constructible from Args...");
        if (RB_UNLIKELY(size_ == capacity_)) {
            value_type tmp(std::forward<Args>(args)...);
            grow_to(::ringview::cap::rb_grow(capacity_));
            pointer p = detail::construct_at(std::addressof(raw(head_ - 1u)), std::move(tmp));
            --head_;
            ++size_;
            return *p;
        }

        pointer p = detail::construct_at(std::addressof(raw(head_ - 1u)),
                                         std::forward<Args>(args)...);
        --head_;
        ++size_;
        return *p;
    }

    void push_back(const value_type &v) { (void)emplace_back(v); }
    void push_back(value_type &&v) { (void)emplace_back(std::move(v)); }
    void push_front(const value_type &v) { (void)emplace_front(v); }
    void push_front(value_type &&v) { (void)emplace_front(std::move(v)); }

    void pop_front() {
        if (RB_UNLIKELY(empty())) {
            detail::throw_out_of_range("[ring_buffer]: pop_front() on empty ring");
        }
        detail::destroy_at(std::addressof(raw(head_)));
        ++head_;
        --size_;
    }

    void pop_back() {
        if (RB_UNLIKELY(empty())) {
            detail::throw_out_of_range("[ring_buffer]: pop_back() on empty ring");
        }
        detail::destroy_at(std::addressof(raw(head_ + size_ - 1u)));
        --size_;
    }

    // ------------------------------------------------------------------------------------------
    // Middle (O(n), shorter side shifts)
    // ------------------------------------------------------------------------------------------
    void remove_at(const size_type i) {
        check_index(i);

        if (i == 0u) {
            pop_front();
            return;
        }
        if (i == size_ - 1u) {
            pop_back();
            return;
        }

        if (i < (size_ >> 1)) {
            // Close the hole from the front: [0, i) moves one slot right.
            for (size_type k = i; k > 0u; --k) {
                slot(k) = std::move(slot(k - 1u));
            }
            detail::destroy_at(std::addressof(raw(head_)));
            ++head_;
        } else {
            // Close the hole from the back: (i, size) moves one slot left.
            for (size_type k = i; k + 1u < size_; ++k) {
                slot(k) = std::move(slot(k + 1u));
            }
            detail::destroy_at(std::addressof(raw(head_ + size_ - 1u)));
        }
        --size_;
    }

    void remove_range(const size_type start, const size_type len) {
        if (RB_UNLIKELY(start > size_ || len > size_ - start)) {
            detail::throw_out_of_range("[ring_buffer]: remove_range() outside [0, size)");
        }
        if (len == 0u) {
            return;
        }

        const size_type before = start;
        const size_type after = static_cast<size_type>(size_ - start - len);

        if (before < after) {
            // Shift the prefix right by len, then drop the first len slots.
            for (size_type k = before; k > 0u; --k) {
                slot(k - 1u + len) = std::move(slot(k - 1u));
            }
            for (size_type k = 0; k < len; ++k) {
                detail::destroy_at(std::addressof(raw(head_ + k)));
            }
            head_ += len;
        } else {
            // Shift the suffix left by len, then drop the last len slots.
            for (size_type k = start + len; k < size_; ++k) {
                slot(k - len) = std::move(slot(k));
            }
            for (size_type k = size_ - len; k < size_; ++k) {
                detail::destroy_at(std::addressof(raw(head_ + k)));
            }
        }
        size_ -= len;
    }

    template <class... Args>
    reference emplace_at(const size_type i, Args &&...args) {
        if (RB_UNLIKELY(i > size_)) {
            detail::throw_out_of_range("[ring_buffer]: insert position outside [0, size]");
        }
        if (i == 0u) {
            return emplace_front(std::forward<Args>(args)...);
        }
        if (i == size_) {
            return emplace_back(std::forward<Args>(args)...);
        }

        value_type tmp(std::forward<Args>(args)...);
        if (RB_UNLIKELY(size_ == capacity_)) {
            grow_to(::ringview::cap::rb_grow(capacity_));
        }

        if (i < (size_ >> 1)) {
            // Open the hole from the front: [0, i) moves one slot left.
            detail::construct_at(std::addressof(raw(head_ - 1u)), std::move(slot(0u)));
            --head_;
            ++size_;
            for (size_type k = 1u; k < i; ++k) {
                slot(k) = std::move(slot(k + 1u));
            }
        } else {
            // Open the hole from the back: [i, size) moves one slot right.
            detail::construct_at(std::addressof(raw(head_ + size_)), std::move(slot(size_ - 1u)));
            ++size_;
            for (size_type k = size_ - 2u; k > i; --k) {
                slot(k) = std::move(slot(k - 1u));
            }
        }
        slot(i) = std::move(tmp);
        return slot(i);
    }

    void insert_at(const size_type i, const value_type &v) { (void)emplace_at(i, v); }
    void insert_at(const size_type i, value_type &&v) { (void)emplace_at(i, std::move(v)); }

    // Removes element `from` and re-inserts it at `to` (index in the ring
    // after removal). Shifts only the elements between the two positions.
    void move(const size_type from, const size_type to) {
        check_index(from);
        check_index(to);
        if (from == to) {
            return;
        }

        value_type moved(std::move(slot(from)));
        if (from < to) {
            for (size_type k = from; k < to; ++k) {
                slot(k) = std::move(slot(k + 1u));
            }
        } else {
            for (size_type k = from; k > to; --k) {
                slot(k) = std::move(slot(k - 1u));
            }
        }
        slot(to) = std::move(moved);
    }

    // ------------------------------------------------------------------------------------------
    // Whole-ring operations
    // ------------------------------------------------------------------------------------------
    void clear() noexcept {
        destroy_live();
        head_ = 0u;
        size_ = 0u;
    }

    void reserve(const size_type min_capacity) {
        if (min_capacity <= capacity_) {
            return;
        }
        const size_type target = ::ringview::cap::rb_capacity_for(min_capacity);
        if (RB_UNLIKELY(target == 0u)) {
            throw std::length_error("[ring_buffer]: reserve() beyond RB_MAX_UNAMBIGUOUS");
        }
        grow_to(target);
    }

private:
    [[nodiscard]] RB_FORCEINLINE size_type mask() const noexcept {
        return (capacity_ != 0u) ? static_cast<size_type>(capacity_ - 1u) : 0u;
    }

    // Slot by free-running logical index.
    [[nodiscard]] RB_FORCEINLINE reference raw(const size_type logical) noexcept {
        return storage_[logical & mask()];
    }

    [[nodiscard]] RB_FORCEINLINE const_reference raw(const size_type logical) const noexcept {
        return storage_[logical & mask()];
    }

    // Slot by element position.
    [[nodiscard]] RB_FORCEINLINE reference slot(const size_type i) noexcept {
        return raw(head_ + i);
    }

    [[nodiscard]] RB_FORCEINLINE const_reference slot(const size_type i) const noexcept {
        return raw(head_ + i);
    }

    RB_FORCEINLINE void check_index(const size_type i) const {
        if (RB_UNLIKELY(i >= size_)) {
            detail::throw_out_of_range("[ring_buffer]: index outside [0, size)");
        }
    }

    // Reallocate to new_cap and linearize (element 0 lands in slot 0).
    void grow_to(const size_type new_cap) {
        if (RB_UNLIKELY(new_cap == 0u || new_cap < size_)) {
            throw std::length_error("[ring_buffer]: capacity exhausted");
        }
        RINGVIEW_ASSERT(::ringview::cap::rb_is_pow2(new_cap));

        allocator_type alloc{};
        pointer new_buf = alloc_traits::allocate(alloc, new_cap);

        size_type built = 0u;
        try {
            for (; built < size_; ++built) {
                detail::construct_at(new_buf + built, std::move_if_noexcept(slot(built)));
            }
        } catch (...) {
            // Rollback: the old ring is untouched when relocation copies.
            for (size_type k = 0; k < built; ++k) {
                detail::destroy_at(new_buf + k);
            }
            alloc_traits::deallocate(alloc, new_buf, new_cap);
            throw;
        }

        const size_type sz = size_;
        release();

        storage_ = new_buf;
        capacity_ = new_cap;
        head_ = 0u;
        size_ = sz;
    }

    void copy_from(const ring_buffer &other) {
        if (other.empty()) {
            return;
        }
        assign_range(other.cbegin(), other.cend(), other.size_);
    }

    // Builds aside and adopts on success; a throwing element leaves *this
    // untouched and the partial copy is destroyed by tmp.
    template <class InputIt>
    void assign_range(InputIt first, InputIt last, const size_type hint) {
        ring_buffer tmp;
        if (hint != 0u) {
            tmp.reserve(hint);
        }
        for (; first != last; ++first) {
            tmp.emplace_back(*first);
        }
        swap(tmp);
    }

    void destroy_live() noexcept {
        if constexpr (!std::is_trivially_destructible_v<value_type>) {
            for (size_type k = 0; k < size_; ++k) {
                detail::destroy_at(std::addressof(slot(k)));
            }
        }
    }

    void release() noexcept {
        destroy_live();
        if (storage_ != nullptr) {
            allocator_type alloc{};
            alloc_traits::deallocate(alloc, storage_, capacity_);
        }
        detach();
    }

    void detach() noexcept {
        storage_ = nullptr;
        capacity_ = 0u;
        head_ = 0u;
        size_ = 0u;
    }

private:
    pointer storage_{nullptr};
    size_type capacity_{0u};
    size_type head_{0u};
    size_type size_{0u};
};

} // namespace ringview

#endif /* RINGVIEW_RING_BUFFER_HPP_ */
