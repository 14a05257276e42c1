/*
 * ringview_snapshot.hpp
 *
 * Iteration and snapshot utilities for mask-indexed rings.
 *
 * This header provides:
 *  - detail::ring_iterator<T, Size, Const>
 *  - const_snapshot_view<T, Size>  (read-only, forward and reverse)
 *  - snapshot_traits<T, Size>      (bundles types for containers)
 *
 * A snapshot is a pair of logical indices captured when it was made. It is
 * restartable (begin() may be called any number of times) and finite, but it
 * is NOT a live view: mutating the ring while a snapshot is being walked is
 * undefined. Callers serialize through the owning view's lock.
 */

#ifndef RINGVIEW_SNAPSHOT_HPP_
#define RINGVIEW_SNAPSHOT_HPP_

#include <cstddef>     // std::ptrdiff_t
#include <iterator>    // std::bidirectional_iterator_tag, std::reverse_iterator
#include <memory>      // std::addressof
#include <type_traits> // std::conditional_t, std::enable_if_t, std::is_unsigned_v

namespace ringview {

namespace detail {

template<class T, class Size, bool Const>
class ring_iterator
{
    static_assert(std::is_unsigned_v<Size>,
                  "[ring_iterator]: Size must be an unsigned integer type");

public:
    using value_type        = std::remove_const_t<T>;
    using difference_type   = std::ptrdiff_t;
    using reference         = std::conditional_t<Const, const T&, T&>;
    using pointer           = std::conditional_t<Const, const T*, T*>;
    using iterator_category = std::bidirectional_iterator_tag;

    ring_iterator() noexcept = default;

    ring_iterator(pointer storage, Size mask, Size index) noexcept
        : storage_(storage)
        , mask_(mask)
        , index_(index)
    {}

    // Implicit conversion from non-const to const iterator.
    template<bool C = Const, typename = std::enable_if_t<C>>
    ring_iterator(const ring_iterator<T, Size, false>& other) noexcept
        : storage_(other.storage_)
        , mask_(other.mask_)
        , index_(other.index_)
    {}

    reference operator*() const noexcept {
        return storage_[index_ & mask_];
    }

    pointer operator->() const noexcept {
        return std::addressof(**this);
    }

    ring_iterator& operator++() noexcept {
        ++index_;
        return *this;
    }

    ring_iterator operator++(int) noexcept {
        ring_iterator tmp(*this);
        ++(*this);
        return tmp;
    }

    ring_iterator& operator--() noexcept {
        --index_;
        return *this;
    }

    ring_iterator operator--(int) noexcept {
        ring_iterator tmp(*this);
        --(*this);
        return tmp;
    }

    [[nodiscard]] pointer data() const noexcept { return storage_; }
    [[nodiscard]] Size index() const noexcept { return index_; }
    [[nodiscard]] Size mask() const noexcept { return mask_; }

private:
    template<class, class, bool> friend class ring_iterator;

    pointer storage_{nullptr};
    Size    mask_{0};
    Size    index_{0};
};

// Symmetric comparisons for iterator/const_iterator.
template<class T, class Size, bool C1, bool C2>
inline bool operator==(const ring_iterator<T, Size, C1>& a,
                       const ring_iterator<T, Size, C2>& b) noexcept
{
    return a.data() == b.data()
        && a.index() == b.index()
        && a.mask() == b.mask();
}

template<class T, class Size, bool C1, bool C2>
inline bool operator!=(const ring_iterator<T, Size, C1>& a,
                       const ring_iterator<T, Size, C2>& b) noexcept
{
    return !(a == b);
}

} // namespace detail

// ============================================================================
// const_snapshot_view<T, Size> (read-only)
// ============================================================================

template<class T, class Size>
class const_snapshot_view
{
    static_assert(std::is_unsigned_v<Size>,
                  "[const_snapshot_view]: Size must be an unsigned integer type");

public:
    using value_type             = T;
    using size_type              = Size;
    using const_iterator         = detail::ring_iterator<T, Size, true>;
    using iterator               = const_iterator; // Always const.
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator       = const_reverse_iterator;

    const_snapshot_view() noexcept = default;

    const_snapshot_view(const_iterator b, const_iterator e) noexcept
        : begin_(b)
        , end_(e)
    {}

    const_iterator begin() const noexcept { return begin_; }
    const_iterator end() const noexcept { return end_; }

    const_iterator cbegin() const noexcept { return begin_; }
    const_iterator cend() const noexcept { return end_; }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end_); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin_); }

    // Indices are free-running, so the distance survives wrap-around.
    [[nodiscard]] size_type size() const noexcept {
        return static_cast<size_type>(end_.index() - begin_.index());
    }

    [[nodiscard]] size_type first_index() const noexcept { return begin_.index(); }
    [[nodiscard]] size_type last_index() const noexcept { return end_.index(); }

    [[nodiscard]] bool empty() const noexcept {
        return begin_.index() == end_.index();
    }

private:
    const_iterator begin_{};
    const_iterator end_{};
};

// ============================================================================
// snapshot_traits<T, Size>
// ============================================================================

template<class T, class Size>
struct snapshot_traits
{
    using value_type     = T;
    using size_type      = Size;

    using iterator       = detail::ring_iterator<T, Size, false>;
    using const_iterator = detail::ring_iterator<T, Size, true>;

    using const_snapshot = const_snapshot_view<T, Size>;
};

} // namespace ringview

#endif /* RINGVIEW_SNAPSHOT_HPP_ */
