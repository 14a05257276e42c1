/*
 * collection_changed.hpp
 *
 * Change notification raised by an observable source for exactly one
 * mutation, and re-raised unmodified by every view of that source.
 *
 * Item payloads are NON-OWNING: they point into the raising call frame (or
 * into the source's storage) and are valid only while the notification is
 * being delivered. Handlers consume an event synchronously and never keep it.
 *
 * Shape per action:
 *   add     : new_starting_index, new_item (single) or new_items (batch)
 *   remove  : old_starting_index, old_item (single) or old_items (batch)
 *   replace : new_starting_index == old_starting_index, new_item, old_item
 *   move    : new_starting_index, old_starting_index, new_item == old_item
 *   reset   : no payload
 *
 * Single-item events still fill the matching span with that one element,
 * so `new_items.size()` / `old_items.size()` is always the affected count.
 */

#ifndef RINGVIEW_COLLECTION_CHANGED_HPP_
#define RINGVIEW_COLLECTION_CHANGED_HPP_

#include <cstdint>
#include <limits>
#include <memory>      // std::addressof

#include "basic_types.h"             // reg
#include "base/ringview_tools.hpp"   // RINGVIEW_ASSERT

namespace ringview {

enum class collection_changed_action : std::uint8_t {
    add,
    remove,
    replace,
    move,
    reset
};

[[nodiscard]] constexpr const char* action_name(const collection_changed_action a) noexcept {
    switch (a) {
    case collection_changed_action::add:     return "add";
    case collection_changed_action::remove:  return "remove";
    case collection_changed_action::replace: return "replace";
    case collection_changed_action::move:    return "move";
    case collection_changed_action::reset:   return "reset";
    }
    return "unknown";
}

/* =======================================================================
 * items_span<T>
 *
 * Read-only (pointer, count) window over contiguous items.
 * ======================================================================= */
template <class T>
struct items_span {
    using value_type = T;
    using size_type = reg;
    using const_iterator = const T*;

    const T* ptr{nullptr};
    size_type count{0u};

    [[nodiscard]] constexpr bool empty() const noexcept { return count == 0u; }
    [[nodiscard]] constexpr size_type size() const noexcept { return count; }

    [[nodiscard]] constexpr const_iterator begin() const noexcept { return ptr; }
    [[nodiscard]] constexpr const_iterator end() const noexcept { return ptr + count; }

    [[nodiscard]] const T& operator[](const size_type i) const noexcept {
        RINGVIEW_ASSERT(i < count);
        return ptr[i];
    }
};

/* =======================================================================
 * collection_changed_event<T>
 * ======================================================================= */
template <class T>
struct collection_changed_event {
    using value_type = T;
    using size_type = reg;
    using span_type = items_span<T>;

    // Index value of the unused side (e.g. old_starting_index of an add).
    static constexpr size_type npos = std::numeric_limits<size_type>::max();

    collection_changed_action action{collection_changed_action::reset};
    bool is_single_item{false};

    const T* new_item{nullptr};
    span_type new_items{};
    const T* old_item{nullptr};
    span_type old_items{};

    size_type new_starting_index{npos};
    size_type old_starting_index{npos};

    // ------------------------------------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] static collection_changed_event add(const T& item, const size_type index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::add;
        e.is_single_item = true;
        e.new_item = std::addressof(item);
        e.new_items = span_type{std::addressof(item), 1u};
        e.new_starting_index = index;
        return e;
    }

    [[nodiscard]] static collection_changed_event add(const span_type items, const size_type index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::add;
        e.new_items = items;
        e.new_starting_index = index;
        return e;
    }

    [[nodiscard]] static collection_changed_event remove(const T& item, const size_type index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::remove;
        e.is_single_item = true;
        e.old_item = std::addressof(item);
        e.old_items = span_type{std::addressof(item), 1u};
        e.old_starting_index = index;
        return e;
    }

    [[nodiscard]] static collection_changed_event remove(const span_type items, const size_type index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::remove;
        e.old_items = items;
        e.old_starting_index = index;
        return e;
    }

    [[nodiscard]] static collection_changed_event replace(const T& new_value, const T& old_value,
                                                          const size_type index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::replace;
        e.is_single_item = true;
        e.new_item = std::addressof(new_value);
        e.new_items = span_type{std::addressof(new_value), 1u};
        e.old_item = std::addressof(old_value);
        e.old_items = span_type{std::addressof(old_value), 1u};
        e.new_starting_index = index;
        e.old_starting_index = index;
        return e;
    }

    [[nodiscard]] static collection_changed_event move(const T& item, const size_type new_index,
                                                       const size_type old_index) noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::move;
        e.is_single_item = true;
        e.new_item = std::addressof(item);
        e.new_items = span_type{std::addressof(item), 1u};
        e.old_item = e.new_item;
        e.old_items = e.new_items;
        e.new_starting_index = new_index;
        e.old_starting_index = old_index;
        return e;
    }

    [[nodiscard]] static collection_changed_event reset() noexcept {
        collection_changed_event e;
        e.action = collection_changed_action::reset;
        return e;
    }
};

} // namespace ringview

#endif /* RINGVIEW_COLLECTION_CHANGED_HPP_ */
