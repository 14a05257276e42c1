/*
 * synchronized_view_filter.hpp
 *
 * Pluggable visibility / notification policy attached to a synchronized view.
 *
 * A view always has exactly one active filter. "No filter" is the
 * null_filter singleton, never a null pointer, so the view calls hooks
 * unconditionally.
 *
 * Hook contract (all invoked under the view's lock, with the mirror entry's
 * value and its projection):
 *   on_attach : once per existing entry, in mirror order, right after the
 *               filter became active
 *   on_add    : after an entry was inserted into the mirror
 *   on_remove : for an entry leaving the mirror (before a batch/reset removal,
 *               after a single removal)
 *   on_move   : after an entry was repositioned
 *   is_match  : visibility predicate used by enumeration
 *
 * Filters hold no ownership over entries. A filter object must outlive every
 * view it is attached to.
 */

#ifndef RINGVIEW_SYNCHRONIZED_VIEW_FILTER_HPP_
#define RINGVIEW_SYNCHRONIZED_VIEW_FILTER_HPP_

#include <cstdint>
#include <functional>  // std::function
#include <utility>     // std::move

#include "macro.h"     // RINGVIEW_SINGLETON

namespace ringview {

template <class T, class TView>
class synchronized_view_filter {
public:
    virtual ~synchronized_view_filter() = default;

    [[nodiscard]] virtual bool is_match(const T& value, const TView& view) const = 0;

    virtual void on_attach(const T& value, const TView& view) = 0;
    virtual void on_add(const T& value, const TView& view) = 0;
    virtual void on_remove(const T& value, const TView& view) = 0;
    virtual void on_move(const T& value, const TView& view) = 0;

    [[nodiscard]] virtual bool is_null_filter() const noexcept { return false; }
};

/* =======================================================================
 * null_filter<T, TView>
 *
 * Matches everything, ignores every hook.
 * ======================================================================= */
template <class T, class TView>
class null_filter final : public synchronized_view_filter<T, TView> {
    RINGVIEW_SINGLETON(null_filter, = default);

public:
    [[nodiscard]] bool is_match(const T&, const TView&) const override { return true; }

    void on_attach(const T&, const TView&) override {}
    void on_add(const T&, const TView&) override {}
    void on_remove(const T&, const TView&) override {}
    void on_move(const T&, const TView&) override {}

    [[nodiscard]] bool is_null_filter() const noexcept override { return true; }
};

/* =======================================================================
 * delegate_filter<T, TView>
 *
 * Filter assembled from callables:
 *   predicate  : visibility (is_match)
 *   when_true  : entry attached/added and matching
 *   when_false : entry attached/added and not matching
 *   on_changed : every hook, tagged with its kind
 * Any callable except the predicate may be empty.
 * ======================================================================= */
enum class filter_event_kind : std::uint8_t {
    attach,
    add,
    remove,
    move
};

template <class T, class TView>
class delegate_filter final : public synchronized_view_filter<T, TView> {
public:
    using predicate_type = std::function<bool(const T&, const TView&)>;
    using action_type = std::function<void(const T&, const TView&)>;
    using changed_type = std::function<void(filter_event_kind, const T&, const TView&)>;

    explicit delegate_filter(predicate_type predicate,
                             action_type when_true = {},
                             action_type when_false = {},
                             changed_type on_changed = {})
        : predicate_(std::move(predicate))
        , when_true_(std::move(when_true))
        , when_false_(std::move(when_false))
        , on_changed_(std::move(on_changed))
    {}

    [[nodiscard]] bool is_match(const T& value, const TView& view) const override {
        return !predicate_ || predicate_(value, view);
    }

    void on_attach(const T& value, const TView& view) override {
        classify(value, view);
        changed(filter_event_kind::attach, value, view);
    }

    void on_add(const T& value, const TView& view) override {
        classify(value, view);
        changed(filter_event_kind::add, value, view);
    }

    void on_remove(const T& value, const TView& view) override {
        changed(filter_event_kind::remove, value, view);
    }

    void on_move(const T& value, const TView& view) override {
        changed(filter_event_kind::move, value, view);
    }

private:
    void classify(const T& value, const TView& view) const {
        if (is_match(value, view)) {
            if (when_true_) {
                when_true_(value, view);
            }
        } else if (when_false_) {
            when_false_(value, view);
        }
    }

    void changed(const filter_event_kind kind, const T& value, const TView& view) const {
        if (on_changed_) {
            on_changed_(kind, value, view);
        }
    }

    predicate_type predicate_;
    action_type when_true_;
    action_type when_false_;
    changed_type on_changed_;
};

} // namespace ringview

#endif /* RINGVIEW_SYNCHRONIZED_VIEW_FILTER_HPP_ */
