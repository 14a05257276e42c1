/*
 * synchronized_view.hpp
 *
 * Filtered, projected mirror of an observable source.
 *
 * A view owns a private ring_buffer of (value, projection) pairs. It is
 * seeded once from the source (under the source's lock) and then kept in
 * step by translating every collection_changed_event of the source into
 * mirror operations and filter hook calls. The source is never re-scanned.
 *
 * Translation (one event, under the view's lock):
 *   add     : index 0 on a non-empty mirror -> push_front per item,
 *             otherwise push_back per item; on_add after each insertion
 *   remove  : single -> remove, then on_remove
 *             batch  -> on_remove for every entry, then remove_range
 *   replace : overwrite, then on_remove(old), on_add(new)
 *   move    : reposition, then on_move
 *   reset   : on_remove for every entry unless the null filter is active,
 *             then clear
 * followed by routing_collection_changed(event) and
 * collection_state_changed(action), still under the view's lock.
 *
 * Locking:
 * - Source lock first, view lock second. The translation handler runs inside
 *   the source's mutation and takes only the view lock.
 * - count(), attach_filter(), reset_filter(), enumerate(), to_vector() take
 *   only the view lock; they never wait for the source.
 * - dispose() takes no lock. It is idempotent and safe against concurrent or
 *   re-entrant calls.
 *
 * Lifetime:
 * - A view may outlive its source; dispose() then has nothing to detach.
 * - A view disposed or destroyed by another view's hook or handler during a
 *   source mutation is skipped by the rest of that mutation's notification.
 * - A view must not be destroyed from its own hooks or handlers, nor while a
 *   mutation of its source is running on another thread.
 * - An attached filter must outlive the view, or be replaced first.
 */

#ifndef RINGVIEW_SYNCHRONIZED_VIEW_HPP_
#define RINGVIEW_SYNCHRONIZED_VIEW_HPP_

#include <atomic>
#include <functional>  // std::function
#include <memory>      // std::shared_ptr, std::weak_ptr
#include <stdexcept>   // std::invalid_argument
#include <type_traits>
#include <utility>     // std::pair, std::move
#include <vector>

#include "basic_types.h"                        // reg
#include "macro.h"                              // RINGVIEW_DELETE_COPY_MOVE
#include "base/ringview_log.hpp"                // RINGVIEW_LOG_DEBUG, RINGVIEW_LOG_WARN
#include "base/ringview_policy.hpp"             // ::ringview::policy
#include "base/ringview_tools.hpp"              // RB_UNLIKELY, throw_out_of_range
#include "collection_changed.hpp"
#include "event.hpp"
#include "ring_buffer.hpp"
#include "synchronized_view_enumerator.hpp"
#include "synchronized_view_filter.hpp"

namespace ringview {

/* =======================================================================
 * synchronized_view<T, TView>
 *
 * Lock-policy independent surface of a view.
 * ======================================================================= */
template <class T, class TView>
class synchronized_view {
public:
    using entry_type = std::pair<T, TView>;
    using filter_type = synchronized_view_filter<T, TView>;
    using change_type = collection_changed_event<T>;
    using routing_event_type = event<const change_type &>;
    using state_event_type = event<collection_changed_action>;
    using visitor_type = std::function<void(const T &, const TView &)>;
    using size_type = reg;

    virtual ~synchronized_view() = default;

    [[nodiscard]] virtual size_type count() const = 0;
    [[nodiscard]] virtual bool is_reverse() const noexcept = 0;

    virtual void attach_filter(filter_type &filter) = 0;
    virtual void reset_filter(const visitor_type &visitor = {}) = 0;

    // Visible entries (per the active filter) in enumeration order.
    [[nodiscard]] virtual std::vector<entry_type> to_vector() const = 0;

    virtual void dispose() = 0;
    [[nodiscard]] virtual bool is_disposed() const noexcept = 0;

    virtual routing_event_type &routing_collection_changed() noexcept = 0;
    virtual state_event_type &collection_state_changed() noexcept = 0;
};

/* =======================================================================
 * ring_buffer_view<T, TView, LockPolicy>
 * ======================================================================= */
template <class T, class TView, class LockPolicy = policy::default_policy>
class ring_buffer_view final : public synchronized_view<T, TView> {
    using base_type = synchronized_view<T, TView>;

    static_assert(policy::is_lock_policy_v<LockPolicy>,
                  "[ring_buffer_view]: LockPolicy must be a ringview::policy::Lock<>");

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type = T;
    using projection_type = TView;
    using typename base_type::entry_type;
    using typename base_type::filter_type;
    using typename base_type::change_type;
    using typename base_type::routing_event_type;
    using typename base_type::state_event_type;
    using typename base_type::visitor_type;
    using typename base_type::size_type;

    using buffer_type = ring_buffer<entry_type>;
    using transform_type = std::function<TView(const T &)>;
    using source_event_type = event<const change_type &>;
    using token_type = typename source_event_type::token_type;
    using enumerator_type = synchronized_view_enumerator<T, TView, LockPolicy>;

    using mutex_type = typename LockPolicy::mutex_type;
    using guard_type = typename LockPolicy::guard_type;

    static_assert(std::is_copy_constructible_v<T>,
                  "[ring_buffer_view]: T must be copy-constructible (the mirror keeps its own copy).");

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------

    // The caller holds the source's lock for the whole call: `source_items`
    // must not change until the view is subscribed to `source_changed`.
    // observable_ring_buffer::create_view() does exactly that.
    ring_buffer_view(const ring_buffer<T> &source_items,
                     const std::shared_ptr<source_event_type> &source_changed,
                     transform_type transform, const bool reverse)
        : transform_(std::move(transform))
        , reverse_(reverse)
        , filter_(&null_filter<T, TView>::instance())
        , source_changed_(source_changed)
    {
        if (RB_UNLIKELY(!transform_)) {
            throw std::invalid_argument("[ring_buffer_view]: empty transform");
        }

        mirror_.reserve(source_items.size());
        for (const T &item : source_items) {
            mirror_.emplace_back(item, transform_(item));
        }

        if (source_changed) {
            token_.store(source_changed->subscribe(
                             [this](const change_type &e) { on_source_changed(e); }),
                         std::memory_order_release);
        }

        RINGVIEW_LOG_DEBUG(view, "view created over %llu entries (reverse=%d)",
                           static_cast<unsigned long long>(mirror_.size()), reverse_ ? 1 : 0);
    }

    ~ring_buffer_view() override { dispose(); }

    RINGVIEW_DELETE_COPY_MOVE(ring_buffer_view);

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] size_type count() const override {
        guard_type lock(mutex_);
        return mirror_.size();
    }

    [[nodiscard]] bool is_reverse() const noexcept override { return reverse_; }

    [[nodiscard]] bool is_disposed() const noexcept override {
        return token_.load(std::memory_order_acquire) == source_event_type::invalid_token;
    }

    // Lock guarding the mirror. Exposed for callers that need several view
    // calls to be atomic; never take a source lock while holding it.
    [[nodiscard]] mutex_type &sync_root() const noexcept { return mutex_; }

    // ------------------------------------------------------------------------------------------
    // Filter
    // ------------------------------------------------------------------------------------------
    void attach_filter(filter_type &filter) override {
        guard_type lock(mutex_);
        filter_ = &filter;
        for (const entry_type &e : mirror_) {
            filter_->on_attach(e.first, e.second);
        }
        RINGVIEW_LOG_DEBUG(view, "filter attached over %llu entries",
                           static_cast<unsigned long long>(mirror_.size()));
    }

    void reset_filter(const visitor_type &visitor = {}) override {
        guard_type lock(mutex_);
        filter_ = &null_filter<T, TView>::instance();
        if (visitor) {
            for (const entry_type &e : mirror_) {
                visitor(e.first, e.second);
            }
        }
        RINGVIEW_LOG_DEBUG(view, "filter reset");
    }

    [[nodiscard]] bool has_filter() const {
        guard_type lock(mutex_);
        return !filter_->is_null_filter();
    }

    // ------------------------------------------------------------------------------------------
    // Enumeration
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] enumerator_type enumerate() const {
        return enumerator_type(mutex_, mirror_, &filter_, reverse_);
    }

    [[nodiscard]] std::vector<entry_type> to_vector() const override {
        std::vector<entry_type> out;
        const enumerator_type en = enumerate();
        for (const entry_type &e : en) {
            out.push_back(e);
        }
        return out;
    }

    // ------------------------------------------------------------------------------------------
    // Notifications
    // ------------------------------------------------------------------------------------------
    routing_event_type &routing_collection_changed() noexcept override { return routing_changed_; }
    state_event_type &collection_state_changed() noexcept override { return state_changed_; }

    // ------------------------------------------------------------------------------------------
    // Disposal
    // ------------------------------------------------------------------------------------------
    void dispose() override {
        const token_type token = token_.exchange(source_event_type::invalid_token,
                                                 std::memory_order_acq_rel);
        if (token == source_event_type::invalid_token) {
            return;
        }
        if (const std::shared_ptr<source_event_type> source = source_changed_.lock()) {
            (void)source->unsubscribe(token);
        }
        RINGVIEW_LOG_DEBUG(view, "view disposed");
    }

private:
    // ------------------------------------------------------------------------------------------
    // Change translation
    // ------------------------------------------------------------------------------------------
    void on_source_changed(const change_type &e) {
        guard_type lock(mutex_);

        switch (e.action) {
        case collection_changed_action::add:
            translate_add(e);
            break;
        case collection_changed_action::remove:
            translate_remove(e);
            break;
        case collection_changed_action::replace:
            translate_replace(e);
            break;
        case collection_changed_action::move:
            translate_move(e);
            break;
        case collection_changed_action::reset:
            translate_reset();
            break;
        }

        routing_changed_.raise(e);
        state_changed_.raise(e.action);
    }

    void translate_add(const change_type &e) {
        // Batched adds only ever arrive as back-inserts.
        const bool at_front = (e.new_starting_index == 0u) && !mirror_.empty();
        for (const T &item : e.new_items) {
            const entry_type &added = at_front
                ? mirror_.emplace_front(item, transform_(item))
                : mirror_.emplace_back(item, transform_(item));
            filter_->on_add(added.first, added.second);
        }
    }

    void translate_remove(const change_type &e) {
        const size_type start = e.old_starting_index;

        if (e.is_single_item) {
            if (RB_UNLIKELY(start >= mirror_.size())) {
                reject_out_of_sync("remove", start);
            }
            entry_type removed(std::move(mirror_[start]));
            mirror_.remove_at(start);
            filter_->on_remove(removed.first, removed.second);
            return;
        }

        const size_type len = e.old_items.size();
        if (RB_UNLIKELY(start > mirror_.size() || len > mirror_.size() - start)) {
            reject_out_of_sync("batch remove", start);
        }
        for (size_type k = 0; k < len; ++k) {
            const entry_type &leaving = mirror_[start + k];
            filter_->on_remove(leaving.first, leaving.second);
        }
        mirror_.remove_range(start, len);
    }

    void translate_replace(const change_type &e) {
        const size_type index = e.new_starting_index;
        if (RB_UNLIKELY(index >= mirror_.size())) {
            reject_out_of_sync("replace", index);
        }

        const T &item = *e.new_item;
        const entry_type old = mirror_.set(index, entry_type(item, transform_(item)));
        const entry_type &now = mirror_[index];
        filter_->on_remove(old.first, old.second);
        filter_->on_add(now.first, now.second);
    }

    void translate_move(const change_type &e) {
        if (RB_UNLIKELY(e.old_starting_index >= mirror_.size() ||
                        e.new_starting_index >= mirror_.size())) {
            reject_out_of_sync("move", e.old_starting_index);
        }
        mirror_.move(e.old_starting_index, e.new_starting_index);
        const entry_type &moved = mirror_[e.new_starting_index];
        filter_->on_move(moved.first, moved.second);
    }

    // The event does not fit the mirror: the source was not mirrored from the start.
    [[noreturn]] void reject_out_of_sync([[maybe_unused]] const char *what,
                                        [[maybe_unused]] const size_type index) const {
        RINGVIEW_LOG_WARN(view, "%s at %llu does not fit a mirror of %llu entries", what,
                          static_cast<unsigned long long>(index),
                          static_cast<unsigned long long>(mirror_.size()));
        detail::throw_out_of_range("[ring_buffer_view]: change event outside the mirror");
    }

    void translate_reset() {
        if (!filter_->is_null_filter()) {
            for (const entry_type &e : mirror_) {
                filter_->on_remove(e.first, e.second);
            }
        }
        RINGVIEW_LOG_DEBUG(view, "reset: dropping %llu entries",
                           static_cast<unsigned long long>(mirror_.size()));
        mirror_.clear();
    }

private:
    mutable mutex_type mutex_;
    buffer_type mirror_;
    transform_type transform_;
    bool reverse_{false};

    filter_type *filter_;

    routing_event_type routing_changed_;
    state_event_type state_changed_;

    std::weak_ptr<source_event_type> source_changed_;
    std::atomic<token_type> token_{source_event_type::invalid_token};
};

} // namespace ringview

#endif /* RINGVIEW_SYNCHRONIZED_VIEW_HPP_ */
