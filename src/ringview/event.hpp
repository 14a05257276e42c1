/*
 * event.hpp
 *
 * Explicit subscribe/unsubscribe observer list.
 *
 * - subscribe() returns a token; unsubscribe(token) removes exactly that
 *   handler and reports whether it was still registered, so a second
 *   unsubscribe with the same token is a harmless no-op.
 * - The handler list is copy-on-write: raising an event takes a reference
 *   to the current list and calls it without holding the list's mutex, so
 *   handlers may subscribe or unsubscribe (themselves included) while being
 *   invoked. A new subscription is first called by the next raise. An
 *   unsubscribe takes effect at once: a raise in progress on the same thread
 *   skips the removed handler if it has not reached it yet.
 * - Handlers run synchronously on the raising thread, in subscription order.
 *   Exceptions thrown by a handler propagate to the raiser; later handlers
 *   of that raise are skipped.
 */

#ifndef RINGVIEW_EVENT_HPP_
#define RINGVIEW_EVENT_HPP_

#include <algorithm>   // std::find_if
#include <atomic>
#include <functional>  // std::function
#include <memory>      // std::shared_ptr, std::make_shared
#include <mutex>
#include <utility>     // std::move
#include <vector>

#include "basic_types.h"             // reg, u64
#include "base/ringview_tools.hpp"   // RB_UNLIKELY

namespace ringview {

template <class... Args>
class event {
public:
    using handler_type = std::function<void(Args...)>;
    using token_type = u64;
    using size_type = reg;

    static constexpr token_type invalid_token = 0u;

    event() = default;

    event(const event &) = delete;
    event &operator=(const event &) = delete;

    [[nodiscard]] token_type subscribe(handler_type handler) {
        if (RB_UNLIKELY(!handler)) {
            return invalid_token;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<list_type>();
        if (handlers_) {
            next->reserve(handlers_->size() + 1u);
            *next = *handlers_;
        }
        const token_type token = next_token_++;
        next->push_back(entry{token, std::move(handler), std::make_shared<std::atomic<bool>>(true)});
        handlers_ = std::move(next);
        return token;
    }

    bool unsubscribe(const token_type token) {
        if (token == invalid_token) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!handlers_) {
            return false;
        }

        const auto it = std::find_if(handlers_->begin(), handlers_->end(),
                                     [token](const entry &e) { return e.token == token; });
        if (it == handlers_->end()) {
            return false;
        }
        it->active->store(false, std::memory_order_release);

        auto next = std::make_shared<list_type>();
        next->reserve(handlers_->size() - 1u);
        for (const entry &e : *handlers_) {
            if (e.token != token) {
                next->push_back(e);
            }
        }
        handlers_ = next->empty() ? nullptr : std::move(next);
        return true;
    }

    [[nodiscard]] size_type subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_ ? static_cast<size_type>(handlers_->size()) : 0u;
    }

    [[nodiscard]] bool empty() const { return subscriber_count() == 0u; }

    void raise(Args... args) const {
        std::shared_ptr<const list_type> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = handlers_;
        }
        if (!current) {
            return;
        }
        for (const entry &e : *current) {
            if (e.active->load(std::memory_order_acquire)) {
                e.handler(args...);
            }
        }
    }

private:
    struct entry {
        token_type token;
        handler_type handler;
        // Shared by every list copy; cleared by unsubscribe().
        std::shared_ptr<std::atomic<bool>> active;
    };
    using list_type = std::vector<entry>;

    mutable std::mutex mutex_;
    std::shared_ptr<const list_type> handlers_;
    token_type next_token_{1u};
};

} // namespace ringview

#endif /* RINGVIEW_EVENT_HPP_ */
