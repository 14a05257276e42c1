/*
 * ringview_object.hpp
 *
 * Object-lifetime helpers for containers that manage T manually
 * (raw storage, placement construction, explicit destruction).
 */

#ifndef RINGVIEW_OBJECT_HPP_
#define RINGVIEW_OBJECT_HPP_

#include <new>         // placement new
#include <type_traits>
#include <utility>     // std::forward

#include "ringview_tools.hpp" // RB_FORCEINLINE

namespace ringview::detail {

template<class U, class... Args>
RB_FORCEINLINE U* construct_at(U* p, Args&&... args)
    noexcept(std::is_nothrow_constructible_v<U, Args&&...>)
{
    return ::new (static_cast<void*>(p)) U(std::forward<Args>(args)...);
}

template<class U>
RB_FORCEINLINE void destroy_at(U* p) noexcept
{
    if constexpr (!std::is_trivially_destructible_v<U>) {
        p->~U();
    }
}

} // namespace ringview::detail

#endif /* RINGVIEW_OBJECT_HPP_ */
