/*
 * chunkiter_object.hpp
 *
 * Object-lifetime helpers for storage that manages T manually.
 */

#ifndef CHUNKITER_OBJECT_HPP_
#define CHUNKITER_OBJECT_HPP_

#include <new>         // placement new, std::launder
#include <type_traits>
#include <utility>     // std::forward

#include "chunkiter_tools.hpp" // RB_FORCEINLINE

namespace chunkiter::detail {

template<class U, class... Args>
RB_FORCEINLINE U* construct_at(void* raw, Args&&... args) noexcept(
    std::is_nothrow_constructible_v<U, Args&&...>)
{
    U* p = ::new (raw) U(std::forward<Args>(args)...);
    return std::launder(p);
}

template<class U>
RB_FORCEINLINE void destroy_at(U* p) noexcept
{
    if constexpr (!std::is_trivially_destructible_v<U>) {
        p->~U();
    }
}

} // namespace chunkiter::detail

#endif /* CHUNKITER_OBJECT_HPP_ */
