/*
 * ssq_object.hpp
 *
 * Object-lifetime helpers for storage that holds a T only some of the time.
 */

#ifndef SSQ_OBJECT_HPP_
#define SSQ_OBJECT_HPP_

#include <new>         // placement new, std::launder
#include <type_traits>
#include <utility>     // std::forward

#include "ssq_tools.hpp" // SSQ_FORCEINLINE

namespace ssq::detail {

// Constructs U in raw storage and returns the laundered pointer to it.
template<class U, class... Args>
SSQ_FORCEINLINE U* construct_at(void* where, Args&&... args)
    noexcept(std::is_nothrow_constructible_v<U, Args&&...>)
{
    U* p = ::new (where) U(std::forward<Args>(args)...);
    return std::launder(p);
}

template<class U>
SSQ_FORCEINLINE void destroy_at(U* p) noexcept
{
    if constexpr (!std::is_trivially_destructible_v<U>) {
        p->~U();
    }
}

} // namespace ssq::detail

#endif /* SSQ_OBJECT_HPP_ */
