/*
 * slot.hpp
 *
 * Raw storage for at most one T.
 *
 * The slot does not know whether it holds a live object: that state lives
 * in the owning queue's 'full' flag. Every member that touches the object
 * is private and reachable only from single_slot_queue<T>, which calls them
 * strictly under its flag/lock protocol. The slot itself has no intrinsic
 * thread safety and is not transferable between execution contexts.
 */

#ifndef SSQ_SLOT_HPP_
#define SSQ_SLOT_HPP_

#include <cstddef>     // std::byte
#include <new>         // std::launder
#include <type_traits>
#include <utility>     // std::move, std::forward

#include "base/ssq_object.hpp" // ::ssq::detail::construct_at / destroy_at
#include "base/ssq_tools.hpp"  // SSQ_FORCEINLINE

namespace ssq {

template<class T>
class single_slot_queue;

namespace detail {

template<class T>
class slot {
    static_assert(std::is_object_v<T>, "[ssq::slot]: T must be an object type");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[ssq::slot]: T must not be cv-qualified");

public:
    constexpr slot() noexcept = default;

    slot(const slot&) = delete;
    slot& operator=(const slot&) = delete;

    // Does NOT destroy a live T: the owner decides from its flag.
    ~slot() = default;

private:
    friend class ::ssq::single_slot_queue<T>;

    // Precondition: no live object in the slot.
    template<class... Args>
    SSQ_FORCEINLINE void write(Args&&... args)
        noexcept(std::is_nothrow_constructible_v<T, Args&&...>)
    {
        (void)::ssq::detail::construct_at<T>(static_cast<void*>(storage_), std::forward<Args>(args)...);
    }

    // Precondition: live object. Moves it out and ends its lifetime.
    [[nodiscard]] SSQ_FORCEINLINE T take() noexcept {
        T* p = object();
        T out(std::move(*p));
        ::ssq::detail::destroy_at(p);
        return out;
    }

    // Precondition: live object. Leaves it alive.
    [[nodiscard]] SSQ_FORCEINLINE T copy() const noexcept {
        return *object();
    }

    // Precondition: live object.
    SSQ_FORCEINLINE void destroy() noexcept {
        ::ssq::detail::destroy_at(object());
    }

    [[nodiscard]] SSQ_FORCEINLINE T* object() noexcept {
        return std::launder(reinterpret_cast<T*>(storage_));
    }

    [[nodiscard]] SSQ_FORCEINLINE const T* object() const noexcept {
        return std::launder(reinterpret_cast<const T*>(storage_));
    }

    alignas(T) std::byte storage_[sizeof(T)]{};
};

} // namespace detail
} // namespace ssq

#endif /* SSQ_SLOT_HPP_ */
