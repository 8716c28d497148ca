/*
 * ssq_flag.hpp
 *
 *  Created on: 19 Oct. 2026
 *
 * Boolean flag wrapper used by the spin lock ("locked") and by the queue
 * core ("full").
 *
 *   - A uniform API:
 *       * store(value)   → Orders::store
 *       * load()         → Orders::load
 *       * exchange(v)    → Orders::rmw, returns the previous value
 *       * peek_relaxed() → relaxed load, advisory only
 *
 *   - Orders palette:
 *       * default_orders : acquire load, release store, acquire RMW.
 *                          This is the pairing both the queue and the lock
 *                          are built on: a reader that observes a released
 *                          'true' also observes everything written before it.
 *       * any struct with the same three members can be plugged in; invalid
 *         combinations are rejected at compile time.
 *
 * Configuration:
 *   - SSQ_REQUIRE_LOCK_FREE (default 1):
 *       * 1 → static_assert if std::atomic<bool> is not always lock-free.
 *       * 0 → allow fallback implementations.
 */

#ifndef SSQ_FLAG_HPP_
#define SSQ_FLAG_HPP_

#include <atomic>

#include "ssq_tools.hpp" // SSQ_FORCEINLINE

namespace ssq::flag {

/* ------------------------------- Orders palette --------------------------- */
struct default_orders {
    static constexpr std::memory_order load  = std::memory_order_acquire;
    static constexpr std::memory_order store = std::memory_order_release;
    static constexpr std::memory_order rmw   = std::memory_order_acquire;
};

/* Internal constexpr checks to catch nonsense orders at compile-time. */
namespace detail {

    constexpr bool valid_load_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_relaxed:
            case std::memory_order_consume:
            case std::memory_order_acquire:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false; // release / acq_rel are invalid for load
        }
    }

    constexpr bool valid_store_order(std::memory_order mo) {
        switch (mo) {
            case std::memory_order_relaxed:
            case std::memory_order_release:
            case std::memory_order_seq_cst:
                return true;
            default:
                return false; // acquire / consume / acq_rel invalid for store
        }
    }

    constexpr bool valid_rmw_order(std::memory_order mo) {
        return mo != std::memory_order_consume;
    }

} // namespace detail

/* ------------------------------- AtomicFlag --------------------------------
 * std::atomic<bool> with the ordering baked into the type, so call sites
 * cannot silently pick the wrong order.
 * --------------------------------------------------------------------------- */
template<typename Orders = default_orders>
class AtomicFlag {
    static_assert(detail::valid_load_order(Orders::load),   "AtomicFlag: invalid load memory_order");
    static_assert(detail::valid_store_order(Orders::store), "AtomicFlag: invalid store memory_order");
    static_assert(detail::valid_rmw_order(Orders::rmw),     "AtomicFlag: invalid RMW memory_order");

#if SSQ_REQUIRE_LOCK_FREE
    static_assert(std::atomic<bool>::is_always_lock_free, "AtomicFlag: std::atomic<bool> is not always lock-free on this target");
#endif /* SSQ_REQUIRE_LOCK_FREE */

    std::atomic<bool> v_{false};

public:
    constexpr AtomicFlag() noexcept = default;

    AtomicFlag(const AtomicFlag&) = delete;
    AtomicFlag& operator=(const AtomicFlag&) = delete;

    SSQ_FORCEINLINE void store(const bool x) noexcept { v_.store(x, Orders::store); }
    [[nodiscard]] SSQ_FORCEINLINE bool load() const noexcept { return v_.load(Orders::load); }
    [[nodiscard]] SSQ_FORCEINLINE bool exchange(const bool x) noexcept { return v_.exchange(x, Orders::rmw); }

    // No happens-before edge. Never use the result to gate access to shared data.
    [[nodiscard]] SSQ_FORCEINLINE bool peek_relaxed() const noexcept { return v_.load(std::memory_order_relaxed); }
};

} // namespace ssq::flag

#endif /* SSQ_FLAG_HPP_ */
