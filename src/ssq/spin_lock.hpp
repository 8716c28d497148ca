/*
 * spin_lock.hpp
 *
 * Minimal spin lock for contexts without an OS scheduler.
 *
 * - One boolean flag, no heap, no OS calls; usable from an ISR as long as
 *   the holder's critical section is short and bounded.
 * - try_lock(): single acquire exchange false -> true. Engaged guard on
 *   success, std::nullopt if the lock was already held (state unchanged).
 * - lock():     retries try_lock() until it succeeds. Busy-waits, never
 *   yields to a scheduler (SSQ_CPU_RELAX() is a CPU hint only).
 * - spin_guard: the only way to hold the lock. Its destructor stores
 *   'false' with release ordering, exactly once per acquisition, on every
 *   exit path. Guards are move-only; a moved-from guard releases nothing.
 *
 * Not recursive: calling lock() while the same context holds a guard
 * spins forever.
 */

#ifndef SSQ_SPIN_LOCK_HPP_
#define SSQ_SPIN_LOCK_HPP_

#include <optional>
#include <utility> // std::exchange

#include "base/ssq_flag.hpp"  // ::ssq::flag::AtomicFlag
#include "base/ssq_tools.hpp" // SSQ_FORCEINLINE, SSQ_CPU_RELAX, SSQ_LIKELY

namespace ssq {

class spin_lock;

/* =======================================================================
 * spin_guard
 * ======================================================================= */
class [[nodiscard]] spin_guard {
public:
    spin_guard(const spin_guard&) = delete;
    spin_guard& operator=(const spin_guard&) = delete;

    spin_guard(spin_guard&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)) {}

    spin_guard& operator=(spin_guard&& other) noexcept {
        if (this != &other) {
            release();
            lock_ = std::exchange(other.lock_, nullptr);
        }
        return *this;
    }

    ~spin_guard() noexcept { release(); }

    // False only for a moved-from guard.
    [[nodiscard]] SSQ_FORCEINLINE bool owns_lock() const noexcept { return lock_ != nullptr; }

private:
    friend class spin_lock;

    explicit spin_guard(spin_lock& l) noexcept : lock_(&l) {}

    inline void release() noexcept;

    spin_lock* lock_{nullptr};
};

/* =======================================================================
 * spin_lock
 * ======================================================================= */
class spin_lock {
public:
    constexpr spin_lock() noexcept = default;

    spin_lock(const spin_lock&) = delete;
    spin_lock& operator=(const spin_lock&) = delete;
    spin_lock(spin_lock&&) = delete;
    spin_lock& operator=(spin_lock&&) = delete;

    [[nodiscard]] SSQ_FORCEINLINE std::optional<spin_guard> try_lock() noexcept {
        if (locked_.exchange(true)) {
            return std::nullopt;
        }
        return spin_guard{*this};
    }

    // Blocking; busy-waits until the lock is available.
    [[nodiscard]] spin_guard lock() noexcept {
        for (;;) {
            std::optional<spin_guard> g = try_lock();
            if (SSQ_LIKELY(g.has_value())) {
                return std::move(*g);
            }
            // Wait on a plain load so contended spinning does not keep the
            // cache line in exclusive state.
            while (locked_.peek_relaxed()) {
                SSQ_CPU_RELAX();
            }
        }
    }

    // Advisory; may be stale by the time the caller looks at it.
    [[nodiscard]] SSQ_FORCEINLINE bool is_locked() const noexcept { return locked_.peek_relaxed(); }

private:
    friend class spin_guard;

    SSQ_FORCEINLINE void unlock() noexcept { locked_.store(false); }

    ::ssq::flag::AtomicFlag<> locked_{};
};

inline void spin_guard::release() noexcept {
    if (lock_ != nullptr) {
        lock_->unlock();
        lock_ = nullptr;
    }
}

} // namespace ssq

#endif /* SSQ_SPIN_LOCK_HPP_ */
