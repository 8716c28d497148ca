/*
 * single_slot_queue.hpp
 *
 * Single-producer / single-consumer, single-slot queue.
 * Allocation-free, header-only, usable between a thread and an ISR or
 * between two threads.
 *
 * Usage:
 *   ssq::single_slot_queue<u32> q;
 *   auto [cons, prod] = q.split();   // check cons.is_valid() if q may be split already
 *
 *   (void)prod.enqueue(50u);          // std::nullopt -> accepted
 *   auto back = prod.enqueue(2u);     // back == 2u   -> rejected, slot keeps 50
 *   prod.enqueue_overwrite(25u);      // takes the spin lock, always succeeds
 *   auto v = cons.dequeue();          // v == 25u
 *
 * State:
 * - full_    : true means the slot holds a live, initialized T.
 * - slot_    : storage for one T, read as T only after full_ was observed
 *              true with acquire ordering (or under writing_).
 * - writing_ : spin lock serializing enqueue_overwrite against the read
 *              path of dequeue/peek.
 * - roles_   : which handles are currently alive.
 *
 * Producer-side contract (producer<T>):
 * - enqueue(v):           non-blocking. Acquire-load full_; if false construct
 *                         v in the slot and release-store full_ = true, return
 *                         std::nullopt. If true, return v untouched.
 * - enqueue_overwrite(v): blocking. Under writing_: release-store
 *                         full_ = false, destroy the old value if there was
 *                         one, construct v, release-store full_ = true.
 *
 * Consumer-side contract (consumer<T>):
 * - dequeue(): acquire-load full_; if false return std::nullopt without
 *              locking. If true take writing_, move the value out, destroy
 *              the slot copy, release-store full_ = false.
 * - peek():    same read path, copies the value and leaves full_ set.
 *              Only for trivially copyable T (see is_peekable).
 *
 * Both sides:
 * - is_empty(): relaxed load, advisory only.
 *
 * Notes:
 * - enqueue and enqueue_overwrite must never run concurrently with each
 *   other; there is exactly one producer<T> per split, and it is move-only.
 * - Nothing here allocates, throws, sleeps or calls the OS. The only wait
 *   is the spin in writing_.lock(), bounded by one move/copy plus at most
 *   one destructor of T on the other side.
 */

#ifndef SSQ_SINGLE_SLOT_QUEUE_HPP_
#define SSQ_SINGLE_SLOT_QUEUE_HPP_

#include <atomic>
#include <optional>
#include <type_traits>
#include <utility> // std::pair, std::move, std::exchange

#include "basic_types.h"        // u8
#include "base/ssq_flag.hpp"    // ::ssq::flag::AtomicFlag
#include "base/ssq_tools.hpp"   // SSQ_FORCEINLINE, SSQ_ASSERT, SSQ_UNLIKELY
#include "slot.hpp"             // ::ssq::detail::slot
#include "spin_lock.hpp"        // ::ssq::spin_lock, ::ssq::spin_guard

namespace ssq {

template<class T> class consumer;
template<class T> class producer;

/* ------------------------------------------------------------------------
 * Capability traits
 * ------------------------------------------------------------------------ */

// peek() duplicates the value in place while the producer may be waiting
// on the lock, so it is limited to types whose copy is a plain bit copy.
template<class T>
struct is_peekable : std::bool_constant<std::is_trivially_copyable_v<T>> {};

template<class T>
inline constexpr bool is_peekable_v = is_peekable<T>::value;

// May an object of this type be handed to another execution context
// (thread, ISR) and used there while its counterpart is used here?
// Granted to the handles only: every access they make to the shared slot
// is gated by the queue's full flag and spin lock. Raw storage and the
// queue object itself do not get it.
template<class H>
struct is_context_transferable : std::false_type {};

template<class T>
struct is_context_transferable<consumer<T>> : std::true_type {};

template<class T>
struct is_context_transferable<producer<T>> : std::true_type {};

template<class H>
inline constexpr bool is_context_transferable_v = is_context_transferable<H>::value;

/* =======================================================================
 * single_slot_queue<T>
 * ======================================================================= */
template<class T>
class single_slot_queue {
    static_assert(std::is_object_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[ssq::single_slot_queue]: T must be a non-cv object type");
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "[ssq::single_slot_queue]: T must be nothrow move constructible");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "[ssq::single_slot_queue]: T must be nothrow destructible");

#if SSQ_REQUIRE_LOCK_FREE
    static_assert(std::atomic<u8>::is_always_lock_free,
                  "[ssq::single_slot_queue]: std::atomic<u8> is not always lock-free on this target");
#endif /* SSQ_REQUIRE_LOCK_FREE */

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type    = T;
    using consumer_type = consumer<T>;
    using producer_type = producer<T>;
    using handles_type  = std::pair<consumer_type, producer_type>;
    using queue_type    = single_slot_queue<T>;

    // ------------------------------------------------------------------------------------------
    // Construction / Destruction
    // ------------------------------------------------------------------------------------------
    constexpr single_slot_queue() noexcept = default;

    // Handles point into the queue.
    single_slot_queue(const single_slot_queue&) = delete;
    single_slot_queue& operator=(const single_slot_queue&) = delete;
    single_slot_queue(single_slot_queue&&) = delete;
    single_slot_queue& operator=(single_slot_queue&&) = delete;

    ~single_slot_queue() noexcept {
        SSQ_ASSERT(roles_.load(std::memory_order_acquire) == kNoRoles);
        if (full_.load()) {
            slot_.destroy();
        }
    }

    // ------------------------------------------------------------------------------------------
    // Splitting
    // ------------------------------------------------------------------------------------------

    // While a handle from an earlier split is alive both returned handles
    // are invalid (is_valid() == false) and the live roles stay untouched.
    [[nodiscard]] handles_type split() noexcept {
        queue_type* const owner = SSQ_LIKELY(claim_roles()) ? this : nullptr;
        return handles_type{consumer_type{owner}, producer_type{owner}};
    }

    // std::nullopt while any handle from an earlier split is alive.
    [[nodiscard]] std::optional<handles_type> try_split() noexcept {
        if (SSQ_UNLIKELY(!claim_roles())) {
            return std::nullopt;
        }
        return handles_type{consumer_type{this}, producer_type{this}};
    }

    // ------------------------------------------------------------------------------------------
    // Observers (advisory)
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] SSQ_FORCEINLINE bool is_empty() const noexcept { return !full_.peek_relaxed(); }

    [[nodiscard]] SSQ_FORCEINLINE bool has_handles() const noexcept {
        return roles_.load(std::memory_order_relaxed) != kNoRoles;
    }

private:
    friend class consumer<T>;
    friend class producer<T>;

    static constexpr u8 kNoRoles       = 0u;
    static constexpr u8 kConsumerRole  = 1u;
    static constexpr u8 kProducerRole  = 2u;
    static constexpr u8 kBothRoles     = kConsumerRole | kProducerRole;

    [[nodiscard]] bool claim_roles() noexcept {
        u8 expected = kNoRoles;
        return roles_.compare_exchange_strong(expected, kBothRoles,
                                              std::memory_order_acq_rel,
                                              std::memory_order_relaxed);
    }

    SSQ_FORCEINLINE void release_role(const u8 role) noexcept {
        (void)roles_.fetch_and(static_cast<u8>(~role), std::memory_order_release);
    }

    // ------------------------------------------------------------------------------------------
    // Transfer algorithms
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] std::optional<T> enqueue(T value) noexcept {
        if (full_.load()) {
            return std::optional<T>{std::move(value)};
        }
        // full_ was false: the consumer is done with the slot and will not
        // touch it again until it observes our release below.
        slot_.write(std::move(value));
        full_.store(true);
        return std::nullopt;
    }

    void enqueue_overwrite(T value) noexcept {
        const spin_guard guard = writing_.lock();

        // Stable while we hold writing_: only the locked consumer path
        // clears full_, and only this producer sets it.
        const bool had_value = full_.load();
        full_.store(false);
        if (had_value) {
            slot_.destroy();
        }
        slot_.write(std::move(value));
        full_.store(true);
    }

    [[nodiscard]] std::optional<T> dequeue() noexcept {
        if (!full_.load()) {
            return std::nullopt;
        }
        // An overwrite may have started after the load above; the lock
        // makes us read either before it begins or after it has finished.
        const spin_guard guard = writing_.lock();
        std::optional<T> out{slot_.take()};
        full_.store(false);
        return out;
    }

    [[nodiscard]] std::optional<T> peek() const noexcept {
        if (!full_.load()) {
            return std::nullopt;
        }
        const spin_guard guard = writing_.lock();
        return std::optional<T>{slot_.copy()};
    }

    ::ssq::flag::AtomicFlag<> full_{};
    mutable spin_lock         writing_{};
    std::atomic<u8>           roles_{kNoRoles};
    detail::slot<T>           slot_{};
};

/* =======================================================================
 * consumer<T> : read handle
 *
 * Move-only. Gives the consumer role back to the queue on destruction.
 * ======================================================================= */
template<class T>
class consumer {
public:
    using value_type = T;
    using queue_type = single_slot_queue<T>;

    consumer(const consumer&) = delete;
    consumer& operator=(const consumer&) = delete;

    consumer(consumer&& other) noexcept : q_(std::exchange(other.q_, nullptr)) {}

    consumer& operator=(consumer&& other) noexcept {
        if (this != &other) {
            release();
            q_ = std::exchange(other.q_, nullptr);
        }
        return *this;
    }

    ~consumer() noexcept { release(); }

    // Blocks only while the producer is inside enqueue_overwrite.
    [[nodiscard]] SSQ_FORCEINLINE std::optional<T> dequeue() noexcept {
        SSQ_ASSERT(q_ != nullptr);
        return q_->dequeue();
    }

    // Blocks only while the producer is inside enqueue_overwrite.
    template<class U = T, typename = std::enable_if_t<is_peekable_v<U>>>
    [[nodiscard]] SSQ_FORCEINLINE std::optional<T> peek() const noexcept {
        SSQ_ASSERT(q_ != nullptr);
        return q_->peek();
    }

    [[nodiscard]] SSQ_FORCEINLINE bool is_empty() const noexcept {
        SSQ_ASSERT(q_ != nullptr);
        return q_->is_empty();
    }

    // False only for a moved-from handle.
    [[nodiscard]] SSQ_FORCEINLINE bool is_valid() const noexcept { return q_ != nullptr; }

private:
    friend class single_slot_queue<T>;

    explicit consumer(queue_type* q) noexcept : q_(q) {}

    void release() noexcept {
        if (q_ != nullptr) {
            q_->release_role(queue_type::kConsumerRole);
            q_ = nullptr;
        }
    }

    queue_type* q_{nullptr};
};

/* =======================================================================
 * producer<T> : write handle
 *
 * Move-only. Gives the producer role back to the queue on destruction.
 * ======================================================================= */
template<class T>
class producer {
public:
    using value_type = T;
    using queue_type = single_slot_queue<T>;

    producer(const producer&) = delete;
    producer& operator=(const producer&) = delete;

    producer(producer&& other) noexcept : q_(std::exchange(other.q_, nullptr)) {}

    producer& operator=(producer&& other) noexcept {
        if (this != &other) {
            release();
            q_ = std::exchange(other.q_, nullptr);
        }
        return *this;
    }

    ~producer() noexcept { release(); }

    // std::nullopt when accepted; the untouched value when the slot is full.
    [[nodiscard]] SSQ_FORCEINLINE std::optional<T> enqueue(T value) noexcept {
        SSQ_ASSERT(q_ != nullptr);
        return q_->enqueue(std::move(value));
    }

    // Blocks only while the consumer is reading inside dequeue/peek.
    SSQ_FORCEINLINE void enqueue_overwrite(T value) noexcept {
        SSQ_ASSERT(q_ != nullptr);
        q_->enqueue_overwrite(std::move(value));
    }

    [[nodiscard]] SSQ_FORCEINLINE bool is_empty() const noexcept {
        SSQ_ASSERT(q_ != nullptr);
        return q_->is_empty();
    }

    [[nodiscard]] SSQ_FORCEINLINE bool is_valid() const noexcept { return q_ != nullptr; }

private:
    friend class single_slot_queue<T>;

    explicit producer(queue_type* q) noexcept : q_(q) {}

    void release() noexcept {
        if (q_ != nullptr) {
            q_->release_role(queue_type::kProducerRole);
            q_ = nullptr;
        }
    }

    queue_type* q_{nullptr};
};

} // namespace ssq

#endif /* SSQ_SINGLE_SLOT_QUEUE_HPP_ */
