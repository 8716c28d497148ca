/*
 * single_slot_queue_bench.cpp
 *
 * Compact benchmarks for ssq::single_slot_queue.
 *
 * Goals:
 *  - QtCore-only (no QtTest/testlib).
 *  - Compact console output.
 *  - ST benches: enqueue/dequeue, overwrite/dequeue, peek.
 *  - MT benches: enqueue/dequeue hand-off, overwrite/dequeue (latest-wins).
 */

#include <QDebug>
#include <QString>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

#include "single_slot_queue_bench.h"
#include "single_slot_queue.hpp"
#include "base/ssq_tools.hpp"

namespace {

// ------------------------------ knobs ------------------------------

#if defined(NDEBUG)
static constexpr int kOpsST = 4'000'000;
static constexpr int kOpsMT = 1'000'000;
static constexpr int kTimeoutMsMT = 6'000;
#else
static constexpr int kOpsST = 600'000;
static constexpr int kOpsMT = 150'000;
static constexpr int kTimeoutMsMT = 15'000;
#endif

// A global sink prevents the optimizer from "being helpful".
static volatile std::uint64_t g_sink = 0u;

struct cell final {
    bool ok = false;
    double v = 0.0; // M/s
};

struct row final {
    QString label;
    cell enq{};
    cell ovr{};
    cell peek{};
    cell mt_enq{};
    cell mt_ovr{};
};

struct scoped_timer final {
    using clock = std::chrono::steady_clock;
    clock::time_point t0{clock::now()};

    std::uint64_t elapsed_ns() const noexcept {
        const auto dt = clock::now() - t0;
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(dt).count());
    }
};

struct spin_backoff final {
    std::uint32_t spins = 0u;

    void pause() noexcept {
        ++spins;
        if ((spins & 0x7FFu) == 0u) {
            std::this_thread::yield();
        } else {
            std::atomic_signal_fence(std::memory_order_seq_cst);
        }
    }

    void reset() noexcept { spins = 0u; }
};

static double to_m_per_s(std::uint64_t elapsed_ns, std::uint64_t items) noexcept {
    if (elapsed_ns == 0u || items == 0u) return 0.0;
    const double sec = static_cast<double>(elapsed_ns) * 1e-9;
    return (static_cast<double>(items) / sec) * 1e-6;
}

// ------------------------------ ST benches ------------------------------

template <class T, class Make>
static cell bench_st_enqueue_dequeue(Make make) {
    cell out{};
    ssq::single_slot_queue<T> q;
    auto handles = q.split();
    auto& cons = handles.first;
    auto& prod = handles.second;

    std::uint64_t sink = 0u;

    scoped_timer tm;
    for (int i = 0; i < kOpsST; ++i) {
        if (prod.enqueue(make(i)).has_value()) {
            return out; // ST: a rejection here means something is broken.
        }
        const std::optional<T> got = cons.dequeue();
        if (!got) {
            return out;
        }
        sink += static_cast<std::uint64_t>(got->seq);
    }

    g_sink ^= sink;
    out.ok = true;
    out.v = to_m_per_s(tm.elapsed_ns(), static_cast<std::uint64_t>(kOpsST));
    return out;
}

template <class T, class Make>
static cell bench_st_overwrite_dequeue(Make make) {
    cell out{};
    ssq::single_slot_queue<T> q;
    auto handles = q.split();
    auto& cons = handles.first;
    auto& prod = handles.second;

    std::uint64_t sink = 0u;

    scoped_timer tm;
    for (int i = 0; i < kOpsST; ++i) {
        prod.enqueue_overwrite(make(i));
        const std::optional<T> got = cons.dequeue();
        if (!got) {
            return out;
        }
        sink += static_cast<std::uint64_t>(got->seq);
    }

    g_sink ^= sink;
    out.ok = true;
    out.v = to_m_per_s(tm.elapsed_ns(), static_cast<std::uint64_t>(kOpsST));
    return out;
}

template <class T, class Make>
static cell bench_st_peek(Make make) {
    cell out{};
    ssq::single_slot_queue<T> q;
    auto handles = q.split();
    auto& cons = handles.first;
    auto& prod = handles.second;

    prod.enqueue_overwrite(make(1));

    std::uint64_t sink = 0u;

    scoped_timer tm;
    for (int i = 0; i < kOpsST; ++i) {
        const std::optional<T> got = cons.peek();
        if (!got) {
            return out;
        }
        sink += static_cast<std::uint64_t>(got->seq);
    }

    g_sink ^= sink;
    out.ok = true;
    out.v = to_m_per_s(tm.elapsed_ns(), static_cast<std::uint64_t>(kOpsST));
    return out;
}

// ------------------------------ MT benches ------------------------------

// Both sides park on `go` so thread start-up is not timed. Each body gets the
// shared stop flag and returns how many values it moved.
template <class ProdBody, class ConsBody>
static cell run_timed_pair(ProdBody prod_body, ConsBody cons_body) {
    std::atomic<int> ready{0};
    std::atomic<bool> go{false};
    std::atomic<bool> stop{false};
    std::uint64_t consumed = 0u;

    auto park = [&]() {
        ready.fetch_add(1, std::memory_order_release);
        while (!go.load(std::memory_order_acquire)) {
            SSQ_CPU_RELAX();
        }
    };

    std::thread tp([&]() { park(); prod_body(stop); });
    std::thread tc([&]() { park(); consumed = cons_body(stop); });

    while (ready.load(std::memory_order_acquire) < 2) {
        std::this_thread::yield();
    }

    scoped_timer tm;
    go.store(true, std::memory_order_release);
    tp.join();
    tc.join();

    cell out{};
    out.ok = (consumed != 0u) && !stop.load(std::memory_order_relaxed);
    out.v = to_m_per_s(tm.elapsed_ns(), consumed);
    return out;
}

static bool past(std::chrono::steady_clock::time_point deadline, std::atomic<bool>& stop) noexcept {
    if (std::chrono::steady_clock::now() <= deadline) return false;
    stop.store(true, std::memory_order_relaxed);
    return true;
}

// Every value is delivered: the producer retries a rejected value.
template <class T, class Make>
static cell bench_mt_enqueue(Make make) {
    ssq::single_slot_queue<T> q;
    auto handles = q.split();
    auto& cons = handles.first;
    auto& prod = handles.second;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kTimeoutMsMT);
    std::uint64_t checksum = 0u;

    cell out = run_timed_pair(
        [&](std::atomic<bool>& stop) {
            spin_backoff bk;
            std::optional<T> pending;
            for (int i = 0; i < kOpsMT && !stop.load(std::memory_order_relaxed); ++i) {
                pending = prod.enqueue(make(i));
                while (pending.has_value()) {
                    if (past(deadline, stop)) return;
                    bk.pause();
                    pending = prod.enqueue(std::move(*pending));
                }
                bk.reset();
            }
        },
        [&](std::atomic<bool>& stop) -> std::uint64_t {
            spin_backoff bk;
            std::uint64_t n = 0u;
            while (n < static_cast<std::uint64_t>(kOpsMT) && !stop.load(std::memory_order_relaxed)) {
                const std::optional<T> got = cons.dequeue();
                if (!got) {
                    if (past(deadline, stop)) break;
                    bk.pause();
                    continue;
                }
                checksum += static_cast<std::uint64_t>(got->seq);
                ++n;
                bk.reset();
            }
            return n;
        });

    g_sink += checksum;
    return out;
}

// Latest-wins: the rate counts values the consumer actually saw.
template <class T, class Make>
static cell bench_mt_overwrite(Make make) {
    ssq::single_slot_queue<T> q;
    auto handles = q.split();
    auto& cons = handles.first;
    auto& prod = handles.second;

    std::atomic<bool> prod_done{false};
    std::uint64_t checksum = 0u;

    cell out = run_timed_pair(
        [&](std::atomic<bool>&) {
            for (int i = 0; i < kOpsMT; ++i) {
                prod.enqueue_overwrite(make(i));
            }
            prod_done.store(true, std::memory_order_release);
        },
        [&](std::atomic<bool>&) -> std::uint64_t {
            spin_backoff bk;
            std::uint64_t n = 0u;
            for (;;) {
                const bool done = prod_done.load(std::memory_order_acquire);
                const std::optional<T> got = cons.dequeue();
                if (!got) {
                    if (done) break;
                    bk.pause();
                    continue;
                }
                checksum += static_cast<std::uint64_t>(got->seq);
                ++n;
                bk.reset();
            }
            return n;
        });

    g_sink += checksum;
    return out;
}

// ------------------------------ payloads ------------------------------

struct word final {
    std::uint32_t seq;
};

struct frame final {
    std::uint32_t seq;
    std::uint32_t payload[15];
};

static word make_word(int i) noexcept {
    return word{static_cast<std::uint32_t>(i)};
}

static frame make_frame(int i) noexcept {
    frame f{};
    f.seq = static_cast<std::uint32_t>(i);
    f.payload[0] = f.seq ^ 0xA5A5A5A5u;
    return f;
}

// ------------------------------ formatting ------------------------------

static QString fmt_cell(const cell& c, int width = 8) {
    return c.ok ? QStringLiteral("%1").arg(c.v, width, 'f', 3)
                : QStringLiteral("%1").arg(QStringLiteral("-"), width);
}

static void emit_header() {
    qInfo().noquote() << "\n=== ssq::single_slot_queue bench ===";
    qInfo().noquote() << QStringLiteral("ops_st=%1 ops_mt=%2").arg(kOpsST).arg(kOpsMT);
    qInfo().noquote()
        << "\npayload    | enq/deq M/s | ovr/deq M/s | peek M/s | mt_enq M/s | mt_ovr M/s";
}

static void emit_row(const row& r) {
    qInfo().noquote() << QStringLiteral("%1 | %2 | %3 | %4 | %5 | %6")
                             .arg(r.label, -10)
                             .arg(fmt_cell(r.enq, 11))
                             .arg(fmt_cell(r.ovr, 11))
                             .arg(fmt_cell(r.peek))
                             .arg(fmt_cell(r.mt_enq, 10))
                             .arg(fmt_cell(r.mt_ovr, 10));
}

// ------------------------------ suite runner ------------------------------

template <class T, class Make>
static void run_suite(row& r, Make make) {
    r.enq    = bench_st_enqueue_dequeue<T>(make);
    r.ovr    = bench_st_overwrite_dequeue<T>(make);
    r.peek   = bench_st_peek<T>(make);
    r.mt_enq = bench_mt_enqueue<T>(make);
    r.mt_ovr = bench_mt_overwrite<T>(make);
}

} // namespace

int run_single_slot_queue_bench() {
    emit_header();

    {
        row r{};
        r.label = QStringLiteral("u32");
        run_suite<word>(r, make_word);
        emit_row(r);
    }

    {
        row r{};
        r.label = QStringLiteral("64B frame");
        run_suite<frame>(r, make_frame);
        emit_row(r);
    }

    // Touch the sink to keep the compiler honest.
    if (g_sink == 0xFFFFFFFFFFFFFFFFull) {
        qWarning().noquote() << "[ssq_bench] sink hit the impossible";
    }

    return 0;
}
