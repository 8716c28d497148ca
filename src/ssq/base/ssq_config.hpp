/*
 * ssq_config.hpp
 *
 *  Created on: 19 Oct. 2026
 *
 * Build toggles for the single-slot queue.
 * Every switch is guarded by #ifndef, override with -D on the command line.
 *
 *   - SSQ_ASSERT(x) (default: no-op)
 *       Contract hook for misuse that the type system cannot catch
 *       (double split, destroying a queue with live handles, using a
 *       moved-from handle). Tests define it to abort in debug builds.
 *
 *   - SSQ_REQUIRE_LOCK_FREE (default: 1)
 *       1 -> static_assert that the flag atomics are always lock-free.
 *            A queue shared with an interrupt handler is only safe if the
 *            atomics never fall back to a hidden mutex.
 *       0 -> accept libatomic / fallback toolchains (host-only use).
 *
 *   - SSQ_ENABLE_CPU_RELAX (default: 1)
 *       1 -> spin_lock::lock() issues a pause/yield instruction between
 *            attempts (never an OS yield).
 *       0 -> bare busy-wait.
 */

#ifndef SSQ_CONFIG_HPP_
#define SSQ_CONFIG_HPP_

// assert ------------------------
#ifndef SSQ_ASSERT
#  define SSQ_ASSERT(x)
#endif /* SSQ_ASSERT */

#ifndef SSQ_REQUIRE_LOCK_FREE
#  define SSQ_REQUIRE_LOCK_FREE 1
#endif /* SSQ_REQUIRE_LOCK_FREE */

static_assert(SSQ_REQUIRE_LOCK_FREE == 0 || SSQ_REQUIRE_LOCK_FREE == 1,
              "SSQ_REQUIRE_LOCK_FREE must be 0 or 1");

#ifndef SSQ_ENABLE_CPU_RELAX
#  define SSQ_ENABLE_CPU_RELAX 1
#endif /* SSQ_ENABLE_CPU_RELAX */

static_assert(SSQ_ENABLE_CPU_RELAX == 0 || SSQ_ENABLE_CPU_RELAX == 1,
              "SSQ_ENABLE_CPU_RELAX must be 0 or 1");

#endif /* SSQ_CONFIG_HPP_ */
