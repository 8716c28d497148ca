/*
 * ssq_tools.hpp
 *
 *  Created on: 19 Oct. 2026
 *
 * Tiny portability helpers shared by the queue headers.
 * - Zero dependencies, header-only, safe for inclusion from multiple TUs.
 * - One token for "force inline", branch hints, and a CPU relax hint for
 *   spin loops.
 *
 * Notes:
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. All queue code lives in headers, so it always is.
 * - SSQ_CPU_RELAX() is an instruction-level hint (x86 PAUSE, ARM YIELD).
 *   It never enters the OS scheduler, so it is legal inside an ISR.
 */

#ifndef SSQ_TOOLS_HPP_
#define SSQ_TOOLS_HPP_

#include "ssq_config.hpp"

/* ---------------------------------------------------------------------------
 * SSQ_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef SSQ_FORCEINLINE
  /* MSVC or clang-cl */
#  if defined(_MSC_VER)
#    define SSQ_FORCEINLINE __forceinline
  /* Clang/GCC style (Clang also defines __GNUC__, so check __clang__ first) */
#  elif defined(__clang__) || defined(__GNUC__)
#    define SSQ_FORCEINLINE inline __attribute__((always_inline))
  /* ARMCC (armcc/armcc5), non-clang front-end */
#  elif defined(__ARMCC_VERSION) && !defined(__clang__)
#    define SSQ_FORCEINLINE __forceinline
  /* Fallback: at least hint 'inline' */
#  else
#    define SSQ_FORCEINLINE inline
#  endif
#endif /* SSQ_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hints.
 * Separate guards prevent losing SSQ_UNLIKELY if SSQ_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef SSQ_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define SSQ_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define SSQ_LIKELY(x)   (x)
#  endif
#endif /* SSQ_LIKELY */

#ifndef SSQ_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define SSQ_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define SSQ_UNLIKELY(x) (x)
#  endif
#endif /* SSQ_UNLIKELY */

/* ---------------------------------------------------------------------------
 * SSQ_CPU_RELAX(): spin-wait hint
 * ------------------------------------------------------------------------- */
#ifndef SSQ_CPU_RELAX
#  if !SSQ_ENABLE_CPU_RELAX
#    define SSQ_CPU_RELAX() ((void)0)
#  elif defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86))
#    include <intrin.h>
#    define SSQ_CPU_RELAX() _mm_pause()
#  elif (defined(__clang__) || defined(__GNUC__)) && (defined(__x86_64__) || defined(__i386__))
#    define SSQ_CPU_RELAX() __builtin_ia32_pause()
#  elif (defined(__clang__) || defined(__GNUC__)) && (defined(__aarch64__) || defined(__arm__))
     /* YIELD is a hint, cores without it execute it as a NOP. */
#    define SSQ_CPU_RELAX() __asm__ __volatile__("yield" ::: "memory")
#  elif defined(__clang__) || defined(__GNUC__)
#    define SSQ_CPU_RELAX() __asm__ __volatile__("" ::: "memory")
#  else
#    define SSQ_CPU_RELAX() ((void)0)
#  endif
#endif /* SSQ_CPU_RELAX */

#endif /* SSQ_TOOLS_HPP_ */
