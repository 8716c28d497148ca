/*
 * basic_types.h - platform-independent type aliases for ssq
 *
 * Only the subset the single-slot queue and its tests actually need:
 *
 * ────────────────────────────────────────────────────────────────────
 *  Category      │ Purpose                         │ Types
 * ───────────────┼─────────────────────────────────┼───────────────────
 *  Exact-width   │ Fixed bit size                  │ u8, u32, u64, i32
 *  Native        │ Pointer-sized (register proxy)  │ reg, sreg
 * ────────────────────────────────────────────────────────────────────
 *
 * Platform assumptions:
 *     - 8-bit bytes.
 *     - reg is wide enough to hold any object size (it is std::size_t).
 *
 * C++ only: the queue is a template library, there is no C interface.
 */

#ifndef SSQ_BASIC_TYPES_H_
#define SSQ_BASIC_TYPES_H_

#include <cstddef>   /* size_t, ptrdiff_t */
#include <cstdint>   /* integer types */

/* Exact-width integer types (guaranteed size) */
using u8  = std::uint8_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;      /* unsigned native word (sizes, counts) */
using sreg = std::ptrdiff_t;   /* signed native word (differences) */

/* ------------------------------ Sanity checks ------------------------------- */
static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");
static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");

static_assert(sizeof(reg)  == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(sreg) == sizeof(void*), "sreg must match pointer size");

#endif /* SSQ_BASIC_TYPES_H_ */
