/*
 * basic_types.h — platform-independent type aliases used by chunkiter
 *
 * ────────────────────────────────────────────────────────────────────────────────
 *  Category      │ Purpose                         │ Example types
 * ───────────────┼─────────────────────────────────┼───────────────────────────────
 *  Exact-width   │ Fixed bit size                  │ u8, u32, i32, u64
 *  Native        │ Pointer-sized (register proxy)  │ reg, sreg
 *  Size-friendly │ API ergonomics for sizes        │ usize, isize
 * ────────────────────────────────────────────────────────────────────────────────
 *
 * Platform assumptions:
 *     - 8-bit bytes.
 *     - reg matches the pointer size. Chunk sizes and live counts are reg.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstdint>   /* integer types */
#include <cstddef>   /* size_t, ptrdiff_t */

/* Exact-width integer types (guaranteed size) */
using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;      /* unsigned native word (for indices/capacities) */
using sreg = std::ptrdiff_t;   /* signed native word (for differences) */

/* Size-friendly aliases (API ergonomics) */
using usize = std::size_t;
using isize = std::ptrdiff_t;

static_assert(sizeof(reg)  == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(sreg) == sizeof(void*), "sreg must match pointer size");

#endif /* BASIC_TYPES_H_ */
