/*
* (C) 2025 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_VALUE_BARRIER_H_
#define TACET_VALUE_BARRIER_H_

#include <tacet/types.h>
#include <tacet/internal/target_info.h>
#include <concepts>
#include <type_traits>

namespace Tacet::CT {

namespace barrier_detail {

/*
* Store and reload through a volatile object. Must never be inlined,
* otherwise the optimizer could see that the value round trips unchanged.
*/
template <std::unsigned_integral T>
TACET_NOINLINE T volatile_round_trip(T x) {
   volatile T vx = x;
   return vx;
}

}  // namespace barrier_detail

/**
* This function returns its argument, but (if called in a non-constexpr context)
* attempts to prevent the compiler from reasoning about the value or the possible
* range of values. Such optimizations have a way of breaking constant time code,
* for instance by turning an accumulate-then-test-for-zero loop into a loop
* which exits at the first mismatching byte.
*
* The method that is used is decided at configuration time based on the target
* compiler and architecture, and can be overridden with the CMake option
* `TACET_CT_VALUE_BARRIER_TYPE`. One of the following is selected:
*
*  * `ASM_BYTE_REG` (x86, x86-64): an empty inline assembly statement which
*    claims to read and modify the value held in a byte addressable register.
*
*  * `ASM_WORD_REG` (ARM, AArch64, RISC-V): these have no byte register class,
*    so the value is widened to a full register word and passed through an
*    empty inline assembly statement using a general register.
*
*  * `VOLATILE` (everything else, and MSVC which lacks GCC-style inline asm):
*    launder the value through a volatile variable inside a function which is
*    never inlined. This costs a store, a load and a call on each use.
*
* The asm variants touch no memory and clobber nothing; the value stays in a
* register throughout.
*/
template <std::unsigned_integral T>
   requires(!std::same_as<bool, T>)
constexpr inline T value_barrier(T x) {
   if(std::is_constant_evaluated()) {
      return x;
   } else {
#if defined(TACET_CT_VALUE_BARRIER_USE_ASM_BYTE_REG)
      if constexpr(sizeof(T) == 1) {
         asm("" : "+q"(x) : /* no input */ : /* no clobbers */);  // NOLINT(*-no-assembler)
      } else {
         asm("" : "+r"(x) : /* no input */ : /* no clobbers */);  // NOLINT(*-no-assembler)
      }
      return x;
#elif defined(TACET_CT_VALUE_BARRIER_USE_ASM_WORD_REG)
      if constexpr(sizeof(T) <= sizeof(size_t)) {
         size_t w = x;
         asm("" : "+r"(w) : /* no input */ : /* no clobbers */);  // NOLINT(*-no-assembler)
         return static_cast<T>(w);
      } else {
         asm("" : "+r"(x) : /* no input */ : /* no clobbers */);  // NOLINT(*-no-assembler)
         return x;
      }
#elif defined(TACET_CT_VALUE_BARRIER_USE_VOLATILE)
      return barrier_detail::volatile_round_trip(x);
#else
   #error "No constant time value barrier selected in target_info.h"
#endif
   }
}

}  // namespace Tacet::CT

#endif
