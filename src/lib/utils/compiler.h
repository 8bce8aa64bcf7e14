/*
* Compiler specific inlining control
* (C) 2016 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_UTIL_COMPILER_FLAGS_H_
#define TACET_UTIL_COMPILER_FLAGS_H_

#include <tacet/api.h>
#include <tacet/build.h>

/*
* TACET_FORCE_INLINE is used on the fixed length CT::compare_ne so that the
* compiler can unroll the loop at each call site.
*
* The volatile value barrier is only opaque to the optimizer while its round
* trip stays an out of line call, so TACET_NOINLINE must be honored there.
*/
#if defined(__GNUC__) || defined(__clang__)
   #if !defined(TACET_FORCE_INLINE)
      #define TACET_FORCE_INLINE inline __attribute__((always_inline))
   #endif
   #if !defined(TACET_NOINLINE)
      #define TACET_NOINLINE __attribute__((noinline))
   #endif
#elif defined(_MSC_VER)
   #if !defined(TACET_FORCE_INLINE)
      #define TACET_FORCE_INLINE __forceinline
   #endif
   #if !defined(TACET_NOINLINE)
      #define TACET_NOINLINE __declspec(noinline)
   #endif
#else
   #if !defined(TACET_FORCE_INLINE)
      #define TACET_FORCE_INLINE inline
   #endif
   #if !defined(TACET_NOINLINE)
      #define TACET_NOINLINE
   #endif
#endif

#endif
