/*
* Constant time comparison primitives and the valgrind based annotations
* used to check them
*
* (C) 2010 Falko Strenzke
* (C) 2015,2016,2018,2024 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_CT_UTILS_H_
#define TACET_CT_UTILS_H_

#include <tacet/types.h>
#include <tacet/internal/target_info.h>
#include <tacet/internal/value_barrier.h>

#include <concepts>
#include <ranges>
#include <span>
#include <tuple>
#include <type_traits>

#if defined(TACET_HAS_VALGRIND)
   #include <valgrind/memcheck.h>
#endif

namespace Tacet::CT {

/// @name Secret data annotations
/// @{

/**
* Mark n objects starting at p as undefined for memcheck. Arithmetic on
* such memory is accepted, but memcheck reports any branch or memory address
* computed from it, which is exactly a timing leak. Unpoison a result before
* branching on it legitimately.
*
* Without TACET_HAS_VALGRIND both functions compile to nothing. With it the
* client request costs a few instructions even outside of valgrind.
*/
template <typename T>
constexpr inline void poison(const T* p, size_t n) {
#if defined(TACET_HAS_VALGRIND)
   if(!std::is_constant_evaluated()) {
      VALGRIND_MAKE_MEM_UNDEFINED(p, sizeof(T) * n);
   }
#else
   TACET_UNUSED(p, n);
#endif
}

template <typename T>
constexpr inline void unpoison(const T* p, size_t n) {
#if defined(TACET_HAS_VALGRIND)
   if(!std::is_constant_evaluated()) {
      VALGRIND_MAKE_MEM_DEFINED(p, sizeof(T) * n);
   }
#else
   TACET_UNUSED(p, n);
#endif
}

/**
* @return true only when built with valgrind support and actually running
* under valgrind; otherwise poisoning checks nothing
*/
inline bool poison_has_effect() {
#if defined(TACET_HAS_VALGRIND)
   return RUNNING_ON_VALGRIND != 0;
#else
   return false;
#endif
}

template <std::integral T>
constexpr void poison(T& v) {
   poison(&v, 1);
}

template <std::integral T>
constexpr void unpoison(T& v) {
   unpoison(&v, 1);
}

template <std::ranges::contiguous_range R>
   requires std::is_trivially_copyable_v<std::ranges::range_value_t<R>>
constexpr void poison(R&& r) {
   poison(std::ranges::data(r), std::ranges::size(r));
}

template <std::ranges::contiguous_range R>
   requires std::is_trivially_copyable_v<std::ranges::range_value_t<R>>
constexpr void unpoison(R&& r) {
   unpoison(std::ranges::data(r), std::ranges::size(r));
}

/**
* Poisons every argument for the lifetime of the object. The arguments are
* held by reference and must outlive it.
*/
template <typename... Ts>
class scoped_poison {
   public:
      constexpr explicit scoped_poison(const Ts&... xs) : m_values(xs...) { (poison(xs), ...); }

      ~scoped_poison() {
         std::apply([](const auto&... xs) { (unpoison(xs), ...); }, m_values);
      }

      scoped_poison(const scoped_poison&) = delete;
      scoped_poison(scoped_poison&&) = delete;
      scoped_poison& operator=(const scoped_poison&) = delete;
      scoped_poison& operator=(scoped_poison&&) = delete;

   private:
      std::tuple<const Ts&...> m_values;
};

/// @}

/// @name Constant Time Comparison
/// @{

/**
* Fold the bytewise difference of x and y into a single byte
*
* Every index is visited exactly once regardless of the contents, and the
* accumulated difference is passed through value_barrier before it is
* returned, so the compiler cannot turn the loop into an early exit.
*
* @param x the first input
* @param y the second input, must have the same length as x
* @return zero iff x[i] == y[i] for all i, otherwise some non-zero byte
*
* Unequal lengths are a programming error and trigger an assertion failure.
*/
inline uint8_t compare_ne(std::span<const uint8_t> x, std::span<const uint8_t> y) {
   TACET_ASSERT_EQUAL(x.size(), y.size(), "Compared inputs have equal length");

   uint8_t difference = 0;

   for(size_t i = 0; i != x.size(); ++i) {
      difference |= x[i] ^ y[i];
   }

   return value_barrier(difference);
}

/**
* Fold the bytewise difference of two fixed length inputs into a single byte
*
* Same as the variable length version, but the length is known at compile
* time so the loop can be fully unrolled or vectorized. There is no failure
* path since both lengths are fixed by the type.
*/
template <size_t N>
   requires(N != std::dynamic_extent)
TACET_FORCE_INLINE uint8_t compare_ne(std::span<const uint8_t, N> x, std::span<const uint8_t, N> y) {
   uint8_t difference = 0;

   for(size_t i = 0; i != N; ++i) {
      difference |= x[i] ^ y[i];
   }

   return value_barrier(difference);
}

/// @}

}  // namespace Tacet::CT

#endif
