/*
* Memory Operations
* (C) 1999-2009,2012,2015 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_MEMORY_OPS_H_
#define TACET_MEMORY_OPS_H_

#include <tacet/types.h>
#include <span>

namespace Tacet {

/**
* Memory comparison, input insensitive
*
* For inputs of equal length the running time depends only on that length,
* never on the position or number of differing bytes.
*
* @warning If the lengths of x and y differ, false is returned immediately.
* That length check is not constant time: only the contents of same-length
* inputs are protected. Callers which need to hide the length of a secret
* must arrange for both inputs to have the same, public length.
*
* @param x a range of bytes
* @param y another range of bytes
* @return true iff x and y have equal lengths and x[i] == y[i] forall i in [0...n)
*/
TACET_PUBLIC_API(1, 0) bool constant_time_compare(std::span<const uint8_t> x, std::span<const uint8_t> y);

/**
* Memory comparison, input insensitive
* @param x a pointer to an array
* @param y a pointer to another array
* @param len the number of bytes in x and y
* @return true iff x[i] == y[i] forall i in [0...n)
*/
inline bool constant_time_compare(const uint8_t x[], const uint8_t y[], size_t len) {
   // simply assumes that *x and *y point to len allocated bytes at least
   return constant_time_compare({x, len}, {y, len});
}

/**
* Constant time comparison of two 16 byte values (e.g. a truncated MAC)
* @return true iff x == y
*/
TACET_PUBLIC_API(1, 0) bool constant_time_compare_16(std::span<const uint8_t, 16> x, std::span<const uint8_t, 16> y);

/**
* Constant time comparison of two 32 byte values (e.g. a SHA-256 digest)
* @return true iff x == y
*/
TACET_PUBLIC_API(1, 0) bool constant_time_compare_32(std::span<const uint8_t, 32> x, std::span<const uint8_t, 32> y);

/**
* Constant time comparison of two 64 byte values (e.g. a SHA-512 digest)
* @return true iff x == y
*/
TACET_PUBLIC_API(1, 0) bool constant_time_compare_64(std::span<const uint8_t, 64> x, std::span<const uint8_t, 64> y);

}  // namespace Tacet

#endif
