/*
* (C) 2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include <tacet/mem_ops.h>

#include <tacet/internal/ct_utils.h>

namespace Tacet {

bool constant_time_compare(std::span<const uint8_t> x, std::span<const uint8_t> y) {
   // Not constant time, see the warning in mem_ops.h
   if(x.size() != y.size()) {
      return false;
   }

   return CT::compare_ne(x, y) == 0;
}

bool constant_time_compare_16(std::span<const uint8_t, 16> x, std::span<const uint8_t, 16> y) {
   return CT::compare_ne(x, y) == 0;
}

bool constant_time_compare_32(std::span<const uint8_t, 32> x, std::span<const uint8_t, 32> y) {
   return CT::compare_ne(x, y) == 0;
}

bool constant_time_compare_64(std::span<const uint8_t, 64> x, std::span<const uint8_t, 64> y) {
   return CT::compare_ne(x, y) == 0;
}

}  // namespace Tacet
