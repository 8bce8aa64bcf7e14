/*
* Hex Encoding and Decoding for the test and analysis tools
* (C) 2010,2020 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_CLI_HEX_H_
#define TACET_CLI_HEX_H_

#include <tacet/exceptn.h>
#include <tacet/internal/fmt.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Tacet_CLI {

/*
* These only ever see public test data, so unlike the comparison
* functions of the library they are not written to run in constant time.
*/

inline std::string hex_encode(std::span<const uint8_t> input, bool uppercase = true) {
   const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";

   std::string output;
   output.reserve(2 * input.size());

   for(const uint8_t b : input) {
      output.push_back(digits[b >> 4]);
      output.push_back(digits[b & 0x0F]);
   }

   return output;
}

inline std::string hex_encode(const uint8_t input[], size_t input_length, bool uppercase = true) {
   return hex_encode(std::span<const uint8_t>(input, input_length), uppercase);
}

/**
* Decode a hex string, skipping any whitespace
* Throws Tacet::Invalid_Argument on bad characters or a trailing half byte
*/
inline std::vector<uint8_t> hex_decode(std::string_view input) {
   std::vector<uint8_t> output;
   output.reserve(input.size() / 2);

   bool top_nibble = true;
   uint8_t cur = 0;

   for(const char c : input) {
      uint8_t bin = 0;

      if(c >= '0' && c <= '9') {
         bin = static_cast<uint8_t>(c - '0');
      } else if(c >= 'a' && c <= 'f') {
         bin = static_cast<uint8_t>(c - 'a' + 10);
      } else if(c >= 'A' && c <= 'F') {
         bin = static_cast<uint8_t>(c - 'A' + 10);
      } else if(c == ' ' || c == '\n' || c == '\t' || c == '\r') {
         continue;
      } else {
         throw Tacet::Invalid_Argument(Tacet::fmt("hex_decode: invalid character '{}'", c));
      }

      if(top_nibble) {
         cur = static_cast<uint8_t>(bin << 4);
      } else {
         output.push_back(static_cast<uint8_t>(cur | bin));
      }

      top_nibble = !top_nibble;
   }

   if(!top_nibble) {
      throw Tacet::Invalid_Argument("hex_decode: input did not have full bytes");
   }

   return output;
}

}  // namespace Tacet_CLI

#endif
