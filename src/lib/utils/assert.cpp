/*
* Runtime assertion checking
* (C) 2010,2012,2018 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include <tacet/assert.h>

#include <tacet/exceptn.h>
#include <tacet/internal/fmt.h>
#include <string>

#if defined(TACET_TERMINATE_ON_ASSERTS)
   #include <cstdlib>
   #include <iostream>
#endif

namespace Tacet {

namespace {

[[noreturn]] void internal_failure(const std::string& msg) {
#if defined(TACET_TERMINATE_ON_ASSERTS)
   std::cerr << msg << std::endl;
   std::abort();
#else
   throw Internal_Error(msg);
#endif
}

}  // namespace

void assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line) {
   std::string msg = "False assertion ";

   if(assertion_made != nullptr && assertion_made[0] != '\0') {
      msg += fmt("'{}' (expression {}) ", assertion_made, expr_str);
   } else {
      msg += fmt("{} ", expr_str);
   }

   if(func != nullptr) {
      msg += fmt("in {} ", func);
   }

   internal_failure(msg + fmt("@{}:{}", file, line));
}

}  // namespace Tacet
