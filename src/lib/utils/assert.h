/*
* Runtime assertion checking
* (C) 2010,2018 Jack Lloyd
*     2017 Simon Warta (Kullo GmbH)
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_ASSERTION_CHECKING_H_
#define TACET_ASSERTION_CHECKING_H_

#include <tacet/compiler.h>

namespace Tacet {

/**
* Reports a failed TACET_ASSERT* check. Throws Internal_Error with the
* message
*
*   False assertion '<assertion_made>' (expression <expr>) in <func> @<file>:<line>
*
* unless the library was built with TACET_TERMINATE_ON_ASSERTS, in which case
* the message goes to stderr and the process aborts.
*/
[[noreturn]] void TACET_PUBLIC_API(1, 0)
   assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line);

/*
* Common body of the TACET_ASSERT family; expr_str and msg must be string literals
*/
#define TACET_ASSERT_IMPL(cond, expr_str, msg)                                         \
   do {                                                                                \
      if(!(cond)) {                                                                    \
         Tacet::assertion_failure(expr_str, msg, __func__, __FILE__, __LINE__);        \
      }                                                                                \
   } while(0)

#define TACET_ASSERT(expr, assertion_made) TACET_ASSERT_IMPL(expr, #expr, assertion_made)

#define TACET_ASSERT_EQUAL(expr1, expr2, assertion_made) \
   TACET_ASSERT_IMPL((expr1) == (expr2), #expr1 " == " #expr2, assertion_made)

/**
* Marks any number of variables as used, e.g. TACET_UNUSED(p, n)
*/
template <typename... T>
constexpr void ignore_params(T&&... /*args*/) {}

#define TACET_UNUSED Tacet::ignore_params

}  // namespace Tacet

#endif
