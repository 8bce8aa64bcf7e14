/*
* (C) 2023 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_UTIL_FMT_H_
#define TACET_UTIL_FMT_H_

#include <tacet/types.h>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>

namespace Tacet {

namespace fmt_detail {

inline void emit(std::ostringstream& oss, std::string_view format) {
   oss << format;
}

template <typename T, typename... Ts>
void emit(std::ostringstream& oss, std::string_view format, const T& val, const Ts&... rest) {
   const auto marker = format.find("{}");
   if(marker == std::string_view::npos) {
      oss << format;
      return;
   }

   oss << format.substr(0, marker) << val;
   emit(oss, format.substr(marker + 2), rest...);
}

}  // namespace fmt_detail

/**
* Replace each "{}" in format with the next argument, streamed with the
* classic locale. No escapes or format specifiers; surplus arguments are
* dropped and surplus markers are kept as written.
*/
template <typename... T>
std::string fmt(std::string_view format, const T&... args) {
   std::ostringstream oss;
   oss.imbue(std::locale::classic());
   fmt_detail::emit(oss, format, args...);
   return oss.str();
}

}  // namespace Tacet

#endif
