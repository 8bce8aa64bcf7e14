/*
* (C) 2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include <tacet/exceptn.h>

#include <tacet/internal/fmt.h>

namespace Tacet {

std::string to_string(ErrorType type) {
   // Exhaustive without a default, so a new enumerator triggers -Wswitch
   switch(type) {
      case ErrorType::Unknown:
         return "Unknown";
      case ErrorType::InternalError:
         return "InternalError";
      case ErrorType::InvalidArgument:
         return "InvalidArgument";
   }

   return fmt("ErrorType({})", static_cast<int>(type));
}

Exception::Exception(std::string_view msg) : m_msg(msg) {}

Exception::Exception(const char* prefix, std::string_view msg) : m_msg(prefix) {
   m_msg.push_back(' ');
   m_msg.append(msg);
}

Invalid_Argument::Invalid_Argument(std::string_view msg) : Exception(msg) {}

Internal_Error::Internal_Error(std::string_view err) : Exception("Internal error:", err) {}

}  // namespace Tacet
