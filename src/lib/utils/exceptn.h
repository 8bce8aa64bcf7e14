/*
* Exceptions
* (C) 1999-2009,2018 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_EXCEPTION_H_
#define TACET_EXCEPTION_H_

#include <tacet/types.h>
#include <exception>
#include <string>
#include <string_view>

namespace Tacet {

/**
* Broad classification of a failure, used by the FFI layer to pick a
* return code without inspecting the exception type
*/
enum class ErrorType {
   Unknown = 1,
   /** A library invariant was violated; always a bug in Tacet */
   InternalError,
   /** The caller passed something the API does not accept */
   InvalidArgument,
};

/**
* @return the enumerator name of type, e.g. "InternalError"
*/
std::string TACET_PUBLIC_API(1, 0) to_string(ErrorType type);

/**
* Root of every exception Tacet throws. Not thrown directly.
*/
class TACET_PUBLIC_API(1, 0) Exception : public std::exception {
   public:
      const char* what() const noexcept override { return m_msg.c_str(); }

      virtual ErrorType error_type() const noexcept { return ErrorType::Unknown; }

      /**
      * Subclasses wrapping an FFI failure carry the return code here
      */
      virtual int error_code() const noexcept { return 0; }

   protected:
      explicit Exception(std::string_view msg);

      /**
      * The message becomes "<prefix> <msg>"
      */
      Exception(const char* prefix, std::string_view msg);

   private:
      std::string m_msg;
};

class TACET_PUBLIC_API(1, 0) Invalid_Argument : public Exception {
   public:
      explicit Invalid_Argument(std::string_view msg);

      ErrorType error_type() const noexcept override { return ErrorType::InvalidArgument; }
};

/**
* Thrown by a failed TACET_ASSERT, for instance if the comparison loop
* is ever entered with unequal lengths
*/
class TACET_PUBLIC_API(1, 0) Internal_Error : public Exception {
   public:
      explicit Internal_Error(std::string_view err);

      ErrorType error_type() const noexcept override { return ErrorType::InternalError; }
};

}  // namespace Tacet

#endif
