/*
* (C) 2015,2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_FFI_UTILS_H_
#define TACET_FFI_UTILS_H_

#include <tacet/exceptn.h>
#include <tacet/ffi.h>
#include <concepts>
#include <cstdint>
#include <exception>
#include <new>

namespace Tacet_FFI {

class TACET_UNSTABLE_API FFI_Error final : public Tacet::Exception {
   public:
      FFI_Error(std::string_view what, int err_code) : Exception("FFI error", what), m_err_code(err_code) {}

      int error_code() const noexcept override { return m_err_code; }

      Tacet::ErrorType error_type() const noexcept override { return Tacet::ErrorType::InvalidArgument; }

   private:
      int m_err_code;
};

// Declared in ffi.cpp
void ffi_clear_last_exception();

int ffi_error_exception_thrown(const char* func_name, const char* exn, int rc);

int ffi_error_exception_thrown(const char* func_name, const char* exn, Tacet::ErrorType err);

template <std::invocable T>
int ffi_guard_thunk(const char* func_name, T thunk) {
   ffi_clear_last_exception();

   try {
      return thunk();
   } catch(std::bad_alloc&) {
      return ffi_error_exception_thrown(func_name, "bad_alloc", TACET_FFI_ERROR_OUT_OF_MEMORY);
   } catch(Tacet_FFI::FFI_Error& e) {
      return ffi_error_exception_thrown(func_name, e.what(), e.error_code());
   } catch(Tacet::Exception& e) {
      return ffi_error_exception_thrown(func_name, e.what(), e.error_type());
   } catch(std::exception& e) {
      return ffi_error_exception_thrown(func_name, e.what(), TACET_FFI_ERROR_EXCEPTION_THROWN);
   } catch(...) {
      return ffi_error_exception_thrown(func_name, "unknown exception", TACET_FFI_ERROR_EXCEPTION_THROWN);
   }
}

/**
* A pointer may only be null if the buffer it refers to is empty
*/
inline void check_buffer(const uint8_t* buf, size_t len) {
   if(buf == nullptr && len > 0) {
      throw FFI_Error("Null pointer with non-zero length", TACET_FFI_ERROR_NULL_POINTER);
   }
}

inline int ffi_bool_rc(bool equal) {
   return equal ? TACET_FFI_SUCCESS : TACET_FFI_ERROR_INVALID_INPUT;
}

}  // namespace Tacet_FFI

#endif
