/*
* (C) 2015,2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include <tacet/ffi.h>

#include <tacet/mem_ops.h>
#include <tacet/version.h>
#include <tacet/internal/ffi_util.h>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>

namespace Tacet_FFI {

namespace {

// NOLINTNEXTLINE(*-avoid-non-const-global-variables)
thread_local std::string g_last_exception_what;

int ffi_map_error_type(Tacet::ErrorType err) {
   switch(err) {
      case Tacet::ErrorType::Unknown:
         return TACET_FFI_ERROR_UNKNOWN_ERROR;

      case Tacet::ErrorType::InternalError:
         return TACET_FFI_ERROR_INTERNAL_ERROR;
      case Tacet::ErrorType::InvalidArgument:
         return TACET_FFI_ERROR_BAD_PARAMETER;
   }

   return TACET_FFI_ERROR_UNKNOWN_ERROR;
}

bool print_exceptions_requested() {
   const char* val = std::getenv("TACET_FFI_PRINT_EXCEPTIONS");  // NOLINT(*-mt-unsafe)
   return val != nullptr && val[0] != 0;
}

}  // namespace

void ffi_clear_last_exception() {
   g_last_exception_what.clear();
}

int ffi_error_exception_thrown(const char* func_name, const char* exn, int rc) {
   g_last_exception_what.assign(exn);

   if(print_exceptions_requested()) {
      // NOLINTNEXTLINE(*-vararg)
      std::fprintf(stderr, "in %s exception '%s' returning %d\n", func_name, exn, rc);
   }

   return rc;
}

int ffi_error_exception_thrown(const char* func_name, const char* exn, Tacet::ErrorType err) {
   return ffi_error_exception_thrown(func_name, exn, ffi_map_error_type(err));
}

namespace {

template <size_t N>
using fixed_compare_fn = bool (*)(std::span<const uint8_t, N>, std::span<const uint8_t, N>);

template <size_t N>
int ffi_compare_fixed(const char* func_name, const uint8_t x[], const uint8_t y[], fixed_compare_fn<N> cmp) {
   return ffi_guard_thunk(func_name, [=]() -> int {
      check_buffer(x, N);
      check_buffer(y, N);
      return ffi_bool_rc(cmp(std::span<const uint8_t, N>(x, N), std::span<const uint8_t, N>(y, N)));
   });
}

}  // namespace

}  // namespace Tacet_FFI

extern "C" {

using namespace Tacet_FFI;

const char* tacet_error_last_exception_message() {
   return g_last_exception_what.c_str();
}

const char* tacet_error_description(int err) {
   struct Description {
         int code;
         const char* text;
   };

   static constexpr Description descriptions[] = {
      {TACET_FFI_SUCCESS, "OK"},
      {TACET_FFI_ERROR_INVALID_INPUT, "Invalid input"},
      {TACET_FFI_ERROR_EXCEPTION_THROWN, "Exception thrown"},
      {TACET_FFI_ERROR_OUT_OF_MEMORY, "Out of memory"},
      {TACET_FFI_ERROR_INTERNAL_ERROR, "Internal error"},
      {TACET_FFI_ERROR_NULL_POINTER, "Null pointer argument"},
      {TACET_FFI_ERROR_BAD_PARAMETER, "Bad parameter"},
      {TACET_FFI_ERROR_UNKNOWN_ERROR, "Unknown error"},
   };

   for(const auto& d : descriptions) {
      if(d.code == err) {
         return d.text;
      }
   }

   return "Unknown error";
}

uint32_t tacet_ffi_api_version() {
   return TACET_HAS_FFI;
}

int tacet_ffi_supports_api(uint32_t api_version) {
   // Only one revision of the interface exists so far
   return (api_version == TACET_FFI_API_VERSION) ? TACET_FFI_SUCCESS : -1;
}

const char* tacet_version_string() {
   return Tacet::version_cstr();
}

uint32_t tacet_version_major() {
   return Tacet::version_major();
}

uint32_t tacet_version_minor() {
   return Tacet::version_minor();
}

uint32_t tacet_version_patch() {
   return Tacet::version_patch();
}

uint32_t tacet_version_datestamp() {
   return Tacet::version_datestamp();
}

int tacet_constant_time_compare(const uint8_t* x, const uint8_t* y, size_t len) {
   return ffi_guard_thunk(__func__, [=]() -> int {
      check_buffer(x, len);
      check_buffer(y, len);
      return ffi_bool_rc(Tacet::constant_time_compare(x, y, len));
   });
}

int tacet_constant_time_compare_16(const uint8_t x[16], const uint8_t y[16]) {
   return ffi_compare_fixed<16>(__func__, x, y, Tacet::constant_time_compare_16);
}

int tacet_constant_time_compare_32(const uint8_t x[32], const uint8_t y[32]) {
   return ffi_compare_fixed<32>(__func__, x, y, Tacet::constant_time_compare_32);
}

int tacet_constant_time_compare_64(const uint8_t x[64], const uint8_t y[64]) {
   return ffi_compare_fixed<64>(__func__, x, y, Tacet::constant_time_compare_64);
}

int tacet_same_mem(const uint8_t* x, const uint8_t* y, size_t len) {
   return tacet_constant_time_compare(x, y, len);
}
}
