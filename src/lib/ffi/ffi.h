/*
* FFI (C89 API)
* (C) 2015,2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_FFI_H_
#define TACET_FFI_H_

#ifdef __cplusplus
extern "C" {
#endif

/*
C interface to the Tacet comparison functions, meant to be loaded from other
languages through ctypes, cffi, JNA and the like.

Conventions:

- Every function other than the version queries returns an int, either 0 or
  a negative TACET_FFI_ERROR value.

- Comparisons return 0 for equal inputs and -1 (TACET_FFI_ERROR_INVALID_INPUT)
  for different ones, so a caller can never mistake an error for "equal".

- Buffers are passed as uint8_t pointer plus size_t length and are only read
  during the call. Nothing allocated by the library is handed out except the
  thread local string behind tacet_error_last_exception_message.
*/

#include <stddef.h>
#include <stdint.h>

/*
* Version of this interface, as YYYYMMDD. Kept equal to tacet_ffi_api_version()
* and to TACET_HAS_FFI; repeated here so the header has no dependency on
* build.h.
*/
#define TACET_FFI_API_VERSION 20261019

/*
* TACET_FFI_EXPORT(maj, min) marks a function first shipped in version maj.min
*/
#if defined(TACET_DLL)
   #define TACET_FFI_EXPORT(maj, min) TACET_DLL
#elif defined(__GNUC__) || defined(__clang__)
   #define TACET_FFI_EXPORT(maj, min) __attribute__((visibility("default")))
#else
   #define TACET_FFI_EXPORT(maj, min)
#endif

#if defined(TACET_NO_DEPRECATED_WARNINGS)
   #define TACET_FFI_DEPRECATED(msg)
#elif defined(__GNUC__) || defined(__clang__)
   #define TACET_FFI_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
   #define TACET_FFI_DEPRECATED(msg) __declspec(deprecated(msg))
#else
   #define TACET_FFI_DEPRECATED(msg)
#endif

/*
* Return codes. tacet_error_description has a case for each of them.
*/
enum TACET_FFI_ERROR {
   TACET_FFI_SUCCESS = 0,

   /* the compared inputs differ */
   TACET_FFI_ERROR_INVALID_INPUT = -1,

   TACET_FFI_ERROR_EXCEPTION_THROWN = -20,
   TACET_FFI_ERROR_OUT_OF_MEMORY = -21,
   TACET_FFI_ERROR_INTERNAL_ERROR = -23,

   TACET_FFI_ERROR_NULL_POINTER = -31,
   TACET_FFI_ERROR_BAD_PARAMETER = -32,

   TACET_FFI_ERROR_UNKNOWN_ERROR = -100,
};

/**
* @return a static description of err, "Unknown error" for values not in
* TACET_FFI_ERROR
*/
TACET_FFI_EXPORT(1, 0) const char* tacet_error_description(int err);

/**
* @return what() of the most recent exception an FFI call caught on this
* thread, or "" if there was none. The next FFI call from the same thread
* may overwrite the buffer; copy it out if it is needed later.
*/
TACET_FFI_EXPORT(1, 0) const char* tacet_error_last_exception_message(void);

/**
* @return TACET_FFI_API_VERSION of the loaded library
*/
TACET_FFI_EXPORT(1, 0) uint32_t tacet_ffi_api_version(void);

/**
* @return 0 if the library implements the given interface version, otherwise -1
*/
TACET_FFI_EXPORT(1, 0) int tacet_ffi_supports_api(uint32_t api_version);

/**
* @return the full version line of the library, e.g. "Tacet 1.0.0 (release, ...)"
*/
TACET_FFI_EXPORT(1, 0) const char* tacet_version_string(void);

TACET_FFI_EXPORT(1, 0) uint32_t tacet_version_major(void);
TACET_FFI_EXPORT(1, 0) uint32_t tacet_version_minor(void);
TACET_FFI_EXPORT(1, 0) uint32_t tacet_version_patch(void);

/**
* @return release date as YYYYMMDD, 0 for unreleased builds
*/
TACET_FFI_EXPORT(1, 0) uint32_t tacet_version_datestamp(void);

/**
* Compare len bytes at x and y in time that depends on len alone.
*
* @return 0 if equal, -1 if different, TACET_FFI_ERROR_NULL_POINTER if
* len > 0 and either pointer is null
*/
TACET_FFI_EXPORT(1, 0) int tacet_constant_time_compare(const uint8_t* x, const uint8_t* y, size_t len);

/*
* Fixed size variants reading exactly 16, 32 or 64 bytes from each pointer.
* Return 0 if equal, -1 if different, TACET_FFI_ERROR_NULL_POINTER if either
* pointer is null.
*/
TACET_FFI_EXPORT(1, 0) int tacet_constant_time_compare_16(const uint8_t x[16], const uint8_t y[16]);
TACET_FFI_EXPORT(1, 0) int tacet_constant_time_compare_32(const uint8_t x[32], const uint8_t y[32]);
TACET_FFI_EXPORT(1, 0) int tacet_constant_time_compare_64(const uint8_t x[64], const uint8_t y[64]);

/**
* Older name of tacet_constant_time_compare
*/
TACET_FFI_DEPRECATED("Use tacet_constant_time_compare")
TACET_FFI_EXPORT(1, 0) int tacet_same_mem(const uint8_t* x, const uint8_t* y, size_t len);

#ifdef __cplusplus
}
#endif

#endif
