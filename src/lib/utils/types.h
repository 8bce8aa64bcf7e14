/*
* Low Level Types
* (C) 1999-2007 Jack Lloyd
* (C) 2015 Simon Warta (Kullo GmbH)
* (C) 2016 René Korthaus, Rohde & Schwarz Cybersecurity
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_TYPES_H_
#define TACET_TYPES_H_

#include <tacet/assert.h>    // IWYU pragma: export
#include <tacet/build.h>     // IWYU pragma: export
#include <tacet/compiler.h>  // IWYU pragma: export
#include <cstddef>           // IWYU pragma: export
#include <cstdint>           // IWYU pragma: export

namespace Tacet {

/**
* @mainpage Tacet Constant Time Comparison API Reference
*
* <dl>
* <dt>Comparison<dd>
*        constant_time_compare, constant_time_compare_16, constant_time_compare_32,
*        constant_time_compare_64
* <dt>Errors<dd>
*        Exception, Invalid_Argument, Internal_Error
* <dt>C interface<dd>
*        @ref ffi.h "FFI"
* </dl>
*/

using std::size_t;
using std::uint32_t;
using std::uint64_t;
using std::uint8_t;

// The word sized value barrier and the FFI assume a 32 or 64 bit size_t
static_assert(sizeof(size_t) == 4 || sizeof(size_t) == 8, "Unsupported size_t width");

}  // namespace Tacet

#endif
