/*
* Version Information
* (C) 1999-2011,2015 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_VERSION_H_
#define TACET_VERSION_H_

#include <tacet/types.h>
#include <string>

namespace Tacet {

/**
* @return a one line description of this build, starting with
* "Tacet MAJOR.MINOR.PATCH" and followed by release type, date and target
*/
TACET_PUBLIC_API(1, 0) std::string version_string();

/// version_string() as a pointer to static storage
TACET_PUBLIC_API(1, 0) const char* version_cstr();

/**
* @return "MAJOR.MINOR.PATCH"
*/
TACET_PUBLIC_API(1, 0) std::string short_version_string();

/// short_version_string() as a pointer to static storage
TACET_PUBLIC_API(1, 0) const char* short_version_cstr();

/**
* @return the release date as YYYYMMDD, or 0 for an unreleased build
*/
TACET_PUBLIC_API(1, 0) uint32_t version_datestamp();

TACET_PUBLIC_API(1, 0) uint32_t version_major();
TACET_PUBLIC_API(1, 0) uint32_t version_minor();
TACET_PUBLIC_API(1, 0) uint32_t version_patch();

/**
* Compare the version an application was compiled against with the shared
* library actually loaded:
*
*   std::cerr << Tacet::runtime_version_check(TACET_VERSION_MAJOR, TACET_VERSION_MINOR, TACET_VERSION_PATCH);
*
* @return an empty string on a match, otherwise a warning line
*/
TACET_PUBLIC_API(1, 0) std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch);

/*
* Compile time checks, e.g. #if TACET_VERSION_CODE >= TACET_VERSION_CODE_FOR(1, 1, 0)
*/
#define TACET_VERSION_CODE_FOR(a, b, c) ((a << 16) | (b << 8) | (c))

#define TACET_VERSION_CODE TACET_VERSION_CODE_FOR(TACET_VERSION_MAJOR, TACET_VERSION_MINOR, TACET_VERSION_PATCH)

}  // namespace Tacet

#endif
