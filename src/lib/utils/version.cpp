/*
* Version Information
* (C) 1999-2013,2015 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include <tacet/version.h>

#include <tacet/internal/fmt.h>
#include <tacet/internal/version_info.h>

namespace Tacet {

const char* version_cstr() {
   return TACET_FULL_VERSION_STRING;
}

const char* short_version_cstr() {
   return TACET_SHORT_VERSION_STRING;
}

std::string version_string() {
   return version_cstr();
}

std::string short_version_string() {
   return short_version_cstr();
}

uint32_t version_major() {
   return TACET_VERSION_MAJOR;
}

uint32_t version_minor() {
   return TACET_VERSION_MINOR;
}

uint32_t version_patch() {
   return TACET_VERSION_PATCH;
}

uint32_t version_datestamp() {
   return TACET_VERSION_DATESTAMP;
}

std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch) {
   const bool matches = (major == version_major() && minor == version_minor() && patch == version_patch());

   if(matches) {
      return std::string();
   }

   return fmt("Warning: Tacet {} is loaded but the application was built against {}.{}.{}\n",
              short_version_cstr(),
              major,
              minor,
              patch);
}

}  // namespace Tacet
