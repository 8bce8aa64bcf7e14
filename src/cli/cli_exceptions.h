/*
* (C) 2015 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_CLI_EXCEPTIONS_H_
#define TACET_CLI_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace Tacet_CLI {

class CLI_Error : public std::runtime_error {
   public:
      explicit CLI_Error(const std::string& s) : std::runtime_error(s) {}
};

/// A file could not be opened or read
class CLI_IO_Error final : public CLI_Error {
   public:
      CLI_IO_Error(const std::string& op, const std::string& who) : CLI_Error("Error " + op + " " + who) {}
};

/// Bad command line; the tools print their usage text after the message
class CLI_Usage_Error final : public CLI_Error {
   public:
      explicit CLI_Usage_Error(const std::string& what) : CLI_Error(what) {}
};

}  // namespace Tacet_CLI

#endif
