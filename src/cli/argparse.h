/*
* (C) 2015,2017 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_CLI_ARGPARSE_H_
#define TACET_CLI_ARGPARSE_H_

#include "cli_exceptions.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Tacet_CLI {

/**
* Command line parser driven by a one line usage string such as
*
*   "tool --verbose --runs=10 input *rest"
*
* The first word is the program name. "--name" declares a flag, "--name=def"
* an option with default value def, a bare word a required positional
* argument and "*name" collects all remaining positional arguments.
*/
class Argument_Parser final {
   public:
      explicit Argument_Parser(const std::string& usage);

      void parse_args(const std::vector<std::string>& params);

      bool flag_set(const std::string& flag) const { return m_flags_given.contains(flag); }

      std::string get_arg(const std::string& name) const;

      std::string get_arg_or(const std::string& name, const std::string& otherwise) const;

      size_t get_arg_sz(const std::string& name) const;

      /// The "*rest" arguments, or a comma separated option split into its parts
      std::vector<std::string> get_arg_list(const std::string& name) const;

      static std::vector<std::string> split_on(const std::string& str, char delim);

   private:
      std::set<std::string> m_flags;
      std::map<std::string, std::string> m_defaults;
      std::vector<std::string> m_positional;
      std::string m_rest_name;

      std::set<std::string> m_flags_given;
      std::map<std::string, std::string> m_values;
      std::vector<std::string> m_rest;
};

/*
* Unlike a plain tokenizer, empty fields are dropped and an input ending in
* the delimiter is rejected
*/
inline std::vector<std::string> Argument_Parser::split_on(const std::string& str, char delim) {
   std::vector<std::string> parts;
   std::string::size_type start = 0;

   while(start < str.size()) {
      const auto end = str.find(delim, start);
      if(end == std::string::npos) {
         parts.push_back(str.substr(start));
         return parts;
      }
      if(end > start) {
         parts.push_back(str.substr(start, end - start));
      }
      start = end + 1;
   }

   if(!str.empty()) {
      throw CLI_Error("Unable to split string: " + str);
   }
   return parts;
}

inline Argument_Parser::Argument_Parser(const std::string& usage) {
   const auto words = split_on(usage, ' ');

   if(words.empty()) {
      throw CLI_Error("Invalid command spec '" + usage + "'");
   }

   for(size_t i = 1; i != words.size(); ++i) {
      const std::string& w = words[i];

      if(!m_rest_name.empty()) {
         throw CLI_Error("Invalid command spec '" + usage + "': '*" + m_rest_name + "' must come last");
      }

      if(w.starts_with("--") && w.size() > 2) {
         const auto eq = w.find('=');
         if(eq == std::string::npos) {
            m_flags.insert(w.substr(2));
         } else {
            m_defaults[w.substr(2, eq - 2)] = w.substr(eq + 1);
         }
      } else if(w.starts_with("*") && w.size() > 1) {
         m_rest_name = w.substr(1);
      } else {
         m_positional.push_back(w);
      }
   }
}

inline void Argument_Parser::parse_args(const std::vector<std::string>& params) {
   std::vector<std::string> positional;

   for(const auto& param : params) {
      if(!param.starts_with("--")) {
         positional.push_back(param);
         continue;
      }

      const auto eq = param.find('=');
      const std::string name = param.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

      if(eq == std::string::npos) {
         if(m_defaults.contains(name)) {
            throw CLI_Usage_Error("Invalid usage of option --" + name + " without value");
         }
         if(!m_flags.contains(name)) {
            throw CLI_Usage_Error("Unknown flag --" + name);
         }
         m_flags_given.insert(name);
      } else {
         if(!m_defaults.contains(name)) {
            throw CLI_Usage_Error("Unknown option --" + name);
         }
         if(!m_values.emplace(name, param.substr(eq + 1)).second) {
            throw CLI_Usage_Error("Duplicated option --" + name);
         }
      }
   }

   // --help must work even without the required arguments
   if(flag_set("help")) {
      return;
   }

   if(positional.size() < m_positional.size()) {
      throw CLI_Usage_Error("Invalid argument count, got " + std::to_string(positional.size()) + " expected " +
                            std::to_string(m_positional.size()));
   }

   if(m_rest_name.empty() && positional.size() > m_positional.size()) {
      throw CLI_Usage_Error("Too many arguments");
   }

   for(size_t i = 0; i != m_positional.size(); ++i) {
      m_values[m_positional[i]] = positional[i];
   }
   m_rest.assign(positional.begin() + static_cast<std::ptrdiff_t>(m_positional.size()), positional.end());

   for(const auto& [name, def] : m_defaults) {
      m_values.emplace(name, def);
   }
}

inline std::string Argument_Parser::get_arg(const std::string& name) const {
   const auto i = m_values.find(name);
   if(i == m_values.end()) {
      throw CLI_Error("Unknown option " + name + " used (program bug)");
   }
   return i->second;
}

inline std::string Argument_Parser::get_arg_or(const std::string& name, const std::string& otherwise) const {
   const auto i = m_values.find(name);
   return (i == m_values.end() || i->second.empty()) ? otherwise : i->second;
}

inline size_t Argument_Parser::get_arg_sz(const std::string& name) const {
   const std::string s = get_arg(name);

   size_t consumed = 0;
   unsigned long long v = 0;
   try {
      v = std::stoull(s, &consumed);
   } catch(std::logic_error&) {
      consumed = 0;
   }

   if(s.empty() || consumed != s.size() || s[0] == '-') {
      throw CLI_Usage_Error("Invalid integer value '" + s + "' for option " + name);
   }
   return static_cast<size_t>(v);
}

inline std::vector<std::string> Argument_Parser::get_arg_list(const std::string& name) const {
   if(!m_rest_name.empty() && name == m_rest_name) {
      return m_rest;
   }
   return split_on(get_arg(name), ',');
}

}  // namespace Tacet_CLI

#endif
