/*
* Timing measurements for the comparison functions
*
* Each line of the data file is a hex encoded secret. Every secret is compared
* against an all zero reference in turn and the elapsed time of each call is
* printed as "id;secret_id;nanoseconds". Feeding the output to a statistical
* tool (the Mona timing report tool or a simple t-test) shows whether the
* timing depends on where the inputs differ. The memcmp test type serves as
* a known leaky baseline.
*
* (C) 2016 Juraj Somorovsky - juraj.somorovsky@hackmanit.de
* (C) 2017 Neverhub
* (C) 2017,2018,2019 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include "argparse.h"
#include "cli_hex.h"

#include <tacet/mem_ops.h>
#include <tacet/version.h>
#include <tacet/internal/fmt.h>
#include <array>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <span>
#include <sstream>
#include <string>
#include <vector>

namespace Tacet_CLI {

namespace {

class Stopwatch final {
   public:
      Stopwatch() : m_start(std::chrono::steady_clock::now()) {}

      uint64_t elapsed_ns() const {
         const auto dur = std::chrono::steady_clock::now() - m_start;
         return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
      }

   private:
      std::chrono::steady_clock::time_point m_start;
};

/*
* Keeps the result of the measured call alive so the compiler
* cannot drop the call as having no observable effect
*/
// NOLINTNEXTLINE(*-avoid-non-const-global-variables)
volatile bool g_sink = false;

}  // namespace

class Timing_Test {
   public:
      Timing_Test() = default;

      virtual ~Timing_Test() = default;

      Timing_Test(const Timing_Test&) = delete;
      Timing_Test& operator=(const Timing_Test&) = delete;

      /**
      * @return one row of measurement_runs timings per secret, in input order
      */
      std::vector<std::vector<uint64_t>> measure(const std::vector<std::string>& secrets,
                                                 size_t warmup_runs,
                                                 size_t measurement_runs);

   protected:
      virtual std::vector<uint8_t> decode_secret(const std::string& hex) { return hex_decode(hex); }

      /// Time a single call of the function under test on secret
      virtual uint64_t time_one(const std::vector<uint8_t>& secret) = 0;
};

/*
* Compares each input against an all-zero reference of the same length.
* Inputs differing in the first byte, the last byte, or not at all should
* produce indistinguishable timings.
*/
class Compare_Timing_Test final : public Timing_Test {
   protected:
      uint64_t time_one(const std::vector<uint8_t>& input) override {
         if(m_reference.size() != input.size()) {
            m_reference.assign(input.size(), 0);
         }

         const Stopwatch timer;
         const bool eq = Tacet::constant_time_compare(input, m_reference);
         const uint64_t elapsed = timer.elapsed_ns();
         g_sink = eq;
         return elapsed;
      }

   private:
      std::vector<uint8_t> m_reference;
};

class Compare_32_Timing_Test final : public Timing_Test {
   protected:
      std::vector<uint8_t> decode_secret(const std::string& hex) override {
         auto bin = hex_decode(hex);
         if(bin.size() != m_reference.size()) {
            throw CLI_Usage_Error(Tacet::fmt("ct_compare_32 inputs must be 32 bytes, got {}", bin.size()));
         }
         return bin;
      }

      uint64_t time_one(const std::vector<uint8_t>& input) override {
         const std::span<const uint8_t, 32> in(input.data(), 32);

         const Stopwatch timer;
         const bool eq = Tacet::constant_time_compare_32(in, m_reference);
         const uint64_t elapsed = timer.elapsed_ns();
         g_sink = eq;
         return elapsed;
      }

   private:
      std::array<uint8_t, 32> m_reference = {};
};

/*
* Baseline using an ordinary early exit comparison; its timings are
* expected to depend on the position of the first mismatch
*/
class Memcmp_Timing_Test final : public Timing_Test {
   protected:
      uint64_t time_one(const std::vector<uint8_t>& input) override {
         if(m_reference.size() != input.size()) {
            m_reference.assign(input.size(), 0);
         }

         const Stopwatch timer;
         const bool eq = input.empty() || std::memcmp(input.data(), m_reference.data(), input.size()) == 0;
         const uint64_t elapsed = timer.elapsed_ns();
         g_sink = eq;
         return elapsed;
      }

   private:
      std::vector<uint8_t> m_reference;
};

std::vector<std::vector<uint64_t>> Timing_Test::measure(const std::vector<std::string>& secrets,
                                                        size_t warmup_runs,
                                                        size_t measurement_runs) {
   if(warmup_runs > 1000000 || measurement_runs > 100000000) {
      throw CLI_Usage_Error(Tacet::fmt("Run counts {}/{} exceed the limits of 1000000/100000000",
                                       warmup_runs,
                                       measurement_runs));
   }

   std::vector<std::vector<uint8_t>> decoded;
   decoded.reserve(secrets.size());
   for(const auto& hex : secrets) {
      decoded.push_back(decode_secret(hex));
   }

   // Secrets are interleaved within each round so drift in clock speed or
   // system load affects all of them alike
   for(size_t round = 0; round != warmup_runs; ++round) {
      for(const auto& secret : decoded) {
         time_one(secret);
      }
   }

   std::vector<std::vector<uint64_t>> timings(decoded.size());
   for(auto& row : timings) {
      row.reserve(measurement_runs);
   }

   for(size_t round = 0; round != measurement_runs; ++round) {
      for(size_t i = 0; i != decoded.size(); ++i) {
         timings[i].push_back(time_one(decoded[i]));
      }
   }

   return timings;
}

namespace {

std::unique_ptr<Timing_Test> lookup_timing_test(std::string_view test_type) {
   if(test_type == "ct_compare") {
      return std::make_unique<Compare_Timing_Test>();
   }

   if(test_type == "ct_compare_32") {
      return std::make_unique<Compare_32_Timing_Test>();
   }

   if(test_type == "memcmp") {
      return std::make_unique<Memcmp_Timing_Test>();
   }

   return nullptr;
}

/*
* Non empty lines not starting with '#'
*/
std::vector<std::string> read_secrets(const std::string& filename) {
   std::ifstream in(filename);
   if(!in) {
      throw CLI_IO_Error("reading test data from", filename);
   }

   std::vector<std::string> secrets;
   for(std::string line; std::getline(in, line);) {
      if(line.empty() || line.front() == '#') {
         continue;
      }
      secrets.push_back(line);
   }

   if(secrets.empty()) {
      throw CLI_Usage_Error("No secrets found in " + filename);
   }
   return secrets;
}

void write_timings(std::ostream& out, const std::vector<std::vector<uint64_t>>& timings) {
   size_t id = 0;
   for(size_t secret_id = 0; secret_id != timings.size(); ++secret_id) {
      for(const uint64_t ns : timings[secret_id]) {
         out << id << ';' << secret_id << ';' << ns << '\n';
         ++id;
      }
   }
   out.flush();
}

std::string help_text(const std::string& usage) {
   std::ostringstream out;
   out << "Usage: " << usage << "\n\n"
       << "test_type can take on values ct_compare ct_compare_32 memcmp\n"
       << "\nOutput lines are id;secret_id;nanoseconds where secret_id is the\n"
       << "index of the input line in the test data file\n";
   return out.str();
}

}  // namespace

}  // namespace Tacet_CLI

int main(int argc, char* argv[]) {
   std::cerr << Tacet::runtime_version_check(TACET_VERSION_MAJOR, TACET_VERSION_MINOR, TACET_VERSION_PATCH);

   const std::string arg_spec =
      "tacet_timing_test --help --test-data-file= --test-data-dir=src/tests/data/timing "
      "--warmup-runs=5000 --measurement-runs=50000 test_type";

   try {
      Tacet_CLI::Argument_Parser parser(arg_spec);
      parser.parse_args(std::vector<std::string>(argv + 1, argv + argc));

      if(parser.flag_set("help")) {
         std::cout << Tacet_CLI::help_text(arg_spec);
         return 0;
      }

      const std::string test_type = parser.get_arg("test_type");
      const size_t warmup_runs = parser.get_arg_sz("warmup-runs");
      const size_t measurement_runs = parser.get_arg_sz("measurement-runs");

      std::unique_ptr<Tacet_CLI::Timing_Test> test = Tacet_CLI::lookup_timing_test(test_type);

      if(!test) {
         throw Tacet_CLI::CLI_Usage_Error("Unknown or unavailable test type '" + test_type + "'");
      }

      const std::string filename =
         parser.get_arg_or("test-data-file", parser.get_arg("test-data-dir") + "/" + test_type + ".vec");

      const auto timings = test->measure(Tacet_CLI::read_secrets(filename), warmup_runs, measurement_runs);
      Tacet_CLI::write_timings(std::cout, timings);
      return 0;
   } catch(Tacet_CLI::CLI_Usage_Error& e) {
      std::cerr << "Usage error: " << e.what() << "\n" << Tacet_CLI::help_text(arg_spec);
      return 1;
   } catch(std::exception& e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return 2;
   }
}
