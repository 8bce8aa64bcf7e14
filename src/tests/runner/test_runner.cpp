/*
* (C) 2017 Jack Lloyd
* (C) 2022 René Meusel, Rohde & Schwarz Cybersecurity
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#include "test_runner.h"

#include "../../cli/cli_hex.h"
#include "../tests.h"
#include "test_stdout_reporter.h"

#include <tacet/internal/fmt.h>
#include <tacet/internal/target_info.h>
#include <algorithm>

namespace Tacet_Tests {

namespace {

const char* value_barrier_kind() {
#if defined(TACET_CT_VALUE_BARRIER_USE_ASM_BYTE_REG)
   return "asm (byte register)";
#elif defined(TACET_CT_VALUE_BARRIER_USE_ASM_WORD_REG)
   return "asm (word register)";
#else
   return "volatile";
#endif
}

/*
* Without --drbg-seed the current time is used; it is printed with the
* other properties so any run can be repeated
*/
std::vector<uint8_t> choose_seed(const std::string& hex_seed) {
   std::vector<uint8_t> seed = Tacet_CLI::hex_decode(hex_seed);

   if(seed.empty()) {
      const uint64_t ts = Test::timestamp();
      for(size_t i = 0; i != 8; ++i) {
         seed.push_back(static_cast<uint8_t>(ts >> (56 - 8 * i)));
      }
   }

   return seed;
}

std::vector<Test::Result> run_a_test(const std::string& test_name) {
   std::unique_ptr<Test> test = Test::get_test(test_name);
   if(!test) {
      return {Test::Result::Note(test_name, "Test missing or unavailable")};
   }

   try {
      std::vector<Test::Result> results = test->run();

      // results without a location of their own point at the registration
      for(auto& result : results) {
         if(!result.code_location() && test->registration_location()) {
            result.set_code_location(test->registration_location().value());
         }
      }
      return results;
   } catch(std::exception& e) {
      return {Test::Result::Failure(test_name, Tacet::fmt("threw an exception: {}", e.what()))};
   }
}

}  // namespace

Test_Runner::Test_Runner(std::ostream& out) : m_output(out) {}

Test_Runner::~Test_Runner() = default;

bool Test_Runner::run(const Test_Options& opts) {
   if(!opts.no_stdout) {
      m_reporters.push_back(std::make_unique<StdoutReporter>(opts, m_output));
   }

   const auto tests_to_run = Test::filter_registered_tests(opts.requested_tests, opts.skip_tests);
   if(tests_to_run.empty()) {
      throw Test_Error("No tests to run");
   }

   const std::vector<uint8_t> seed = choose_seed(opts.drbg_seed);

   for(auto& reporter : m_reporters) {
      reporter->set_property("target", TACET_TARGET_ARCH);
      reporter->set_property("value barrier", value_barrier_kind());
      reporter->set_property("drbg_seed", Tacet_CLI::hex_encode(seed));
   }

   Test::set_test_options(opts);

   for(size_t run = 0; run != opts.test_runs; ++run) {
      Test::set_test_rng_seed(seed, run);

      for(auto& reporter : m_reporters) {
         reporter->next_test_run();
      }

      const bool passed = run_tests(tests_to_run);

      for(const auto& reporter : m_reporters) {
         reporter->render();
      }

      if(!passed) {
         return false;
      }
   }

   return true;
}

bool Test_Runner::run_tests(const std::vector<std::string>& tests_to_run) {
   bool passed = true;

   for(const auto& test_name : tests_to_run) {
      for(auto& reporter : m_reporters) {
         reporter->waiting_for_next_results(test_name);
      }

      const auto results = run_a_test(test_name);

      for(auto& reporter : m_reporters) {
         reporter->record(test_name, results);
      }

      passed &= std::all_of(results.begin(), results.end(), [](const auto& r) { return r.tests_failed() == 0; });
   }

   return passed;
}

}  // namespace Tacet_Tests
