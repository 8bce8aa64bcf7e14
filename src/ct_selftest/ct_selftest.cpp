/*
 * Constant time checks of the comparison functions using the CT::poison
 * annotations. Some of those are expected to fail, because they deliberately
 * branch on secret memory.
 *
 * (C) 2024 Jack Lloyd
 * (C) 2024 Fabian Albert, René Meusel - Rohde & Schwarz Cybersecurity
 * (C) 2026 The Tacet Authors
 *
 * Tacet is released under the Simplified BSD License (see license.txt)
 */

#include <iostream>

#include <tacet/mem_ops.h>

#include <tacet/internal/ct_utils.h>
#include <tacet/internal/fmt.h>
#include <tacet/internal/value_barrier.h>

#include <array>
#include <functional>
#include <map>
#include <random>
#include <vector>

namespace {

/*
* Source of the "secret" inputs. Only needs to be unpredictable for the
* compiler; no cryptographic quality is required.
*/
class Secret_Source final {
   public:
      uint8_t next_byte() { return static_cast<uint8_t>(m_rd()); }

      template <size_t N>
      std::array<uint8_t, N> random_array() {
         std::array<uint8_t, N> r;
         for(auto& b : r) {
            b = next_byte();
         }
         return r;
      }

      /// Either an exact copy of x or one with a single byte changed
      template <size_t N>
      std::array<uint8_t, N> maybe_mutated(const std::array<uint8_t, N>& x) {
         auto y = x;
         if(next_byte() & 1) {
            y[next_byte() % N] ^= static_cast<uint8_t>(next_byte() | 1);
         }
         return y;
      }

   private:
      std::random_device m_rd;
};

void report(bool equal) {
   std::cout << (equal ? "equal" : "different") << std::endl;
}

void test_compare_generic(Secret_Source& src) {
   const auto x = src.random_array<61>();
   const auto y = src.maybe_mutated(x);

   Tacet::CT::poison(x);
   Tacet::CT::poison(y);

   bool equal = Tacet::constant_time_compare(x, y);

   // Only the final result is public
   Tacet::CT::unpoison(equal);
   report(equal);
}

void test_compare_16(Secret_Source& src) {
   const auto x = src.random_array<16>();
   const auto y = src.maybe_mutated(x);

   const auto scope = Tacet::CT::scoped_poison(x, y);
   bool equal = Tacet::constant_time_compare_16(x, y);
   Tacet::CT::unpoison(equal);
   report(equal);
}

void test_compare_32(Secret_Source& src) {
   const auto x = src.random_array<32>();
   const auto y = src.maybe_mutated(x);

   const auto scope = Tacet::CT::scoped_poison(x, y);
   bool equal = Tacet::constant_time_compare_32(x, y);
   Tacet::CT::unpoison(equal);
   report(equal);
}

void test_compare_64(Secret_Source& src) {
   const auto x = src.random_array<64>();
   const auto y = src.maybe_mutated(x);

   const auto scope = Tacet::CT::scoped_poison(x, y);
   bool equal = Tacet::constant_time_compare_64(x, y);
   Tacet::CT::unpoison(equal);
   report(equal);
}

void test_value_barrier(Secret_Source& src) {
   const uint8_t poisoned_byte = src.next_byte();
   Tacet::CT::poison(poisoned_byte);

   std::array<uint8_t, 16> output_bytes;
   output_bytes.fill(0x42);

   // Without the barrier some compilers notice the mask is all-zero or
   // all-one and jump over the loop, see the naive variants below
   const uint8_t mask = Tacet::CT::value_barrier(static_cast<uint8_t>(-(poisoned_byte & 1)));
   for(size_t i = 0; i != output_bytes.size(); ++i) {
      output_bytes[i] &= mask;
   }

   Tacet::CT::unpoison(output_bytes);
   std::cout << static_cast<int>(output_bytes[0]) << std::endl;
}

/*
* An ordinary early exit comparison. Valgrind must report the
* conditional jump on the poisoned bytes.
*/
void test_naive_early_exit(Secret_Source& src) {
   const auto x = src.random_array<32>();
   const auto y = src.maybe_mutated(x);

   Tacet::CT::poison(x);
   Tacet::CT::poison(y);

   bool equal = true;
   for(size_t i = 0; i != x.size(); ++i) {
      if(x[i] != y[i]) {
         equal = false;
         break;
      }
   }

   Tacet::CT::unpoison(equal);
   report(equal);
}

/*
* Uses the comparison result without unpoisoning it first. The comparison
* itself is fine, but the caller branching on a secret dependent result
* must still be reported.
*/
void test_poisoned_branch(Secret_Source& src) {
   const auto x = src.random_array<32>();
   const auto y = src.maybe_mutated(x);

   Tacet::CT::poison(x);
   Tacet::CT::poison(y);

   if(Tacet::CT::compare_ne(x, y) == 0) {
      std::cout << "I may or may not be printed." << std::endl;
   }
}

struct Test {
      bool expect_failure;
      std::function<void(Secret_Source&)> test;
};

constexpr bool SHOULD_FAIL = true;
constexpr bool SHOULD_SUCCEED = false;

void print_help(std::string_view path) {
   std::cerr << "Usage: valgrind [...] " << path << " [testname]" << std::endl;
   std::cerr << "Usage: " << path << " [--list|--help]" << std::endl;
   std::cerr << "This can only run one test at a time. "
             << "Some tests are expected to cause CT::poison warnings." << std::endl;
}

void list_tests(const std::map<std::string, Test>& tests) {
   std::cout << "fail?\ttest name\n\n";

   for(const auto& [name, test_info] : tests) {
      std::cout << Tacet::fmt("{}\t{}\n", test_info.expect_failure ? "true" : "false", name);
   }
}

}  // namespace

int main(int argc, char* argv[]) {
   // clang-format off
   const std::map<std::string, Test> available_tests = {
      {"compare_generic",  {SHOULD_SUCCEED, test_compare_generic}},
      {"compare_16",       {SHOULD_SUCCEED, test_compare_16}},
      {"compare_32",       {SHOULD_SUCCEED, test_compare_32}},
      {"compare_64",       {SHOULD_SUCCEED, test_compare_64}},
      {"value_barrier",    {SHOULD_SUCCEED, test_value_barrier}},
      {"naive_early_exit", {SHOULD_FAIL,    test_naive_early_exit}},
      {"poisoned_branch",  {SHOULD_FAIL,    test_poisoned_branch}},
   };
   // clang-format on

   if(argc != 2) {
      print_help(argv[0]);
      return 1;
   }

   const std::string argument(argv[1]);

   if(argument == "--help") {
      print_help(argv[0]);
      return 0;
   }

   if(argument == "--list") {
      list_tests(available_tests);
      return 0;
   }

   const auto test = available_tests.find(argument);
   if(test == available_tests.end()) {
      std::cerr << "Unknown test: " << argument << std::endl;
      return 1;
   }

#if !defined(TACET_CT_POISON_ENABLED)
   std::cout << "The CT::poison API is disabled in this build, this test won't do anything useful\n"
             << "Configure with -DTACET_WITH_VALGRIND=ON to make the magic happen." << std::endl;
   return 1;
#else
   if(!Tacet::CT::poison_has_effect()) {
      std::cerr << "This test must run with a tool populating the CT::poison (e.g. valgrind)." << std::endl;
      return 1;
   }

   try {
      Secret_Source src;
      test->second.test(src);
   } catch(const std::exception& ex) {
      std::cerr << "Caught exception: " << ex.what() << std::endl;
      return 1;
   }

   return 0;
#endif
}
