/*
* (C) 2022 Jack Lloyd
* (C) 2022 René Meusel, Rohde & Schwarz Cybersecurity
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_TEST_STDOUT_REPORTER_H_
#define TACET_TEST_STDOUT_REPORTER_H_

#include "test_reporter.h"

#include <iosfwd>

namespace Tacet_Tests {

/**
* Prints each case as soon as it is recorded, then a one line summary per run
*/
class StdoutReporter final : public Reporter {
   public:
      StdoutReporter(const Test_Options& opts, std::ostream& out) :
            Reporter(opts), m_verbose(opts.verbose), m_out(out) {}

      void render() const override;

   private:
      void next_testsuite(const std::string& name) override;
      void next_run() override;
      void record_case(const std::string& name, const Test::Result& result) override;

      void render_preamble() const;

      bool m_verbose;
      std::ostream& m_out;
};

}  // namespace Tacet_Tests

#endif
