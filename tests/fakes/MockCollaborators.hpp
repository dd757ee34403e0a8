#pragma once
/** @file  MockCollaborators.hpp
 *  @brief gmock doubles for the printer, process runner and error monitor seams.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"
#include "core/PrintDispatcher.hpp"
#include "io/ProcessRunner.hpp"

namespace booth {
  namespace test {

    class MockErrorMonitor : public booth::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

    class MockPrintDispatcher : public booth::core::PrintDispatcher {
    public:
      MOCK_METHOD(booth::core::JobResult, submit,
                  (const booth::core::PhotoRef&, const std::optional<std::string>&,
                   const booth::core::PrintOptions&),
                  (override));
    };

    class MockProcessRunner : public booth::io::ProcessRunner {
    public:
      MOCK_METHOD(booth::io::ProcessResult, run,
                  (const std::vector<std::string>&, std::chrono::milliseconds), (override));
    };

  } // namespace test
} // namespace booth
