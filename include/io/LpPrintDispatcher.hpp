#pragma once
/** @file  LpPrintDispatcher.hpp
 *  @brief CUPS `lp` adapter for the PrintDispatcher seam.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/PrintDispatcher.hpp"
#include "io/ProcessRunner.hpp"

namespace booth {
  namespace io {

    class LpPrintDispatcher : public core::PrintDispatcher {
    public:
      explicit LpPrintDispatcher(std::shared_ptr<ProcessRunner> runner, std::string command = "lp",
                                 std::chrono::milliseconds timeout = std::chrono::seconds{ 60 });

      core::JobResult submit(const core::PhotoRef& artifact,
                             const std::optional<std::string>& printerName,
                             const core::PrintOptions& options) override;

      /// `lp [-d printer] -o <flag>... <path>`
      std::vector<std::string> commandLine(const core::PhotoRef& artifact,
                                           const std::optional<std::string>& printerName,
                                           const core::PrintOptions& options) const;

    private:
      std::shared_ptr<ProcessRunner> runner_;
      std::string command_;
      std::chrono::milliseconds timeout_;
    };

  } // namespace io
} // namespace booth
