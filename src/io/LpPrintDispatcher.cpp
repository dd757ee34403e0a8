/* @file LpPrintDispatcher.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// Booth headers
#include "io/LpPrintDispatcher.hpp"

using namespace booth::io;

namespace {

  std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
  }

} // namespace

LpPrintDispatcher::LpPrintDispatcher(std::shared_ptr<ProcessRunner> runner, std::string command,
                                     std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), command_(std::move(command)), timeout_(timeout) {}

std::vector<std::string> LpPrintDispatcher::commandLine(
    const core::PhotoRef& artifact, const std::optional<std::string>& printerName,
    const core::PrintOptions& options) const {
  std::vector<std::string> argv{ command_ };
  if (printerName && !printerName->empty()) {
    argv.push_back("-d");
    argv.push_back(*printerName);
  }
  for (const auto& flag : options.flags) {
    argv.push_back("-o");
    argv.push_back(flag);
  }
  argv.push_back(artifact.path.string());
  return argv;
}

booth::core::JobResult LpPrintDispatcher::submit(const core::PhotoRef& artifact,
                                                 const std::optional<std::string>& printerName,
                                                 const core::PrintOptions& options) {
  auto result = runner_->run(commandLine(artifact, printerName, options), timeout_);
  if (result.ok())
    return core::JobResult::success();

  if (result.timedOut)
    return core::JobResult::failure(command_ + " timed out");
  auto why = trim(result.stdErr);
  if (why.empty())
    why = command_ + " exited with status " + std::to_string(result.exitCode);
  return core::JobResult::failure(why);
}
