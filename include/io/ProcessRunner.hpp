#pragma once
/** @file  ProcessRunner.hpp
 *  @brief fork/exec wrapper for the external `lp` and `rpicam-*` helpers.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace booth {
  namespace io {

    struct ProcessResult {
      int exitCode{ -1 };    ///< -1 = could not spawn / killed by signal
      std::string stdErr;    ///< captured, truncated to a few kB
      bool timedOut{ false };

      bool ok() const { return exitCode == 0 && !timedOut; }
    };

    /**
 * @class ProcessRunner
 * @brief Run a command to completion (argv, no shell) and capture its stderr.
 *
 *  * Blocking: only call from the print worker or where a stall is acceptable
 *    (still capture holds the control thread for the exposure anyway).
 *  * A timeout kills the child with SIGKILL.
 */
    class ProcessRunner {
    public:
      virtual ~ProcessRunner() = default;

      virtual ProcessResult run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout = std::chrono::seconds{ 30 });
    };

    /**
 * @class ProcessPipe
 * @brief Long-running child whose stdout we read non-blockingly (MJPEG preview stream).
 *
 *  * RAII: destructor terminates and reaps the child.
 *  * Non-copyable, move-enabled.
 */
    class ProcessPipe {
    public:
      ProcessPipe() = default;
      ~ProcessPipe();

      bool start(const std::vector<std::string>& argv);

      /// Read whatever is available within \p timeout; nullopt on EOF / error.
      std::optional<std::vector<unsigned char>> readSome(std::chrono::milliseconds timeout);

      bool running() const { return pid_ > 0; }
      void stop();

      ProcessPipe(const ProcessPipe&) = delete;
      ProcessPipe& operator=(const ProcessPipe&) = delete;
      ProcessPipe(ProcessPipe&& other) noexcept;
      ProcessPipe& operator=(ProcessPipe&& other) noexcept;

    private:
      pid_t pid_{ -1 };
      int fd_{ -1 }; ///< read end of the child's stdout
    };

  } // namespace io
} // namespace booth
