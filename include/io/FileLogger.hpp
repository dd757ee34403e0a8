#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for run logs on the kiosk's local FS.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace booth {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file in append mode, buffers writes, and flushes on demand.
 *
 *  * Buffer is pushed to disk with `std::fwrite` once it crosses 4 kB.
 *  * Only touched by the logger's worker thread, so no locking here.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace booth
