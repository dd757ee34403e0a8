#pragma once
/** @file  CaptureCoordinator.hpp
 *  @brief Camera boundary: preview frames, stills, fallback backend, placeholders.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "core/PhotoRef.hpp"
#include "io/CameraBackend.hpp"

namespace booth {
  namespace io {
    class PhotoStore;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class Logger;

    struct CaptureSettings {
      io::Resolution still{ 1920, 1080 };
      int previewFailureThreshold{ 30 }; ///< consecutive failures before switching backend
      int jpegQuality{ 95 };
    };

    /**
 * @class CaptureCoordinator
 * @brief Nothing thrown by a backend gets past this class.
 *
 *  * Preview failures are counted; after `previewFailureThreshold` in a row the
 *    secondary backend (if any) takes over for the rest of the process.
 *  * A failed still is retried on the secondary backend, then replaced by the
 *    last good preview frame, then by a generated placeholder. The caller
 *    always gets a PhotoRef.
 *  * Faults go to ErrorMonitor (de-duplicated), progress to Logger.
 */
    class CaptureCoordinator {
    public:
      CaptureCoordinator(std::unique_ptr<io::CameraBackend> primary,
                         std::unique_ptr<io::CameraBackend> secondary, io::PhotoStore& store,
                         std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                         CaptureSettings settings = {});
      virtual ~CaptureCoordinator();

      /// Open the primary backend (secondary if that fails). False if neither opened.
      bool start();
      void stop();

      /// Best effort; nullopt when no new frame or on a contained failure.
      std::optional<io::Frame> capturePreviewFrame();

      /// \p number is the 1-based capture number within the session (goes into the file name).
      virtual PhotoRef captureStill(std::size_t number);
      PhotoRef captureStill(std::size_t number, io::Resolution resolution);

      std::string activeBackend() const;
      bool usingSecondary() const { return usingSecondary_; }
      int consecutivePreviewFailures() const { return previewFailures_; }

    private:
      io::CameraBackend* active() const;
      bool switchToSecondary(const std::string& reason);
      bool tryStill(io::CameraBackend& backend, const std::filesystem::path& out,
                    io::Resolution resolution);
      bool writeFrame(const io::Frame& frame, const std::filesystem::path& out);
      bool writePlaceholder(const std::filesystem::path& out, io::Resolution resolution);
      void reportFailure(const std::string& message);

      std::unique_ptr<io::CameraBackend> primary_;
      std::unique_ptr<io::CameraBackend> secondary_;
      io::PhotoStore& store_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      CaptureSettings settings_;

      bool usingSecondary_{ false };
      int previewFailures_{ 0 };
      io::Frame lastGoodFrame_;
    };

  } // namespace core
} // namespace booth
