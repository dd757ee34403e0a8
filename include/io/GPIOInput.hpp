#pragma once
/** @file  GPIOInput.hpp
 *  @brief Abstract, debounced edge-input wrapper for a single GPIO line.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace booth {
  namespace io {

    /**
 * @class GPIOInput
 * @brief Base-class that owns one line requested through the GPIO character
 *        device (v2 uAPI), debounces it and invokes a callback on edges.
 *
 *  * Non-blocking: `poll()` is called periodically by the owner thread.
 *  * Levels are logical: with `activeLow` a grounded pin reads as `true`.
 *  * No copy, move-enabled (sole owner of the line handle).
 */
    class GPIOInput {
    public:
      enum class Edge { Rising, Falling };

      using Callback = std::function<void(Edge)>;

      explicit GPIOInput(std::chrono::milliseconds debounce = std::chrono::milliseconds{ 30 })
          : debounce_{ debounce } {}
      virtual ~GPIOInput(); ///< auto-release line

      /** @returns false if the GPIO chip/line cannot be opened. */
      bool open(const std::string& chip, ///< e.g. "/dev/gpiochip0"
                unsigned int line,       ///< line offset on that chip
                bool activeLow = true);  ///< also enables the pull-up bias

      /** Polls the line and emits debounced edge events. To be called from the
      owner’s loop (control thread). */
      virtual void poll(std::chrono::milliseconds now) = 0;

      void registerCallback(Callback cb) { cb_ = std::move(cb); }

      void close();
      bool isOpen() const { return fd_ >= 0; }

      // ─── non-copyable, move-enabled ───────────────────────────────────────────
      GPIOInput(const GPIOInput&) = delete;
      GPIOInput& operator=(const GPIOInput&) = delete;
      GPIOInput(GPIOInput&& other) noexcept;
      GPIOInput& operator=(GPIOInput&& other) noexcept;

    protected:
      /// Current logical level; nullopt when closed or the ioctl fails.
      virtual std::optional<bool> readLevel();

      /** Read + debounce one sample; emits and returns the edge if the stable
      level changed. */
      std::optional<Edge> sample(std::chrono::milliseconds now);

      void emit(Edge e) {
        if (cb_)
          cb_(e);
      }

      int fd_{ -1 }; ///< line request FD (-1 = closed)
      Callback cb_{};

    private:
      std::chrono::milliseconds debounce_{ 30 };
      bool rawState_{ false };
      bool stableState_{ false };
      std::chrono::milliseconds rawSince_{ 0 }; ///< time of last raw change
    };

  } // namespace io
} // namespace booth
