#pragma once
/** @file ButtonGPIO.hpp
 * @brief Debounced push-button wrapper with short/long-press detection
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include "io/GPIOInput.hpp" // base class

#include <chrono>
#include <string>

namespace booth {
  namespace io {

    /**
	 * @class ButtonGPIO
	 * @brief Concrete GPIOInput that classifies press types.
	 *
	 *  * Emits `ShortPress` on release if the hold was shorter than the threshold.
	 *  * Emits `LongPress` as soon as the hold reaches the threshold (once, nothing
	 *    more on release).
	 *  * No copy, move-enabled (inherits fd_ ownership).
	 */

    class ButtonGPIO : public GPIOInput {

    public:
      enum class Event { ShortPress, LongPress };

      using Callback = std::function<void(Event)>;

      explicit ButtonGPIO(std::string name,
                          std::chrono::milliseconds longPressThresh = std::chrono::seconds{ 3 },
                          std::chrono::milliseconds debounce = std::chrono::milliseconds{ 30 })
          : GPIOInput{ debounce }, name_{ std::move(name) }, longThreshold_{ longPressThresh } {}

      void registerCallback(Callback cb) { cbButton_ = std::move(cb); }

      /** Called by owner loop every ~10-50 ms. */
      void poll(std::chrono::milliseconds now) override;

      const std::string& name() const { return name_; }
      bool pressed() const { return pressed_; }

    private:
      void emitPress(Event e) {
        if (cbButton_)
          cbButton_(e);
      }

      Callback cbButton_{};
      std::string name_;

      std::chrono::milliseconds longThreshold_{ 3000 };
      bool pressed_{ false };
      bool longFired_{ false };
      std::chrono::milliseconds pressStart_{ 0 };
    };

  } // namespace io
} // namespace booth
