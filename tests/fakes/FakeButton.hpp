#pragma once
/** @file  FakeButton.hpp
 *  @brief ButtonGPIO whose line level is set by the test instead of the GPIO chip.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include "io/ButtonGPIO.hpp"

namespace booth {
  namespace test {

    class FakeButton : public booth::io::ButtonGPIO {
    public:
      using ButtonGPIO::ButtonGPIO;

      bool level = false;

    protected:
      std::optional<bool> readLevel() override { return level; }
    };

  } // namespace test
} // namespace booth
