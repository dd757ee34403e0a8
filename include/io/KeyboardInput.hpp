#pragma once
/** @file  KeyboardInput.hpp
 *  @brief Non-blocking terminal key reader for bench use (termios + poll under the hood).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Linux header
#include <termios.h>

namespace booth {
  namespace io {

    enum class Key : std::uint8_t { Character, Space, Enter, Escape, Up, Down, Left, Right };

    struct KeyPress {
      Key key{ Key::Character };
      char ch{ 0 }; ///< only meaningful for Key::Character

      bool operator==(const KeyPress&) const = default;
    };

    /**
 * @class KeyboardInput
 * @brief RAII wrapper around a terminal file descriptor in non-canonical,
 *        no-echo mode. The previous terminal settings are restored on close.
 *
 *  * Decodes ANSI arrow sequences (`ESC [ A..D` and `ESC O A..D`).
 *  * A lone ESC is reported once 50 ms pass without a continuation; a
 *    started `ESC [` / `ESC O` always waits for its final byte.
 *  * Signals (Ctrl-C) keep working.
 *  * *Non-copyable*, but move-constructible.
 */
    class KeyboardInput {

    public:
      //---ctr / dtr--------------------------------------------
      KeyboardInput() = default;
      virtual ~KeyboardInput(); // restores the tty and closes the fd

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev = "/dev/tty");
      /// Keys decoded within \p timeout (0 = just drain what is there). Empty on timeout.
      virtual std::vector<KeyPress> readKeys(std::chrono::milliseconds timeout);
      void close();
      bool isOpen() const { return fd_ >= 0; }

      /// Decode \p pending in place. Incomplete sequences stay pending; \p flushEscape
      /// only turns a trailing lone ESC into Key::Escape.
      static std::vector<KeyPress> decode(std::string& pending, bool flushEscape);

      //---non-copyable-----------------------------------------
      KeyboardInput(const KeyboardInput&) = delete;
      KeyboardInput& operator=(const KeyboardInput&) = delete;

      //---mv and mv assign-------------------------------------
      KeyboardInput(KeyboardInput&& other) noexcept;
      KeyboardInput& operator=(KeyboardInput&& other) noexcept;

    private:
      int fd_{ -1 };           ///< POSIX fd (-1==closed)
      bool restore_{ false };  ///< saved_ holds settings to put back
      struct termios saved_ {};
      std::string pending_{}; ///< undecoded bytes (split escape sequences)
      std::chrono::steady_clock::time_point lastData_{}; ///< arrival of the last byte
    };
  } // namespace io
} // namespace booth
