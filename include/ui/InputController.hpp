#pragma once
/** @file  InputController.hpp
 *  @brief Front-panel buttons + bench keyboard, normalised to core::InputAction.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "core/SessionState.hpp"

namespace booth {
  namespace io { // forward decls so we don’t pull io headers in
    class ButtonGPIO;
    class KeyboardInput;
    struct KeyPress;
  } // namespace io

  namespace ui {

    /**
 * @class InputController
 * @brief Owns every input source and polls them from the owner's loop.
 *
 * * Emits one `InputAction` callback per recognised press; the application
 *   forwards it to `SessionController::post()`.
 * * A button without a long-press action treats a long hold as a normal press.
 */
    class InputController {

    public:
      using Callback = std::function<void(core::InputAction)>;

      InputController() = default;
      ~InputController();

      // ---- public API ----------------------------------------------------------
      /// Register a lambda or free function to receive actions.
      void registerCallback(Callback cb) { cb_ = std::move(cb); }

      void addButton(std::unique_ptr<io::ButtonGPIO> button, core::InputAction press,
                     std::optional<core::InputAction> longPress = std::nullopt);
      void attachKeyboard(std::unique_ptr<io::KeyboardInput> keyboard);

      /// Poll buttons, drain the keyboard. Never blocks.
      void poll(std::chrono::milliseconds now);

      /// Bench bindings: space = shutter, arrows = prev/next, enter / 's' / 'p' = enter,
      /// esc / 'q' = cancel.
      static std::optional<core::InputAction> mapKey(const io::KeyPress& key);

      std::size_t buttonCount() const { return buttons_.size(); }
      bool hasKeyboard() const { return keyboard_ != nullptr; }

      InputController(const InputController&) = delete;
      InputController& operator=(const InputController&) = delete;

    private:
      void emit(core::InputAction action) {
        if (cb_)
          cb_(action);
      }

      std::vector<std::unique_ptr<io::ButtonGPIO>> buttons_;
      std::unique_ptr<io::KeyboardInput> keyboard_;
      Callback cb_{};
    };

  } // namespace ui
} // namespace booth
