/* @file InputController.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include "ui/InputController.hpp"
#include "io/ButtonGPIO.hpp"
#include "io/KeyboardInput.hpp"

using namespace booth::ui;
using booth::core::InputAction;

InputController::~InputController() = default;

void InputController::addButton(std::unique_ptr<io::ButtonGPIO> button, InputAction press,
                                std::optional<InputAction> longPress) {
  const InputAction onLong = longPress.value_or(press);
  button->registerCallback([this, press, onLong](io::ButtonGPIO::Event e) {
    emit(e == io::ButtonGPIO::Event::LongPress ? onLong : press);
  });
  buttons_.push_back(std::move(button));
}

void InputController::attachKeyboard(std::unique_ptr<io::KeyboardInput> keyboard) {
  keyboard_ = std::move(keyboard);
}

void InputController::poll(std::chrono::milliseconds now) {
  for (auto& b : buttons_)
    b->poll(now);

  if (!keyboard_ || !keyboard_->isOpen())
    return;
  for (const auto& key : keyboard_->readKeys(std::chrono::milliseconds{ 0 }))
    if (auto action = mapKey(key))
      emit(*action);
}

std::optional<InputAction> InputController::mapKey(const io::KeyPress& key) {
  switch (key.key) {
  case io::Key::Space:
    return InputAction::Shutter;
  case io::Key::Enter:
    return InputAction::Enter;
  case io::Key::Escape:
    return InputAction::Cancel;
  case io::Key::Right:
  case io::Key::Down:
    return InputAction::Next;
  case io::Key::Left:
  case io::Key::Up:
    return InputAction::Prev;
  case io::Key::Character:
    switch (key.ch) {
    case 's': // start
    case 'p': // print
      return InputAction::Enter;
    case 'q':
      return InputAction::Cancel;
    default:
      return std::nullopt;
    }
  default:
    return std::nullopt;
  }
}
