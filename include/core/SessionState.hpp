#pragma once
/** @file  SessionState.hpp
 *  @brief Screen states and the five-symbol input vocabulary every source resolves to.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace booth {
  namespace core {

    enum class ScreenState : std::uint8_t {
      Attract,
      Template,
      Countdown,
      Capturing,
      QuickReview,
      Selection,
      Review,
      Printing,
    };

    inline const char* toString(ScreenState s) {
      switch (s) {
      case ScreenState::Attract:
        return "attract";
      case ScreenState::Template:
        return "template";
      case ScreenState::Countdown:
        return "countdown";
      case ScreenState::Capturing:
        return "capturing";
      case ScreenState::QuickReview:
        return "quick_review";
      case ScreenState::Selection:
        return "selection";
      case ScreenState::Review:
        return "review";
      case ScreenState::Printing:
        return "printing";
      default:
        return "unknown";
      }
    }

    enum class InputAction : std::uint8_t { Next, Prev, Shutter, Enter, Cancel };

    inline const char* toString(InputAction a) {
      switch (a) {
      case InputAction::Next:
        return "next";
      case InputAction::Prev:
        return "prev";
      case InputAction::Shutter:
        return "shutter";
      case InputAction::Enter:
        return "enter";
      case InputAction::Cancel:
        return "cancel";
      default:
        return "unknown";
      }
    }

    inline std::optional<InputAction> actionFromString(const std::string& name) {
      for (auto a : { InputAction::Next, InputAction::Prev, InputAction::Shutter, InputAction::Enter,
                      InputAction::Cancel })
        if (name == toString(a))
          return a;
      return std::nullopt;
    }

  } // namespace core
} // namespace booth
