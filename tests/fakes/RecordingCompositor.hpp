#pragma once
/** @file  RecordingCompositor.hpp
 *  @brief Real Compositor that remembers what it was asked to compose and can be told to fail.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <stdexcept>
#include <vector>

#include "imaging/Compositor.hpp"

namespace booth {
  namespace test {

    class RecordingCompositor : public booth::imaging::Compositor {
    public:
      using Compositor::Compositor;

      struct Call {
        std::vector<booth::core::PhotoRef> photos;
        booth::imaging::FilterKind filter;
        std::string templateId;
      };

      std::vector<Call> calls;
      bool fail_next = false;

      booth::imaging::ComposedArtifact compose(const std::vector<booth::core::PhotoRef>& photos,
                                               booth::imaging::FilterKind filter,
                                               const booth::core::Template& tpl) override {
        calls.push_back({ photos, filter, tpl.id });
        if (fail_next) {
          fail_next = false;
          throw std::runtime_error("[RecordingCompositor] disk full");
        }
        return Compositor::compose(photos, filter, tpl);
      }
    };

  } // namespace test
} // namespace booth
