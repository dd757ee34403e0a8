#pragma once
/** @file  CaptureSession.hpp
 *  @brief Everything that belongs to one customer; owned by SessionController.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <vector>

#include "core/PhotoRef.hpp"
#include "core/SelectionModel.hpp"
#include "core/SessionState.hpp"
#include "core/Template.hpp"
#include "imaging/Compositor.hpp"

namespace booth::core {

  /**
 * @struct CaptureSession
 * @brief Plain data, mutated only on the control thread.
 *
 *  * `captures` is append-only; index = capture order.
 *  * `reset()` forgets files, it never deletes them.
 */
  struct CaptureSession {
    ScreenState state{ ScreenState::Attract };
    const Template* tpl{ nullptr }; ///< points into TemplateCatalog
    int toTake{ 0 };
    int takenCount{ 0 };
    std::vector<PhotoRef> captures;
    SelectionModel selection;
    std::size_t filterIndex{ 0 };
    int countdownValue{ 0 };
    std::optional<imaging::ComposedArtifact> lastComposed;

    imaging::FilterKind filter() const { return imaging::kFilterCycle[filterIndex]; }
    int remaining() const { return toTake > takenCount ? toTake - takenCount : 0; }

    void reset() {
      state = ScreenState::Attract;
      tpl = nullptr;
      toTake = 0;
      takenCount = 0;
      captures.clear();
      selection.clear();
      filterIndex = 0;
      countdownValue = 0;
      lastComposed.reset();
    }
  };

} // namespace booth::core
