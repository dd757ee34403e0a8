#pragma once
/** @file  PhotoStore.hpp
 *  @brief Date-derived file layout for captures and composed pages.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace booth {
  namespace io {

    /**
 * @class PhotoStore
 * @brief Hands out fresh paths under `<root>/YYYY/MM/DD/`; never returns an existing file.
 *
 *  * Captures:  `HHMMSS_<n>.jpg` (n = 1-based capture number in the session).
 *  * Artifacts: `A4_HHMMSS_<micros>.jpg` beside the captures of the same day.
 *  * A clash (same second, retried session) gets a `-<k>` suffix.
 *  * Files are never deleted by the kiosk.
 */
    class PhotoStore {
    public:
      explicit PhotoStore(std::filesystem::path root);

      std::filesystem::path capturePath(std::size_t number,
                                        std::chrono::system_clock::time_point when =
                                            std::chrono::system_clock::now()) const;

      std::filesystem::path artifactPath(std::chrono::system_clock::time_point when =
                                             std::chrono::system_clock::now()) const;

      /// `<root>/printer.json`
      std::filesystem::path printerPreferencePath() const { return root_ / "printer.json"; }

      const std::filesystem::path& root() const { return root_; }

      /// \p candidate, or the first `stem-k.ext` that does not exist yet.
      static std::filesystem::path uniquePath(const std::filesystem::path& candidate);

    private:
      std::filesystem::path dayDirectory(std::chrono::system_clock::time_point when) const;

      std::filesystem::path root_;
    };

  } // namespace io
} // namespace booth
