#pragma once
/** @file  TempDir.hpp
 *  @brief Scratch directory that removes itself when the test ends.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include <stdlib.h> // mkdtemp

namespace booth {
  namespace test {

    class TempDir {
    public:
      TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "booth_test_XXXXXX").string();
        if (!::mkdtemp(pattern.data()))
          throw std::runtime_error("[TempDir] mkdtemp failed");
        path_ = pattern;
      }

      ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
      }

      const std::filesystem::path& path() const { return path_; }
      std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

      TempDir(const TempDir&) = delete;
      TempDir& operator=(const TempDir&) = delete;

    private:
      std::filesystem::path path_;
    };

  } // namespace test
} // namespace booth
