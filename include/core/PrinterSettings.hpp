#pragma once
/** @file  PrinterSettings.hpp
 *  @brief Persisted printer preference (`{ "printer": name }`).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <optional>
#include <string>

namespace booth::core {

  /**
 * @class PrinterSettings
 * @brief Tiny JSON file next to the photos; an empty / missing name means the
 *        spooler's default printer.
 */
  class PrinterSettings {
  public:
    explicit PrinterSettings(std::string path);

    /// Re-read the file; a missing or corrupt file yields no preference.
    void load();

    /// Persist \p name ("" clears the preference). Returns false on IO error.
    bool save(const std::string& name);

    std::optional<std::string> printer() const;

  private:
    std::string path_;
    std::string name_;
  };

} // namespace booth::core
