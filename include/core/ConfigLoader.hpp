#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time JSON documents (kiosk config, templates, printer pref) from the host FS.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace booth::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (KioskConfig, TemplateCatalog).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// True if the file exists (lets callers tell "missing" from "corrupt").
    bool exists() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace booth::core
