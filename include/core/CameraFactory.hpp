#pragma once
/** @file  CameraFactory.hpp
 *  @brief Runtime registry that maps camera backend names to creators.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace booth::io {
  class CameraBackend;
}

namespace booth::core {

  /**
 * @class CameraFactory
 * @brief Register & instantiate camera backends by string key ("rpicam", "opencv").
 *
 *  * Keeps KioskRuntime decoupled from concrete drivers; config picks primary / secondary.
 *  * Creators are lambdas returning `unique_ptr<CameraBackend>`.
 */
  class CameraFactory {
  public:
    using Creator = std::function<std::unique_ptr<io::CameraBackend>()>;

    /// Register a backend under \p name.  Returns false on duplicate.
    bool registerBackend(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<io::CameraBackend> create(const std::string& name) const;

    bool contains(const std::string& name) const { return creators_.count(name) != 0; }
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace booth::core
