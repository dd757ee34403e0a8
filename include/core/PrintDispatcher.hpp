#pragma once
/** @file  PrintDispatcher.hpp
 *  @brief Abstract printer collaborator + job result type.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "core/PhotoRef.hpp"

namespace booth::core {

  /** Page/quality flags handed to the spooler verbatim (`-o <opt>`). */
  struct PrintOptions {
    std::vector<std::string> flags{ "media=A4.Borderless", "fit-to-page=false" };
  };

  struct JobResult {
    bool ok{ false };
    std::string message; ///< spooler error text when !ok

    static JobResult success() { return JobResult{ true, {} }; }
    static JobResult failure(std::string why) { return JobResult{ false, std::move(why) }; }
  };

  /**
 * @class PrintDispatcher
 * @brief `submit()` may block for seconds; SessionController only ever calls it
 *        from its print worker and receives the result as a queued message.
 *
 *  * Implementations must report failure through JobResult, not by throwing
 *    (a throw is still caught by the worker and turned into a failure).
 */
  class PrintDispatcher {
  public:
    virtual ~PrintDispatcher() = default;

    virtual JobResult submit(const PhotoRef& artifact, const std::optional<std::string>& printerName,
                             const PrintOptions& options) = 0;
  };

} // namespace booth::core
