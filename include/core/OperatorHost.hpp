#pragma once
/** @file  OperatorHost.hpp
 *  @brief Capability interface a device implements to own an OperatorRuntime.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <exception>
#include <optional>
#include <string>

// Third-party headers
#include <nlohmann/json.hpp>

namespace labrun {
  namespace core {

    /**
 * @class OperatorHost
 * @brief Callbacks the runtime invokes on the controller context.
 *
 *  * `kill()` may deactivate the runtime re-entrantly but must not destroy it.
 */
    class OperatorHost {
    public:
      virtual ~OperatorHost() = default;

      /// Operator::prepare() returned \p result; called at most once per cycle.
      virtual void operatorReady(const nlohmann::json& result) = 0;

      virtual void showError(const std::string& message,
                             const std::optional<std::string>& detail) = 0;
      virtual void showException(std::exception_ptr fault) = 0;

      /// Fatal initialization fault: the device never becomes usable.
      virtual void kill() = 0;
    };

  } // namespace core
} // namespace labrun
