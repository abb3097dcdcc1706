#pragma once
/** @file  ErrorEvent.hpp
 *  @brief Inert error value handed from a worker context to the controller.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace labrun {
  namespace core {

    /// Where in the operator lifecycle the fault originated.
    enum class FaultKind : std::uint8_t { Prepare, Finalize, Reported };

    inline const char* toString(FaultKind k) {
      switch (k) {
      case FaultKind::Prepare:
        return "prepare";
      case FaultKind::Finalize:
        return "finalize";
      case FaultKind::Reported:
        return "reported";
      default:
        return "unknown";
      }
    }

    /**
 * @class ErrorEvent
 * @brief Either a structured (message, detail) pair or a wrapped exception.
 *
 *  * Immutable once built; copied through the dispatcher channel.
 *  * Consumed exactly once by the device owning the originating runtime.
 */
    class ErrorEvent {
    public:
      static ErrorEvent structured(FaultKind kind, std::string message,
                                   std::optional<std::string> detail = std::nullopt);
      static ErrorEvent wrapped(FaultKind kind, std::exception_ptr fault, std::string message);

      FaultKind kind() const { return kind_; }
      const std::string& message() const { return message_; }
      const std::optional<std::string>& detail() const { return detail_; }

      /// True when the payload is an exception rather than a message/detail pair.
      bool isWrapped() const { return static_cast<bool>(fault_); }
      std::exception_ptr fault() const { return fault_; }

      /// One-line rendering for logs: "<kind>: <message> (<detail or what()>)".
      std::string describe() const;

    private:
      ErrorEvent() = default;

      FaultKind kind_{ FaultKind::Reported };
      std::string message_{};
      std::optional<std::string> detail_{};
      std::exception_ptr fault_{};
    };

    /// what() of a stored exception, or a fixed text for non-std exceptions.
    std::string describeException(std::exception_ptr fault);

  } // namespace core
} // namespace labrun
