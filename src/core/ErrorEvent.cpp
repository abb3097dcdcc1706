/* @file ErrorEvent.cpp
 * @brief construction helpers and log rendering for ErrorEvent
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/ErrorEvent.hpp"

using namespace labrun::core;

ErrorEvent ErrorEvent::structured(FaultKind kind, std::string message,
                                  std::optional<std::string> detail) {
  ErrorEvent ev;
  ev.kind_ = kind;
  ev.message_ = std::move(message);
  ev.detail_ = std::move(detail);
  return ev;
}

ErrorEvent ErrorEvent::wrapped(FaultKind kind, std::exception_ptr fault, std::string message) {
  if (!fault)
    throw std::invalid_argument("[ErrorEvent] wrapped event needs a fault");

  ErrorEvent ev;
  ev.kind_ = kind;
  ev.message_ = std::move(message);
  ev.fault_ = std::move(fault);
  return ev;
}

std::string ErrorEvent::describe() const {
  std::string out = std::string(toString(kind_)) + ": " + message_;
  if (fault_)
    out += " (" + describeException(fault_) + ")";
  else if (detail_)
    out += " (" + *detail_ + ")";
  return out;
}

std::string labrun::core::describeException(std::exception_ptr fault) {
  if (!fault)
    return "no exception";
  try {
    std::rethrow_exception(fault);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}
