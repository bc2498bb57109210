/**
 * @file status.hpp
 * @brief Error codes and the Status value returned by every core operation.
 *
 * Codes are grouped by the component that produces them:
 * - Connection: NOT_CONNECTED, CLOSE_TIMEOUT, CONNECT_FAILED
 * - Stream:     CANCELLED, NOT_FOUND, STREAM_FAILED, STOP_TIMEOUT
 * - Sandbox:    RUNTIME_UNAVAILABLE, PORT_CONFLICT, READINESS_TIMEOUT, PROCESS_EXITED
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/core/export.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace psgui {
namespace core {

/**
 * @brief Failure categories.
 */
enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,
    NOT_CONNECTED,        ///< No active connection handle
    CLOSE_TIMEOUT,        ///< Old handle did not close within the bound
    CONNECT_FAILED,       ///< Connect precondition or channel setup failed
    CANCELLED,            ///< Operation observed its cancellation token
    NOT_FOUND,            ///< Remote resource does not exist
    STREAM_FAILED,        ///< Receive loop ended with an unexpected error
    STOP_TIMEOUT,         ///< Receive loop did not finish within the bound
    PERMISSION_DENIED,
    RUNTIME_UNAVAILABLE,  ///< Container runtime missing or daemon unreachable
    PORT_CONFLICT,        ///< Sandbox port already bound
    READINESS_TIMEOUT,    ///< Sandbox never answered the readiness probe
    PROCESS_EXITED,       ///< Sandbox process exited on its own
    INTERNAL
};

/**
 * @brief Stable upper-case name for an error code.
 */
PSGUI_CORE_API const char* errorCodeName(ErrorCode code);

/**
 * @class Status
 * @brief Result of an operation: OK, or a code with a human readable message.
 */
class PSGUI_CORE_API Status {
public:
    Status() : code_(ErrorCode::OK) {}
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::OK; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /**
     * @brief "CODE: message", or "OK".
     */
    std::string toString() const;

    bool operator==(const Status& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }
    bool operator!=(const Status& other) const { return !(*this == other); }

private:
    ErrorCode code_;
    std::string message_;
};

PSGUI_CORE_API std::ostream& operator<<(std::ostream& os, const Status& status);

}  // namespace core
}  // namespace psgui
