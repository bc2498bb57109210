/**
 * @file status.cpp
 * @brief Status formatting.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/core/status.hpp"

namespace psgui {
namespace core {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorCode::NOT_CONNECTED:       return "NOT_CONNECTED";
        case ErrorCode::CLOSE_TIMEOUT:       return "CLOSE_TIMEOUT";
        case ErrorCode::CONNECT_FAILED:      return "CONNECT_FAILED";
        case ErrorCode::CANCELLED:           return "CANCELLED";
        case ErrorCode::NOT_FOUND:           return "NOT_FOUND";
        case ErrorCode::STREAM_FAILED:       return "STREAM_FAILED";
        case ErrorCode::STOP_TIMEOUT:        return "STOP_TIMEOUT";
        case ErrorCode::PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case ErrorCode::RUNTIME_UNAVAILABLE: return "RUNTIME_UNAVAILABLE";
        case ErrorCode::PORT_CONFLICT:       return "PORT_CONFLICT";
        case ErrorCode::READINESS_TIMEOUT:   return "READINESS_TIMEOUT";
        case ErrorCode::PROCESS_EXITED:      return "PROCESS_EXITED";
        case ErrorCode::INTERNAL:            return "INTERNAL";
    }
    return "UNKNOWN";
}

std::string Status::toString() const {
    if (ok()) {
        return "OK";
    }
    return std::string(errorCodeName(code_)) + ": " + message_;
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.toString();
}

}  // namespace core
}  // namespace psgui
