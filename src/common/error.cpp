// =============================================================================
// saudi-id - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "sid/common/error.h"

#include <format>
#include <sstream>

namespace sid {

// =============================================================================
// SIDException Implementation
// =============================================================================

void SIDException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;
    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

SIDException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kInvalidId:
            return InvalidIdError(message_);
        case ErrorCode::kInvalidArgument:
            return InvalidArgumentError(message_);
        case ErrorCode::kInternalError:
            return InternalError(message_);
        case ErrorCode::kSuccess:
            // Should not happen, but handle gracefully
            return SIDException(ErrorCode::kSuccess, message_);
    }
    return SIDException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kInvalidId:
            throw InvalidIdError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kInternalError:
            throw InternalError(message_);
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw SIDException(ErrorCode::kSuccess, message_);
    }
    throw SIDException(code_, message_);
}

}  // namespace sid
