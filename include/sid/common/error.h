// =============================================================================
// saudi-id - Error Handling Framework
// =============================================================================
// Error handling for the saudi-id library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - InvalidIdReason enum describing why a candidate identifier was rejected
// - SIDException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (input file missing or unreadable)
// - 3: At least one candidate identifier was invalid
// - 4: Invalid argument passed to a library primitive
// - 5: Internal invariant violated
// =============================================================================

#ifndef SID_COMMON_ERROR_H
#define SID_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace sid {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, missing required options, etc.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Input file not found, read failure, permission denied, etc.
    kIOError = 2,

    /// @brief Candidate identifier failed validation.
    kInvalidId = 3,

    /// @brief Invalid argument value passed to a library primitive.
    kInvalidArgument = 4,

    /// @brief A class invariant or internal postcondition was violated.
    kInternalError = 5
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kInvalidId:
            return "invalid id";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Invalid ID Reasons
// =============================================================================

/// @brief Cause attached to an invalid identifier.
/// @note All causes share ErrorCode::kInvalidId; the reason is diagnostic only.
enum class InvalidIdReason : std::uint8_t {
    /// @brief Text is empty or contains a non-digit character.
    kMalformedText = 0,

    /// @brief Digit count is not exactly kIdSize.
    kWrongLength = 1,

    /// @brief An element of a digit sequence is greater than 9.
    kDigitOutOfRange = 2,

    /// @brief Leading digit is neither the citizen nor the resident prefix.
    kUnknownPrefix = 3,

    /// @brief Digits do not satisfy the Luhn checksum.
    kChecksumMismatch = 4
};

/// @brief Convert InvalidIdReason to string representation.
[[nodiscard]] constexpr std::string_view invalidIdReasonToString(InvalidIdReason reason) noexcept {
    switch (reason) {
        case InvalidIdReason::kMalformedText:
            return "malformed text";
        case InvalidIdReason::kWrongLength:
            return "wrong length";
        case InvalidIdReason::kDigitOutOfRange:
            return "digit out of range";
        case InvalidIdReason::kUnknownPrefix:
            return "unknown prefix";
        case InvalidIdReason::kChecksumMismatch:
            return "checksum mismatch";
    }
    return "unknown reason";
}

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all saudi-id errors.
/// @note Provides error code and message.
class SIDException : public std::exception {
public:
    /// @brief Construct with error code and message.
    /// @param code The error code.
    /// @param message Descriptive error message.
    SIDException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ~SIDException() override = default;

    SIDException(const SIDException&) = default;
    SIDException(SIDException&&) noexcept = default;
    SIDException& operator=(const SIDException&) = default;
    SIDException& operator=(SIDException&&) noexcept = default;

    /// @brief Get the formatted message ("[category] message").
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without category prefix).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

protected:
    /// @brief Format the what() string from code and message.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public SIDException {
public:
    explicit UsageError(std::string message)
        : SIDException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public SIDException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : SIDException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct from system error code.
    /// @param message Descriptive error message.
    /// @param ec System error code.
    IOError(std::string message, std::error_code ec)
        : SIDException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for invalid identifiers (exit code 3).
class InvalidIdError : public SIDException {
public:
    /// @brief Construct with message only (reason unknown).
    explicit InvalidIdError(std::string message)
        : SIDException(ErrorCode::kInvalidId, std::move(message)) {}

    /// @brief Construct with message and rejection reason.
    InvalidIdError(std::string message, InvalidIdReason reason)
        : SIDException(ErrorCode::kInvalidId, std::move(message)), reason_(reason) {}

    /// @brief Get the rejection reason (if available).
    [[nodiscard]] std::optional<InvalidIdReason> reason() const noexcept { return reason_; }

private:
    std::optional<InvalidIdReason> reason_;
};

/// @brief Exception for invalid arguments to library primitives (exit code 4).
class InvalidArgumentError : public SIDException {
public:
    explicit InvalidArgumentError(std::string message)
        : SIDException(ErrorCode::kInvalidArgument, std::move(message)) {}
};

/// @brief Exception for violated internal invariants (exit code 5).
/// @note Signals a defect, never a property of user input.
class InternalError : public SIDException {
public:
    explicit InternalError(std::string message)
        : SIDException(ErrorCode::kInternalError, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an SIDException.
    explicit Error(const SIDException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] SIDException toException() const;

    /// @brief Throw the appropriate exception.
    /// @note This function does not return.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
/// @tparam T The expected value type.
/// @param code The error code.
/// @param message The error message.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
/// @throws SIDException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note std::exception that is not an SIDException maps to kInternalError.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const SIDException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInternalError, ex.what()});
    }
}

}  // namespace sid

#endif  // SID_COMMON_ERROR_H
