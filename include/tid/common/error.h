// =============================================================================
// tid - Error Handling Framework
// =============================================================================
// Error handling for the tid library and the tidtool CLI.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - TidException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error on the command line
// - 2: Invalid identifier input (bad integer, bad string, unknown version)
// - 3: Random source or digest primitive failure
// - 4: Unexpected failure outside the tid error hierarchy
// =============================================================================

#ifndef TID_COMMON_ERROR_H
#define TID_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tid {

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

    /// @brief Rejected identifier input.
    /// @note Negative integer, unknown version, implied time out of range,
    ///       malformed or oversized string.
    kInvalidArgument = 2,

    /// @brief Random source or digest primitive failure.
    kCryptoError = 3,

    /// @brief Failure that is not a TidException (e.g. std::bad_alloc).
    kInternalError = 4
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
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kCryptoError:
            return "crypto error";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Records the rejected input so callers can report it.
struct ErrorContext {
    /// @brief Input text that was rejected (if applicable).
    std::string input;

    /// @brief Integer value that was rejected (if applicable).
    std::optional<std::int64_t> value;

    /// @brief Version code involved in the error (if applicable).
    std::optional<std::uint8_t> version;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with input text.
    explicit ErrorContext(std::string text,
                          std::source_location loc = std::source_location::current())
        : input(std::move(text)), location(loc) {}

    /// @brief Set the input text.
    /// @return Reference to this for method chaining.
    ErrorContext& withInput(std::string text) {
        input = std::move(text);
        return *this;
    }

    /// @brief Set the integer value.
    /// @return Reference to this for method chaining.
    ErrorContext& withValue(std::int64_t v) {
        value = v;
        return *this;
    }

    /// @brief Set the version code.
    /// @return Reference to this for method chaining.
    ErrorContext& withVersion(std::uint8_t code) {
        version = code;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all tid errors.
/// @note Provides error code, message, and optional context.
class TidException : public std::exception {
public:
    /// @brief Construct with error code and message.
    TidException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    TidException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~TidException() override = default;

    TidException(const TidException&) = default;
    TidException(TidException&&) noexcept = default;
    TidException& operator=(const TidException&) = default;
    TidException& operator=(TidException&&) noexcept = default;

    /// @brief Get the error message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for command-line usage errors (exit code 1).
class UsageError : public TidException {
public:
    explicit UsageError(std::string message)
        : TidException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : TidException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for rejected identifier input (exit code 2).
/// @note Thrown for negative integers, unknown versions, out-of-range implied
///       timestamps, and malformed or oversized strings.
class InvalidArgumentError : public TidException {
public:
    explicit InvalidArgumentError(std::string message)
        : TidException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : TidException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for random source and digest failures (exit code 3).
class CryptoError : public TidException {
public:
    explicit CryptoError(std::string message)
        : TidException(ErrorCode::kCryptoError, std::move(message)) {}

    CryptoError(std::string message, ErrorContext context)
        : TidException(ErrorCode::kCryptoError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

    /// @brief Throw the appropriate exception carrying the given context.
    [[noreturn]] void throwException(ErrorContext context) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
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

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws TidException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace tid

#endif  // TID_COMMON_ERROR_H
