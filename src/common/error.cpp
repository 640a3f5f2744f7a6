// =============================================================================
// tid - Error Handling Framework Implementation
// =============================================================================

#include "tid/common/error.h"

#include <sstream>

namespace tid {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!input.empty()) {
        oss << "input: \"" << input << "\"";
        hasContent = true;
    }

    if (value.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "value: " << *value;
        hasContent = true;
    }

    if (version.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "version: " << static_cast<int>(*version);
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// TidException Implementation
// =============================================================================

void TidException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kCryptoError:
            throw CryptoError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInternalError:
            break;
    }
    throw TidException(code_, message_);
}

[[noreturn]] void Error::throwException(ErrorContext context) const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, std::move(context));
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_, std::move(context));
        case ErrorCode::kCryptoError:
            throw CryptoError(message_, std::move(context));
        case ErrorCode::kSuccess:
        case ErrorCode::kInternalError:
            break;
    }
    throw TidException(code_, message_, std::move(context));
}

}  // namespace tid
