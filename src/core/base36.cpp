// =============================================================================
// tid - Base-36 String Form Implementation
// =============================================================================

#include "tid/core/base36.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <vector>

#include <fmt/format.h>

namespace tid {

namespace {

constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

/// @brief ASCII-only alphanumeric test; locale must not widen the alphabet.
[[nodiscard]] constexpr bool isAlnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr std::optional<unsigned> digitValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<unsigned>(c - '0');
    }
    if (c >= 'a' && c <= 'z') {
        return static_cast<unsigned>(c - 'a') + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return static_cast<unsigned>(c - 'A') + 10;
    }
    return std::nullopt;
}

}  // namespace

std::string encodeBase36(TidValue value) {
    if (value == 0) {
        return "0";
    }

    // 13 digits cover 2^64
    std::array<char, 13> buffer{};
    std::size_t pos = buffer.size();
    while (value != 0) {
        buffer[--pos] = kDigits[value % kStringRadix];
        value /= kStringRadix;
    }
    return std::string(buffer.data() + pos, buffer.size() - pos);
}

Result<TidValue> decodeBase36(std::string_view text) {
    const std::string digits = stripSeparators(text);
    if (digits.empty()) {
        return makeError<TidValue>(ErrorCode::kInvalidArgument, "Invalid empty Tid string");
    }

    TidValue value = 0;
    for (char c : digits) {
        const auto digit = digitValue(c);
        if (!digit.has_value()) {
            return makeError<TidValue>(ErrorCode::kInvalidArgument, "Invalid Tid characters");
        }
        if (value > (kMaxTidValue - *digit) / kStringRadix) {
            return makeError<TidValue>(
                ErrorCode::kInvalidArgument,
                fmt::format("Tid string exceeds the 63-bit range: {}", digits.size() > 32
                                                                          ? digits.substr(0, 32) + "..."
                                                                          : digits));
        }
        value = value * kStringRadix + *digit;
    }
    return value;
}

std::string formatString(std::string_view input) {
    std::string clean;
    clean.reserve(input.size());
    std::copy_if(input.begin(), input.end(), std::back_inserter(clean), isAlnum);

    std::vector<std::string_view> chunks;
    const std::string_view view(clean);
    for (std::size_t pos = 0; pos < view.size(); pos += kGroupWidth) {
        chunks.push_back(view.substr(pos, kGroupWidth));
    }

    std::string result;
    result.reserve(clean.size() + chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const bool mergeIntoPrevious =
            i > 0 && i + 1 == chunks.size() && chunks[i].size() < kMinTrailingGroup;
        if (i > 0 && !mergeIntoPrevious) {
            result.push_back(kGroupSeparator);
        }
        result.append(chunks[i]);
    }
    return result;
}

std::string stripSeparators(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    std::copy_if(input.begin(), input.end(), std::back_inserter(result),
                 [](char c) { return c != kGroupSeparator; });
    return result;
}

std::string formatValue(TidValue value) {
    return formatString(encodeBase36(value));
}

}  // namespace tid
