// =============================================================================
// tid - Bit Layout Implementation
// =============================================================================

#include "tid/core/layout.h"

#include <charconv>
#include <system_error>

#include <fmt/format.h>

namespace tid {

Result<VersionSpec> lookupVersion(Version version) {
    const VersionSpec* spec = findVersionSpec(versionCode(version));
    if (spec == nullptr) {
        return makeError<VersionSpec>(
            ErrorCode::kInvalidArgument,
            fmt::format("Unsupported Tid version: {}", versionCode(version)));
    }
    return *spec;
}

Result<Version> parseVersion(std::string_view text) {
    for (const auto& spec : kVersionTable) {
        if (spec.name == text) {
            return spec.version;
        }
    }

    unsigned code = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), code);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return makeError<Version>(ErrorCode::kInvalidArgument,
                                  fmt::format("Unknown Tid version: '{}'", text));
    }
    if (findVersionSpec(code) == nullptr) {
        return makeError<Version>(ErrorCode::kInvalidArgument,
                                  fmt::format("Unsupported Tid version: {}", code));
    }
    return static_cast<Version>(code);
}

VoidResult validateValue(std::int64_t value, UnixSeconds now) {
    if (value < 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Tid integer must not be negative");
    }

    const auto raw = static_cast<TidValue>(value);
    const std::uint8_t code = decodeVersionCode(raw);
    const VersionSpec* spec = findVersionSpec(code);
    if (spec == nullptr) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Unsupported Tid version: {}", code));
    }

    if (!spec->timeBearing) {
        return makeVoidSuccess();
    }

    const UnixSeconds earliest = decodeEarliestTime(*spec, raw);
    if (earliest < 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Tid implies a negative timestamp: {}", earliest));
    }
    if (earliest > now) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            fmt::format("Tid implies a future timestamp: {} > {}", earliest, now));
    }
    return makeVoidSuccess();
}

}  // namespace tid
