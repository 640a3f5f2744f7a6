// =============================================================================
// tid - Identifier Value Type Implementation
// =============================================================================

#include "tid/core/tid.h"

#include <cctype>
#include <ostream>
#include <utility>

#include <fmt/format.h>

#include "tid/common/logger.h"
#include "tid/core/base36.h"
#include "tid/core/clock.h"
#include "tid/core/digest.h"
#include "tid/core/entropy.h"

namespace tid {

namespace {

[[nodiscard]] std::string_view trimWhitespace(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// =============================================================================
// Generation
// =============================================================================

Result<Tid> Tid::tryGenerate(Version version) {
    auto spec = lookupVersion(version);
    if (!spec) {
        return makeError<Tid>(spec.error());
    }

    if (!spec->timeBearing) {
        auto payload = tid::randomBits(kRandomPayloadBits);
        if (!payload) {
            return makeError<Tid>(payload.error());
        }
        return Tid(packRandom(*payload));
    }

    auto entropy = tid::randomBits(spec->entropyBits);
    if (!entropy) {
        return makeError<Tid>(entropy.error());
    }
    const UnixSeconds now = unixNow();
    if (now < 0) {
        return makeError<Tid>(ErrorCode::kInvalidArgument,
                              fmt::format("System clock is before the Unix epoch: {}", now));
    }
    return Tid(packTimed(*spec, static_cast<std::uint64_t>(now), *entropy));
}

Tid Tid::generate(Version version) {
    return unwrapOrThrow(tryGenerate(version));
}

Result<Tid> Tid::tryFromSeed(std::string_view seed) {
    auto digest = sha256(seed);
    if (!digest) {
        return makeError<Tid>(digest.error());
    }
    return Tid(packDigestPrefix(digestPrefix(*digest)));
}

Result<Tid> Tid::tryFromSeed(std::string_view seed, std::string_view secret) {
    auto digest = hmacSha256(secret, seed);
    if (!digest) {
        return makeError<Tid>(digest.error());
    }
    return Tid(packDigestPrefix(digestPrefix(*digest)));
}

Tid Tid::fromSeed(std::string_view seed) {
    return unwrapOrThrow(tryFromSeed(seed));
}

Tid Tid::fromSeed(std::string_view seed, std::string_view secret) {
    return unwrapOrThrow(tryFromSeed(seed, secret));
}

// =============================================================================
// Parsing
// =============================================================================

Result<Tid> Tid::tryFromInteger(std::int64_t value, UnixSeconds now) {
    auto valid = validateValue(value, now);
    if (!valid) {
        TID_LOG_DEBUG("Rejected Tid integer {}: {}", value, valid.error().message());
        return makeError<Tid>(valid.error());
    }
    return Tid(static_cast<TidValue>(value));
}

Result<Tid> Tid::tryFromInteger(std::int64_t value) {
    return tryFromInteger(value, unixNow());
}

Tid Tid::fromInteger(std::int64_t value, UnixSeconds now) {
    auto result = tryFromInteger(value, now);
    if (!result) {
        ErrorContext context;
        context.withValue(value);
        if (value >= 0) {
            context.withVersion(decodeVersionCode(static_cast<TidValue>(value)));
        }
        result.error().throwException(std::move(context));
    }
    return *result;
}

Tid Tid::fromInteger(std::int64_t value) {
    return fromInteger(value, unixNow());
}

Result<Tid> Tid::tryFromString(std::string_view text, UnixSeconds now) {
    auto decoded = decodeBase36(text);
    if (!decoded) {
        TID_LOG_DEBUG("Rejected Tid string '{}': {}", text, decoded.error().message());
        return makeError<Tid>(decoded.error());
    }
    return tryFromInteger(static_cast<std::int64_t>(*decoded), now);
}

Result<Tid> Tid::tryFromString(std::string_view text) {
    return tryFromString(text, unixNow());
}

Tid Tid::fromString(std::string_view text) {
    auto result = tryFromString(text);
    if (!result) {
        result.error().throwException(ErrorContext(std::string(text)));
    }
    return *result;
}

Result<Tid> Tid::tryFromJson(std::string_view json) {
    const std::string_view trimmed = trimWhitespace(json);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return makeError<Tid>(ErrorCode::kInvalidArgument,
                              "Tid JSON value must be a quoted string");
    }
    return tryFromString(trimmed.substr(1, trimmed.size() - 2));
}

Tid Tid::fromJson(std::string_view json) {
    auto result = tryFromJson(json);
    if (!result) {
        result.error().throwException(ErrorContext{}.withInput(std::string(json)));
    }
    return *result;
}

bool Tid::isValidInteger(std::int64_t value) {
    return validateValue(value, unixNow()).has_value();
}

bool Tid::isValidString(std::string_view text) {
    return tryFromString(text).has_value();
}

// =============================================================================
// Fields
// =============================================================================

Version Tid::version() const noexcept {
    return static_cast<Version>(decodeVersionCode(value_));
}

const VersionSpec& Tid::spec() const noexcept {
    // Construction guarantees a defined version code
    return kVersionTable[decodeVersionCode(value_)];
}

UnixSeconds Tid::earliestTime() const noexcept {
    return decodeEarliestTime(spec(), value_);
}

UnixSeconds Tid::latestTime() const noexcept {
    return decodeLatestTime(spec(), value_);
}

unsigned Tid::entropyBits() const noexcept {
    return spec().entropyBits;
}

std::uint64_t Tid::randomBits() const noexcept {
    return decodeRandomBits(spec(), value_);
}

std::int64_t Tid::resolutionSeconds() const noexcept {
    return spec().resolutionSeconds();
}

// =============================================================================
// Rendering
// =============================================================================

std::string Tid::toString() const {
    return formatValue(value_);
}

std::string Tid::compactString() const {
    return encodeBase36(value_);
}

std::string Tid::toJson() const {
    return fmt::format("\"{}\"", toString());
}

std::ostream& operator<<(std::ostream& os, const Tid& id) {
    return os << id.toString();
}

}  // namespace tid
