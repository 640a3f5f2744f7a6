// =============================================================================
// tid - Bit Layout Module
// =============================================================================
// The version table and every piece of bit arithmetic that packs or unpacks
// an identifier. Nothing else in the library shifts or masks identifier bits.
//
// Layout (least significant bit first):
//
//   | version (4) | entropy (entropyBits) | timestamp >> droppedBits |
//
// Version 0 carries no timestamp: 58 uniformly random bits sit above the
// version tag and bit 62 is forced to one.
//
// Version table:
//   code  name     dropped  entropy  resolution
//   0     random   -        59       -
//   1     seconds  0        14       1 s
//   2     minutes  8        22       ~4.25 min
//   3     hours    16       30       ~18 h
//   4     days     18       32       ~3 days
//   5     weeks    20       34       ~12 days
// =============================================================================

#ifndef TID_CORE_LAYOUT_H
#define TID_CORE_LAYOUT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tid/common/error.h"
#include "tid/common/types.h"

namespace tid {

// =============================================================================
// Version Codes
// =============================================================================

/// @brief Layout selector stored in the low 4 bits.
enum class Version : std::uint8_t {
    /// @brief Entirely random, no time information.
    kRandom = 0,

    /// @brief Full one-second timestamp resolution.
    kSeconds = 1,

    /// @brief Timestamp truncated by 8 bits (~4.25 minutes).
    kMinutes = 2,

    /// @brief Timestamp truncated by 16 bits (~18 hours).
    kHours = 3,

    /// @brief Timestamp truncated by 18 bits (~3 days).
    kDays = 4,

    /// @brief Timestamp truncated by 20 bits (~12 days).
    kWeeks = 5
};

/// @brief Number of defined version codes.
inline constexpr std::size_t kVersionCount = 6;

/// @brief Version used when the caller does not choose one.
inline constexpr Version kDefaultVersion = Version::kRandom;

/// @brief Numeric code of a version.
[[nodiscard]] constexpr std::uint8_t versionCode(Version version) noexcept {
    return static_cast<std::uint8_t>(version);
}

// =============================================================================
// Version Table
// =============================================================================

/// @brief Bit allocation of one version.
struct VersionSpec {
    /// @brief Version this entry describes.
    Version version = Version::kRandom;

    /// @brief Short lowercase name.
    std::string_view name;

    /// @brief Whether a timestamp is packed above the entropy field.
    bool timeBearing = false;

    /// @brief Low timestamp bits discarded before packing.
    unsigned droppedBits = 0;

    /// @brief Width of the entropy field.
    unsigned entropyBits = 0;

    /// @brief Mask covering the entropy field (before the version shift).
    [[nodiscard]] constexpr std::uint64_t entropyMask() const noexcept {
        return entropyBits >= 64 ? ~std::uint64_t{0}
                                 : (std::uint64_t{1} << entropyBits) - 1;
    }

    /// @brief Seconds covered by one timestamp step, 0 for version 0.
    [[nodiscard]] constexpr std::int64_t resolutionSeconds() const noexcept {
        return timeBearing ? (std::int64_t{1} << droppedBits) : 0;
    }
};

/// @brief Process-wide constant version table, indexed by version code.
inline constexpr std::array<VersionSpec, kVersionCount> kVersionTable = {{
    {Version::kRandom, "random", false, 0, kRandomPayloadBits + 1},
    {Version::kSeconds, "seconds", true, 0, 14},
    {Version::kMinutes, "minutes", true, 8, 22},
    {Version::kHours, "hours", true, 16, 30},
    {Version::kDays, "days", true, 18, 32},
    {Version::kWeeks, "weeks", true, 20, 34},
}};

/// @brief Look up the table entry for a raw version code.
/// @return nullptr when the code is not defined.
[[nodiscard]] constexpr const VersionSpec* findVersionSpec(std::uint64_t code) noexcept {
    return code < kVersionTable.size() ? &kVersionTable[code] : nullptr;
}

/// @brief Look up the table entry for a version.
/// @return Error kInvalidArgument when the version is not defined.
[[nodiscard]] Result<VersionSpec> lookupVersion(Version version);

/// @brief Parse a version from its numeric code or table name.
/// @param text Either a decimal code ("3") or a name ("hours").
[[nodiscard]] Result<Version> parseVersion(std::string_view text);

// =============================================================================
// Packing
// =============================================================================

/// @brief Pack a version 0 identifier.
/// @param payload Random bits; only the low 58 are used.
[[nodiscard]] constexpr TidValue packRandom(std::uint64_t payload) noexcept {
    const std::uint64_t random = payload & ((std::uint64_t{1} << kRandomPayloadBits) - 1);
    TidValue value = random << kVersionTagBits;
    value |= versionCode(Version::kRandom);
    value |= kStabilizerBit;
    return value;
}

/// @brief Pack a time-bearing identifier.
/// @param spec Table entry of a time-bearing version.
/// @param seconds Non-negative Unix timestamp.
/// @param entropy Random bits; only the low entropyBits are used.
[[nodiscard]] constexpr TidValue packTimed(const VersionSpec& spec, std::uint64_t seconds,
                                           std::uint64_t entropy) noexcept {
    TidValue value = seconds >> spec.droppedBits;
    value <<= spec.entropyBits;
    value |= entropy & spec.entropyMask();
    value <<= kVersionTagBits;
    value |= versionCode(spec.version);
    return value;
}

/// @brief Pack a version 0 identifier from the first 64 bits of a digest.
/// @note The top 6 bits are discarded to leave room for the version tag and
///       the stabilizer bit.
[[nodiscard]] constexpr TidValue packDigestPrefix(std::uint64_t prefix) noexcept {
    TidValue value = prefix >> 6;
    value <<= kVersionTagBits;
    value |= versionCode(Version::kRandom);
    value |= kStabilizerBit;
    return value;
}

// =============================================================================
// Unpacking
// =============================================================================

/// @brief Raw version code (low 4 bits) of a value.
[[nodiscard]] constexpr std::uint8_t decodeVersionCode(TidValue value) noexcept {
    return static_cast<std::uint8_t>(value & kVersionTagMask);
}

/// @brief Lower bound of the generation time window.
/// @return 0 for version 0.
[[nodiscard]] constexpr UnixSeconds decodeEarliestTime(const VersionSpec& spec,
                                                       TidValue value) noexcept {
    if (!spec.timeBearing) {
        return 0;
    }
    TidValue time = value >> kVersionTagBits;
    time >>= spec.entropyBits;
    time <<= spec.droppedBits;
    return static_cast<UnixSeconds>(time);
}

/// @brief Earliest time OR'd with the entropy mask.
[[nodiscard]] constexpr UnixSeconds decodeLatestTime(const VersionSpec& spec,
                                                     TidValue value) noexcept {
    const auto earliest = static_cast<std::uint64_t>(decodeEarliestTime(spec, value));
    return static_cast<UnixSeconds>(earliest | spec.entropyMask());
}

/// @brief Decoded entropy field.
/// @note Version 0 returns every bit above the version tag, stabilizer included.
[[nodiscard]] constexpr std::uint64_t decodeRandomBits(const VersionSpec& spec,
                                                       TidValue value) noexcept {
    const std::uint64_t shifted = value >> kVersionTagBits;
    if (!spec.timeBearing) {
        return shifted;
    }
    return shifted & spec.entropyMask();
}

// =============================================================================
// Validation
// =============================================================================

/// @brief Check an integer against every identifier invariant.
/// @param value Candidate integer.
/// @param now Current Unix time used as the upper bound for implied timestamps.
/// @return Error kInvalidArgument describing the first violated rule.
[[nodiscard]] VoidResult validateValue(std::int64_t value, UnixSeconds now);

}  // namespace tid

#endif  // TID_CORE_LAYOUT_H
