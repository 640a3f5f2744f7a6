// =============================================================================
// tid - Identifier Value Type
// =============================================================================
// Tid is an immutable, time-ordered identifier that is an integer under the
// hood and renders as a grouped base-36 string ("a6qz-aw3fi").
//
// Every Tid instance satisfies the identifier invariants:
// - its integer is in [0, INT64_MAX]
// - its version code is defined in kVersionTable
// - for time-bearing versions, its earliest time was in [0, now] when it was
//   validated
//
// Construction paths:
// - generate():   random (version 0) or time-ordered (versions 1-5)
// - fromSeed():   deterministic version 0 from SHA-256 / HMAC-SHA256
// - fromInteger() / fromString() / fromJson(): validated parsing
//
// Each throwing factory has a try* twin returning Result<Tid>.
// =============================================================================

#ifndef TID_CORE_TID_H
#define TID_CORE_TID_H

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include "tid/common/error.h"
#include "tid/common/types.h"
#include "tid/core/layout.h"

namespace tid {

class Tid {
public:
    // =========================================================================
    // Generation
    // =========================================================================

    /// @brief Generate a new identifier of the given version.
    /// @throws InvalidArgumentError if the version is not defined.
    /// @throws CryptoError if the random source fails.
    [[nodiscard]] static Tid generate(Version version = kDefaultVersion);

    /// @brief Non-throwing generate().
    [[nodiscard]] static Result<Tid> tryGenerate(Version version = kDefaultVersion);

    /// @brief Derive a version 0 identifier from the SHA-256 of a seed.
    /// @note Anyone who knows the seed can reproduce the identifier.
    [[nodiscard]] static Tid fromSeed(std::string_view seed);

    /// @brief Derive a version 0 identifier from HMAC-SHA256(secret, seed).
    [[nodiscard]] static Tid fromSeed(std::string_view seed, std::string_view secret);

    /// @brief Non-throwing fromSeed(seed).
    [[nodiscard]] static Result<Tid> tryFromSeed(std::string_view seed);

    /// @brief Non-throwing fromSeed(seed, secret).
    [[nodiscard]] static Result<Tid> tryFromSeed(std::string_view seed, std::string_view secret);

    // =========================================================================
    // Parsing
    // =========================================================================

    /// @brief Wrap a validated integer.
    /// @throws InvalidArgumentError on a negative value, undefined version, or
    ///         an implied timestamp outside [0, now].
    [[nodiscard]] static Tid fromInteger(std::int64_t value);

    /// @brief fromInteger() against an explicit current time.
    [[nodiscard]] static Tid fromInteger(std::int64_t value, UnixSeconds now);

    [[nodiscard]] static Result<Tid> tryFromInteger(std::int64_t value);
    [[nodiscard]] static Result<Tid> tryFromInteger(std::int64_t value, UnixSeconds now);

    /// @brief Parse the string form, with or without separators.
    /// @throws InvalidArgumentError on empty input, characters outside
    ///         base-36, overflow, or any fromInteger() rule.
    [[nodiscard]] static Tid fromString(std::string_view text);

    [[nodiscard]] static Result<Tid> tryFromString(std::string_view text);
    [[nodiscard]] static Result<Tid> tryFromString(std::string_view text, UnixSeconds now);

    /// @brief Parse the JSON interchange form (a quoted string).
    [[nodiscard]] static Tid fromJson(std::string_view json);

    [[nodiscard]] static Result<Tid> tryFromJson(std::string_view json);

    /// @brief Check an integer without throwing.
    [[nodiscard]] static bool isValidInteger(std::int64_t value);

    /// @brief Check a string without throwing.
    [[nodiscard]] static bool isValidString(std::string_view text);

    // =========================================================================
    // Fields
    // =========================================================================

    /// @brief Raw integer value.
    [[nodiscard]] std::int64_t value() const noexcept { return static_cast<std::int64_t>(value_); }

    /// @brief Version stored in the low 4 bits.
    [[nodiscard]] Version version() const noexcept;

    /// @brief Table entry of this identifier's version.
    [[nodiscard]] const VersionSpec& spec() const noexcept;

    /// @brief Lower bound of the generation time window, 0 for version 0.
    [[nodiscard]] UnixSeconds earliestTime() const noexcept;

    /// @brief earliestTime() with every entropy-width bit set.
    [[nodiscard]] UnixSeconds latestTime() const noexcept;

    /// @brief Width of the entropy field for this version.
    [[nodiscard]] unsigned entropyBits() const noexcept;

    /// @brief Decoded entropy field.
    [[nodiscard]] std::uint64_t randomBits() const noexcept;

    /// @brief Seconds per timestamp step, 0 for version 0.
    [[nodiscard]] std::int64_t resolutionSeconds() const noexcept;

    // =========================================================================
    // Rendering
    // =========================================================================

    /// @brief Grouped base-36 form, e.g. "11u8-0ugb-7uj28".
    [[nodiscard]] std::string toString() const;

    /// @brief Base-36 form without separators.
    [[nodiscard]] std::string compactString() const;

    /// @brief JSON interchange form: the grouped string in double quotes.
    [[nodiscard]] std::string toJson() const;

    [[nodiscard]] friend bool operator==(const Tid&, const Tid&) noexcept = default;
    [[nodiscard]] friend auto operator<=>(const Tid&, const Tid&) noexcept = default;

private:
    /// @brief Wrap an already validated value.
    explicit constexpr Tid(TidValue value) noexcept : value_(value) {}

    TidValue value_;
};

/// @brief Writes toString().
std::ostream& operator<<(std::ostream& os, const Tid& id);

}  // namespace tid

template <>
struct std::hash<tid::Tid> {
    std::size_t operator()(const tid::Tid& id) const noexcept {
        return std::hash<std::int64_t>{}(id.value());
    }
};

#endif  // TID_CORE_TID_H
