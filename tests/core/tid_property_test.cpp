// =============================================================================
// tid - Tid Property Tests
// =============================================================================
// Property-based tests for the identifier codec.
//
// Properties:
// - integer -> string -> integer round-trips for every version
// - the low 4 bits always hold the requested version
// - entropy never exceeds the version's width
// - earliest time is monotonic in the packed timestamp
// - seed derivation is deterministic and input-sensitive
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "tid/core/base36.h"
#include "tid/core/tid.h"

namespace tid::test {

/// @brief Fixed clock reading used by properties that need one.
constexpr UnixSeconds kNow = 1704067200;

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate a defined version.
[[nodiscard]] rc::Gen<Version> version() {
    return rc::gen::map(rc::gen::inRange<int>(0, static_cast<int>(kVersionCount)),
                        [](int code) { return static_cast<Version>(code); });
}

/// @brief Generate a time-bearing version.
[[nodiscard]] rc::Gen<Version> timedVersion() {
    return rc::gen::map(rc::gen::inRange<int>(1, static_cast<int>(kVersionCount)),
                        [](int code) { return static_cast<Version>(code); });
}

/// @brief Generate a timestamp in [0, kNow].
[[nodiscard]] rc::Gen<UnixSeconds> pastTimestamp() {
    return rc::gen::inRange<UnixSeconds>(0, kNow + 1);
}

/// @brief Generate a packed, valid identifier integer of any version.
[[nodiscard]] rc::Gen<std::int64_t> validValue() {
    return rc::gen::apply(
        [](Version v, UnixSeconds seconds, std::uint64_t entropy) {
            const VersionSpec& spec = kVersionTable[versionCode(v)];
            const TidValue value = spec.timeBearing
                                       ? packTimed(spec, static_cast<std::uint64_t>(seconds), entropy)
                                       : packRandom(entropy);
            return static_cast<std::int64_t>(value);
        },
        version(), pastTimestamp(), rc::gen::arbitrary<std::uint64_t>());
}

}  // namespace gen

// =============================================================================
// Round-trip Properties
// =============================================================================

RC_GTEST_PROP(TidProperty, IntegerStringRoundTrip, ()) {
    const std::int64_t value = *gen::validValue();

    const Tid id = Tid::fromInteger(value, kNow);
    const auto parsed = Tid::tryFromString(id.toString(), kNow);
    RC_ASSERT(parsed.has_value());
    RC_ASSERT(parsed->value() == value);

    const auto compact = Tid::tryFromString(id.compactString(), kNow);
    RC_ASSERT(compact.has_value());
    RC_ASSERT(*compact == id);
}

RC_GTEST_PROP(TidProperty, GeneratedRoundTrip, ()) {
    const Version v = *gen::version();
    const Tid id = Tid::generate(v);
    RC_ASSERT(Tid::fromString(id.toString()) == id);
    RC_ASSERT(Tid::fromJson(id.toJson()) == id);
}

RC_GTEST_PROP(TidProperty, RawBase36RoundTrip, (std::uint64_t raw)) {
    const TidValue value = raw & kMaxTidValue;
    const auto decoded = decodeBase36(formatValue(value));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == value);
}

// =============================================================================
// Layout Properties
// =============================================================================

RC_GTEST_PROP(TidProperty, VersionIsolation, ()) {
    const Version v = *gen::version();
    const Tid id = Tid::generate(v);
    RC_ASSERT((static_cast<std::uint64_t>(id.value()) & kVersionTagMask) == versionCode(v));
    RC_ASSERT(id.version() == v);
}

RC_GTEST_PROP(TidProperty, EntropyWithinWidth, ()) {
    const Version v = *gen::version();
    const Tid id = Tid::generate(v);
    const unsigned width = kVersionTable[versionCode(v)].entropyBits;
    RC_ASSERT(id.entropyBits() == width);
    RC_ASSERT((id.randomBits() >> width) == 0U);
}

RC_GTEST_PROP(TidProperty, RandomVersionKeepsStabilizer, (std::uint64_t payload)) {
    const TidValue value = packRandom(payload);
    RC_ASSERT((value & kStabilizerBit) != 0U);
    RC_ASSERT(value <= kMaxTidValue);
    RC_ASSERT(Tid::isValidInteger(static_cast<std::int64_t>(value)));
}

RC_GTEST_PROP(TidProperty, EarliestTimeMonotonic, ()) {
    const Version v = *gen::timedVersion();
    const VersionSpec& spec = kVersionTable[versionCode(v)];
    const std::int64_t step = spec.resolutionSeconds();

    const UnixSeconds t1 = *rc::gen::inRange<UnixSeconds>(0, kNow - 2 * step);
    const UnixSeconds t2 = *rc::gen::inRange<UnixSeconds>(t1 + step, kNow);

    const Tid a = Tid::fromInteger(
        static_cast<std::int64_t>(packTimed(spec, static_cast<std::uint64_t>(t1),
                                            *rc::gen::arbitrary<std::uint64_t>())),
        kNow);
    const Tid b = Tid::fromInteger(
        static_cast<std::int64_t>(packTimed(spec, static_cast<std::uint64_t>(t2),
                                            *rc::gen::arbitrary<std::uint64_t>())),
        kNow);

    RC_ASSERT(a.earliestTime() < b.earliestTime());
    RC_ASSERT(a < b);
    RC_ASSERT(a.earliestTime() <= t1);
    RC_ASSERT(t1 - a.earliestTime() < step);
}

RC_GTEST_PROP(TidProperty, FutureTimestampsRejected, ()) {
    const Version v = *gen::timedVersion();
    const VersionSpec& spec = kVersionTable[versionCode(v)];
    const UnixSeconds ahead =
        *rc::gen::inRange<UnixSeconds>(spec.resolutionSeconds(), 10 * spec.resolutionSeconds() + 1);
    const TidValue value = packTimed(spec, static_cast<std::uint64_t>(kNow + ahead),
                                     *rc::gen::arbitrary<std::uint64_t>());
    RC_ASSERT(!Tid::tryFromInteger(static_cast<std::int64_t>(value), kNow).has_value());
}

RC_GTEST_PROP(TidProperty, NegativeIntegersRejected, ()) {
    const std::int64_t value =
        *rc::gen::inRange<std::int64_t>(std::numeric_limits<std::int64_t>::min(), 0);
    RC_ASSERT(!Tid::isValidInteger(value));
}

// =============================================================================
// Seed Derivation Properties
// =============================================================================

RC_GTEST_PROP(TidProperty, SeedDerivationDeterministic, (const std::string& seed,
                                                        const std::string& secret)) {
    RC_ASSERT(Tid::fromSeed(seed) == Tid::fromSeed(seed));
    RC_ASSERT(Tid::fromSeed(seed, secret) == Tid::fromSeed(seed, secret));

    const Tid derived = Tid::fromSeed(seed, secret);
    RC_ASSERT(derived.version() == Version::kRandom);
    RC_ASSERT((static_cast<std::uint64_t>(derived.value()) & kStabilizerBit) != 0U);
}

RC_GTEST_PROP(TidProperty, SeedDerivationSensitive, (const std::string& seed)) {
    const std::string other = seed + "x";
    RC_ASSERT(Tid::fromSeed(seed) != Tid::fromSeed(other));
    RC_ASSERT(Tid::fromSeed(seed, "k1") != Tid::fromSeed(seed, "k2"));
}

}  // namespace tid::test
