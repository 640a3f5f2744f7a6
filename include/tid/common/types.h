// =============================================================================
// tid - Common Type Definitions
// =============================================================================
// Core type definitions shared by the tid library and the tidtool CLI.
//
// This module defines:
// - TidValue, UnixSeconds: Type aliases for the integer forms
// - Layout constants: version tag width, random payload width, stabilizer bit
// - String form constants: separator and chunk width
//
// Naming Conventions (per project style guide):
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef TID_COMMON_TYPES_H
#define TID_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>

namespace tid {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Raw integer form of an identifier.
/// @note Always <= INT64_MAX so it can be stored in a signed 64-bit column.
using TidValue = std::uint64_t;

/// @brief Unix timestamp in seconds.
using UnixSeconds = std::int64_t;

// =============================================================================
// Layout Constants
// =============================================================================

/// @brief Width of the version tag in the low bits.
inline constexpr unsigned kVersionTagBits = 4;

/// @brief Mask selecting the version tag.
inline constexpr TidValue kVersionTagMask = (TidValue{1} << kVersionTagBits) - 1;

/// @brief Number of uniformly random bits in a version 0 identifier.
inline constexpr unsigned kRandomPayloadBits = 58;

/// @brief Bit forced to one in version 0 identifiers.
/// @note Keeps random identifiers at the top of the 63-bit range.
inline constexpr TidValue kStabilizerBit = TidValue{1} << 62;

/// @brief Largest integer an identifier may hold.
inline constexpr TidValue kMaxTidValue =
    static_cast<TidValue>(std::numeric_limits<std::int64_t>::max());

// =============================================================================
// String Form Constants
// =============================================================================

/// @brief Separator inserted between digit groups.
inline constexpr char kGroupSeparator = '-';

/// @brief Number of digits per group.
inline constexpr std::size_t kGroupWidth = 4;

/// @brief Trailing groups shorter than this merge into their predecessor.
inline constexpr std::size_t kMinTrailingGroup = 3;

/// @brief Numeric base of the string form.
inline constexpr unsigned kStringRadix = 36;

}  // namespace tid

#endif  // TID_COMMON_TYPES_H
