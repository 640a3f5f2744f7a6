// =============================================================================
// tid - Base-36 String Form
// =============================================================================
// Conversion between raw integers and the grouped base-36 string form.
//
// These helpers know nothing about versions or timestamps: they accept any
// integer up to INT64_MAX. Identifier-level validation lives in Tid.
//
// Grouping rule (formatString):
//   "ABCDEFG"     -> "ABCD-EFG"
//   "ABCDEFGHI"   -> "ABCD-EFGHI"   (trailing group of 1 merges)
//   "A-_A!@A%^AAAAAAAAA" -> "AAAA-AAAA-AAAA"
// =============================================================================

#ifndef TID_CORE_BASE36_H
#define TID_CORE_BASE36_H

#include <string>
#include <string_view>

#include "tid/common/error.h"
#include "tid/common/types.h"

namespace tid {

/// @brief Render an integer as lowercase base-36 digits, no separators.
[[nodiscard]] std::string encodeBase36(TidValue value);

/// @brief Parse base-36 digits (either case), separators allowed.
/// @return Error kInvalidArgument for empty input, characters outside
///         [0-9A-Za-z-], or a magnitude above INT64_MAX.
[[nodiscard]] Result<TidValue> decodeBase36(std::string_view text);

/// @brief Group alphanumeric characters into dash-separated chunks of 4.
/// @note Every non-alphanumeric character of the input is discarded first.
[[nodiscard]] std::string formatString(std::string_view input);

/// @brief Remove group separators from a string.
[[nodiscard]] std::string stripSeparators(std::string_view input);

/// @brief encodeBase36 followed by formatString.
[[nodiscard]] std::string formatValue(TidValue value);

}  // namespace tid

#endif  // TID_CORE_BASE36_H
