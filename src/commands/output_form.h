// =============================================================================
// tid - Identifier Output Forms
// =============================================================================
// Shared rendering choice for commands that print identifiers.
// =============================================================================

#ifndef TID_COMMANDS_OUTPUT_FORM_H
#define TID_COMMANDS_OUTPUT_FORM_H

#include <cstdint>
#include <string>
#include <string_view>

#include "tid/core/tid.h"

namespace tid::commands {

/// @brief How a command prints each identifier.
enum class OutputForm : std::uint8_t {
    /// @brief Dash-grouped base-36 ("11u8-0ugb-7uj28").
    kGrouped = 0,

    /// @brief Base-36 without separators.
    kCompact,

    /// @brief Decimal integer.
    kInteger
};

/// @brief Pick the output form from the --compact / --int flags.
/// @note --int wins when both are given.
[[nodiscard]] constexpr OutputForm selectOutputForm(bool compact, bool integer) noexcept {
    if (integer) {
        return OutputForm::kInteger;
    }
    return compact ? OutputForm::kCompact : OutputForm::kGrouped;
}

[[nodiscard]] constexpr std::string_view outputFormToString(OutputForm form) noexcept {
    switch (form) {
        case OutputForm::kGrouped:
            return "grouped";
        case OutputForm::kCompact:
            return "compact";
        case OutputForm::kInteger:
            return "integer";
    }
    return "unknown";
}

/// @brief Render an identifier in the requested form.
[[nodiscard]] inline std::string renderTid(const Tid& id, OutputForm form) {
    switch (form) {
        case OutputForm::kCompact:
            return id.compactString();
        case OutputForm::kInteger:
            return std::to_string(id.value());
        case OutputForm::kGrouped:
            break;
    }
    return id.toString();
}

}  // namespace tid::commands

#endif  // TID_COMMANDS_OUTPUT_FORM_H
