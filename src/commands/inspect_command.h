// =============================================================================
// tid - Inspect Command
// =============================================================================
// Command handler for decoding an existing identifier.
//
// This module provides:
// - InspectCommand: validate a Tid and print its fields
// - Support for JSON output format
// - parseDecimalInteger(): strict decimal parsing for --from-int
// =============================================================================

#ifndef TID_COMMANDS_INSPECT_COMMAND_H
#define TID_COMMANDS_INSPECT_COMMAND_H

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "tid/common/error.h"
#include "tid/core/tid.h"

namespace tid::commands {

// =============================================================================
// Inspect Options
// =============================================================================

/// @brief Configuration options for inspect command.
struct InspectOptions {
    /// @brief Identifier as a formatted string or, with fromInteger, decimal.
    std::string value;

    /// @brief Treat value as a decimal integer.
    bool fromInteger = false;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Reject an empty value.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Parse a whole string as a signed decimal integer.
/// @return kInvalidArgument on stray characters or out-of-range magnitude.
[[nodiscard]] Result<std::int64_t> parseDecimalInteger(std::string_view text);

// =============================================================================
// InspectCommand Class
// =============================================================================

/// @brief Command handler for displaying identifier fields.
class InspectCommand {
public:
    explicit InspectCommand(InspectOptions options, std::ostream& out = std::cout);

    ~InspectCommand();

    InspectCommand(const InspectCommand&) = delete;
    InspectCommand& operator=(const InspectCommand&) = delete;
    InspectCommand(InspectCommand&&) noexcept;
    InspectCommand& operator=(InspectCommand&&) noexcept = delete;

    /// @brief Execute the inspect command.
    /// @return Exit code (0 = success).
    /// @throws InvalidArgumentError if the value is not a valid Tid.
    [[nodiscard]] int execute();

    [[nodiscard]] const InspectOptions& options() const noexcept { return options_; }

private:
    /// @brief Parse options_.value according to fromInteger.
    [[nodiscard]] Tid parseInput() const;

    /// @brief Print fields in text format.
    void printTextInfo(const Tid& id);

    /// @brief Print fields in JSON format.
    void printJsonInfo(const Tid& id);

    InspectOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an inspect command from CLI options.
[[nodiscard]] std::unique_ptr<InspectCommand> createInspectCommand(
    const std::string& value,
    bool fromInteger,
    bool jsonOutput);

}  // namespace tid::commands

#endif  // TID_COMMANDS_INSPECT_COMMAND_H
