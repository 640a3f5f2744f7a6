// =============================================================================
// tid - Generate Command
// =============================================================================
// Command handler for printing freshly generated identifiers.
//
// This module provides:
// - GenerateOptions: version, count and output form
// - GenerateCommand: generate and print one identifier per line
// =============================================================================

#ifndef TID_COMMANDS_GENERATE_COMMAND_H
#define TID_COMMANDS_GENERATE_COMMAND_H

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "tid/common/error.h"
#include "tid/core/layout.h"

#include "output_form.h"

namespace tid::commands {

// =============================================================================
// Constants
// =============================================================================

/// @brief Upper bound on identifiers printed by one invocation.
inline constexpr std::uint32_t kMaxGenerateCount = 100000;

// =============================================================================
// Generate Options
// =============================================================================

/// @brief Configuration options for generate command.
struct GenerateOptions {
    /// @brief Layout version of the generated identifiers.
    Version version = kDefaultVersion;

    /// @brief Number of identifiers to print.
    std::uint32_t count = 1;

    /// @brief Output form.
    OutputForm form = OutputForm::kGrouped;

    /// @brief Validate option ranges.
    /// @return VoidResult with kUsageError on a bad count.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// GenerateCommand Class
// =============================================================================

/// @brief Command handler for generating identifiers.
class GenerateCommand {
public:
    /// @brief Construct with options, printing to the given stream.
    explicit GenerateCommand(GenerateOptions options, std::ostream& out = std::cout);

    ~GenerateCommand();

    // Non-copyable, movable
    GenerateCommand(const GenerateCommand&) = delete;
    GenerateCommand& operator=(const GenerateCommand&) = delete;
    GenerateCommand(GenerateCommand&&) noexcept;
    GenerateCommand& operator=(GenerateCommand&&) noexcept = delete;

    /// @brief Execute the generate command.
    /// @return Exit code (0 = success).
    /// @throws TidException on invalid options or random source failure.
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    GenerateOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a generate command from CLI options.
/// @param versionName Version name or decimal code, e.g. "minutes" or "2".
/// @throws InvalidArgumentError if the version is not defined.
[[nodiscard]] std::unique_ptr<GenerateCommand> createGenerateCommand(
    const std::string& versionName,
    std::uint32_t count,
    bool compact,
    bool integer);

}  // namespace tid::commands

#endif  // TID_COMMANDS_GENERATE_COMMAND_H
