// =============================================================================
// tid - Derive Command
// =============================================================================
// Command handler for deterministic identifiers derived from a seed.
//
// This module provides:
// - DeriveOptions: seed, optional secret, output form
// - DeriveCommand: print SHA-256 or HMAC-SHA256 derived version 0 Tid
// - resolveSecretFromEnv(): read the HMAC key from the environment
// =============================================================================

#ifndef TID_COMMANDS_DERIVE_COMMAND_H
#define TID_COMMANDS_DERIVE_COMMAND_H

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tid/common/error.h"

#include "output_form.h"

namespace tid::commands {

// =============================================================================
// Derive Options
// =============================================================================

/// @brief Configuration options for derive command.
struct DeriveOptions {
    /// @brief Seed text. May be empty.
    std::string seed;

    /// @brief HMAC key given directly on the command line.
    std::optional<std::string> secret;

    /// @brief Environment variable holding the HMAC key.
    std::string secretEnv;

    /// @brief Output form.
    OutputForm form = OutputForm::kGrouped;

    /// @brief Check that at most one secret source is given.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Read an HMAC key from the named environment variable.
/// @return kUsageError if the name is empty or the variable is unset.
[[nodiscard]] Result<std::string> resolveSecretFromEnv(std::string_view variable);

// =============================================================================
// DeriveCommand Class
// =============================================================================

/// @brief Command handler for seed-derived identifiers.
class DeriveCommand {
public:
    explicit DeriveCommand(DeriveOptions options, std::ostream& out = std::cout);

    ~DeriveCommand();

    DeriveCommand(const DeriveCommand&) = delete;
    DeriveCommand& operator=(const DeriveCommand&) = delete;
    DeriveCommand(DeriveCommand&&) noexcept;
    DeriveCommand& operator=(DeriveCommand&&) noexcept = delete;

    /// @brief Execute the derive command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const DeriveOptions& options() const noexcept { return options_; }

private:
    /// @brief Key to use, if any, after consulting the environment.
    [[nodiscard]] std::optional<std::string> effectiveSecret() const;

    DeriveOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a derive command from CLI options.
/// @param secret Empty when --secret was not given.
[[nodiscard]] std::unique_ptr<DeriveCommand> createDeriveCommand(
    const std::string& seed,
    const std::string& secret,
    bool secretGiven,
    const std::string& secretEnv,
    bool compact,
    bool integer);

}  // namespace tid::commands

#endif  // TID_COMMANDS_DERIVE_COMMAND_H
