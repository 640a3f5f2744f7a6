// =============================================================================
// tid - Derive Command Implementation
// =============================================================================

#include "derive_command.h"

#include <cstdlib>

#include <fmt/format.h>

#include "tid/common/logger.h"
#include "tid/core/tid.h"

namespace tid::commands {

// =============================================================================
// DeriveOptions Implementation
// =============================================================================

VoidResult DeriveOptions::validate() const {
    if (secret.has_value() && !secretEnv.empty()) {
        return makeVoidError(ErrorCode::kUsageError,
                             "--secret and --secret-env are mutually exclusive");
    }
    return makeVoidSuccess();
}

Result<std::string> resolveSecretFromEnv(std::string_view variable) {
    if (variable.empty()) {
        return makeError<std::string>(ErrorCode::kUsageError,
                                      "Secret environment variable name is empty");
    }
    const std::string name(variable);
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return makeError<std::string>(
            ErrorCode::kUsageError,
            fmt::format("Secret environment variable is not set: {}", name));
    }
    return std::string(value);
}

// =============================================================================
// DeriveCommand Implementation
// =============================================================================

DeriveCommand::DeriveCommand(DeriveOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

DeriveCommand::~DeriveCommand() = default;

DeriveCommand::DeriveCommand(DeriveCommand&&) noexcept = default;

std::optional<std::string> DeriveCommand::effectiveSecret() const {
    if (options_.secret.has_value()) {
        return options_.secret;
    }
    if (!options_.secretEnv.empty()) {
        return unwrapOrThrow(resolveSecretFromEnv(options_.secretEnv));
    }
    return std::nullopt;
}

int DeriveCommand::execute() {
    unwrapOrThrow(options_.validate());

    const auto secret = effectiveSecret();
    TID_LOG_DEBUG("Deriving identifier from {}-byte seed ({})", options_.seed.size(),
                  secret ? "HMAC-SHA256" : "SHA-256");

    const Tid id = secret ? Tid::fromSeed(options_.seed, *secret) : Tid::fromSeed(options_.seed);
    out_ << renderTid(id, options_.form) << '\n';
    out_.flush();
    return toExitCode(ErrorCode::kSuccess);
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<DeriveCommand> createDeriveCommand(
    const std::string& seed,
    const std::string& secret,
    bool secretGiven,
    const std::string& secretEnv,
    bool compact,
    bool integer) {

    DeriveOptions opts;
    opts.seed = seed;
    if (secretGiven) {
        opts.secret = secret;
    }
    opts.secretEnv = secretEnv;
    opts.form = selectOutputForm(compact, integer);

    return std::make_unique<DeriveCommand>(std::move(opts));
}

}  // namespace tid::commands
