// =============================================================================
// tid - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <fmt/format.h>

#include "tid/common/logger.h"
#include "tid/core/tid.h"

namespace tid::commands {

// =============================================================================
// GenerateOptions Implementation
// =============================================================================

VoidResult GenerateOptions::validate() const {
    if (count == 0 || count > kMaxGenerateCount) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Count must be 1-{}, got {}", kMaxGenerateCount, count));
    }
    auto spec = lookupVersion(version);
    if (!spec) {
        return std::unexpected(spec.error());
    }
    return makeVoidSuccess();
}

// =============================================================================
// GenerateCommand Implementation
// =============================================================================

GenerateCommand::GenerateCommand(GenerateOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

GenerateCommand::~GenerateCommand() = default;

GenerateCommand::GenerateCommand(GenerateCommand&&) noexcept = default;

int GenerateCommand::execute() {
    unwrapOrThrow(options_.validate());

    TID_LOG_DEBUG("Generating {} identifier(s), version {}, {} form", options_.count,
                  versionCode(options_.version), outputFormToString(options_.form));

    for (std::uint32_t i = 0; i < options_.count; ++i) {
        out_ << renderTid(Tid::generate(options_.version), options_.form) << '\n';
    }
    out_.flush();
    return toExitCode(ErrorCode::kSuccess);
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<GenerateCommand> createGenerateCommand(
    const std::string& versionName,
    std::uint32_t count,
    bool compact,
    bool integer) {

    GenerateOptions opts;
    opts.version = unwrapOrThrow(parseVersion(versionName));
    opts.count = count;
    opts.form = selectOutputForm(compact, integer);

    return std::make_unique<GenerateCommand>(std::move(opts));
}

}  // namespace tid::commands
