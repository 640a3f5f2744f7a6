// =============================================================================
// tid - Inspect Command Implementation
// =============================================================================

#include "inspect_command.h"

#include <charconv>
#include <ctime>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "tid/common/logger.h"

namespace tid::commands {

namespace {

/// @brief ISO-8601 UTC rendering of a Unix timestamp.
[[nodiscard]] std::string formatUtc(UnixSeconds seconds) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(static_cast<std::time_t>(seconds)));
}

}  // namespace

// =============================================================================
// InspectOptions Implementation
// =============================================================================

VoidResult InspectOptions::validate() const {
    if (value.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "Identifier value must not be empty");
    }
    return makeVoidSuccess();
}

Result<std::int64_t> parseDecimalInteger(std::string_view text) {
    std::int64_t parsed = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc::result_out_of_range) {
        return makeError<std::int64_t>(ErrorCode::kInvalidArgument,
                                       fmt::format("Integer out of range: {}", text));
    }
    if (ec != std::errc{} || ptr != last) {
        return makeError<std::int64_t>(ErrorCode::kInvalidArgument,
                                       fmt::format("Not a decimal integer: {}", text));
    }
    return parsed;
}

// =============================================================================
// InspectCommand Implementation
// =============================================================================

InspectCommand::InspectCommand(InspectOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

InspectCommand::~InspectCommand() = default;

InspectCommand::InspectCommand(InspectCommand&&) noexcept = default;

Tid InspectCommand::parseInput() const {
    if (options_.fromInteger) {
        auto parsed = parseDecimalInteger(options_.value);
        if (!parsed) {
            parsed.error().throwException(ErrorContext(options_.value));
        }
        return Tid::fromInteger(*parsed);
    }
    return Tid::fromString(options_.value);
}

int InspectCommand::execute() {
    unwrapOrThrow(options_.validate());

    const Tid id = parseInput();
    TID_LOG_DEBUG("Inspecting {} (version {})", id.toString(), versionCode(id.version()));

    if (options_.jsonOutput) {
        printJsonInfo(id);
    } else {
        printTextInfo(id);
    }
    out_.flush();
    return toExitCode(ErrorCode::kSuccess);
}

void InspectCommand::printTextInfo(const Tid& id) {
    const VersionSpec& spec = id.spec();

    out_ << "=== Tid Information ===" << '\n';
    out_ << '\n';
    out_ << "Tid:            " << id.toString() << '\n';
    out_ << "Integer:        " << id.value() << '\n';
    out_ << "Version:        " << static_cast<int>(versionCode(spec.version)) << " ("
         << spec.name << ")" << '\n';

    if (spec.timeBearing) {
        out_ << "Earliest time:  " << id.earliestTime() << " (" << formatUtc(id.earliestTime())
             << ")" << '\n';
        out_ << "Latest time:    " << id.latestTime() << " (" << formatUtc(id.latestTime())
             << ")" << '\n';
        out_ << "Resolution:     " << id.resolutionSeconds() << " s" << '\n';
    } else {
        out_ << "Time window:    none (random)" << '\n';
    }

    out_ << "Entropy:        " << id.entropyBits() << " bits" << '\n';
    out_ << "Random bits:    " << fmt::format("{:#x}", id.randomBits()) << '\n';
}

void InspectCommand::printJsonInfo(const Tid& id) {
    const VersionSpec& spec = id.spec();

    out_ << "{" << '\n';
    out_ << "  \"tid\": " << id.toJson() << "," << '\n';
    out_ << "  \"integer\": " << id.value() << "," << '\n';
    out_ << "  \"version\": " << static_cast<int>(versionCode(spec.version)) << "," << '\n';
    out_ << "  \"version_name\": \"" << spec.name << "\"," << '\n';
    out_ << "  \"time_bearing\": " << (spec.timeBearing ? "true" : "false") << "," << '\n';
    if (spec.timeBearing) {
        out_ << "  \"earliest_time\": " << id.earliestTime() << "," << '\n';
        out_ << "  \"latest_time\": " << id.latestTime() << "," << '\n';
    } else {
        out_ << "  \"earliest_time\": null," << '\n';
        out_ << "  \"latest_time\": null," << '\n';
    }
    out_ << "  \"resolution_seconds\": " << id.resolutionSeconds() << "," << '\n';
    out_ << "  \"entropy_bits\": " << id.entropyBits() << "," << '\n';
    out_ << "  \"random_bits\": " << id.randomBits() << '\n';
    out_ << "}" << '\n';
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InspectCommand> createInspectCommand(
    const std::string& value,
    bool fromInteger,
    bool jsonOutput) {

    InspectOptions opts;
    opts.value = value;
    opts.fromInteger = fromInteger;
    opts.jsonOutput = jsonOutput;

    return std::make_unique<InspectCommand>(std::move(opts));
}

}  // namespace tid::commands
