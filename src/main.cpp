// =============================================================================
// tidtool - Tid Identifier Tool
// =============================================================================
// Main entry point for the tidtool command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: generate, derive, inspect
// - Global options: verbose, quiet, log-level, log-file
// - Exit codes taken from tid::ErrorCode
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "tid/common/error.h"
#include "tid/common/logger.h"
#include "tid/common/types.h"

// Command implementations
#include "commands/derive_command.h"
#include "commands/failure_report.h"
#include "commands/generate_command.h"
#include "commands/inspect_command.h"

// Forward declarations for command handlers
namespace tid::commands {
int runGenerate(CLI::App* app);
int runDerive(CLI::App* app);
int runInspect(CLI::App* app);
}  // namespace tid::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "tidtool: generate and inspect Tids\n"
    "Tids are 63-bit integers rendered as dash-grouped base-36 strings.\n"
    "Versions 1-5 embed a truncated timestamp and sort by creation time;\n"
    "version 0 is fully random or derived from a seed.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;    // 0 = --log-level, 1+ = debug
    bool quiet = false;
    std::string logLevel = "warning";
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    std::string version = "0";  // Name or code
    std::uint32_t count = 1;
    bool compact = false;
    bool integer = false;
};

CliGenerateOptions gGenerateOpts;

// =============================================================================
// Derive Command Options
// =============================================================================

struct CliDeriveOptions {
    std::string seed;
    std::string secret;
    std::string secretEnv;
    bool compact = false;
    bool integer = false;
};

CliDeriveOptions gDeriveOpts;

// =============================================================================
// Inspect Command Options
// =============================================================================

struct CliInspectOptions {
    std::string value;
    bool fromInteger = false;
    bool json = false;
};

CliInspectOptions gInspectOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Generate new Tids");
    generate->alias("g");

    generate->add_option("-t,--tid-version", gGenerateOpts.version,
                         "Version: 0-5 or random, seconds, minutes, hours, days, weeks")
        ->default_val("0");

    generate->add_option("-n,--count", gGenerateOpts.count, "Number of Tids to print")
        ->default_val(1)
        ->check(CLI::Range(1U, tid::commands::kMaxGenerateCount));

    generate->add_flag("--compact", gGenerateOpts.compact, "Print without dashes");

    generate->add_flag("--int", gGenerateOpts.integer, "Print as decimal integers");
}

void setupDeriveCommand(CLI::App& app) {
    auto* derive = app.add_subcommand("derive", "Derive a version 0 Tid from a seed");
    derive->alias("d");

    derive->add_option("-s,--seed", gDeriveOpts.seed, "Seed text")->required();

    auto* secret = derive->add_option("--secret", gDeriveOpts.secret,
                                      "HMAC-SHA256 key (visible in process listings)");

    auto* secretEnv = derive->add_option("--secret-env", gDeriveOpts.secretEnv,
                                         "Environment variable holding the HMAC-SHA256 key");
    secret->excludes(secretEnv);

    derive->add_flag("--compact", gDeriveOpts.compact, "Print without dashes");

    derive->add_flag("--int", gDeriveOpts.integer, "Print as a decimal integer");
}

void setupInspectCommand(CLI::App& app) {
    auto* inspect = app.add_subcommand("inspect", "Validate a Tid and display its fields");
    inspect->alias("i");

    inspect->add_option("value", gInspectOpts.value, "Tid string (or integer with --from-int)")
        ->required();

    inspect->add_flag("--from-int", gInspectOpts.fromInteger, "Value is a decimal integer");

    inspect->add_flag("--json", gInspectOpts.json, "Output as JSON");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Enable debug logging");

    app.add_flag("-q,--quiet", gOptions.quiet, "Log errors only");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->default_val("warning")
        ->check([](const std::string& name) -> std::string {
            return tid::log::levelFromString(name) ? std::string{}
                                                   : "unknown log level '" + name + "'";
        });

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupGenerateCommand(app);
    setupDeriveCommand(app);
    setupInspectCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments; CLI11's own codes are folded into kUsageError
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? EXIT_SUCCESS : tid::toExitCode(tid::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        tid::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.loggerName = "tidtool";
        logConfig.level = tid::log::levelFromString(gOptions.logLevel)
                              .value_or(tid::log::Level::kWarning);
        if (gOptions.quiet) {
            logConfig.level = tid::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = tid::log::Level::kDebug;
        }
        tid::log::init(logConfig);
        TID_LOG_DEBUG("tidtool {} starting, log level {}", kVersion,
                      tid::log::levelToString(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return tid::toExitCode(tid::ErrorCode::kInternalError);
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    if (app.got_subcommand("generate")) {
        exitCode = tid::commands::runGenerate(app.get_subcommand("generate"));
    } else if (app.got_subcommand("derive")) {
        exitCode = tid::commands::runDerive(app.get_subcommand("derive"));
    } else if (app.got_subcommand("inspect")) {
        exitCode = tid::commands::runInspect(app.get_subcommand("inspect"));
    }

    tid::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace tid::commands {

int runGenerate([[maybe_unused]] CLI::App* app) {
    try {
        auto cmd = createGenerateCommand(
            gGenerateOpts.version,
            gGenerateOpts.count,
            gGenerateOpts.compact,
            gGenerateOpts.integer
        );
        return cmd->execute();
    } catch (const TidException& e) {
        return reportFailure("generate", e);
    } catch (const std::exception& e) {
        return reportFailure("generate", e);
    }
}

int runDerive(CLI::App* app) {
    try {
        auto cmd = createDeriveCommand(
            gDeriveOpts.seed,
            gDeriveOpts.secret,
            app->count("--secret") > 0,
            gDeriveOpts.secretEnv,
            gDeriveOpts.compact,
            gDeriveOpts.integer
        );
        return cmd->execute();
    } catch (const TidException& e) {
        return reportFailure("derive", e);
    } catch (const std::exception& e) {
        return reportFailure("derive", e);
    }
}

int runInspect([[maybe_unused]] CLI::App* app) {
    try {
        auto cmd = createInspectCommand(
            gInspectOpts.value,
            gInspectOpts.fromInteger,
            gInspectOpts.json
        );
        return cmd->execute();
    } catch (const TidException& e) {
        return reportFailure("inspect", e);
    } catch (const std::exception& e) {
        return reportFailure("inspect", e);
    }
}

}  // namespace tid::commands
