// =============================================================================
// tid - Command Handler Tests
// =============================================================================
// Unit tests for tidtool option validation and command output.
// =============================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "commands/derive_command.h"
#include "commands/failure_report.h"
#include "commands/generate_command.h"
#include "commands/inspect_command.h"
#include "tid/common/logger.h"
#include "tid/core/tid.h"

namespace tid::commands {
namespace {

/// @brief Split command output into lines.
std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        result.push_back(line);
    }
    return result;
}

// =============================================================================
// Output Form Tests
// =============================================================================

TEST(OutputFormTest, FlagSelection) {
    EXPECT_EQ(selectOutputForm(false, false), OutputForm::kGrouped);
    EXPECT_EQ(selectOutputForm(true, false), OutputForm::kCompact);
    EXPECT_EQ(selectOutputForm(false, true), OutputForm::kInteger);
    EXPECT_EQ(selectOutputForm(true, true), OutputForm::kInteger);
}

TEST(OutputFormTest, Render) {
    const Tid id = Tid::fromSeed("foo", "bar");
    EXPECT_EQ(renderTid(id, OutputForm::kGrouped), "11u8-0ugb-7uj28");
    EXPECT_EQ(renderTid(id, OutputForm::kCompact), "11u80ugb7uj28");
    EXPECT_EQ(renderTid(id, OutputForm::kInteger), "4980502661450870528");
}

// =============================================================================
// Generate Command Tests
// =============================================================================

TEST(GenerateOptionsTest, ValidateCount) {
    GenerateOptions opts;
    EXPECT_TRUE(opts.validate().has_value());

    opts.count = 0;
    auto result = opts.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);

    opts.count = kMaxGenerateCount;
    EXPECT_TRUE(opts.validate().has_value());

    opts.count = kMaxGenerateCount + 1;
    EXPECT_FALSE(opts.validate().has_value());
}

TEST(GenerateOptionsTest, ValidateVersion) {
    GenerateOptions opts;
    opts.version = static_cast<Version>(12);
    auto result = opts.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(GenerateCommandTest, PrintsRequestedCount) {
    GenerateOptions opts;
    opts.version = Version::kHours;
    opts.count = 5;

    std::ostringstream out;
    GenerateCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);

    const auto printed = lines(out.str());
    ASSERT_EQ(printed.size(), 5U);
    for (const auto& line : printed) {
        const Tid id = Tid::fromString(line);
        EXPECT_EQ(id.version(), Version::kHours);
    }
}

TEST(GenerateCommandTest, IntegerForm) {
    GenerateOptions opts;
    opts.form = OutputForm::kInteger;

    std::ostringstream out;
    GenerateCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);

    const auto printed = lines(out.str());
    ASSERT_EQ(printed.size(), 1U);
    EXPECT_TRUE(Tid::isValidInteger(std::stoll(printed[0])));
}

TEST(GenerateCommandTest, StdoutHoldsOnlyIdentifiersWhenVerbose) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();

    log::Config config;
    config.level = log::Level::kDebug;
    log::init(config);

    GenerateOptions opts;
    opts.count = 3;
    opts.form = OutputForm::kInteger;
    GenerateCommand cmd(opts, std::cout);
    const int rc = cmd.execute();
    std::cout.flush();
    log::flush();

    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();
    log::shutdown();

    EXPECT_EQ(rc, 0);
    const auto printed = lines(out);
    ASSERT_EQ(printed.size(), 3U);
    for (const auto& line : printed) {
        EXPECT_TRUE(Tid::isValidInteger(std::stoll(line))) << line;
    }
    EXPECT_NE(err.find("Generating 3 identifier(s)"), std::string::npos);
    EXPECT_EQ(out.find("Generating"), std::string::npos);
}

TEST(GenerateCommandTest, InvalidOptionsThrow) {
    GenerateOptions opts;
    opts.count = 0;
    std::ostringstream out;
    GenerateCommand cmd(opts, out);
    EXPECT_THROW((void)cmd.execute(), UsageError);
    EXPECT_TRUE(out.str().empty());
}

TEST(GenerateCommandTest, FactoryParsesVersionName) {
    auto cmd = createGenerateCommand("minutes", 3, true, false);
    EXPECT_EQ(cmd->options().version, Version::kMinutes);
    EXPECT_EQ(cmd->options().count, 3U);
    EXPECT_EQ(cmd->options().form, OutputForm::kCompact);

    EXPECT_THROW((void)createGenerateCommand("9", 1, false, false), InvalidArgumentError);
}

// =============================================================================
// Derive Command Tests
// =============================================================================

TEST(DeriveOptionsTest, SecretSourcesExclusive) {
    DeriveOptions opts;
    opts.seed = "foo";
    EXPECT_TRUE(opts.validate().has_value());

    opts.secret = "bar";
    EXPECT_TRUE(opts.validate().has_value());

    opts.secretEnv = "TID_TEST_SECRET";
    auto result = opts.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);
}

TEST(DeriveCommandTest, Sha256) {
    DeriveOptions opts;
    opts.seed = "foo";

    std::ostringstream out;
    DeriveCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);
    EXPECT_EQ(out.str(), "152v-wtzi-w5eow\n");
}

TEST(DeriveCommandTest, HmacFromOption) {
    DeriveOptions opts;
    opts.seed = "foo";
    opts.secret = "bar";
    opts.form = OutputForm::kInteger;

    std::ostringstream out;
    DeriveCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);
    EXPECT_EQ(out.str(), "4980502661450870528\n");
}

TEST(DeriveCommandTest, HmacFromEnvironment) {
    ASSERT_EQ(::setenv("TID_TEST_DERIVE_SECRET", "bar", 1), 0);

    DeriveOptions opts;
    opts.seed = "foo";
    opts.secretEnv = "TID_TEST_DERIVE_SECRET";

    std::ostringstream out;
    DeriveCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);
    EXPECT_EQ(out.str(), "11u8-0ugb-7uj28\n");

    ::unsetenv("TID_TEST_DERIVE_SECRET");
}

TEST(DeriveCommandTest, UnsetEnvironmentIsUsageError) {
    ::unsetenv("TID_TEST_UNSET_SECRET");

    auto secret = resolveSecretFromEnv("TID_TEST_UNSET_SECRET");
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error().code(), ErrorCode::kUsageError);
    EXPECT_FALSE(resolveSecretFromEnv("").has_value());

    DeriveOptions opts;
    opts.seed = "foo";
    opts.secretEnv = "TID_TEST_UNSET_SECRET";
    std::ostringstream out;
    DeriveCommand cmd(opts, out);
    EXPECT_THROW((void)cmd.execute(), UsageError);
}

TEST(DeriveCommandTest, FactoryDistinguishesEmptySecret) {
    auto withoutSecret = createDeriveCommand("foo", "", false, "", false, false);
    EXPECT_FALSE(withoutSecret->options().secret.has_value());

    auto emptySecret = createDeriveCommand("foo", "", true, "", false, false);
    ASSERT_TRUE(emptySecret->options().secret.has_value());
    EXPECT_TRUE(emptySecret->options().secret->empty());
}

// =============================================================================
// Inspect Command Tests
// =============================================================================

TEST(InspectOptionsTest, EmptyValueRejected) {
    InspectOptions opts;
    auto result = opts.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);
}

TEST(ParseDecimalIntegerTest, Accepts) {
    auto result = parseDecimalInteger("4980502661450870528");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 4980502661450870528LL);

    auto negative = parseDecimalInteger("-1");
    ASSERT_TRUE(negative.has_value());
    EXPECT_EQ(*negative, -1);
}

TEST(ParseDecimalIntegerTest, Rejects) {
    EXPECT_FALSE(parseDecimalInteger("").has_value());
    EXPECT_FALSE(parseDecimalInteger("12ab").has_value());
    EXPECT_FALSE(parseDecimalInteger(" 12").has_value());
    EXPECT_FALSE(parseDecimalInteger("99999999999999999999").has_value());
}

TEST(InspectCommandTest, TextOutput) {
    InspectOptions opts;
    opts.value = "11u8-0ugb-7uj28";

    std::ostringstream out;
    InspectCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("4980502661450870528"), std::string::npos);
    EXPECT_NE(text.find("0 (random)"), std::string::npos);
    EXPECT_NE(text.find("59 bits"), std::string::npos);
}

TEST(InspectCommandTest, JsonOutputFromInteger) {
    InspectOptions opts;
    opts.value = "5407043158477369760";
    opts.fromInteger = true;
    opts.jsonOutput = true;

    std::ostringstream out;
    InspectCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);

    const std::string json = out.str();
    EXPECT_NE(json.find("\"tid\": \"152v-wtzi-w5eow\""), std::string::npos);
    EXPECT_NE(json.find("\"version_name\": \"random\""), std::string::npos);
    EXPECT_NE(json.find("\"earliest_time\": null"), std::string::npos);
}

TEST(InspectCommandTest, TimedVersionShowsWindow) {
    const Tid id = Tid::generate(Version::kDays);

    InspectOptions opts;
    opts.value = id.toString();
    opts.jsonOutput = true;

    std::ostringstream out;
    InspectCommand cmd(opts, out);
    EXPECT_EQ(cmd.execute(), 0);

    const std::string json = out.str();
    EXPECT_NE(json.find("\"earliest_time\": " + std::to_string(id.earliestTime())),
              std::string::npos);
    EXPECT_NE(json.find("\"resolution_seconds\": 262144"), std::string::npos);
}

TEST(InspectCommandTest, InvalidValueThrows) {
    InspectOptions opts;
    opts.value = "a6qz-aw3fi";
    std::ostringstream out;
    InspectCommand bad(opts, out);
    EXPECT_THROW((void)bad.execute(), InvalidArgumentError);

    opts.value = "12ab";
    opts.fromInteger = true;
    InspectCommand notDecimal(opts, out);
    EXPECT_THROW((void)notDecimal.execute(), InvalidArgumentError);
}

// =============================================================================
// Failure Report Tests
// =============================================================================

TEST(FailureReportTest, TidExceptionKeepsItsExitCode) {
    std::ostringstream err;
    EXPECT_EQ(reportFailure("derive", UsageError("Secret environment variable is not set"), err), 1);
    EXPECT_EQ(err.str(),
              "tidtool derive: [usage error] Secret environment variable is not set\n");

    err.str("");
    EXPECT_EQ(reportFailure("inspect", InvalidArgumentError("bad"), err), 2);
}

TEST(FailureReportTest, UnexpectedExceptionIsInternalError) {
    std::ostringstream err;
    const int rc = reportFailure("generate", std::runtime_error("disk on fire"), err);
    EXPECT_EQ(rc, toExitCode(ErrorCode::kInternalError));
    EXPECT_NE(rc, toExitCode(ErrorCode::kUsageError));
    EXPECT_EQ(err.str(), "tidtool generate: unexpected error: disk on fire\n");
}

}  // namespace
}  // namespace tid::commands
