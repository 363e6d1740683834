// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <filesystem>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "common/cli.hpp"
#include "common/utils.hpp"

#include "common/gtest_utils.hpp"

using namespace std::literals;

namespace {

constexpr std::string_view secret_document = "host = \"h\"\npassword = \"hunter2\"\n";
constexpr std::string_view redacted_document = "host = \"h\"\npassword = \"***REDACTED***\"\n";
constexpr std::string_view clean_document = "host = \"h\"\nport = 5432\n";

cli_arguments parse(std::initializer_list<std::string_view> arguments)
{
    std::vector<std::string> storage{"confscrub"};
    storage.insert(storage.end(), arguments.begin(), arguments.end());

    std::vector<const char *> argv;
    argv.reserve(storage.size());
    for (const auto &arg : storage) { argv.emplace_back(arg.c_str()); }

    return parse_args(static_cast<int>(argv.size()), argv.data());
}

class TestCli : public ::testing::Test {
public:
    void SetUp() override
    {
        directory_ = std::filesystem::temp_directory_path() /
                     ("confscrub_cli_" + std::string{::testing::UnitTest::GetInstance()
                                                         ->current_test_info()
                                                         ->name()});
        std::filesystem::remove_all(directory_);
        std::filesystem::create_directories(directory_);
    }

    void TearDown() override { std::filesystem::remove_all(directory_); }

    std::string make_file(std::string_view name, std::string_view contents)
    {
        auto path = (directory_ / name).string();
        write_file(path, contents);
        return path;
    }

    std::string path_of(std::string_view name) { return (directory_ / name).string(); }

    int run_cli(std::initializer_list<std::string_view> arguments)
    {
        out_.str({});
        err_.str({});
        return run("confscrub", parse(arguments), out_, err_);
    }

protected:
    std::filesystem::path directory_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST(TestCliArguments, ShortAndLongOptions)
{
    auto args = parse({"-o", "out.toml", "--redaction-text", "x", "-i", "a.toml", "b.toml"});

    EXPECT_THAT(args["--output"], ::testing::ElementsAre("out.toml"));
    EXPECT_THAT(args["--redaction-text"], ::testing::ElementsAre("x"));
    EXPECT_TRUE(args.contains("--in-place"));
    EXPECT_THAT(args["--input"], ::testing::ElementsAre("a.toml", "b.toml"));
    EXPECT_FALSE(args.contains("--unknown"));
}

TEST(TestCliArguments, UnknownOption)
{
    auto args = parse({"--frobnicate", "a.toml"});
    EXPECT_THAT(args["--unknown"], ::testing::ElementsAre("--frobnicate"));
    EXPECT_THAT(args["--input"], ::testing::ElementsAre("a.toml"));
}

TEST(TestCliArguments, TrailingOptionWithoutValue)
{
    auto args = parse({"a.toml", "-o"});
    EXPECT_THAT(args["--missing-value"], ::testing::ElementsAre("-o"));
    EXPECT_TRUE(args["--output"].empty());
}

TEST_F(TestCli, TrailingOptionWithoutValueIsUsageError)
{
    auto input = make_file("app.toml", secret_document);

    EXPECT_EQ(run_cli({input, "-o"}), exit_error);
    EXPECT_THAT(err_.str(), ::testing::HasSubstr("Missing value for option: -o"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(TestCli, Usage)
{
    EXPECT_EQ(run_cli({"--help"}), exit_clean);
    EXPECT_THAT(err_.str(), ::testing::HasSubstr("Usage: confscrub"));

    EXPECT_EQ(run_cli({}), exit_error);
    EXPECT_EQ(run_cli({"--frobnicate", "a.toml"}), exit_error);
    EXPECT_EQ(run_cli({"--help", "--frobnicate"}), exit_error);
}

TEST_F(TestCli, ExitStatusWithoutFindings)
{
    auto input = make_file("app.toml", clean_document);

    EXPECT_EQ(run_cli({input}), exit_clean);
    EXPECT_STR(out_.str(), clean_document);
}

TEST_F(TestCli, ExitStatusWithFindings)
{
    auto clean = make_file("clean.toml", clean_document);
    auto secret = make_file("secret.toml", secret_document);

    EXPECT_EQ(run_cli({clean, secret}), exit_findings);
    EXPECT_STR(out_.str(), std::string{clean_document} + std::string{redacted_document});
}

TEST_F(TestCli, ErrorsWinOverFindings)
{
    auto secret = make_file("secret.toml", secret_document);
    auto missing = path_of("missing.toml");

    EXPECT_EQ(run_cli({secret, missing}), exit_error);
    EXPECT_THAT(err_.str(), ::testing::HasSubstr(missing));

    EXPECT_EQ(run_cli({missing, secret}), exit_error);
    // The remaining inputs are still processed
    EXPECT_STR(out_.str(), redacted_document);
}

TEST_F(TestCli, InPlaceWithBackup)
{
    auto input = make_file("app.toml", secret_document);

    EXPECT_EQ(run_cli({"-i", "-b", input}), exit_findings);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_STR(read_file(input + ".bak"), secret_document);
    EXPECT_STR(read_file(input), redacted_document);

    // A second pass backs up the already redacted file
    EXPECT_EQ(run_cli({"--in-place", "--backup", "--backup-suffix", ".orig", input}),
        exit_findings);
    EXPECT_STR(read_file(input + ".orig"), redacted_document);
    EXPECT_STR(read_file(input + ".bak"), secret_document);
}

TEST_F(TestCli, InPlaceWithoutBackup)
{
    auto input = make_file("app.toml", secret_document);

    EXPECT_EQ(run_cli({"--in-place", input}), exit_findings);
    EXPECT_STR(read_file(input), redacted_document);
    EXPECT_FALSE(std::filesystem::exists(input + ".bak"));
}

TEST_F(TestCli, OutputFile)
{
    auto input = make_file("app.toml", secret_document);
    auto output = path_of("redacted.toml");

    EXPECT_EQ(run_cli({input, "--output", output}), exit_findings);
    EXPECT_STR(read_file(output), redacted_document);
    EXPECT_STR(read_file(input), secret_document);
}

TEST_F(TestCli, ConflictingOutputs)
{
    auto first = make_file("first.toml", secret_document);
    auto second = make_file("second.toml", clean_document);
    auto output = path_of("redacted.toml");

    EXPECT_EQ(run_cli({first, second, "-o", output}), exit_error);
    EXPECT_EQ(run_cli({first, "-i", "-o", output}), exit_error);
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_STR(read_file(first), secret_document);
}

TEST_F(TestCli, CheckReport)
{
    auto input = make_file("app.toml", "[auth]\npassword = \"hunter2\"\n");

    EXPECT_EQ(run_cli({"--check", input}), exit_findings);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_THAT(err_.str(), ::testing::HasSubstr(input + ":2: [auth] password (key_name: password)"));
}

TEST_F(TestCli, JsonReport)
{
    auto input = make_file("app.toml", secret_document);

    EXPECT_EQ(run_cli({"--format", "json", input}), exit_findings);
    EXPECT_THAT(out_.str(), ::testing::HasSubstr(R"("key": "password")"));
    EXPECT_THAT(out_.str(), ::testing::HasSubstr(R"("line": 2)"));
    EXPECT_THAT(out_.str(), ::testing::Not(::testing::HasSubstr("hunter2")));
}

TEST_F(TestCli, YamlReport)
{
    auto input = make_file("app.toml", secret_document);

    EXPECT_EQ(run_cli({"--format", "yaml", input}), exit_findings);

    auto report = YAML::Load(out_.str());
    ASSERT_TRUE(report.IsSequence());
    ASSERT_EQ(report.size(), 1);
    EXPECT_EQ(report[0]["file"].as<std::string>(), input);
    EXPECT_EQ(report[0]["findings"][0]["key"].as<std::string>(), "password");
    EXPECT_EQ(report[0]["findings"][0]["line"].as<unsigned>(), 2);
}

TEST_F(TestCli, UnknownFormat)
{
    auto input = make_file("app.toml", secret_document);
    EXPECT_EQ(run_cli({"--format", "xml", input}), exit_error);
}

TEST_F(TestCli, InvalidConfiguration)
{
    auto input = make_file("app.toml", secret_document);
    EXPECT_EQ(run_cli({"-r", "", input}), exit_error);
    EXPECT_THAT(err_.str(), ::testing::HasSubstr("Invalid configuration"));

    auto config = make_file("bad.yaml", "check_values: maybe\n");
    EXPECT_EQ(run_cli({"-c", config, input}), exit_error);
    EXPECT_THAT(err_.str(), ::testing::HasSubstr("Failed to load configuration"));
}

TEST_F(TestCli, ConfigFileWithOverrides)
{
    auto input = make_file("app.toml", "session = \"eyJhbGciOi\"\ninternal_host = \"h\"\n");
    auto config = make_file("scrub.yaml", R"(redaction_text: "<hidden>"
check_values: false
patterns:
  key: ^internal_
)");

    EXPECT_EQ(run_cli({"-c", config, input}), exit_findings);
    EXPECT_STR(out_.str(), "session = \"eyJhbGciOi\"\ninternal_host = \"<hidden>\"\n");

    EXPECT_EQ(run_cli({"-c", config, "-r", "[x]", input}), exit_findings);
    EXPECT_STR(out_.str(), "session = \"eyJhbGciOi\"\ninternal_host = \"[x]\"\n");
}

} // namespace
