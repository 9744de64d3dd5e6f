/// @file test_config.cpp
/// Unit tests for config.hpp — argument parsing, config files, validation.

#include "config.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace spo_sweep;
using std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// Helper: run parseArgs over a list of strings
// ---------------------------------------------------------------------------

static Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "spo_sweep");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parseArgs(static_cast<int>(argv.size()), argv.data());
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("SPO_ACCESS_TOKEN"); }
    void TearDown() override {
        unsetenv("SPO_ACCESS_TOKEN");
        for (const auto& f : mFiles) std::remove(f.c_str());
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = ::testing::TempDir() + name;
        std::ofstream(path) << content;
        mFiles.push_back(path);
        return path;
    }

private:
    std::vector<std::string> mFiles;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, DefaultsAreReportOnlyLabelReset) {
    auto cfg = parse({"--sites", "sites.txt"});

    EXPECT_EQ(cfg.sitesFile, "sites.txt");
    EXPECT_EQ(cfg.mode, SweepMode::LabelReset);
    EXPECT_TRUE(cfg.reportOnly);
    EXPECT_EQ(cfg.targetLabel, "");
    EXPECT_EQ(cfg.maxAttempts, 5);
    EXPECT_EQ(cfg.baseDelay, milliseconds(5000));
    EXPECT_EQ(cfg.pacing.betweenItems, milliseconds(0));
    EXPECT_EQ(cfg.pacing.betweenLists, milliseconds(500));
    EXPECT_EQ(cfg.pacing.betweenSites, milliseconds(2000));
    EXPECT_FALSE(cfg.failOnError);
    EXPECT_EQ(cfg.ignoreLists.count("Style Library"), 1u);
    EXPECT_EQ(cfg.ignoreLists.count("Documents"), 0u);
}

// ============================================================================
// Flags
// ============================================================================

TEST_F(ConfigTest, AllFlagsAreApplied) {
    auto cfg = parse({"--sites", "s.txt", "--mode", "record-unlock", "--apply",
                      "--target-label", "Record", "--ignore-list", "Archive",
                      "--max-attempts", "3", "--base-delay-ms", "100",
                      "--item-delay-ms", "10", "--list-delay-ms", "20",
                      "--site-delay-ms", "30", "--page-size", "200",
                      "--timeout-ms", "1000", "--access-token", "tok",
                      "--log-file", "run.log", "--fail-on-error", "--verbose"});

    EXPECT_EQ(cfg.mode, SweepMode::RecordUnlock);
    EXPECT_FALSE(cfg.reportOnly);
    EXPECT_EQ(cfg.targetLabel, "Record");
    EXPECT_EQ(cfg.ignoreLists.count("Archive"), 1u);
    EXPECT_EQ(cfg.maxAttempts, 3);
    EXPECT_EQ(cfg.baseDelay, milliseconds(100));
    EXPECT_EQ(cfg.pacing.betweenItems, milliseconds(10));
    EXPECT_EQ(cfg.pacing.betweenLists, milliseconds(20));
    EXPECT_EQ(cfg.pacing.betweenSites, milliseconds(30));
    EXPECT_EQ(cfg.pageSize, 200);
    EXPECT_EQ(cfg.timeoutMs, 1000);
    EXPECT_EQ(cfg.accessToken, "tok");
    EXPECT_EQ(cfg.logFile, "run.log");
    EXPECT_TRUE(cfg.failOnError);
    EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, HelpFlagIsRecorded) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-h"}).showHelp);
}

TEST_F(ConfigTest, UnknownArgumentThrows) {
    EXPECT_THROW(parse({"--sites", "s.txt", "--bogus"}), std::invalid_argument);
}

TEST_F(ConfigTest, MalformedNumberThrows) {
    EXPECT_THROW(parse({"--max-attempts", "three"}), std::invalid_argument);
    EXPECT_THROW(parse({"--base-delay-ms", "10ms"}), std::invalid_argument);
}

TEST_F(ConfigTest, UnknownModeThrows) {
    EXPECT_THROW(parse({"--mode", "delete-everything"}), std::invalid_argument);
}

TEST_F(ConfigTest, AccessTokenFallsBackToEnvironment) {
    setenv("SPO_ACCESS_TOKEN", "from-env", 1);
    EXPECT_EQ(parse({"--sites", "s.txt"}).accessToken, "from-env");
    EXPECT_EQ(parse({"--sites", "s.txt", "--access-token", "cli"}).accessToken, "cli");
}

// ============================================================================
// Config file
// ============================================================================

TEST_F(ConfigTest, ConfigFileValuesAreLoaded) {
    auto path = writeFile("spo_sweep_cfg.json", R"({
        "sites_file": "from-file.txt",
        "mode": "record-unlock",
        "apply": true,
        "max_attempts": 7,
        "list_delay_ms": 0,
        "ignore_lists": ["Old Archive"]
    })");

    auto cfg = parse({"--config", path});
    EXPECT_EQ(cfg.sitesFile, "from-file.txt");
    EXPECT_EQ(cfg.mode, SweepMode::RecordUnlock);
    EXPECT_FALSE(cfg.reportOnly);
    EXPECT_EQ(cfg.maxAttempts, 7);
    EXPECT_EQ(cfg.pacing.betweenLists, milliseconds(0));
    EXPECT_EQ(cfg.ignoreLists.count("Old Archive"), 1u);
    EXPECT_EQ(cfg.ignoreLists.count("Style Library"), 1u);
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    auto path = writeFile("spo_sweep_cfg2.json",
                          R"({"sites_file": "a.txt", "max_attempts": 7})");

    auto cfg = parse({"--max-attempts", "2", "--config", path});
    EXPECT_EQ(cfg.sitesFile, "a.txt");
    EXPECT_EQ(cfg.maxAttempts, 2);
}

TEST_F(ConfigTest, MissingConfigFileIsConfigurationError) {
    EXPECT_THROW(parse({"--config", ::testing::TempDir() + "no-such-cfg-91b.json"}),
                 ConfigurationError);
}

TEST_F(ConfigTest, MalformedConfigFileIsConfigurationError) {
    auto bad = writeFile("spo_sweep_bad.json", "{ not json");
    EXPECT_THROW(parse({"--config", bad}), ConfigurationError);

    auto wrongType = writeFile("spo_sweep_bad2.json", R"({"max_attempts": "many"})");
    EXPECT_THROW(parse({"--config", wrongType}), ConfigurationError);
}

// ============================================================================
// validate
// ============================================================================

TEST_F(ConfigTest, ValidateAcceptsDefaultsWithSitesFile) {
    auto cfg = parse({"--sites", "s.txt"});
    EXPECT_NO_THROW(validate(cfg));
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    EXPECT_THROW(validate(parse({})), std::invalid_argument);
    EXPECT_THROW(validate(parse({"--sites", "s", "--max-attempts", "0"})), std::invalid_argument);
    EXPECT_THROW(validate(parse({"--sites", "s", "--list-delay-ms", "-1"})), std::invalid_argument);
    EXPECT_THROW(validate(parse({"--sites", "s", "--page-size", "0"})), std::invalid_argument);
    EXPECT_THROW(validate(parse({"--sites", "s", "--page-size", "5001"})), std::invalid_argument);
    EXPECT_THROW(validate(parse({"--sites", "s", "--timeout-ms", "0"})), std::invalid_argument);
}
