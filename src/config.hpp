#pragma once

#include "rate_limiter.hpp"

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace spo_sweep {

enum class SweepMode { LabelReset, RecordUnlock };

const char* sweepModeName(SweepMode mode);

/// Titles of system libraries that are never swept.
std::set<std::string> defaultIgnoredLists();

/// Run configuration.  Built once at startup and passed by const reference
/// to the components that need it.
struct Config {
    std::string sitesFile;
    SweepMode   mode         = SweepMode::LabelReset;
    bool        reportOnly   = true;
    std::string targetLabel;

    std::set<std::string>    ignoreLists = defaultIgnoredLists();
    std::vector<std::string> ignoreFiles;

    int                       maxAttempts = 5;
    std::chrono::milliseconds baseDelay{5000};
    PacingConfig              pacing{std::chrono::milliseconds(0),
                                     std::chrono::milliseconds(500),
                                     std::chrono::milliseconds(2000)};

    int         pageSize    = 500;
    int         timeoutMs   = 30000;
    std::string accessToken;
    std::string logFile;
    bool        verbose     = false;
    bool        failOnError = false;
    bool        showHelp    = false;
};

/// Print the option reference.
void printUsage();

/// Parse command-line arguments.  Values from --config are applied first,
/// flags given on the command line win.  The access token falls back to
/// the SPO_ACCESS_TOKEN environment variable.
/// Throws std::invalid_argument on unknown or malformed options and
/// ConfigurationError when --config can't be loaded.
Config parseArgs(int argc, char* argv[]);

/// Merge settings from a JSON config file into @p cfg.
/// Throws ConfigurationError if the file is missing or malformed.
void loadConfigFile(const std::string& path, Config& cfg);

/// Reject values the sweep can't run with.  Throws std::invalid_argument.
void validate(const Config& cfg);

} // namespace spo_sweep
