#include "config.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace spo_sweep {

namespace {

int parseInt(const std::string& option, const std::string& value) {
    std::size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    return parsed;
}

SweepMode parseMode(const std::string& value) {
    if (value == "label-reset")   return SweepMode::LabelReset;
    if (value == "record-unlock") return SweepMode::RecordUnlock;
    throw std::invalid_argument("Unknown mode: " + value +
                                " (expected label-reset or record-unlock)");
}

} // namespace

const char* sweepModeName(SweepMode mode) {
    return mode == SweepMode::LabelReset ? "label-reset" : "record-unlock";
}

std::set<std::string> defaultIgnoredLists() {
    return {
        "Access Requests",        "App Packages",
        "appdata",                "appfiles",
        "Apps in Testing",        "Cache Profiles",
        "Composed Looks",         "Content and Structure Reports",
        "Content type publishing error log",
        "Converted Forms",        "Device Channels",
        "Form Templates",         "fpdatasources",
        "List Template Gallery",  "Long Running Operation Status",
        "Maintenance Log Library","Master Docs",
        "Master Page Gallery",    "MicroFeed",
        "Preservation Hold Library",
        "Quick Deploy Items",     "Relationships List",
        "Reusable Content",       "Search Config List",
        "Site Assets",            "Site Collection Documents",
        "Site Collection Images", "Site Pages",
        "Solution Gallery",       "Style Library",
        "TaxonomyHiddenList",     "Theme Gallery",
        "User Information List",  "Web Part Gallery",
        "wfpub",                  "wfsvc",
        "Workflow History",       "Workflow Tasks",
    };
}

void printUsage() {
    std::cout
        << "Usage: spo_sweep --sites FILE [options]\n\n"
        << "Options:\n"
        << "  --sites FILE          Text file with one site URL per line\n"
        << "  --mode MODE           label-reset | record-unlock "
           "(default: label-reset)\n"
        << "  --apply               Perform changes (default: report only)\n"
        << "  --target-label NAME   Only act on labels starting with NAME\n"
        << "  --ignore-list TITLE   Skip lists with this title (repeatable)\n"
        << "  --ignore-file FILE    Skip lists named in FILE, one per line\n"
        << "  --max-attempts N      Attempts per throttled call (default: 5)\n"
        << "  --base-delay-ms N     First backoff delay       (default: 5000)\n"
        << "  --item-delay-ms N     Pause between items       (default: 0)\n"
        << "  --list-delay-ms N     Pause between lists       (default: 500)\n"
        << "  --site-delay-ms N     Pause between sites       (default: 2000)\n"
        << "  --page-size N         Items per request page    (default: 500)\n"
        << "  --timeout-ms N        HTTP timeout in ms        (default: 30000)\n"
        << "  --access-token TOKEN  Bearer token (default: $SPO_ACCESS_TOKEN)\n"
        << "  --config FILE         JSON file with any of the settings above\n"
        << "  --log-file FILE       Append log entries to FILE\n"
        << "  --fail-on-error       Exit 2 if any site, list or item failed\n"
        << "  --verbose             Enable verbose diagnostics\n"
        << "  --help, -h            Show this message\n";
}

void loadConfigFile(const std::string& path, Config& cfg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot read config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;

        if (j.contains("sites_file"))    cfg.sitesFile   = j["sites_file"].get<std::string>();
        if (j.contains("mode"))          cfg.mode        = parseMode(j["mode"].get<std::string>());
        if (j.contains("apply"))         cfg.reportOnly  = !j["apply"].get<bool>();
        if (j.contains("target_label"))  cfg.targetLabel = j["target_label"].get<std::string>();
        if (j.contains("ignore_lists")) {
            for (const auto& title : j["ignore_lists"]) {
                cfg.ignoreLists.insert(title.get<std::string>());
            }
        }
        if (j.contains("ignore_file"))   cfg.ignoreFiles.push_back(j["ignore_file"].get<std::string>());
        if (j.contains("max_attempts"))  cfg.maxAttempts = j["max_attempts"].get<int>();
        if (j.contains("base_delay_ms")) cfg.baseDelay   = std::chrono::milliseconds(j["base_delay_ms"].get<int>());
        if (j.contains("item_delay_ms")) cfg.pacing.betweenItems = std::chrono::milliseconds(j["item_delay_ms"].get<int>());
        if (j.contains("list_delay_ms")) cfg.pacing.betweenLists = std::chrono::milliseconds(j["list_delay_ms"].get<int>());
        if (j.contains("site_delay_ms")) cfg.pacing.betweenSites = std::chrono::milliseconds(j["site_delay_ms"].get<int>());
        if (j.contains("page_size"))     cfg.pageSize    = j["page_size"].get<int>();
        if (j.contains("timeout_ms"))    cfg.timeoutMs   = j["timeout_ms"].get<int>();
        if (j.contains("log_file"))      cfg.logFile     = j["log_file"].get<std::string>();
        if (j.contains("verbose"))       cfg.verbose     = j["verbose"].get<bool>();
        if (j.contains("fail_on_error")) cfg.failOnError = j["fail_on_error"].get<bool>();

    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what());
    }
}

Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    // --config is applied before everything else so flags override it.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            loadConfigFile(argv[i + 1], cfg);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--sites" && hasValue) {
            cfg.sitesFile = argv[++i];
        } else if (arg == "--mode" && hasValue) {
            cfg.mode = parseMode(argv[++i]);
        } else if (arg == "--apply") {
            cfg.reportOnly = false;
        } else if (arg == "--target-label" && hasValue) {
            cfg.targetLabel = argv[++i];
        } else if (arg == "--ignore-list" && hasValue) {
            cfg.ignoreLists.insert(argv[++i]);
        } else if (arg == "--ignore-file" && hasValue) {
            cfg.ignoreFiles.push_back(argv[++i]);
        } else if (arg == "--max-attempts" && hasValue) {
            cfg.maxAttempts = parseInt(arg, argv[++i]);
        } else if (arg == "--base-delay-ms" && hasValue) {
            cfg.baseDelay = std::chrono::milliseconds(parseInt(arg, argv[++i]));
        } else if (arg == "--item-delay-ms" && hasValue) {
            cfg.pacing.betweenItems = std::chrono::milliseconds(parseInt(arg, argv[++i]));
        } else if (arg == "--list-delay-ms" && hasValue) {
            cfg.pacing.betweenLists = std::chrono::milliseconds(parseInt(arg, argv[++i]));
        } else if (arg == "--site-delay-ms" && hasValue) {
            cfg.pacing.betweenSites = std::chrono::milliseconds(parseInt(arg, argv[++i]));
        } else if (arg == "--page-size" && hasValue) {
            cfg.pageSize = parseInt(arg, argv[++i]);
        } else if (arg == "--timeout-ms" && hasValue) {
            cfg.timeoutMs = parseInt(arg, argv[++i]);
        } else if (arg == "--access-token" && hasValue) {
            cfg.accessToken = argv[++i];
        } else if (arg == "--config" && hasValue) {
            ++i;  // already applied
        } else if (arg == "--log-file" && hasValue) {
            cfg.logFile = argv[++i];
        } else if (arg == "--fail-on-error") {
            cfg.failOnError = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (cfg.accessToken.empty()) {
        if (const char* token = std::getenv("SPO_ACCESS_TOKEN")) {
            cfg.accessToken = token;
        }
    }
    return cfg;
}

void validate(const Config& cfg) {
    if (cfg.sitesFile.empty()) {
        throw std::invalid_argument("--sites is required");
    }
    if (cfg.maxAttempts < 1) {
        throw std::invalid_argument("--max-attempts must be at least 1");
    }
    if (cfg.baseDelay.count() < 0 ||
        cfg.pacing.betweenItems.count() < 0 ||
        cfg.pacing.betweenLists.count() < 0 ||
        cfg.pacing.betweenSites.count() < 0) {
        throw std::invalid_argument("Delays must not be negative");
    }
    if (cfg.pageSize < 1 || cfg.pageSize > 5000) {
        throw std::invalid_argument("--page-size must be between 1 and 5000");
    }
    if (cfg.timeoutMs < 1) {
        throw std::invalid_argument("--timeout-ms must be positive");
    }
}

} // namespace spo_sweep
