#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spo_sweep {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/sites/hr")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Blocking suspension used by the retry policy and the pacer.  Tests
/// substitute a recorder.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Default SleepFn: std::this_thread::sleep_for.
void sleepFor(std::chrono::milliseconds duration);

/// Delay before the next attempt after a throttled failure.
/// A server-supplied retry-after is used verbatim; otherwise
/// baseDelay * 2^(attempt-1), attempt is 1-based.
std::chrono::milliseconds computeRetryDelay(
    int attempt,
    std::chrono::milliseconds baseDelay,
    std::optional<std::chrono::seconds> retryAfter = std::nullopt);

/// Parse a Retry-After header given in delta-seconds.  HTTP-date values
/// and garbage yield nullopt.
std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value);

/// Strip leading / trailing whitespace.
std::string trim(const std::string& s);

/// Read a text file into trimmed, non-empty lines, skipping '#' comments.
/// Order is preserved.  Throws ConfigurationError if the file can't be read.
std::vector<std::string> readLinesFile(const std::string& path);

/// Quote a value for an OData string literal ('it''s').
std::string odataQuote(const std::string& value);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

} // namespace spo_sweep
