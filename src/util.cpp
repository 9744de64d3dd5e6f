#include "util.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace spo_sweep {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

void sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::chrono::milliseconds computeRetryDelay(
    int attempt,
    std::chrono::milliseconds baseDelay,
    std::optional<std::chrono::seconds> retryAfter)
{
    if (retryAfter.has_value()) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(*retryAfter);
    }

    // Exponential: base * 2^(attempt-1).  Shift is capped so a runaway
    // attempt count can't overflow.
    const int shift = std::clamp(attempt - 1, 0, 20);
    return baseDelay * (int64_t{1} << shift);
}

std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value) {
    const std::string v = trim(value);
    if (v.empty() || v.size() > 9) return std::nullopt;
    if (!std::all_of(v.begin(), v.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::stol(v));
}

std::string trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end   = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::vector<std::string> readLinesFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot read file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        std::string value = trim(line);
        if (value.empty() || value.front() == '#') continue;
        lines.push_back(std::move(value));
    }

    if (in.bad()) {
        throw ConfigurationError("I/O error while reading: " + path);
    }
    return lines;
}

std::string odataQuote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

} // namespace spo_sweep
