#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>

namespace spo_sweep {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Verbose: return "VERBOSE";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

// ---------------------------------------------------------------------------
// Console
// ---------------------------------------------------------------------------

void ConsoleLogSink::write(LogLevel level, const std::string& message) {
    if (level == LogLevel::Verbose && !mVerbose) return;

    if (level == LogLevel::Info) {
        std::cerr << message << "\n";
    } else {
        std::cerr << logLevelName(level) << ": " << message << "\n";
    }
}

// ---------------------------------------------------------------------------
// File
// ---------------------------------------------------------------------------

FileLogSink::FileLogSink(const std::string& path)
    : mPath(path)
{
    mStream.open(path, std::ios::out | std::ios::app);
    if (!mStream.is_open()) {
        reportFailure("cannot open file");
    }
}

void FileLogSink::write(LogLevel level, const std::string& message) {
    if (mFailed) return;

    const auto now  = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    mStream << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ["
            << logLevelName(level) << "] " << message << "\n";
    mStream.flush();

    if (!mStream) {
        reportFailure("write failed");
    }
}

void FileLogSink::reportFailure(const std::string& reason) {
    mFailed = true;
    std::cerr << "WARN: [Log] " << reason << " for " << mPath
              << "; file logging disabled\n";
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

void Logger::addSink(std::shared_ptr<LogSink> sink) {
    if (sink) mSinks.push_back(std::move(sink));
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    for (const auto& sink : mSinks) {
        try {
            sink->write(level, message);
        } catch (const std::exception& e) {
            std::cerr << "WARN: [Log] sink failed: " << e.what() << "\n";
        }
    }
}

} // namespace spo_sweep
