#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace spo_sweep {

enum class LogLevel { Verbose, Info, Warning, Error };

const char* logLevelName(LogLevel level);

/// Destination for log entries.  Implementations must not throw; the
/// Logger still guards against it.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string& message) = 0;
};

/// Writes to std::cerr.  Verbose entries are dropped unless enabled.
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(bool verbose = false) : mVerbose(verbose) {}

    void write(LogLevel level, const std::string& message) override;

private:
    bool mVerbose;
};

/// Appends timestamped entries to a file.  A file that cannot be opened or
/// written is reported once on std::cerr and then ignored.
class FileLogSink : public LogSink {
public:
    explicit FileLogSink(const std::string& path);

    void write(LogLevel level, const std::string& message) override;

    bool isOpen() const { return mStream.is_open() && !mFailed; }

private:
    std::string   mPath;
    std::ofstream mStream;
    bool          mFailed = false;

    void reportFailure(const std::string& reason);
};

/// Fans entries out to every registered sink.
class Logger {
public:
    void addSink(std::shared_ptr<LogSink> sink);

    void log(LogLevel level, const std::string& message) noexcept;

    void verbose(const std::string& message) noexcept { log(LogLevel::Verbose, message); }
    void info(const std::string& message)    noexcept { log(LogLevel::Info, message); }
    void warn(const std::string& message)    noexcept { log(LogLevel::Warning, message); }
    void error(const std::string& message)   noexcept { log(LogLevel::Error, message); }

private:
    std::vector<std::shared_ptr<LogSink>> mSinks;
};

} // namespace spo_sweep
