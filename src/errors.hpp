#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace spo_sweep {

/// Input or configuration could not be used.  Fatal before any processing.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Failure reported by a remote call.  Produced by the remote adapters
/// with the HTTP status (0 for transport failures) and the server's
/// Retry-After hint, if it sent one.
class RemoteError : public std::runtime_error {
public:
    RemoteError(unsigned int statusCode,
                const std::string& what,
                std::optional<std::chrono::seconds> retryAfter = std::nullopt);

    unsigned int statusCode() const { return mStatusCode; }
    const std::optional<std::chrono::seconds>& retryAfter() const { return mRetryAfter; }

    /// 429 Too Many Requests or 503 Service Unavailable.
    bool isThrottled() const;

private:
    unsigned int                        mStatusCode;
    std::optional<std::chrono::seconds> mRetryAfter;
};

/// A throttled operation ran out of attempts.
class RetryExhaustedError : public std::runtime_error {
public:
    RetryExhaustedError(const std::string& description,
                        int attempts,
                        unsigned int lastStatus);

    const std::string& description() const { return mDescription; }
    int attempts() const { return mAttempts; }
    unsigned int lastStatus() const { return mLastStatus; }

private:
    std::string  mDescription;
    int          mAttempts;
    unsigned int mLastStatus;
};

/// The label was removed from a list but could not be put back.  The list
/// is left without a label and a later run will not pick it up again.
class PartialMutationError : public std::runtime_error {
public:
    PartialMutationError(const std::string& listTitle,
                         const std::string& labelName,
                         const std::string& cause);

    const std::string& listTitle() const { return mListTitle; }
    const std::string& labelName() const { return mLabelName; }

private:
    std::string mListTitle;
    std::string mLabelName;
};

} // namespace spo_sweep
