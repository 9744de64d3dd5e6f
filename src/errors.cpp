#include "errors.hpp"

namespace spo_sweep {

RemoteError::RemoteError(unsigned int statusCode,
                         const std::string& what,
                         std::optional<std::chrono::seconds> retryAfter)
    : std::runtime_error(what)
    , mStatusCode(statusCode)
    , mRetryAfter(retryAfter) {}

bool RemoteError::isThrottled() const {
    return mStatusCode == 429 || mStatusCode == 503;
}

RetryExhaustedError::RetryExhaustedError(const std::string& description,
                                         int attempts,
                                         unsigned int lastStatus)
    : std::runtime_error("Max retries exceeded for '" + description +
                         "' after " + std::to_string(attempts) +
                         " attempts.  Last HTTP status: " +
                         std::to_string(lastStatus))
    , mDescription(description)
    , mAttempts(attempts)
    , mLastStatus(lastStatus) {}

PartialMutationError::PartialMutationError(const std::string& listTitle,
                                           const std::string& labelName,
                                           const std::string& cause)
    : std::runtime_error("Label '" + labelName + "' was reset on list '" +
                         listTitle + "' but could not be reapplied: " + cause)
    , mListTitle(listTitle)
    , mLabelName(labelName) {}

} // namespace spo_sweep
