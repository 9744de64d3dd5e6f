#include "compliance.hpp"

namespace spo_sweep {

LockState classifyComplianceFlag(const std::optional<int>& flag) {
    if (!flag.has_value()) return LockState::NotLocked;

    switch (*flag) {
        case kLockedRecordFlag:
        case kLockedRecordFlagAlt:
            return LockState::Locked;
        case 0:
        case kUnlockedRecordFlag:
            return LockState::NotLocked;
        default:
            return LockState::Unknown;
    }
}

bool labelQualifies(const std::optional<ComplianceLabel>& label,
                    const std::string& targetLabel) {
    if (!label.has_value() || label->name.empty()) return false;
    if (targetLabel.empty()) return true;
    return label->name.compare(0, targetLabel.size(), targetLabel) == 0;
}

} // namespace spo_sweep
