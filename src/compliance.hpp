#pragma once

#include "models.hpp"

#include <optional>
#include <string>

namespace spo_sweep {

/// _ComplianceFlags values that mark an item as a locked record.
constexpr int kLockedRecordFlag        = 7;
constexpr int kLockedRecordFlagAlt     = 519;
/// Record whose lock has already been lifted.
constexpr int kUnlockedRecordFlag      = 771;

enum class LockState {
    Locked,      // qualifies for unlock
    NotLocked,   // absent, 0 or a known unlocked value
    Unknown      // any other value; reported, never acted on
};

/// Map an item's compliance flag onto a lock state.
LockState classifyComplianceFlag(const std::optional<int>& flag);

/// True when @p label is present and either no target was configured or
/// the label name starts with @p targetLabel.  Label names may carry a
/// human-readable suffix ("Record (Retain 1yr)"), hence the prefix match.
bool labelQualifies(const std::optional<ComplianceLabel>& label,
                    const std::string& targetLabel);

} // namespace spo_sweep
