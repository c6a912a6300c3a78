#pragma once

#include "causal/Event.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace causal {

enum class AuditKind {
    AdmissionRejected = 1,
    OrderingRejected = 2,
    PolicyRejected = 3,
    ThresholdUnmet = 4,
    GovernanceRejected = 5,
};

inline const char* ToString(AuditKind kind) {
    switch (kind) {
    case AuditKind::AdmissionRejected:
        return "admission-rejected";
    case AuditKind::OrderingRejected:
        return "ordering-rejected";
    case AuditKind::PolicyRejected:
        return "policy-rejected";
    case AuditKind::ThresholdUnmet:
        return "threshold-unmet";
    case AuditKind::GovernanceRejected:
        return "governance-rejected";
    }

    return "unknown";
}

// Side record of an attempt that did not (or not fully) succeed. Audit records
// never enter a causal chain.
struct AuditRecord {
    uint64_t timestampMs = 0;
    std::string agentId;
    std::optional<ActionId> actionId;
    AuditKind kind = AuditKind::PolicyRejected;
    std::string reason;
};

} // namespace causal
