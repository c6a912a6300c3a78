#include "runtime/Governance.hpp"

#include "Database.hpp"
#include "causal/CausalEventLogger.hpp"
#include "causal/EventStore.hpp"
#include "policy/PolicyLoader.hpp"

#include "easylogging++.h"

#include <algorithm>

namespace runtime {

Governance::Governance(const causal::Digest& governorKeyDigest, causal::CausalEventLogger& logger,
    causal::EventStore& store, KeyRootRegistry& keyRoots, PolicyRegistry& policies)
    : governorKeyDigest_{governorKeyDigest}
    , logger_{logger}
    , store_{store}
    , keyRoots_{keyRoots}
    , policies_{policies} {}

GovernanceResult Governance::UpdateKeyRoot(const std::string& credential, const causal::Digest& newRoot, uint64_t nowMs) {
    std::lock_guard<std::mutex> lock{mutex_};

    if (!Authenticate(credential)) {
        return Refuse(GovernanceStatus::Unauthorized, "key root update with invalid credential", nowMs);
    }
    if (causal::IsZero(newRoot)) {
        return Refuse(GovernanceStatus::Invalid, "key root must be non-zero", nowMs);
    }

    auto result = Record("key_root:" + causal::ToHex(newRoot), nowMs);
    if (result.Applied()) {
        keyRoots_.Replace(newRoot);
        LOG(INFO) << "Aggregate key root rotated to " << causal::ToHex(newRoot);
    }
    return result;
}

GovernanceResult Governance::ReplacePolicy(const std::string& credential, policy::Policy next, uint64_t nowMs) {
    std::lock_guard<std::mutex> lock{mutex_};

    if (!Authenticate(credential)) {
        return Refuse(GovernanceStatus::Unauthorized, "policy replacement with invalid credential", nowMs);
    }
    if (next.escalation.mediumAtOrAbove > next.escalation.highAtOrAbove) {
        return Refuse(GovernanceStatus::Invalid, "medium breakpoint above high breakpoint", nowMs);
    }

    std::string payload = "policy:" + next.name;
    for (const auto& condition : next.conditions) {
        payload += ";" + policy::FormatCondition(condition);
    }

    auto result = Record(payload, nowMs);
    if (result.Applied()) {
        LOG(INFO) << "Policy '" << next.name << "' installed with " << next.conditions.size() << " conditions";
        policies_.Replace(std::make_shared<const policy::Policy>(std::move(next)));
    }
    return result;
}

bool Governance::Authenticate(const std::string& credential) const {
    if (causal::IsZero(governorKeyDigest_)) {
        return false;
    }

    const auto digest = causal::HashBytes(reinterpret_cast<const uint8_t*>(credential.data()), credential.size());
    return causal::DigestEquals(digest, governorKeyDigest_);
}

GovernanceResult Governance::Refuse(GovernanceStatus status, const std::string& reason, uint64_t nowMs) {
    LOG(WARNING) << "Governance request refused: " << reason;

    GovernanceResult result;
    result.status = status;
    result.reason = reason;

    causal::AuditRecord record;
    record.timestampMs = nowMs;
    record.agentId = kAgentId;
    record.kind = causal::AuditKind::GovernanceRejected;
    record.reason = reason;
    try {
        store_.RecordAudit(record);
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Failed to persist governance audit record: " << e.what();
        result.status = GovernanceStatus::LogFailed;
    }
    return result;
}

GovernanceResult Governance::Record(const std::string& payload, uint64_t nowMs) {
    causal::Proposal proposal;
    proposal.agentId = kAgentId;
    proposal.type = causal::ActionType::GovernanceUpdate;
    proposal.payload.assign(payload.begin(), payload.end());
    proposal.nonce = 1;
    proposal.timestampMs = nowMs;

    if (auto tail = store_.Tail(kScope)) {
        proposal.nonce = tail->nonce + 1;
        proposal.timestampMs = std::max(nowMs, tail->timestampMs);
    }

    GovernanceResult result;
    try {
        auto receipt = logger_.Log(proposal, kScope);
        result.status = GovernanceStatus::Applied;
        result.actionId = receipt.actionId;
    } catch (const causal::LogException& e) {
        LOG(ERROR) << "Governance update could not be logged: " << e.what();
        result.status = GovernanceStatus::LogFailed;
        result.reason = e.what();
    }
    return result;
}

} // namespace runtime
