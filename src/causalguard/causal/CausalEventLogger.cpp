#include "causal/CausalEventLogger.hpp"

#include "Database.hpp"

#include "easylogging++.h"

namespace causal {

const char* ToString(LogError error) {
    switch (error) {
    case LogError::PayloadTooLarge:
        return "payload-too-large";
    case LogError::InvalidProposal:
        return "invalid-proposal";
    case LogError::OrderingViolation:
        return "ordering-violation";
    case LogError::StoreUnavailable:
        return "store-unavailable";
    }

    return "unknown";
}

CausalEventLogger::CausalEventLogger(EventStore& store, LoggerOptions options)
    : store_{store}
    , options_{options} {
    RebuildIndex();
}

LogReceipt CausalEventLogger::Log(const Proposal& proposal) { return Log(proposal, ScopeFor(proposal.agentId)); }

LogReceipt CausalEventLogger::Log(const Proposal& proposal, const std::string& scope) {
    if (proposal.agentId.empty() || proposal.agentId.size() > kMaxAgentIdBytes) {
        throw LogException(LogError::InvalidProposal, "agent id must be 1-256 bytes");
    }

    if (proposal.payload.size() > options_.maxPayloadBytes) {
        throw LogException(LogError::PayloadTooLarge,
            "payload of " + std::to_string(proposal.payload.size()) + " bytes exceeds limit of "
                + std::to_string(options_.maxPayloadBytes));
    }

    auto candidate = MakeCandidate(proposal);

    LogReceipt receipt;
    receipt.actionId = candidate.actionId;
    receipt.scope = scope;

    std::lock_guard<std::mutex> scopeLock{ScopeMutex(receipt.scope)};

    {
        std::lock_guard<std::mutex> indexLock{indexMutex_};
        auto existing = index_.find(candidate.actionId);
        if (existing != index_.end()) {
            auto stored = store_.EventAt(existing->second.scope, existing->second.position);
            if (!stored) {
                throw LogException(LogError::StoreUnavailable, "indexed event missing from store");
            }
            receipt.duplicate = true;
            receipt.scope = existing->second.scope;
            receipt.event = *stored;
            return receipt;
        }
    }

    const auto tail = store_.Tail(receipt.scope);
    const Event* previous = tail ? &*tail : nullptr;

    auto ordering = CheckNonce(previous, candidate);
    if (ordering.Ok()) {
        ordering = CheckTimestamp(previous, candidate, options_.skewToleranceMs);
    }
    if (!ordering.Ok()) {
        LOG(WARNING) << "Refusing out-of-order proposal " << ToHex(candidate.actionId) << " from "
                     << proposal.agentId << ": " << ordering.reason;

        AuditRecord record;
        record.timestampMs = proposal.timestampMs;
        record.agentId = proposal.agentId;
        record.actionId = candidate.actionId;
        record.kind = AuditKind::OrderingRejected;
        record.reason = ordering.reason;
        try {
            store_.RecordAudit(record);
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "Failed to persist audit record: " << e.what();
            throw LogException(LogError::StoreUnavailable, "audit trail unavailable");
        }

        throw LogException(LogError::OrderingViolation, ordering.reason, ordering.violation);
    }

    try {
        receipt.event = store_.Append(receipt.scope, candidate);
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Event store append failed for " << ToHex(candidate.actionId) << ": " << e.what();
        throw LogException(LogError::StoreUnavailable, "event store unavailable");
    }

    // The scope lock makes this event the tail. The history shares the
    // store's events until the next append to the scope.
    const auto appended = store_.Snapshot(receipt.scope);
    receipt.history = appended.Prefix(appended.Size() - 1);

    {
        std::lock_guard<std::mutex> indexLock{indexMutex_};
        index_.emplace(candidate.actionId, IndexEntry{receipt.scope, receipt.history.Size()});
    }

    return receipt;
}

std::string CausalEventLogger::ScopeFor(const std::string& agentId) const {
    if (options_.granularity == ScopeGranularity::Global) {
        return "global";
    }
    return "agent:" + agentId;
}

bool CausalEventLogger::Contains(const ActionId& actionId) const {
    std::lock_guard<std::mutex> lock{indexMutex_};
    return index_.find(actionId) != index_.end();
}

std::size_t CausalEventLogger::IndexSize() const {
    std::lock_guard<std::mutex> lock{indexMutex_};
    return index_.size();
}

std::mutex& CausalEventLogger::ScopeMutex(const std::string& scope) {
    std::lock_guard<std::mutex> lock{scopeMutexesGuard_};
    auto& slot = scopeMutexes_[scope];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

void CausalEventLogger::RebuildIndex() {
    std::lock_guard<std::mutex> lock{indexMutex_};
    for (const auto& scope : store_.Scopes()) {
        auto chain = store_.Snapshot(scope);
        for (std::size_t i = 0; i < chain.Size(); ++i) {
            index_.emplace(chain[i].actionId, IndexEntry{scope, i});
        }
    }
}

} // namespace causal
