#include "runtime/CausalGuardRuntime.hpp"

#include "CausalGuardConfig.hpp"
#include "Database.hpp"

#include "easylogging++.h"

#include <stdexcept>

namespace runtime {

namespace {
policy::FailedRule RuleFor(causal::OrderingViolation violation) {
    switch (violation) {
    case causal::OrderingViolation::NonceRegression:
        return policy::FailedRule::NonceMonotonicity;
    case causal::OrderingViolation::TimestampRegression:
        return policy::FailedRule::TemporalCausality;
    case causal::OrderingViolation::None:
        break;
    }
    return policy::FailedRule::None;
}
} // namespace

RuntimeOptions BuildRuntimeOptions(const CausalGuardConfig& config) {
    RuntimeOptions options;

    options.gateway.maxPayloadBytes = config.maxPayloadBytes;
    options.gateway.maxProposalsPerWindow = config.maxProposalsPerMinute;
    options.gateway.windowMs = static_cast<uint64_t>(config.rateWindowSeconds) * 1000;

    options.logger.maxPayloadBytes = config.maxPayloadBytes;
    options.logger.skewToleranceMs = config.skewToleranceMs;
    if (config.causalScope == "agent") {
        options.logger.granularity = causal::ScopeGranularity::PerAgent;
    } else if (config.causalScope == "global") {
        options.logger.granularity = causal::ScopeGranularity::Global;
    } else {
        throw std::invalid_argument("causal_scope must be agent or global, got '" + config.causalScope + "'");
    }

    options.orchestrator.deadline = std::chrono::milliseconds{config.signatureDeadlineMs};
    options.orchestrator.workers = config.signatureWorkers;
    options.sequencerWorkers = config.sequencerWorkers;
    return options;
}

CausalGuardRuntime::CausalGuardRuntime(causal::EventStore& store, ISignatureCollector& collector,
    RuntimeOptions options, policy::Policy initialPolicy, const causal::Digest& keyRoot,
    const causal::Digest& governorKeyDigest)
    : store_{store}
    , options_{options}
    , gateway_{options.gateway}
    , logger_{store, options.logger}
    , engine_{policy::ThresholdTable::Standard()}
    , policies_{std::move(initialPolicy)}
    , keyRoots_{keyRoot}
    , orchestrator_{policy::ThresholdTable::Standard(), collector, keyRoots_, options.orchestrator}
    , governance_{governorKeyDigest, logger_, store, keyRoots_, policies_}
    , sequencer_{options.sequencerWorkers} {
    LOG(INFO) << "Runtime ready: " << logger_.IndexSize() << " actions indexed, policy '"
              << policies_.Current()->name << "'";
}

CausalGuardRuntime::~CausalGuardRuntime() {
    sequencer_.Shutdown();
    orchestrator_.Drain();
    orchestrator_.Shutdown();
}

ProposalOutcome CausalGuardRuntime::Propose(const causal::Proposal& proposal, uint64_t nowMs) {
    auto admission = gateway_.Admit(proposal.agentId, proposal.payload.size(), nowMs);
    if (!admission.Admitted()) {
        ProposalOutcome outcome;
        outcome.result = ProposalResult::AdmissionError;
        outcome.admission = admission.status;
        outcome.retryable = admission.status == AdmissionStatus::RateLimited;
        outcome.reason = admission.reason;

        causal::AuditRecord record;
        record.timestampMs = nowMs;
        record.agentId = proposal.agentId.substr(0, causal::kMaxAgentIdBytes);
        record.kind = causal::AuditKind::AdmissionRejected;
        record.reason = admission.reason;
        try {
            store_.RecordAudit(record);
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "Failed to persist admission audit record: " << e.what();
        }
        return outcome;
    }

    return sequencer_.Submit(logger_.ScopeFor(proposal.agentId), [this, proposal]() { return Process(proposal); })
        .get();
}

ProposalOutcome CausalGuardRuntime::Process(const causal::Proposal& proposal) {
    ProposalOutcome outcome;
    const auto policy = policies_.Current();

    causal::LogReceipt receipt;
    try {
        receipt = logger_.Log(proposal);
    } catch (const causal::LogException& e) {
        outcome.reason = e.what();

        if (e.Code() != causal::LogError::OrderingViolation) {
            outcome.result = ProposalResult::LogError;
            outcome.logError = e.Code();
            outcome.retryable = e.IsRetryable();
            return outcome;
        }

        // Ordering failures are refused before they enter history; report
        // them as the policy decision they would have produced.
        const auto candidate = causal::MakeCandidate(proposal);
        policy::Decision decision;
        decision.type = policy::DecisionType::Fail;
        decision.riskTier = engine_.AssessRisk(*policy, candidate);
        decision.requiredThreshold = orchestrator_.RequiredThreshold(decision.riskTier);
        decision.failedRule = RuleFor(e.Ordering());
        decision.reason = e.what();
        decision.evaluationNonce = candidate.nonce;

        outcome.result = ProposalResult::PolicyViolation;
        outcome.actionId = candidate.actionId;
        outcome.status = ActionStatus::Rejected;
        outcome.decision = decision;
        return outcome;
    }

    outcome.actionId = receipt.actionId;

    if (receipt.duplicate) {
        outcome.result = ProposalResult::Duplicate;
        outcome.status = Status(receipt.actionId);
        outcome.reason = "already logged";
        return outcome;
    }

    SetStatus(receipt.actionId, ActionStatus::Pending);

    const auto decision = engine_.Evaluate(receipt.history, *policy, receipt.event);
    outcome.decision = decision;

    if (!decision.Passed()) {
        LOG(INFO) << "Policy '" << policy->name << "' rejected " << causal::ToHex(receipt.actionId) << " from "
                  << proposal.agentId << ": " << decision.reason;
        Audit(receipt.event, causal::AuditKind::PolicyRejected, decision.reason);
        SetStatus(receipt.actionId, ActionStatus::Rejected);

        outcome.result = ProposalResult::PolicyViolation;
        outcome.status = ActionStatus::Rejected;
        outcome.reason = decision.reason;
        return outcome;
    }

    SetStatus(receipt.actionId, ActionStatus::Compliant);
    auto request = orchestrator_.BuildRequest(decision, receipt.event, receipt.history);
    LOG(INFO) << "Requesting " << request.requiredThreshold << " signatures (" << policy::ToString(decision.riskTier)
              << ") for " << causal::ToHex(receipt.actionId);
    orchestrator_.Dispatch(std::move(request), [this](const SignatureOutcome& signatures) { OnSignatures(signatures); });

    outcome.result = ProposalResult::Accepted;
    outcome.status = ActionStatus::Compliant;
    outcome.reason = decision.reason;
    return outcome;
}

void CausalGuardRuntime::OnSignatures(const SignatureOutcome& outcome) {
    if (!outcome.Signed()) {
        LOG(WARNING) << "Threshold unmet for " << causal::ToHex(outcome.actionId) << ": " << outcome.reason;

        causal::AuditRecord record;
        record.agentId = outcome.agentId;
        record.actionId = outcome.actionId;
        record.kind = causal::AuditKind::ThresholdUnmet;
        record.reason = outcome.reason;
        if (auto tail = store_.Tail(logger_.ScopeFor(outcome.agentId))) {
            record.timestampMs = tail->timestampMs;
        }
        try {
            store_.RecordAudit(record);
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "Failed to persist threshold audit record: " << e.what();
        }
    }

    std::lock_guard<std::mutex> lock{statusMutex_};
    statuses_[outcome.actionId] = outcome.Signed() ? ActionStatus::Signed : ActionStatus::ThresholdUnmet;
    signatures_[outcome.actionId] = outcome;
}

std::optional<ActionStatus> CausalGuardRuntime::Status(const causal::ActionId& actionId) const {
    std::lock_guard<std::mutex> lock{statusMutex_};
    auto found = statuses_.find(actionId);
    if (found == statuses_.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::optional<SignatureOutcome> CausalGuardRuntime::Signatures(const causal::ActionId& actionId) const {
    std::lock_guard<std::mutex> lock{statusMutex_};
    auto found = signatures_.find(actionId);
    if (found == signatures_.end()) {
        return std::nullopt;
    }
    return found->second;
}

void CausalGuardRuntime::Drain() { orchestrator_.Drain(); }

void CausalGuardRuntime::SetStatus(const causal::ActionId& actionId, ActionStatus status) {
    std::lock_guard<std::mutex> lock{statusMutex_};
    statuses_[actionId] = status;
}

void CausalGuardRuntime::Audit(const causal::Event& event, causal::AuditKind kind, const std::string& reason) {
    causal::AuditRecord record;
    record.timestampMs = event.timestampMs;
    record.agentId = event.agentId;
    record.actionId = event.actionId;
    record.kind = kind;
    record.reason = reason;
    try {
        store_.RecordAudit(record);
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Failed to persist " << causal::ToString(kind) << " audit record: " << e.what();
    }
}

} // namespace runtime
