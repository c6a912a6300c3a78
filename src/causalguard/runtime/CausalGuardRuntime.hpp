#pragma once

#include "runtime/AgentSequencer.hpp"
#include "runtime/Governance.hpp"
#include "runtime/ProposalGateway.hpp"
#include "runtime/RiskOrchestrator.hpp"

#include "causal/CausalEventLogger.hpp"
#include "policy/PolicyEngine.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct CausalGuardConfig;

namespace runtime {

// Lifecycle of a logged action.
enum class ActionStatus {
    Pending,
    Compliant,
    Rejected,
    Signed,
    ThresholdUnmet,
};

inline const char* ToString(ActionStatus status) {
    switch (status) {
    case ActionStatus::Pending:
        return "pending";
    case ActionStatus::Compliant:
        return "compliant";
    case ActionStatus::Rejected:
        return "rejected";
    case ActionStatus::Signed:
        return "signed";
    case ActionStatus::ThresholdUnmet:
        return "threshold-unmet";
    }

    return "unknown";
}

// Synchronous answer to a proposal. Accepted means logged and compliant with
// signatures requested; the final signing result arrives asynchronously and is
// visible through Status and Signatures.
enum class ProposalResult {
    Accepted,
    Duplicate,
    AdmissionError,
    LogError,
    PolicyViolation,
};

inline const char* ToString(ProposalResult result) {
    switch (result) {
    case ProposalResult::Accepted:
        return "accepted";
    case ProposalResult::Duplicate:
        return "duplicate";
    case ProposalResult::AdmissionError:
        return "admission-error";
    case ProposalResult::LogError:
        return "log-error";
    case ProposalResult::PolicyViolation:
        return "policy-violation";
    }

    return "unknown";
}

struct ProposalOutcome {
    ProposalResult result = ProposalResult::AdmissionError;
    std::optional<causal::ActionId> actionId;
    std::optional<ActionStatus> status;
    std::optional<policy::Decision> decision;
    std::optional<AdmissionStatus> admission;
    std::optional<causal::LogError> logError;
    bool retryable = false;
    std::string reason;
};

struct RuntimeOptions {
    GatewayOptions gateway;
    causal::LoggerOptions logger;
    OrchestratorOptions orchestrator;
    std::size_t sequencerWorkers = 4;
};

RuntimeOptions BuildRuntimeOptions(const CausalGuardConfig& config);

// The full proposal path. Each proposal is admitted by the gateway, then
// logged, evaluated and (on pass) sent for signatures on its scope's strand,
// so proposals of one agent are handled strictly in submission order.
class CausalGuardRuntime {
public:
    CausalGuardRuntime(causal::EventStore& store, ISignatureCollector& collector, RuntimeOptions options,
        policy::Policy initialPolicy, const causal::Digest& keyRoot, const causal::Digest& governorKeyDigest);
    ~CausalGuardRuntime();

    CausalGuardRuntime(const CausalGuardRuntime&) = delete;
    CausalGuardRuntime& operator=(const CausalGuardRuntime&) = delete;

    // nowMs is the gateway clock used for rate limiting.
    ProposalOutcome Propose(const causal::Proposal& proposal, uint64_t nowMs);

    std::optional<ActionStatus> Status(const causal::ActionId& actionId) const;
    std::optional<SignatureOutcome> Signatures(const causal::ActionId& actionId) const;

    // Waits for outstanding signature collections.
    void Drain();

    Governance& GetGovernance() { return governance_; }
    const PolicyRegistry& Policies() const { return policies_; }
    const KeyRootRegistry& KeyRoots() const { return keyRoots_; }
    const causal::CausalEventLogger& Logger() const { return logger_; }

private:
    ProposalOutcome Process(const causal::Proposal& proposal);
    void OnSignatures(const SignatureOutcome& outcome);
    void SetStatus(const causal::ActionId& actionId, ActionStatus status);
    void Audit(const causal::Event& event, causal::AuditKind kind, const std::string& reason);

    causal::EventStore& store_;
    RuntimeOptions options_;

    ProposalGateway gateway_;
    causal::CausalEventLogger logger_;
    policy::PolicyEngine engine_;
    PolicyRegistry policies_;
    KeyRootRegistry keyRoots_;
    RiskOrchestrator orchestrator_;
    Governance governance_;

    mutable std::mutex statusMutex_;
    std::unordered_map<causal::ActionId, ActionStatus, causal::DigestHash> statuses_;
    std::unordered_map<causal::ActionId, SignatureOutcome, causal::DigestHash> signatures_;

    // Declared last so its workers stop before anything they touch.
    AgentSequencer sequencer_;
};

} // namespace runtime
