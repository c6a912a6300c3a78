#pragma once

#include "causal/Event.hpp"
#include "policy/RiskTier.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace runtime {

// Binds a signature to what will actually be executed:
// H(amount || recipient || nonce).
struct ExecutionCommitment {
    uint64_t amount = 0;
    std::string recipient;
    uint64_t nonce = 0;
    causal::Digest binding{};
};

// Built only by RiskOrchestrator. requiredThreshold always comes from the
// threshold table for riskTier.
struct SignatureRequest {
    causal::ActionId actionId{};
    std::string agentId;
    causal::Digest payloadDigest{};
    policy::RiskTier riskTier = policy::RiskTier::High;
    uint16_t requiredThreshold = 0;
    ExecutionCommitment commitment;
    causal::Digest historyRoot{};
    causal::Digest keyRoot{};
};

struct ValidatorSignature {
    uint16_t validatorId = 0;
    std::vector<uint8_t> signature;
};

struct SignatureBundle {
    std::vector<ValidatorSignature> signatures;
    causal::Digest aggregateProofRoot{};
};

enum class CollectionStatus {
    Complete,
    TimedOut,
    Failed,
};

inline const char* ToString(CollectionStatus status) {
    switch (status) {
    case CollectionStatus::Complete:
        return "complete";
    case CollectionStatus::TimedOut:
        return "timed-out";
    case CollectionStatus::Failed:
        return "failed";
    }

    return "failed";
}

struct CollectionResult {
    CollectionStatus status = CollectionStatus::Failed;
    SignatureBundle bundle;
    std::string detail;
};

// External threshold-signing collaborator. Collect may block up to the
// deadline; it is never called with a store or logger lock held.
class ISignatureCollector {
public:
    virtual ~ISignatureCollector() = default;

    virtual CollectionResult Collect(const SignatureRequest& request, std::chrono::milliseconds deadline) = 0;
};

} // namespace runtime
