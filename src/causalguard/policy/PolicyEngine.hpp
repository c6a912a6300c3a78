#pragma once

#include "policy/Policy.hpp"
#include "policy/PolicyDecision.hpp"

#include "causal/EventChain.hpp"

namespace policy {

// Stateless evaluator. The same chain, policy and candidate always give the
// same decision, so one engine may serve any number of threads.
class PolicyEngine {
public:
    explicit PolicyEngine(const ThresholdTable& thresholds);

    // chain is the candidate's causal scope as it stood before the candidate.
    // Order: nonce, timestamp, then conditions as declared; the first failure
    // ends evaluation.
    Decision Evaluate(const causal::EventChain& chain, const Policy& policy, const causal::Event& candidate) const;

    RiskTier AssessRisk(const Policy& policy, const causal::Event& candidate) const;

private:
    const ThresholdTable& thresholds_;
};

} // namespace policy
