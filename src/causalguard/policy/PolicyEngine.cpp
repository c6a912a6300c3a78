#include "policy/PolicyEngine.hpp"

#include "causal/Ordering.hpp"

namespace policy {

PolicyEngine::PolicyEngine(const ThresholdTable& thresholds)
    : thresholds_{thresholds} {}

Decision PolicyEngine::Evaluate(
    const causal::EventChain& chain, const Policy& policy, const causal::Event& candidate) const {
    Decision decision;
    decision.evaluationNonce = candidate.nonce;
    decision.riskTier = AssessRisk(policy, candidate);
    decision.requiredThreshold = thresholds_.Lookup(decision.riskTier);

    const causal::Event* previous = chain.Empty() ? nullptr : &chain.Back();

    auto nonceCheck = causal::CheckNonce(previous, candidate);
    if (!nonceCheck.Ok()) {
        decision.type = DecisionType::Fail;
        decision.failedRule = FailedRule::NonceMonotonicity;
        decision.reason = nonceCheck.reason;
        return decision;
    }

    auto timeCheck = causal::CheckTimestamp(previous, candidate, policy.skewToleranceMs);
    if (!timeCheck.Ok()) {
        decision.type = DecisionType::Fail;
        decision.failedRule = FailedRule::TemporalCausality;
        decision.reason = timeCheck.reason;
        return decision;
    }

    ConditionContext context{chain, candidate, policy.nominalEventValue, policy.outflowWindowSeconds};
    for (std::size_t i = 0; i < policy.conditions.size(); ++i) {
        auto result = EvaluateCondition(policy.conditions[i], context);
        if (!result.passed) {
            decision.type = DecisionType::Fail;
            decision.failedRule = FailedRule::Condition;
            decision.failedCondition = i;
            decision.reason = std::string{ConditionName(policy.conditions[i])} + ": " + result.reason;
            return decision;
        }
        decision.satisfiedConditions.push_back(i);
    }

    decision.type = DecisionType::Pass;
    decision.reason = "all conditions satisfied";
    return decision;
}

RiskTier PolicyEngine::AssessRisk(const Policy& policy, const causal::Event& candidate) const {
    const auto& escalation = policy.escalation;
    const auto value = candidate.value.value_or(policy.nominalEventValue);

    RiskTier tier = RiskTier::Low;
    if (value >= escalation.highAtOrAbove) {
        tier = RiskTier::High;
    } else if (value >= escalation.mediumAtOrAbove) {
        tier = RiskTier::Medium;
    }

    if (escalation.crossChainIsHigh && candidate.destinationChain != 0) {
        tier = RiskTier::High;
    }

    return MaxTier(tier, escalation.floor);
}

} // namespace policy
