#pragma once

#include "policy/RiskTier.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace policy {

enum class DecisionType {
    Pass,
    Fail,
};

enum class FailedRule {
    None,
    NonceMonotonicity,
    TemporalCausality,
    Condition,
};

struct Decision {
    DecisionType type = DecisionType::Pass;
    RiskTier riskTier = RiskTier::Low;
    uint16_t requiredThreshold = 0;
    std::string reason;

    FailedRule failedRule = FailedRule::None;
    std::optional<std::size_t> failedCondition;
    std::vector<std::size_t> satisfiedConditions;
    uint64_t evaluationNonce = 0;

    bool Passed() const { return type == DecisionType::Pass; }
};

inline const char* ToString(DecisionType type) {
    switch (type) {
    case DecisionType::Pass:
        return "pass";
    case DecisionType::Fail:
        return "fail";
    }

    return "fail";
}

inline const char* ToString(FailedRule rule) {
    switch (rule) {
    case FailedRule::None:
        return "none";
    case FailedRule::NonceMonotonicity:
        return "nonce-monotonicity";
    case FailedRule::TemporalCausality:
        return "temporal-causality";
    case FailedRule::Condition:
        return "condition";
    }

    return "none";
}

} // namespace policy
