#pragma once

#include "policy/PolicyCondition.hpp"
#include "policy/RiskTier.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace policy {

// Value breakpoints for the baseline tier. A candidate below
// mediumAtOrAbove is Low; at or above highAtOrAbove it is High.
struct RiskEscalation {
    uint64_t mediumAtOrAbove = 100;
    uint64_t highAtOrAbove = 1000;
    bool crossChainIsHigh = true;
    RiskTier floor = RiskTier::Low;
};

// Loaded once and treated as immutable; replaced only as a whole through
// governance.
struct Policy {
    std::string name = "default";
    std::vector<Condition> conditions;
    RiskEscalation escalation;
    uint64_t nominalEventValue = 1000;
    uint64_t skewToleranceMs = 500;
    uint64_t outflowWindowSeconds = 86400;
};

} // namespace policy
