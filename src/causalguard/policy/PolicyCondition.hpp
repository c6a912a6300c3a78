#pragma once

#include "causal/EventChain.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace policy {

// Sum of SignatureRequest values in (T - window, T], candidate included, must
// not exceed cap.
struct MaxDailyOutflow {
    uint64_t cap = 0;
};

// A candidate of actionType must trail the previous event of that type by at
// least minSeconds.
struct MinTimeBetweenActions {
    causal::ActionType actionType = causal::ActionType::SignatureRequest;
    uint64_t minSeconds = 0;
};

// No event of a different type in the open interval (T - window, T).
struct NoConcurrentRequests {
    uint64_t windowSeconds = 0;
};

// Candidates valued at or above thresholdAmount need requiredCount events of
// actionType anywhere in history.
struct MinVerificationCount {
    uint64_t thresholdAmount = 0;
    causal::ActionType actionType = causal::ActionType::AddressVerification;
    uint32_t requiredCount = 0;
};

// Recipient of a signature request or address verification must start with
// one of the prefixes.
struct AddressAllowList {
    std::vector<std::string> allowedPrefixes;
};

// Caller supplied rule. Returns a failure reason, or nothing to pass.
struct CustomCondition {
    std::string name;
    std::function<std::optional<std::string>(const causal::EventChain&, const causal::Event&)> check;
};

using Condition = std::variant<MaxDailyOutflow, MinTimeBetweenActions, NoConcurrentRequests,
    MinVerificationCount, AddressAllowList, CustomCondition>;

struct ConditionContext {
    const causal::EventChain& chain;
    const causal::Event& candidate;
    uint64_t nominalEventValue;
    uint64_t outflowWindowSeconds;
};

struct ConditionResult {
    bool passed = true;
    std::string reason;
};

ConditionResult EvaluateCondition(const Condition& condition, const ConditionContext& context);

const char* ConditionName(const Condition& condition);

} // namespace policy
