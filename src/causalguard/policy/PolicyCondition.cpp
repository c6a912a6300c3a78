#include "policy/PolicyCondition.hpp"

#include <limits>

namespace policy {

namespace {

constexpr uint64_t kMillisPerSecond = 1000;

uint64_t SaturatingAdd(uint64_t lhs, uint64_t rhs) {
    if (lhs > std::numeric_limits<uint64_t>::max() - rhs) {
        return std::numeric_limits<uint64_t>::max();
    }
    return lhs + rhs;
}

uint64_t SecondsToMillis(uint64_t seconds) {
    if (seconds > std::numeric_limits<uint64_t>::max() / kMillisPerSecond) {
        return std::numeric_limits<uint64_t>::max();
    }
    return seconds * kMillisPerSecond;
}

ConditionResult Fail(std::string reason) {
    ConditionResult result;
    result.passed = false;
    result.reason = std::move(reason);
    return result;
}

class ConditionEvaluator {
public:
    explicit ConditionEvaluator(const ConditionContext& context)
        : context_{context}
        , candidateTime_{context.candidate.timestampMs} {}

    ConditionResult operator()(const MaxDailyOutflow& condition) const {
        const auto windowMs = SecondsToMillis(context_.outflowWindowSeconds);

        uint64_t total = 0;
        for (const auto& event : context_.chain) {
            if (event.type != causal::ActionType::SignatureRequest) {
                continue;
            }
            // (T - window, T]
            if (event.timestampMs <= candidateTime_ && SaturatingAdd(event.timestampMs, windowMs) > candidateTime_) {
                total = SaturatingAdd(total, ValueOf(event));
            }
        }

        if (context_.candidate.type == causal::ActionType::SignatureRequest) {
            total = SaturatingAdd(total, ValueOf(context_.candidate));
        }

        if (total > condition.cap) {
            return Fail("outflow " + std::to_string(total) + " within window exceeds cap "
                + std::to_string(condition.cap));
        }
        return {};
    }

    ConditionResult operator()(const MinTimeBetweenActions& condition) const {
        if (context_.candidate.type != condition.actionType) {
            return {};
        }

        const auto& chain = context_.chain;
        for (auto iter = chain.rbegin(); iter != chain.rend(); ++iter) {
            if (iter->type != condition.actionType) {
                continue;
            }

            const auto minimumMs = SecondsToMillis(condition.minSeconds);
            if (candidateTime_ < iter->timestampMs || candidateTime_ - iter->timestampMs < minimumMs) {
                return Fail(std::string{"last "} + causal::ToString(condition.actionType) + " was less than "
                    + std::to_string(condition.minSeconds) + "s ago");
            }
            return {};
        }

        return {};
    }

    ConditionResult operator()(const NoConcurrentRequests& condition) const {
        const auto windowMs = SecondsToMillis(condition.windowSeconds);

        for (const auto& event : context_.chain) {
            if (event.type == context_.candidate.type) {
                continue;
            }
            // (T - window, T)
            if (event.timestampMs < candidateTime_ && SaturatingAdd(event.timestampMs, windowMs) > candidateTime_) {
                return Fail(std::string{"concurrent "} + causal::ToString(event.type) + " within "
                    + std::to_string(condition.windowSeconds) + "s");
            }
        }

        return {};
    }

    ConditionResult operator()(const MinVerificationCount& condition) const {
        if (ValueOf(context_.candidate) < condition.thresholdAmount) {
            return {};
        }

        uint64_t count = 0;
        for (const auto& event : context_.chain) {
            if (event.type == condition.actionType) {
                ++count;
            }
        }

        if (count < condition.requiredCount) {
            return Fail(std::to_string(count) + " " + causal::ToString(condition.actionType)
                + " events recorded, " + std::to_string(condition.requiredCount) + " required");
        }
        return {};
    }

    ConditionResult operator()(const AddressAllowList& condition) const {
        const auto type = context_.candidate.type;
        if (type != causal::ActionType::SignatureRequest && type != causal::ActionType::AddressVerification) {
            return {};
        }

        const auto& recipient = context_.candidate.recipient;
        for (const auto& prefix : condition.allowedPrefixes) {
            if (!prefix.empty() && recipient.compare(0, prefix.size(), prefix) == 0) {
                return {};
            }
        }

        return Fail("recipient is not on the allow list");
    }

    ConditionResult operator()(const CustomCondition& condition) const {
        if (!condition.check) {
            return Fail(condition.name + " has no check");
        }

        auto failure = condition.check(context_.chain, context_.candidate);
        if (failure) {
            return Fail(condition.name + ": " + *failure);
        }
        return {};
    }

private:
    uint64_t ValueOf(const causal::Event& event) const {
        return event.value.value_or(context_.nominalEventValue);
    }

    const ConditionContext& context_;
    uint64_t candidateTime_;
};

struct ConditionNamer {
    const char* operator()(const MaxDailyOutflow&) const { return "max_daily_outflow"; }
    const char* operator()(const MinTimeBetweenActions&) const { return "min_time_between_actions"; }
    const char* operator()(const NoConcurrentRequests&) const { return "no_concurrent_requests"; }
    const char* operator()(const MinVerificationCount&) const { return "min_verification_count"; }
    const char* operator()(const AddressAllowList&) const { return "address_allow_list"; }
    const char* operator()(const CustomCondition&) const { return "custom"; }
};

} // namespace

ConditionResult EvaluateCondition(const Condition& condition, const ConditionContext& context) {
    return std::visit(ConditionEvaluator{context}, condition);
}

const char* ConditionName(const Condition& condition) { return std::visit(ConditionNamer{}, condition); }

} // namespace policy
