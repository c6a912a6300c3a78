#include "policy/PolicyLoader.hpp"

#include "CausalGuardConfig.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace policy {

namespace {

std::vector<std::string> Split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in{text};
    while (std::getline(in, current, delimiter)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

uint64_t ParseUnsigned(const std::string& text, const std::string& field) {
    if (text.empty() || text.size() > 20) {
        throw std::invalid_argument("invalid " + field + ": '" + text + "'");
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid " + field + ": '" + text + "'");
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw std::invalid_argument(field + " out of range: '" + text + "'");
        }
        value = value * 10 + digit;
    }
    return value;
}

causal::ActionType ParseType(const std::string& text) {
    auto type = causal::ParseActionType(text);
    if (!type) {
        throw std::invalid_argument("unknown action type '" + text + "'");
    }
    return *type;
}

void ExpectArity(const std::vector<std::string>& parts, std::size_t minimum, std::size_t maximum) {
    if (parts.size() < minimum || parts.size() > maximum) {
        throw std::invalid_argument("wrong number of arguments for condition '" + parts.front() + "'");
    }
}

struct ConditionFormatter {
    std::string operator()(const MaxDailyOutflow& c) const {
        return "max_daily_outflow:" + std::to_string(c.cap);
    }

    std::string operator()(const MinTimeBetweenActions& c) const {
        return std::string{"min_time_between_actions:"} + causal::ToString(c.actionType) + ":"
            + std::to_string(c.minSeconds);
    }

    std::string operator()(const NoConcurrentRequests& c) const {
        return "no_concurrent_requests:" + std::to_string(c.windowSeconds);
    }

    std::string operator()(const MinVerificationCount& c) const {
        return "min_verification_count:" + std::to_string(c.thresholdAmount) + ":"
            + std::to_string(c.requiredCount) + ":" + causal::ToString(c.actionType);
    }

    std::string operator()(const AddressAllowList& c) const {
        std::string out = "address_allow_list:";
        for (std::size_t i = 0; i < c.allowedPrefixes.size(); ++i) {
            if (i > 0) {
                out += ",";
            }
            out += c.allowedPrefixes[i];
        }
        return out;
    }

    std::string operator()(const CustomCondition& c) const { return "custom:" + c.name; }
};

} // namespace

Condition ParseCondition(const std::string& text) {
    auto parts = Split(Trim(text), ':');
    if (parts.empty() || parts.front().empty()) {
        throw std::invalid_argument("empty policy condition");
    }
    for (auto& part : parts) {
        part = Trim(part);
    }

    const auto& kind = parts.front();

    if (kind == "max_daily_outflow") {
        ExpectArity(parts, 2, 2);
        return MaxDailyOutflow{ParseUnsigned(parts[1], "cap")};
    }

    if (kind == "min_time_between_actions") {
        ExpectArity(parts, 3, 3);
        return MinTimeBetweenActions{ParseType(parts[1]), ParseUnsigned(parts[2], "min_seconds")};
    }

    if (kind == "no_concurrent_requests") {
        ExpectArity(parts, 2, 2);
        return NoConcurrentRequests{ParseUnsigned(parts[1], "window_seconds")};
    }

    if (kind == "min_verification_count") {
        ExpectArity(parts, 3, 4);
        MinVerificationCount condition;
        condition.thresholdAmount = ParseUnsigned(parts[1], "threshold_amount");
        const auto required = ParseUnsigned(parts[2], "required_count");
        if (required > std::numeric_limits<uint32_t>::max()) {
            throw std::invalid_argument("required_count out of range");
        }
        condition.requiredCount = static_cast<uint32_t>(required);
        if (parts.size() == 4) {
            condition.actionType = ParseType(parts[3]);
        }
        return condition;
    }

    if (kind == "address_allow_list") {
        ExpectArity(parts, 2, 2);
        AddressAllowList condition;
        for (const auto& prefix : Split(parts[1], ',')) {
            auto trimmed = Trim(prefix);
            if (trimmed.empty()) {
                throw std::invalid_argument("empty prefix in address_allow_list");
            }
            condition.allowedPrefixes.push_back(trimmed);
        }
        return condition;
    }

    throw std::invalid_argument("unknown policy condition '" + kind + "'");
}

std::string FormatCondition(const Condition& condition) { return std::visit(ConditionFormatter{}, condition); }

Policy BuildPolicy(const CausalGuardConfig& config) {
    Policy result;
    result.name = config.policyName;
    result.nominalEventValue = config.nominalEventValue;
    result.skewToleranceMs = config.skewToleranceMs;
    result.outflowWindowSeconds = config.dailyOutflowWindowSeconds;

    result.escalation.mediumAtOrAbove = config.mediumValueBreakpoint;
    result.escalation.highAtOrAbove = config.highValueBreakpoint;
    if (result.escalation.highAtOrAbove < result.escalation.mediumAtOrAbove) {
        throw std::invalid_argument("high_value_breakpoint must not be below medium_value_breakpoint");
    }

    auto floor = ParseRiskTier(config.policyFloorTier);
    if (!floor) {
        throw std::invalid_argument("invalid policy_floor_tier '" + config.policyFloorTier + "'");
    }
    result.escalation.floor = *floor;

    for (const auto& entry : config.policyConditions) {
        result.conditions.push_back(ParseCondition(entry));
    }

    return result;
}

} // namespace policy
