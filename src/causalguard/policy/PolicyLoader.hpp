#pragma once

#include "policy/Policy.hpp"

#include <string>

struct CausalGuardConfig;

namespace policy {

// Condition grammar, one per policy_condition entry:
//   max_daily_outflow:<cap>
//   min_time_between_actions:<action_type>:<min_seconds>
//   no_concurrent_requests:<window_seconds>
//   min_verification_count:<threshold_amount>:<required_count>[:<action_type>]
//   address_allow_list:<prefix>[,<prefix>...]
// Throws std::invalid_argument on malformed input.
Condition ParseCondition(const std::string& text);

std::string FormatCondition(const Condition& condition);

Policy BuildPolicy(const CausalGuardConfig& config);

} // namespace policy
