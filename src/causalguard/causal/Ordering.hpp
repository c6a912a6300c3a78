#pragma once

#include "causal/Event.hpp"

#include <cstdint>
#include <string>

namespace causal {

enum class OrderingViolation {
    None,
    NonceRegression,
    TimestampRegression,
};

struct OrderingCheck {
    OrderingViolation violation = OrderingViolation::None;
    std::string reason;

    bool Ok() const { return violation == OrderingViolation::None; }
};

// previous is the tail of the candidate's causal scope, or null for genesis.
// Nonces must strictly increase; gaps are allowed.
OrderingCheck CheckNonce(const Event* previous, const Event& candidate);

// The candidate may trail the previous event by at most skewToleranceMs.
OrderingCheck CheckTimestamp(const Event* previous, const Event& candidate, uint64_t skewToleranceMs);

} // namespace causal
