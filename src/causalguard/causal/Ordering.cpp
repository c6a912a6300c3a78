#include "causal/Ordering.hpp"

namespace causal {

namespace {

// candidate + skew < previous, without overflowing near the top of the range.
bool FallsBehind(uint64_t candidateMs, uint64_t previousMs, uint64_t skewToleranceMs) {
    return previousMs > skewToleranceMs && candidateMs < previousMs - skewToleranceMs;
}

} // namespace

OrderingCheck CheckNonce(const Event* previous, const Event& candidate) {
    OrderingCheck check;
    if (previous != nullptr && candidate.nonce <= previous->nonce) {
        check.violation = OrderingViolation::NonceRegression;
        check.reason = "nonce " + std::to_string(candidate.nonce) + " does not exceed previous nonce "
            + std::to_string(previous->nonce);
    }
    return check;
}

OrderingCheck CheckTimestamp(const Event* previous, const Event& candidate, uint64_t skewToleranceMs) {
    OrderingCheck check;
    if (previous != nullptr && FallsBehind(candidate.timestampMs, previous->timestampMs, skewToleranceMs)) {
        check.violation = OrderingViolation::TimestampRegression;
        check.reason = "timestamp " + std::to_string(candidate.timestampMs) + " is more than "
            + std::to_string(skewToleranceMs) + "ms before previous event at "
            + std::to_string(previous->timestampMs);
    }
    return check;
}

} // namespace causal
