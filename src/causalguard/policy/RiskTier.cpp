#include "policy/RiskTier.hpp"

#include <stdexcept>

namespace policy {

ThresholdTable::ThresholdTable(uint16_t low, uint16_t medium, uint16_t high)
    : thresholds_{{low, medium, high}} {
    if (low < 1 || medium < low || high < medium) {
        throw std::invalid_argument("threshold table must be positive and non-decreasing by tier");
    }
}

const ThresholdTable& ThresholdTable::Standard() {
    static const ThresholdTable standard{2, 3, 5};
    return standard;
}

} // namespace policy
