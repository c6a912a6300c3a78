#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace policy {

enum class RiskTier {
    Low = 0,
    Medium = 1,
    High = 2,
};

inline const char* ToString(RiskTier tier) {
    switch (tier) {
    case RiskTier::Low:
        return "low";
    case RiskTier::Medium:
        return "medium";
    case RiskTier::High:
        return "high";
    }

    return "high";
}

inline std::optional<RiskTier> ParseRiskTier(const std::string& name) {
    if (name == "low") {
        return RiskTier::Low;
    }
    if (name == "medium") {
        return RiskTier::Medium;
    }
    if (name == "high") {
        return RiskTier::High;
    }
    return std::nullopt;
}

inline RiskTier MaxTier(RiskTier lhs, RiskTier rhs) {
    return static_cast<int>(lhs) >= static_cast<int>(rhs) ? lhs : rhs;
}

// Tier -> required signer count. The standard table is fixed at build time and
// is the only table the runtime uses; no proposal field can select another.
class ThresholdTable {
public:
    ThresholdTable(uint16_t low, uint16_t medium, uint16_t high);

    static const ThresholdTable& Standard();

    uint16_t Lookup(RiskTier tier) const { return thresholds_[static_cast<std::size_t>(tier)]; }

private:
    std::array<uint16_t, 3> thresholds_;
};

} // namespace policy
