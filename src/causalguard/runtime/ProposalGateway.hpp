#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace runtime {

enum class AdmissionStatus {
    Admitted,
    InvalidAgent,
    PayloadTooLarge,
    RateLimited,
};

inline const char* ToString(AdmissionStatus status) {
    switch (status) {
    case AdmissionStatus::Admitted:
        return "admitted";
    case AdmissionStatus::InvalidAgent:
        return "invalid-agent";
    case AdmissionStatus::PayloadTooLarge:
        return "payload-too-large";
    case AdmissionStatus::RateLimited:
        return "rate-limited";
    }

    return "rate-limited";
}

struct AdmissionDecision {
    AdmissionStatus status = AdmissionStatus::Admitted;
    std::string reason;

    bool Admitted() const { return status == AdmissionStatus::Admitted; }
};

struct GatewayOptions {
    std::size_t maxPayloadBytes = 4096;
    uint32_t maxProposalsPerWindow = 10;
    uint64_t windowMs = 60000;
};

// Front door for proposals. Cheap checks only: agent id length, payload size
// and a per-agent sliding window over admitted proposals. Rejected proposals
// do not count against the window. Windows that drain are dropped, so only
// agents seen within the last two windows are tracked.
class ProposalGateway {
public:
    explicit ProposalGateway(GatewayOptions options);

    // nowMs is the gateway's clock, not the proposal's own timestamp.
    AdmissionDecision Admit(const std::string& agentId, std::size_t payloadBytes, uint64_t nowMs);

    std::size_t RecentCount(const std::string& agentId, uint64_t nowMs);
    std::size_t TrackedAgents() const;

    const GatewayOptions& Options() const { return options_; }

private:
    using Window = std::deque<uint64_t>;

    void Expire(Window& window, uint64_t nowMs) const;
    void SweepDrained(uint64_t nowMs);

    GatewayOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> admitted_;
    uint64_t lastSweepMs_ = 0;
};

} // namespace runtime
