#include "runtime/ProposalGateway.hpp"

#include "causal/Event.hpp"

#include "easylogging++.h"

namespace runtime {

ProposalGateway::ProposalGateway(GatewayOptions options)
    : options_{options} {}

AdmissionDecision ProposalGateway::Admit(const std::string& agentId, std::size_t payloadBytes, uint64_t nowMs) {
    AdmissionDecision decision;

    if (agentId.empty() || agentId.size() > causal::kMaxAgentIdBytes) {
        decision.status = AdmissionStatus::InvalidAgent;
        decision.reason = "agent id must be 1-" + std::to_string(causal::kMaxAgentIdBytes) + " bytes";
        return decision;
    }

    if (payloadBytes > options_.maxPayloadBytes) {
        decision.status = AdmissionStatus::PayloadTooLarge;
        decision.reason = "payload of " + std::to_string(payloadBytes) + " bytes exceeds limit of "
            + std::to_string(options_.maxPayloadBytes);
        return decision;
    }

    std::lock_guard<std::mutex> lock{mutex_};
    SweepDrained(nowMs);

    auto& window = admitted_[agentId];
    Expire(window, nowMs);

    if (window.size() >= options_.maxProposalsPerWindow) {
        decision.status = AdmissionStatus::RateLimited;
        decision.reason = "agent exceeded " + std::to_string(options_.maxProposalsPerWindow)
            + " proposals per " + std::to_string(options_.windowMs / 1000) + "s";
        LOG(INFO) << "Rate limited agent " << agentId << " (" << window.size() << " in window)";
        return decision;
    }

    window.push_back(nowMs);
    return decision;
}

std::size_t ProposalGateway::TrackedAgents() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return admitted_.size();
}

std::size_t ProposalGateway::RecentCount(const std::string& agentId, uint64_t nowMs) {
    std::lock_guard<std::mutex> lock{mutex_};
    auto found = admitted_.find(agentId);
    if (found == admitted_.end()) {
        return 0;
    }

    Expire(found->second, nowMs);
    if (found->second.empty()) {
        admitted_.erase(found);
        return 0;
    }
    return found->second.size();
}

void ProposalGateway::Expire(Window& window, uint64_t nowMs) const {
    // The window is [now - windowMs, now]; entries stamped exactly windowMs ago still count.
    if (nowMs <= options_.windowMs) {
        return;
    }
    const uint64_t oldest = nowMs - options_.windowMs;
    while (!window.empty() && window.front() < oldest) {
        window.pop_front();
    }
}

void ProposalGateway::SweepDrained(uint64_t nowMs) {
    if (nowMs >= lastSweepMs_ && nowMs - lastSweepMs_ < options_.windowMs) {
        return;
    }
    lastSweepMs_ = nowMs;

    for (auto iter = admitted_.begin(); iter != admitted_.end();) {
        Expire(iter->second, nowMs);
        if (iter->second.empty()) {
            iter = admitted_.erase(iter);
        } else {
            ++iter;
        }
    }
}

} // namespace runtime
