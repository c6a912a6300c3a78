#pragma once

#include "runtime/ExecutionVerifier.hpp"
#include "runtime/SignatureCollector.hpp"

#include "causal/EventChain.hpp"
#include "policy/PolicyDecision.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace runtime {

class KeyRootRegistry;

enum class SignatureState {
    Signed,
    ThresholdUnmet,
};

inline const char* ToString(SignatureState state) {
    switch (state) {
    case SignatureState::Signed:
        return "signed";
    case SignatureState::ThresholdUnmet:
        return "threshold-unmet";
    }

    return "threshold-unmet";
}

struct SignatureOutcome {
    causal::ActionId actionId{};
    std::string agentId;
    SignatureState state = SignatureState::ThresholdUnmet;
    policy::RiskTier riskTier = policy::RiskTier::High;
    uint16_t requiredThreshold = 0;
    std::size_t signerCount = 0;
    SignatureBundle bundle;
    std::string reason;

    bool Signed() const { return state == SignatureState::Signed; }
};

struct OrchestratorOptions {
    std::chrono::milliseconds deadline{30000};
    std::size_t workers = 4;
};

// Turns a passing decision into a signature request and drives collection on
// its own worker pool. The threshold is always looked up from the tier;
// collection never runs on the caller's thread when dispatched.
class RiskOrchestrator {
public:
    using Completion = std::function<void(const SignatureOutcome&)>;

    RiskOrchestrator(const policy::ThresholdTable& thresholds, ISignatureCollector& collector,
        const KeyRootRegistry& keyRoots, OrchestratorOptions options);
    ~RiskOrchestrator();

    RiskOrchestrator(const RiskOrchestrator&) = delete;
    RiskOrchestrator& operator=(const RiskOrchestrator&) = delete;

    uint16_t RequiredThreshold(policy::RiskTier tier) const { return thresholds_.Lookup(tier); }

    // history is the scope before event. Throws std::invalid_argument for a
    // failing decision; those never reach the signers.
    SignatureRequest BuildRequest(const policy::Decision& decision, const causal::Event& event,
        const causal::EventChain& history) const;

    // Blocks for at most the deadline plus verification.
    SignatureOutcome Collect(const SignatureRequest& request);

    void Dispatch(SignatureRequest request, Completion onComplete);

    // Waits for every dispatched collection to complete.
    void Drain();
    void Shutdown();

    std::size_t InFlight() const;

private:
    const policy::ThresholdTable& thresholds_;
    ISignatureCollector& collector_;
    const KeyRootRegistry& keyRoots_;
    OrchestratorOptions options_;
    ExecutionVerifier verifier_;

    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t inFlight_ = 0;
    bool stopped_ = false;
};

} // namespace runtime
