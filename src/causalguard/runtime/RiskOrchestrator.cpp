#include "runtime/RiskOrchestrator.hpp"

#include "runtime/Governance.hpp"

#include "easylogging++.h"

#include <boost/asio/post.hpp>

#include <stdexcept>

namespace runtime {

RiskOrchestrator::RiskOrchestrator(const policy::ThresholdTable& thresholds, ISignatureCollector& collector,
    const KeyRootRegistry& keyRoots, OrchestratorOptions options)
    : thresholds_{thresholds}
    , collector_{collector}
    , keyRoots_{keyRoots}
    , options_{options}
    , pool_{options.workers == 0 ? 1 : options.workers} {}

RiskOrchestrator::~RiskOrchestrator() { Shutdown(); }

SignatureRequest RiskOrchestrator::BuildRequest(const policy::Decision& decision, const causal::Event& event,
    const causal::EventChain& history) const {
    if (!decision.Passed()) {
        throw std::invalid_argument("cannot request signatures for a failed decision");
    }

    SignatureRequest request;
    request.actionId = event.actionId;
    request.agentId = event.agentId;
    request.payloadDigest = event.payloadDigest;
    request.riskTier = decision.riskTier;
    request.requiredThreshold = RequiredThreshold(decision.riskTier);
    if (decision.requiredThreshold != request.requiredThreshold) {
        LOG(WARNING) << "Decision for " << causal::ToHex(event.actionId) << " carried threshold "
                     << decision.requiredThreshold << "; using " << request.requiredThreshold << " for tier "
                     << policy::ToString(decision.riskTier);
    }
    request.commitment = MakeCommitment(event.value.value_or(0), event.recipient, event.nonce);

    auto hashes = history.EventHashes();
    hashes.push_back(event.eventHash);
    request.historyRoot = causal::ComputeMerkleRoot(hashes);
    request.keyRoot = keyRoots_.Current();
    return request;
}

SignatureOutcome RiskOrchestrator::Collect(const SignatureRequest& request) {
    SignatureOutcome outcome;
    outcome.actionId = request.actionId;
    outcome.agentId = request.agentId;
    outcome.riskTier = request.riskTier;
    outcome.requiredThreshold = request.requiredThreshold;

    const auto started = std::chrono::steady_clock::now();
    CollectionResult collected;
    try {
        collected = collector_.Collect(request, options_.deadline);
    } catch (const std::exception& e) {
        outcome.reason = std::string{"signature collector failed: "} + e.what();
        LOG(ERROR) << "Signature collection for " << causal::ToHex(request.actionId) << " failed: " << e.what();
        return outcome;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    outcome.bundle = collected.bundle;

    if (elapsed > options_.deadline) {
        collected.status = CollectionStatus::TimedOut;
    }
    if (collected.status != CollectionStatus::Complete) {
        outcome.signerCount = collected.bundle.signatures.size();
        outcome.reason = std::string{"collection "} + ToString(collected.status)
            + (collected.detail.empty() ? "" : ": " + collected.detail);
        return outcome;
    }

    const auto verification = verifier_.Verify(request, collected.bundle, keyRoots_.Current());
    outcome.signerCount = verification.distinctSigners;
    if (!verification.Ok()) {
        outcome.reason = verification.reason;
        return outcome;
    }

    outcome.state = SignatureState::Signed;
    outcome.reason = std::to_string(outcome.signerCount) + " of " + std::to_string(request.requiredThreshold)
        + " signatures";
    return outcome;
}

void RiskOrchestrator::Dispatch(SignatureRequest request, Completion onComplete) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopped_) {
            throw std::runtime_error("orchestrator is shut down");
        }
        ++inFlight_;
    }

    boost::asio::post(pool_, [this, request = std::move(request), onComplete = std::move(onComplete)]() {
        const auto outcome = Collect(request);
        try {
            onComplete(outcome);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Signature completion handler for " << causal::ToHex(outcome.actionId)
                       << " threw: " << e.what();
        }

        std::lock_guard<std::mutex> lock{mutex_};
        --inFlight_;
        if (inFlight_ == 0) {
            idle_.notify_all();
        }
    });
}

void RiskOrchestrator::Drain() {
    std::unique_lock<std::mutex> lock{mutex_};
    idle_.wait(lock, [this]() { return inFlight_ == 0; });
}

void RiskOrchestrator::Shutdown() {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    pool_.join();
}

std::size_t RiskOrchestrator::InFlight() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return inFlight_;
}

} // namespace runtime
