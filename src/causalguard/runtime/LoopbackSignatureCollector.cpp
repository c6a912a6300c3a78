#include "runtime/LoopbackSignatureCollector.hpp"

#include "causal/Merkle.hpp"

namespace runtime {

LoopbackSignatureCollector::LoopbackSignatureCollector(uint16_t validatorCount, const std::string& sessionSeed)
    : offline_(validatorCount, false) {
    for (uint16_t i = 0; i < validatorCount; ++i) {
        causal::Sha3Hasher secret;
        secret.Update(std::string{"loopback-validator"}).Update(sessionSeed).UpdateU16(i);
        secrets_.push_back(secret.Finalize());

        causal::Sha3Hasher publicKey;
        publicKey.Update(std::string{"loopback-public"}).Update(secrets_.back());
        publicKeys_.push_back(publicKey.Finalize());
    }
    keyRoot_ = causal::ComputeMerkleRoot(publicKeys_);
}

void LoopbackSignatureCollector::SetOffline(std::vector<uint16_t> validatorIds) {
    std::lock_guard<std::mutex> lock{mutex_};
    offline_.assign(secrets_.size(), false);
    for (auto id : validatorIds) {
        if (id < offline_.size()) {
            offline_[id] = true;
        }
    }
}

CollectionResult LoopbackSignatureCollector::Collect(const SignatureRequest& request, std::chrono::milliseconds) {
    CollectionResult result;
    result.bundle.aggregateProofRoot = keyRoot_;

    std::lock_guard<std::mutex> lock{mutex_};

    for (uint16_t i = 0; i < secrets_.size() && result.bundle.signatures.size() < request.requiredThreshold; ++i) {
        if (offline_[i]) {
            continue;
        }

        causal::Sha3Hasher hasher;
        hasher.Update(secrets_[i])
            .Update(request.actionId)
            .Update(request.payloadDigest)
            .Update(request.commitment.binding);
        const auto digest = hasher.Finalize();

        ValidatorSignature signature;
        signature.validatorId = i;
        signature.signature.assign(digest.begin(), digest.end());
        result.bundle.signatures.push_back(std::move(signature));
    }

    if (result.bundle.signatures.size() < request.requiredThreshold) {
        result.status = CollectionStatus::Failed;
        result.detail = "only " + std::to_string(result.bundle.signatures.size()) + " validators available";
    } else {
        result.status = CollectionStatus::Complete;
    }
    return result;
}

} // namespace runtime
