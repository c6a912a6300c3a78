#pragma once

#include "runtime/SignatureCollector.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace runtime {

// In-process validator set for development and tests. Each validator holds a
// key derived from the session seed and signs H(key || payload || commitment).
// The set's key root is the Merkle root over the validators' public digests.
class LoopbackSignatureCollector final : public ISignatureCollector {
public:
    LoopbackSignatureCollector(uint16_t validatorCount, const std::string& sessionSeed);

    CollectionResult Collect(const SignatureRequest& request, std::chrono::milliseconds deadline) override;

    causal::Digest KeyRoot() const { return keyRoot_; }
    uint16_t ValidatorCount() const { return static_cast<uint16_t>(secrets_.size()); }

    // Validators listed here do not answer.
    void SetOffline(std::vector<uint16_t> validatorIds);

private:
    std::vector<causal::Digest> secrets_;
    std::vector<causal::Digest> publicKeys_;
    causal::Digest keyRoot_{};

    std::mutex mutex_;
    std::vector<bool> offline_;
};

} // namespace runtime
