#include "runtime/ExecutionVerifier.hpp"

#include <set>

namespace runtime {

namespace {
constexpr uint8_t kCommitmentTag = 0x43;
}

ExecutionCommitment MakeCommitment(uint64_t amount, const std::string& recipient, uint64_t nonce) {
    ExecutionCommitment commitment;
    commitment.amount = amount;
    commitment.recipient = recipient;
    commitment.nonce = nonce;

    causal::Sha3Hasher hasher;
    hasher.UpdateU8(kCommitmentTag).UpdateU64(amount).Update(recipient).UpdateU64(nonce);
    commitment.binding = hasher.Finalize();
    return commitment;
}

VerificationResult ExecutionVerifier::Verify(const SignatureRequest& request, const SignatureBundle& bundle,
    const causal::Digest& expectedKeyRoot) const {
    VerificationResult result;

    if (causal::IsZero(request.commitment.binding)) {
        result.failure = VerificationFailure::ZeroCommitment;
        result.reason = "execution commitment is zero";
        return result;
    }

    const auto rederived = MakeCommitment(
        request.commitment.amount, request.commitment.recipient, request.commitment.nonce);
    if (!causal::DigestEquals(rederived.binding, request.commitment.binding)) {
        result.failure = VerificationFailure::CommitmentMismatch;
        result.reason = "execution commitment does not match amount, recipient and nonce";
        return result;
    }

    if (causal::IsZero(expectedKeyRoot) || !causal::DigestEquals(bundle.aggregateProofRoot, expectedKeyRoot)) {
        result.failure = VerificationFailure::RootMismatch;
        result.reason = "aggregate proof root " + causal::ToHex(bundle.aggregateProofRoot)
            + " does not match key root " + causal::ToHex(expectedKeyRoot);
        return result;
    }

    std::set<uint16_t> signers;
    for (const auto& signature : bundle.signatures) {
        if (!signature.signature.empty()) {
            signers.insert(signature.validatorId);
        }
    }
    result.distinctSigners = signers.size();

    if (result.distinctSigners < request.requiredThreshold) {
        result.failure = VerificationFailure::InsufficientSigners;
        result.reason = std::to_string(result.distinctSigners) + " of "
            + std::to_string(request.requiredThreshold) + " required signatures";
        return result;
    }

    return result;
}

} // namespace runtime
