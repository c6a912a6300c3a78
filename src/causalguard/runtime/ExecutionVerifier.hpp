#pragma once

#include "runtime/SignatureCollector.hpp"

#include <cstddef>
#include <string>

namespace runtime {

ExecutionCommitment MakeCommitment(uint64_t amount, const std::string& recipient, uint64_t nonce);

enum class VerificationFailure {
    None,
    ZeroCommitment,
    CommitmentMismatch,
    RootMismatch,
    InsufficientSigners,
};

inline const char* ToString(VerificationFailure failure) {
    switch (failure) {
    case VerificationFailure::None:
        return "none";
    case VerificationFailure::ZeroCommitment:
        return "zero-commitment";
    case VerificationFailure::CommitmentMismatch:
        return "commitment-mismatch";
    case VerificationFailure::RootMismatch:
        return "root-mismatch";
    case VerificationFailure::InsufficientSigners:
        return "insufficient-signers";
    }

    return "unknown";
}

struct VerificationResult {
    VerificationFailure failure = VerificationFailure::None;
    std::size_t distinctSigners = 0;
    std::string reason;

    bool Ok() const { return failure == VerificationFailure::None; }
};

// Checks a collected bundle against the request it answers, the way the
// settlement side would before executing: the commitment must be non-zero
// and re-derivable, the proof must be anchored at the expected key root, and
// enough distinct validators must have signed.
class ExecutionVerifier {
public:
    VerificationResult Verify(const SignatureRequest& request, const SignatureBundle& bundle,
        const causal::Digest& expectedKeyRoot) const;
};

} // namespace runtime
