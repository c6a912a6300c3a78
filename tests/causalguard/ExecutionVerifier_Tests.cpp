#include "catch.hpp"

#include "runtime/ExecutionVerifier.hpp"
#include "runtime/LoopbackSignatureCollector.hpp"

namespace {

runtime::SignatureRequest MakeRequest(uint16_t threshold, const causal::Digest& keyRoot) {
    runtime::SignatureRequest request;
    request.actionId = causal::HashBytes(std::vector<uint8_t>{1});
    request.payloadDigest = causal::HashBytes(std::vector<uint8_t>{2});
    request.requiredThreshold = threshold;
    request.commitment = runtime::MakeCommitment(250, "0xabc", 7);
    request.keyRoot = keyRoot;
    return request;
}

} // namespace

SCENARIO("commitments bind amount, recipient and nonce", "[runtime][verifier]") {
    const auto base = runtime::MakeCommitment(250, "0xabc", 7);

    REQUIRE_FALSE(causal::IsZero(base.binding));
    REQUIRE(causal::DigestEquals(base.binding, runtime::MakeCommitment(250, "0xabc", 7).binding));
    REQUIRE_FALSE(causal::DigestEquals(base.binding, runtime::MakeCommitment(251, "0xabc", 7).binding));
    REQUIRE_FALSE(causal::DigestEquals(base.binding, runtime::MakeCommitment(250, "0xabd", 7).binding));
    REQUIRE_FALSE(causal::DigestEquals(base.binding, runtime::MakeCommitment(250, "0xabc", 8).binding));
}

SCENARIO("a complete loopback bundle verifies", "[runtime][verifier]") {
    runtime::LoopbackSignatureCollector collector{7, "verifier-test"};
    auto request = MakeRequest(5, collector.KeyRoot());

    auto collected = collector.Collect(request, std::chrono::milliseconds{1000});
    REQUIRE(collected.status == runtime::CollectionStatus::Complete);

    auto result = runtime::ExecutionVerifier{}.Verify(request, collected.bundle, collector.KeyRoot());
    REQUIRE(result.Ok());
    REQUIRE(result.distinctSigners == 5);
}

SCENARIO("verification rejects zero or altered commitments", "[runtime][verifier]") {
    runtime::LoopbackSignatureCollector collector{3, "verifier-test"};
    auto request = MakeRequest(2, collector.KeyRoot());
    auto bundle = collector.Collect(request, std::chrono::milliseconds{1000}).bundle;
    runtime::ExecutionVerifier verifier;

    auto zeroed = request;
    zeroed.commitment.binding = causal::Digest{};
    REQUIRE(verifier.Verify(zeroed, bundle, collector.KeyRoot()).failure == runtime::VerificationFailure::ZeroCommitment);

    auto altered = request;
    altered.commitment.amount = 1000000;
    REQUIRE(verifier.Verify(altered, bundle, collector.KeyRoot()).failure
        == runtime::VerificationFailure::CommitmentMismatch);
}

SCENARIO("verification rejects a proof anchored at another key root", "[runtime][verifier]") {
    runtime::LoopbackSignatureCollector collector{3, "verifier-test"};
    runtime::LoopbackSignatureCollector impostor{3, "impostor"};
    auto request = MakeRequest(2, collector.KeyRoot());
    auto bundle = impostor.Collect(request, std::chrono::milliseconds{1000}).bundle;

    auto result = runtime::ExecutionVerifier{}.Verify(request, bundle, collector.KeyRoot());
    REQUIRE(result.failure == runtime::VerificationFailure::RootMismatch);
}

SCENARIO("repeated signatures from one validator count once", "[runtime][verifier]") {
    runtime::LoopbackSignatureCollector collector{3, "verifier-test"};
    auto request = MakeRequest(2, collector.KeyRoot());
    auto bundle = collector.Collect(request, std::chrono::milliseconds{1000}).bundle;
    REQUIRE(bundle.signatures.size() == 2);

    bundle.signatures[1] = bundle.signatures[0];

    auto result = runtime::ExecutionVerifier{}.Verify(request, bundle, collector.KeyRoot());
    REQUIRE(result.failure == runtime::VerificationFailure::InsufficientSigners);
    REQUIRE(result.distinctSigners == 1);
}

SCENARIO("the loopback set fails when too few validators answer", "[runtime][verifier]") {
    runtime::LoopbackSignatureCollector collector{5, "verifier-test"};
    collector.SetOffline({0, 1, 2});

    auto collected = collector.Collect(MakeRequest(3, collector.KeyRoot()), std::chrono::milliseconds{1000});
    REQUIRE(collected.status == runtime::CollectionStatus::Failed);
    REQUIRE(collected.bundle.signatures.size() == 2);
}
