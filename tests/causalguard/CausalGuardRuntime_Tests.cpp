#include "catch.hpp"

#include "TestSupport.hpp"

#include "policy/PolicyLoader.hpp"
#include "runtime/CausalGuardRuntime.hpp"
#include "runtime/LoopbackSignatureCollector.hpp"

#include <algorithm>
#include <thread>

using causal::ActionType;
using testsupport::MakeProposal;
using testsupport::MemoryJournal;
using testsupport::TempDatabase;

namespace {

constexpr uint64_t kNow = 1700000000000;
const std::string kCredential = "governor";

policy::Policy OutflowPolicy(uint64_t cap) {
    policy::Policy result;
    result.conditions.push_back(policy::MaxDailyOutflow{cap});
    return result;
}

causal::Digest CredentialDigest() {
    return causal::HashBytes(reinterpret_cast<const uint8_t*>(kCredential.data()), kCredential.size());
}

std::size_t CountAudit(const causal::EventStore& store, causal::AuditKind kind) {
    auto trail = store.AuditTrail();
    return static_cast<std::size_t>(std::count_if(
        trail.begin(), trail.end(), [kind](const causal::AuditRecord& record) { return record.kind == kind; }));
}

struct RuntimeFixture {
    explicit RuntimeFixture(policy::Policy initial = OutflowPolicy(10000),
        std::unique_ptr<causal::IEventJournal> journal = nullptr)
        : store{std::move(journal)}
        , collector{7, "runtime-test"}
        , runtime{store, collector, {}, std::move(initial), collector.KeyRoot(), CredentialDigest()} {}

    causal::EventStore store;
    runtime::LoopbackSignatureCollector collector;
    runtime::CausalGuardRuntime runtime;
};

} // namespace

SCENARIO("a compliant proposal is logged, evaluated and signed", "[runtime][flow]") {
    RuntimeFixture fixture;

    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 50), kNow);

    REQUIRE(outcome.result == runtime::ProposalResult::Accepted);
    REQUIRE(outcome.actionId.has_value());
    REQUIRE(outcome.decision->riskTier == policy::RiskTier::Low);
    REQUIRE(outcome.decision->requiredThreshold == 2);

    fixture.runtime.Drain();

    REQUIRE(fixture.runtime.Status(*outcome.actionId) == runtime::ActionStatus::Signed);
    auto signatures = fixture.runtime.Signatures(*outcome.actionId);
    REQUIRE(signatures.has_value());
    REQUIRE(signatures->signerCount == 2);
    REQUIRE(fixture.store.EventCount() == 1);
}

SCENARIO("resubmission returns the original action without reprocessing", "[runtime][flow]") {
    RuntimeFixture fixture;
    auto proposal = MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 50);

    auto first = fixture.runtime.Propose(proposal, kNow);
    fixture.runtime.Drain();
    auto again = fixture.runtime.Propose(proposal, kNow + 10);

    REQUIRE(again.result == runtime::ProposalResult::Duplicate);
    REQUIRE(causal::DigestEquals(*again.actionId, *first.actionId));
    REQUIRE(again.status == runtime::ActionStatus::Signed);
    REQUIRE(fixture.store.EventCount() == 1);
}

SCENARIO("the eleventh proposal in a minute never reaches the logger", "[runtime][flow][gateway]") {
    RuntimeFixture fixture{policy::Policy{}};

    for (uint64_t i = 1; i <= 10; ++i) {
        auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", i, kNow + i, ActionType::BalanceCheck, 1), kNow + i);
        REQUIRE(outcome.result == runtime::ProposalResult::Accepted);
    }

    const auto indexed = fixture.runtime.Logger().IndexSize();
    auto eleventh = fixture.runtime.Propose(MakeProposal("agent-1", 11, kNow + 11, ActionType::BalanceCheck, 1), kNow + 11);

    REQUIRE(eleventh.result == runtime::ProposalResult::AdmissionError);
    REQUIRE(eleventh.admission == runtime::AdmissionStatus::RateLimited);
    REQUIRE(eleventh.retryable);
    REQUIRE_FALSE(eleventh.actionId.has_value());
    REQUIRE(fixture.runtime.Logger().IndexSize() == indexed);
    REQUIRE(fixture.store.EventCount() == 10);
    REQUIRE(CountAudit(fixture.store, causal::AuditKind::AdmissionRejected) == 1);
}

SCENARIO("an oversized agent id is refused at admission", "[runtime][flow][gateway]") {
    RuntimeFixture fixture;
    const std::string oversized(300, 'x');

    auto outcome = fixture.runtime.Propose(MakeProposal(oversized, 1, kNow), kNow);

    REQUIRE(outcome.result == runtime::ProposalResult::AdmissionError);
    REQUIRE(outcome.admission == runtime::AdmissionStatus::InvalidAgent);
    REQUIRE_FALSE(outcome.retryable);
    REQUIRE(fixture.store.EventCount() == 0);

    auto trail = fixture.store.AuditTrail();
    REQUIRE(trail.size() == 1);
    REQUIRE(trail[0].kind == causal::AuditKind::AdmissionRejected);
    REQUIRE(trail[0].agentId.size() == causal::kMaxAgentIdBytes);
}

SCENARIO("a policy violation is reported and stays in history", "[runtime][flow][policy]") {
    RuntimeFixture fixture{OutflowPolicy(1000)};

    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 1500), kNow);

    REQUIRE(outcome.result == runtime::ProposalResult::PolicyViolation);
    REQUIRE(outcome.status == runtime::ActionStatus::Rejected);
    REQUIRE(outcome.decision->riskTier == policy::RiskTier::High);
    REQUIRE(outcome.decision->failedRule == policy::FailedRule::Condition);
    REQUIRE(fixture.runtime.Status(*outcome.actionId) == runtime::ActionStatus::Rejected);
    REQUIRE_FALSE(fixture.runtime.Signatures(*outcome.actionId).has_value());
    REQUIRE(fixture.store.EventCount() == 1);
    REQUIRE(CountAudit(fixture.store, causal::AuditKind::PolicyRejected) == 1);

    // The rejected attempt still counts toward the agent's outflow.
    auto next = fixture.runtime.Propose(MakeProposal("agent-1", 2, kNow + 1000, ActionType::SignatureRequest, 10), kNow + 1000);
    REQUIRE(next.result == runtime::ProposalResult::PolicyViolation);
}

SCENARIO("a timestamp regression is a temporal causality violation", "[runtime][flow][policy]") {
    RuntimeFixture fixture;

    fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow + 10000, ActionType::SignatureRequest, 50), kNow);
    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 2, kNow + 9400, ActionType::SignatureRequest, 50), kNow);

    REQUIRE(outcome.result == runtime::ProposalResult::PolicyViolation);
    REQUIRE(outcome.decision->failedRule == policy::FailedRule::TemporalCausality);
    REQUIRE(fixture.store.EventCount() == 1);
    REQUIRE(CountAudit(fixture.store, causal::AuditKind::OrderingRejected) == 1);
}

SCENARIO("missing signatures leave the action threshold-unmet", "[runtime][flow][signatures]") {
    RuntimeFixture fixture;
    fixture.collector.SetOffline({0, 1, 2, 3});

    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 5000), kNow);
    REQUIRE(outcome.result == runtime::ProposalResult::Accepted);
    REQUIRE(outcome.decision->requiredThreshold == 5);

    fixture.runtime.Drain();

    REQUIRE(fixture.runtime.Status(*outcome.actionId) == runtime::ActionStatus::ThresholdUnmet);
    REQUIRE(CountAudit(fixture.store, causal::AuditKind::ThresholdUnmet) == 1);
}

SCENARIO("an unavailable store is a retryable log error", "[runtime][flow][store]") {
    auto journal = std::make_unique<MemoryJournal>();
    auto* journalView = journal.get();
    RuntimeFixture fixture{OutflowPolicy(10000), std::move(journal)};
    journalView->failWrites = true;

    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 50), kNow);

    REQUIRE(outcome.result == runtime::ProposalResult::LogError);
    REQUIRE(outcome.logError == causal::LogError::StoreUnavailable);
    REQUIRE(outcome.retryable);
}

SCENARIO("a governed policy swap applies to the next proposal", "[runtime][flow][governance]") {
    RuntimeFixture fixture;

    REQUIRE(fixture.runtime.Propose(MakeProposal("agent-1", 1, kNow, ActionType::SignatureRequest, 800), kNow).result
        == runtime::ProposalResult::Accepted);

    auto tightened = OutflowPolicy(1000);
    tightened.name = "tightened";
    REQUIRE(fixture.runtime.GetGovernance().ReplacePolicy(kCredential, tightened, kNow).Applied());
    REQUIRE(fixture.runtime.Policies().Current()->name == "tightened");

    auto outcome = fixture.runtime.Propose(MakeProposal("agent-1", 2, kNow + 1000, ActionType::SignatureRequest, 800), kNow + 1000);
    REQUIRE(outcome.result == runtime::ProposalResult::PolicyViolation);
}

SCENARIO("agents proposing concurrently each keep an intact chain", "[runtime][flow][concurrency]") {
    RuntimeFixture fixture{policy::Policy{}};
    std::vector<std::thread> agents;

    for (int agent = 0; agent < 4; ++agent) {
        agents.emplace_back([&fixture, agent]() {
            const auto agentId = "agent-" + std::to_string(agent);
            for (uint64_t nonce = 1; nonce <= 5; ++nonce) {
                fixture.runtime.Propose(MakeProposal(agentId, nonce, kNow + nonce, ActionType::BalanceCheck, 1), kNow);
            }
        });
    }
    for (auto& agent : agents) {
        agent.join();
    }
    fixture.runtime.Drain();

    REQUIRE(fixture.store.EventCount() == 20);
    for (const auto& scope : fixture.store.Scopes()) {
        auto chain = fixture.store.Snapshot(scope);
        REQUIRE(chain.Size() == 5);
        REQUIRE(chain.VerifyIntegrity());
    }
}

SCENARIO("agents proposing concurrently over a sqlite journal lose nothing", "[runtime][flow][concurrency][sqlite]") {
    TempDatabase database;
    constexpr int kAgents = 4;
    constexpr uint64_t kProposalsPerAgent = 8;
    std::vector<runtime::ProposalResult> results(kAgents * kProposalsPerAgent, runtime::ProposalResult::LogError);

    {
        RuntimeFixture fixture{policy::Policy{}, database.OpenJournal()};
        // One validator left online, so every signing round ends in an audit
        // record written from the orchestrator while other agents append.
        fixture.collector.SetOffline({0, 1, 2, 3, 4, 5});

        std::vector<std::thread> agents;
        for (int agent = 0; agent < kAgents; ++agent) {
            agents.emplace_back([&fixture, &results, agent]() {
                const auto agentId = "agent-" + std::to_string(agent);
                for (uint64_t nonce = 1; nonce <= kProposalsPerAgent; ++nonce) {
                    auto outcome = fixture.runtime.Propose(
                        MakeProposal(agentId, nonce, kNow + nonce, ActionType::BalanceCheck, 1), kNow);
                    results[agent * kProposalsPerAgent + (nonce - 1)] = outcome.result;
                }
            });
        }
        for (auto& agent : agents) {
            agent.join();
        }
        fixture.runtime.Drain();

        REQUIRE(std::all_of(results.begin(), results.end(),
            [](runtime::ProposalResult result) { return result == runtime::ProposalResult::Accepted; }));
        REQUIRE(fixture.store.EventCount() == kAgents * kProposalsPerAgent);
        REQUIRE(CountAudit(fixture.store, causal::AuditKind::ThresholdUnmet) == kAgents * kProposalsPerAgent);
    }

    causal::EventStore reopened{database.OpenJournal()};
    REQUIRE(reopened.EventCount() == kAgents * kProposalsPerAgent);
    REQUIRE(CountAudit(reopened, causal::AuditKind::ThresholdUnmet) == kAgents * kProposalsPerAgent);
    for (const auto& scope : reopened.Scopes()) {
        auto chain = reopened.Snapshot(scope);
        REQUIRE(chain.Size() == kProposalsPerAgent);
        REQUIRE(chain.VerifyIntegrity());
    }
}
