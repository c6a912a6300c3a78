#include "catch.hpp"

#include "TestSupport.hpp"

#include "causal/CausalEventLogger.hpp"

using testsupport::MakeProposal;
using testsupport::MemoryJournal;

SCENARIO("logging a proposal appends one linked event", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    auto first = logger.Log(MakeProposal("agent-1", 1, 1000));
    auto second = logger.Log(MakeProposal("agent-1", 2, 2000));

    REQUIRE_FALSE(first.duplicate);
    REQUIRE(first.scope == "agent:agent-1");
    REQUIRE(first.history.Empty());
    REQUIRE(second.history.Size() == 1);
    REQUIRE(causal::DigestEquals(*second.event.prevHash, first.event.eventHash));
    REQUIRE(logger.IndexSize() == 2);
    REQUIRE(logger.Contains(first.actionId));
}

SCENARIO("the logged history is the scope before the append, without copying it", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    logger.Log(MakeProposal("agent-1", 1, 1000));
    logger.Log(MakeProposal("agent-1", 2, 2000));
    auto third = logger.Log(MakeProposal("agent-1", 3, 3000));

    REQUIRE(third.history.Size() == 2);
    REQUIRE(third.history.Back().nonce == 2);
    REQUIRE(causal::DigestEquals(*third.event.prevHash, third.history.Back().eventHash));

    auto current = store.Snapshot("agent:agent-1");
    REQUIRE(current.Size() == 3);
    REQUIRE(&third.history[0] == &current[0]);
}

SCENARIO("resubmitting a proposal returns the original id without a new event", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    auto proposal = MakeProposal("agent-1", 1, 1000);
    auto first = logger.Log(proposal);
    auto again = logger.Log(proposal);

    REQUIRE(again.duplicate);
    REQUIRE(causal::DigestEquals(again.actionId, first.actionId));
    REQUIRE(causal::DigestEquals(again.event.eventHash, first.event.eventHash));
    REQUIRE(store.EventCount() == 1);
    REQUIRE(logger.IndexSize() == 1);
}

SCENARIO("oversized payloads are refused before touching history", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    auto proposal = MakeProposal("agent-1", 1, 1000);
    proposal.payload.assign(4097, 0xaa);

    try {
        logger.Log(proposal);
        FAIL("expected LogException");
    } catch (const causal::LogException& e) {
        REQUIRE(e.Code() == causal::LogError::PayloadTooLarge);
        REQUIRE_FALSE(e.IsRetryable());
    }

    proposal.payload.assign(4096, 0xaa);
    REQUIRE_NOTHROW(logger.Log(proposal));
    REQUIRE(store.EventCount() == 1);
}

SCENARIO("empty agent ids are invalid", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    try {
        logger.Log(MakeProposal("", 1, 1000));
        FAIL("expected LogException");
    } catch (const causal::LogException& e) {
        REQUIRE(e.Code() == causal::LogError::InvalidProposal);
    }
}

SCENARIO("out of order proposals are refused and audited", "[causal][logger]") {
    causal::EventStore store;
    causal::CausalEventLogger logger{store, {}};

    logger.Log(MakeProposal("agent-1", 5, 10000));

    try {
        logger.Log(MakeProposal("agent-1", 5, 11000));
        FAIL("expected LogException");
    } catch (const causal::LogException& e) {
        REQUIRE(e.Code() == causal::LogError::OrderingViolation);
        REQUIRE(e.Ordering() == causal::OrderingViolation::NonceRegression);
    }

    try {
        logger.Log(MakeProposal("agent-1", 6, 9400));
        FAIL("expected LogException");
    } catch (const causal::LogException& e) {
        REQUIRE(e.Ordering() == causal::OrderingViolation::TimestampRegression);
    }

    REQUIRE(store.EventCount() == 1);
    REQUIRE(logger.IndexSize() == 1);

    auto audit = store.AuditTrail();
    REQUIRE(audit.size() == 2);
    REQUIRE(audit[0].kind == causal::AuditKind::OrderingRejected);
    REQUIRE(audit[0].agentId == "agent-1");
}

SCENARIO("a store write failure surfaces as a retryable error and publishes nothing", "[causal][logger]") {
    auto journal = std::make_unique<MemoryJournal>();
    auto* journalView = journal.get();
    causal::EventStore store{std::move(journal)};
    causal::CausalEventLogger logger{store, {}};

    journalView->failWrites = true;
    auto proposal = MakeProposal("agent-1", 1, 1000);

    try {
        logger.Log(proposal);
        FAIL("expected LogException");
    } catch (const causal::LogException& e) {
        REQUIRE(e.Code() == causal::LogError::StoreUnavailable);
        REQUIRE(e.IsRetryable());
    }

    REQUIRE(store.EventCount() == 0);
    REQUIRE_FALSE(logger.Contains(causal::MakeCandidate(proposal).actionId));

    journalView->failWrites = false;
    auto receipt = logger.Log(proposal);
    REQUIRE_FALSE(receipt.duplicate);
    REQUIRE(journalView->events.size() == 1);
}

SCENARIO("global granularity puts every agent in one chain", "[causal][logger]") {
    causal::EventStore store;
    causal::LoggerOptions options;
    options.granularity = causal::ScopeGranularity::Global;
    causal::CausalEventLogger logger{store, options};

    logger.Log(MakeProposal("agent-1", 1, 1000));
    auto second = logger.Log(MakeProposal("agent-2", 2, 1000));

    REQUIRE(second.scope == "global");
    REQUIRE(second.history.Size() == 1);
    REQUIRE_THROWS_AS(logger.Log(MakeProposal("agent-3", 2, 1000)), causal::LogException);
}

SCENARIO("the idempotency index is rebuilt from a reopened store", "[causal][logger]") {
    auto proposal = MakeProposal("agent-1", 1, 1000);
    std::vector<causal::JournaledEvent> persisted;

    {
        auto journal = std::make_unique<MemoryJournal>();
        auto* journalView = journal.get();
        causal::EventStore store{std::move(journal)};
        causal::CausalEventLogger logger{store, {}};
        logger.Log(proposal);
        logger.Log(MakeProposal("agent-1", 2, 2000));
        persisted = journalView->events;
    }

    auto reopenedJournal = std::make_unique<MemoryJournal>();
    reopenedJournal->events = persisted;
    causal::EventStore reopened{std::move(reopenedJournal)};
    causal::CausalEventLogger logger{reopened, {}};

    REQUIRE(logger.IndexSize() == 2);
    REQUIRE(logger.Log(proposal).duplicate);
}

SCENARIO("a reopened store refuses a tampered journal", "[causal][store]") {
    std::vector<causal::JournaledEvent> persisted;
    {
        auto journal = std::make_unique<MemoryJournal>();
        auto* journalView = journal.get();
        causal::EventStore store{std::move(journal)};
        causal::CausalEventLogger logger{store, {}};
        logger.Log(MakeProposal("agent-1", 1, 1000, causal::ActionType::SignatureRequest, 10));
        logger.Log(MakeProposal("agent-1", 2, 2000, causal::ActionType::SignatureRequest, 20));
        persisted = journalView->events;
    }

    persisted[1].event.value = 20000;
    auto tampered = std::make_unique<MemoryJournal>();
    tampered->events = persisted;

    try {
        causal::EventStore reopened{std::move(tampered)};
        FAIL("expected StoreIntegrityException");
    } catch (const causal::StoreIntegrityException& e) {
        REQUIRE(e.Scope() == "agent:agent-1");
        REQUIRE(e.Position() == 1);
    }
}
