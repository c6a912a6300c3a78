#include "catch.hpp"

#include "TestSupport.hpp"

#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "causal/CausalEventLogger.hpp"
#include "causal/SqliteEventJournal.hpp"

#include <thread>

using testsupport::MakeProposal;
using testsupport::TempDatabase;


SCENARIO("bootstrapping creates the event schema once", "[database][sqlite]") {
    SqliteDatabaseConnection db{":memory:"};

    auto created = BootstrapEventSchema(db);
    REQUIRE(created.created);
    REQUIRE(created.currentVersion == 1);
    REQUIRE(created.appliedMigrations == std::vector<std::string>{"V1"});

    auto existing = BootstrapEventSchema(db);
    REQUIRE_FALSE(existing.created);
    REQUIRE(existing.currentVersion == 1);
    REQUIRE(existing.appliedMigrations.empty());
}

SCENARIO("bootstrapping refuses a schema newer than the binary", "[database][sqlite]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapEventSchema(db);
    db.Execute("UPDATE schema_version SET version = 99");

    REQUIRE_THROWS_AS(BootstrapEventSchema(db), DatabaseException);
}

SCENARIO("events and audit records survive a reopen of the sqlite store", "[database][sqlite]") {
    TempDatabase database;
    auto withValue = MakeProposal("agent-1", 1, 1000, causal::ActionType::SignatureRequest, 250, "0xfeed");
    withValue.destinationChain = 42;
    auto withoutValue = MakeProposal("agent-1", 2, 2000, causal::ActionType::BalanceCheck);
    causal::Event firstStored;

    {
        causal::EventStore store{database.OpenJournal()};
        causal::CausalEventLogger logger{store, {}};
        firstStored = logger.Log(withValue).event;
        logger.Log(withoutValue);

        causal::AuditRecord record;
        record.timestampMs = 3000;
        record.agentId = "agent-1";
        record.kind = causal::AuditKind::PolicyRejected;
        record.reason = "max_daily_outflow: over cap";
        store.RecordAudit(record);
    }

    causal::EventStore reopened{database.OpenJournal()};
    auto chain = reopened.Snapshot("agent:agent-1");

    REQUIRE(chain.Size() == 2);
    REQUIRE(chain.VerifyIntegrity());

    const auto& first = chain[0];
    REQUIRE(causal::DigestEquals(first.eventHash, firstStored.eventHash));
    REQUIRE(first.value == std::optional<uint64_t>{250});
    REQUIRE(first.recipient == "0xfeed");
    REQUIRE(first.destinationChain == 42);
    REQUIRE_FALSE(first.prevHash.has_value());

    const auto& second = chain[1];
    REQUIRE(second.type == causal::ActionType::BalanceCheck);
    REQUIRE_FALSE(second.value.has_value());

    auto audit = reopened.AuditTrail();
    REQUIRE(audit.size() == 1);
    REQUIRE(audit[0].kind == causal::AuditKind::PolicyRejected);
    REQUIRE_FALSE(audit[0].actionId.has_value());
}

SCENARIO("a duplicate action id is rejected by the journal", "[database][sqlite]") {
    auto connection = std::make_unique<SqliteDatabaseConnection>(":memory:");
    BootstrapEventSchema(*connection);
    causal::SqliteEventJournal journal{std::move(connection)};

    auto event = causal::MakeCandidate(MakeProposal("agent-1", 1, 1000));
    event.eventHash = causal::ComputeEventHash(event);

    journal.WriteEvent("agent:agent-1", event);
    REQUIRE_THROWS_AS(journal.WriteEvent("agent:agent-1", event), DatabaseException);
    REQUIRE(journal.LoadEvents().size() == 1);
}

SCENARIO("scopes appending in parallel share one sqlite journal", "[database][sqlite][concurrency]") {
    TempDatabase database;
    constexpr int kScopes = 8;
    constexpr uint64_t kEventsPerScope = 50;

    {
        causal::EventStore store{database.OpenJournal()};
        std::vector<std::thread> writers;

        for (int scope = 0; scope < kScopes; ++scope) {
            writers.emplace_back([&store, scope]() {
                const auto agentId = "agent-" + std::to_string(scope);
                for (uint64_t nonce = 1; nonce <= kEventsPerScope; ++nonce) {
                    store.Append("agent:" + agentId, causal::MakeCandidate(MakeProposal(agentId, nonce, 1000 + nonce)));

                    causal::AuditRecord record;
                    record.timestampMs = 1000 + nonce;
                    record.agentId = agentId;
                    record.kind = causal::AuditKind::ThresholdUnmet;
                    record.reason = "collection timed-out";
                    store.RecordAudit(record);
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }

        REQUIRE(store.EventCount() == kScopes * kEventsPerScope);
    }

    causal::EventStore reopened{database.OpenJournal()};
    REQUIRE(reopened.EventCount() == kScopes * kEventsPerScope);
    REQUIRE(reopened.AuditTrail().size() == kScopes * kEventsPerScope);
    REQUIRE(reopened.Scopes().size() == kScopes);
    for (const auto& scope : reopened.Scopes()) {
        auto chain = reopened.Snapshot(scope);
        REQUIRE(chain.Size() == kEventsPerScope);
        REQUIRE(chain.VerifyIntegrity());
    }
}
