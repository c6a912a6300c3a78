#pragma once

#include "Database.hpp"
#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "causal/EventStore.hpp"
#include "causal/SqliteEventJournal.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace testsupport {

inline causal::Proposal MakeProposal(const std::string& agentId, uint64_t nonce, uint64_t timestampMs,
    causal::ActionType type = causal::ActionType::SignatureRequest,
    std::optional<uint64_t> value = std::nullopt, std::string recipient = "0xabc") {
    causal::Proposal proposal;
    proposal.agentId = agentId;
    proposal.nonce = nonce;
    proposal.timestampMs = timestampMs;
    proposal.type = type;
    proposal.value = value;
    proposal.recipient = std::move(recipient);
    proposal.payload = {static_cast<uint8_t>(nonce), static_cast<uint8_t>(nonce >> 8), 0x5a};
    return proposal;
}

// Appends candidates for each proposal straight into the store, bypassing the
// logger, and returns the resulting chain.
inline causal::EventChain BuildChain(causal::EventStore& store, const std::string& scope,
    const std::vector<causal::Proposal>& proposals) {
    for (const auto& proposal : proposals) {
        store.Append(scope, causal::MakeCandidate(proposal));
    }
    return store.Snapshot(scope);
}

// Journal that keeps everything in memory and can be told to fail writes.
class MemoryJournal final : public causal::IEventJournal {
public:
    void WriteEvent(const std::string& scope, const causal::Event& event) override {
        if (failWrites) {
            throw DatabaseException("memory", 10, "disk I/O error");
        }
        events.push_back({scope, event});
    }

    void WriteAudit(const causal::AuditRecord& record) override {
        if (failWrites) {
            throw DatabaseException("memory", 10, "disk I/O error");
        }
        audit.push_back(record);
    }

    std::vector<causal::JournaledEvent> LoadEvents() override { return events; }
    std::vector<causal::AuditRecord> LoadAudit() override { return audit; }

    bool failWrites = false;
    std::vector<causal::JournaledEvent> events;
    std::vector<causal::AuditRecord> audit;
};

// Sqlite file in the temp directory, removed with its WAL files on destruction.
class TempDatabase {
public:
    TempDatabase() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / ("causalguard-test-" + std::to_string(stamp) + ".db");
    }

    ~TempDatabase() {
        std::error_code error;
        std::filesystem::remove(path_, error);
        std::filesystem::remove(path_.string() + "-wal", error);
        std::filesystem::remove(path_.string() + "-shm", error);
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    std::string Path() const { return path_.string(); }

    std::unique_ptr<causal::SqliteEventJournal> OpenJournal() const {
        auto connection = std::make_unique<SqliteDatabaseConnection>(Path());
        BootstrapEventSchema(*connection);
        return std::make_unique<causal::SqliteEventJournal>(std::move(connection));
    }

private:
    std::filesystem::path path_;
};

} // namespace testsupport
