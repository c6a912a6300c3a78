#pragma once

#include "causal/EventStore.hpp"

#include <mutex>

class IDatabaseConnection;

namespace causal {

// Every scope shares one connection, so each call holds mutex_ for its whole
// statement or transaction.
class SqliteEventJournal final : public IEventJournal {
public:
    // The connection must already carry the event schema (see BootstrapEventSchema).
    explicit SqliteEventJournal(std::unique_ptr<IDatabaseConnection> db);
    ~SqliteEventJournal() override;

    void WriteEvent(const std::string& scope, const Event& event) override;
    void WriteAudit(const AuditRecord& record) override;

    std::vector<JournaledEvent> LoadEvents() override;
    std::vector<AuditRecord> LoadAudit() override;

private:
    std::mutex mutex_;
    std::unique_ptr<IDatabaseConnection> db_;
};

} // namespace causal
