#include "causal/SqliteEventJournal.hpp"

#include "Database.hpp"

namespace causal {

namespace {

void BindDigest(StatementHandle& stmt, int index, const Digest& digest) {
    stmt->BindBlob(index, digest.data(), digest.size());
}

ActionType ReadActionType(int64_t code) {
    auto type = ActionTypeFromCode(static_cast<int>(code));
    if (!type) {
        throw DatabaseException("sqlite", 0, "stored event has unknown type " + std::to_string(code));
    }
    return *type;
}

} // namespace

SqliteEventJournal::SqliteEventJournal(std::unique_ptr<IDatabaseConnection> db)
    : db_{std::move(db)} {}

SqliteEventJournal::~SqliteEventJournal() = default;

void SqliteEventJournal::WriteEvent(const std::string& scope, const Event& event) {
    char sql[] = "INSERT INTO causal_event (scope, action_id, agent_id, event_type, nonce, timestamp_ms, "
                 "payload_digest, value, recipient, destination_chain, prev_hash, event_hash) VALUES "
                 "(@scope, @action_id, @agent_id, @event_type, @nonce, @timestamp_ms, @payload_digest, "
                 "@value, @recipient, @destination_chain, @prev_hash, @event_hash)";

    std::lock_guard<std::mutex> lock{mutex_};
    TransactionScope transaction{db_->BeginTransaction()};
    StatementHandle stmt{db_->Prepare(sql)};

    stmt->BindText(stmt->BindParameterIndex("@scope"), scope);
    BindDigest(stmt, stmt->BindParameterIndex("@action_id"), event.actionId);
    stmt->BindText(stmt->BindParameterIndex("@agent_id"), event.agentId);
    stmt->BindInt(stmt->BindParameterIndex("@event_type"), static_cast<int64_t>(event.type));
    stmt->BindInt(stmt->BindParameterIndex("@nonce"), static_cast<int64_t>(event.nonce));
    stmt->BindInt(stmt->BindParameterIndex("@timestamp_ms"), static_cast<int64_t>(event.timestampMs));
    BindDigest(stmt, stmt->BindParameterIndex("@payload_digest"), event.payloadDigest);

    int valueIdx = stmt->BindParameterIndex("@value");
    if (event.value) {
        stmt->BindInt(valueIdx, static_cast<int64_t>(*event.value));
    } else {
        stmt->BindNull(valueIdx);
    }

    stmt->BindText(stmt->BindParameterIndex("@recipient"), event.recipient);
    stmt->BindInt(stmt->BindParameterIndex("@destination_chain"), event.destinationChain);

    int prevHashIdx = stmt->BindParameterIndex("@prev_hash");
    if (event.prevHash) {
        BindDigest(stmt, prevHashIdx, *event.prevHash);
    } else {
        stmt->BindNull(prevHashIdx);
    }

    BindDigest(stmt, stmt->BindParameterIndex("@event_hash"), event.eventHash);

    stmt.ExpectDone("event insert");
    transaction.Commit();
}

void SqliteEventJournal::WriteAudit(const AuditRecord& record) {
    char sql[] = "INSERT INTO audit_record (timestamp_ms, agent_id, action_id, kind, reason) VALUES "
                 "(@timestamp_ms, @agent_id, @action_id, @kind, @reason)";

    std::lock_guard<std::mutex> lock{mutex_};
    StatementHandle stmt{db_->Prepare(sql)};
    stmt->BindInt(stmt->BindParameterIndex("@timestamp_ms"), static_cast<int64_t>(record.timestampMs));
    stmt->BindText(stmt->BindParameterIndex("@agent_id"), record.agentId);

    int actionIdIdx = stmt->BindParameterIndex("@action_id");
    if (record.actionId) {
        BindDigest(stmt, actionIdIdx, *record.actionId);
    } else {
        stmt->BindNull(actionIdIdx);
    }

    stmt->BindInt(stmt->BindParameterIndex("@kind"), static_cast<int64_t>(record.kind));
    stmt->BindText(stmt->BindParameterIndex("@reason"), record.reason);
    stmt.ExpectDone("audit insert");
}

std::vector<JournaledEvent> SqliteEventJournal::LoadEvents() {
    std::vector<JournaledEvent> events;

    char sql[] = "SELECT scope, action_id, agent_id, event_type, nonce, timestamp_ms, payload_digest, "
                 "value, recipient, destination_chain, prev_hash, event_hash FROM causal_event ORDER BY seq";

    std::lock_guard<std::mutex> lock{mutex_};
    StatementHandle stmt{db_->Prepare(sql)};
    while (stmt->Step() == StatementStepResult::Row) {
        JournaledEvent entry;
        entry.scope = stmt->ColumnText(0);

        auto& event = entry.event;
        event.actionId = DigestFromBlob(stmt->ColumnBlob(1));
        event.agentId = stmt->ColumnText(2);
        event.type = ReadActionType(stmt->ColumnInt64(3));
        event.nonce = static_cast<uint64_t>(stmt->ColumnInt64(4));
        event.timestampMs = static_cast<uint64_t>(stmt->ColumnInt64(5));
        event.payloadDigest = DigestFromBlob(stmt->ColumnBlob(6));
        if (!stmt->ColumnIsNull(7)) {
            event.value = static_cast<uint64_t>(stmt->ColumnInt64(7));
        }
        event.recipient = stmt->ColumnText(8);
        event.destinationChain = static_cast<uint16_t>(stmt->ColumnInt64(9));
        if (!stmt->ColumnIsNull(10)) {
            event.prevHash = DigestFromBlob(stmt->ColumnBlob(10));
        }
        event.eventHash = DigestFromBlob(stmt->ColumnBlob(11));

        events.push_back(std::move(entry));
    }

    return events;
}

std::vector<AuditRecord> SqliteEventJournal::LoadAudit() {
    std::vector<AuditRecord> records;

    std::lock_guard<std::mutex> lock{mutex_};
    StatementHandle stmt{db_->Prepare(
        "SELECT timestamp_ms, agent_id, action_id, kind, reason FROM audit_record ORDER BY id")};
    while (stmt->Step() == StatementStepResult::Row) {
        AuditRecord record;
        record.timestampMs = static_cast<uint64_t>(stmt->ColumnInt64(0));
        record.agentId = stmt->ColumnText(1);
        if (!stmt->ColumnIsNull(2)) {
            record.actionId = DigestFromBlob(stmt->ColumnBlob(2));
        }
        record.kind = static_cast<AuditKind>(stmt->ColumnInt64(3));
        record.reason = stmt->ColumnText(4);
        records.push_back(std::move(record));
    }

    return records;
}

} // namespace causal
