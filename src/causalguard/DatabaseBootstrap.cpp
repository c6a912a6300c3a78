#include "DatabaseBootstrap.hpp"

#include "Database.hpp"

#include <utility>

namespace {
constexpr int kRequiredSchemaVersion = 1;

std::vector<std::pair<int, std::vector<std::string>>> MigrationCatalog() {
    return {
        {1, {
            "CREATE TABLE IF NOT EXISTS causal_event ("
            "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
            "scope TEXT NOT NULL, "
            "action_id BLOB NOT NULL UNIQUE, "
            "agent_id TEXT NOT NULL, "
            "event_type INTEGER NOT NULL, "
            "nonce INTEGER NOT NULL, "
            "timestamp_ms INTEGER NOT NULL, "
            "payload_digest BLOB NOT NULL, "
            "value INTEGER, "
            "recipient TEXT NOT NULL, "
            "destination_chain INTEGER NOT NULL, "
            "prev_hash BLOB, "
            "event_hash BLOB NOT NULL)",
            "CREATE INDEX IF NOT EXISTS causal_event_scope_idx ON causal_event (scope, seq)",
            "CREATE TABLE IF NOT EXISTS audit_record ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "timestamp_ms INTEGER NOT NULL, "
            "agent_id TEXT NOT NULL, "
            "action_id BLOB, "
            "kind INTEGER NOT NULL, "
            "reason TEXT NOT NULL)",
            "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL)",
        }},
    };
}

bool TableExists(IDatabaseConnection& db, const std::string& tableName) {
    StatementHandle stmt{db.Prepare(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = @table_name")};
    int tableNameIdx = stmt->BindParameterIndex("@table_name");
    stmt->BindText(tableNameIdx, tableName);
    return stmt->Step() == StatementStepResult::Row;
}

int ReadSchemaVersion(IDatabaseConnection& db) {
    StatementHandle stmt{db.Prepare("SELECT version FROM schema_version LIMIT 1")};
    if (stmt->Step() != StatementStepResult::Row) {
        return 0;
    }

    return static_cast<int>(stmt->ColumnInt64(0));
}

void WriteSchemaVersion(IDatabaseConnection& db, int version) {
    db.Execute("DELETE FROM schema_version");

    StatementHandle stmt{db.Prepare("INSERT INTO schema_version (version) VALUES (@version)")};
    stmt->BindInt(stmt->BindParameterIndex("@version"), version);
    stmt.ExpectDone("schema version update");
}

} // namespace

SchemaValidationResult BootstrapEventSchema(IDatabaseConnection& db) {
    const auto migrations = MigrationCatalog();
    const int latestKnownVersion = migrations.back().first;

    SchemaValidationResult result;
    result.requiredVersion = kRequiredSchemaVersion;
    result.created = !TableExists(db, "schema_version");

    int currentVersion = result.created ? 0 : ReadSchemaVersion(db);
    if (currentVersion > latestKnownVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "event store schema version " + std::to_string(currentVersion)
                + " is newer than this binary supports (latest known migration: "
                + std::to_string(latestKnownVersion) + ")");
    }

    for (const auto& migration : migrations) {
        if (migration.first <= currentVersion) {
            continue;
        }

        TransactionScope transaction{db.BeginTransaction()};
        for (const auto& statement : migration.second) {
            db.Execute(statement);
        }
        WriteSchemaVersion(db, migration.first);
        transaction.Commit();

        currentVersion = migration.first;
        result.appliedMigrations.push_back("V" + std::to_string(migration.first));
    }

    result.currentVersion = currentVersion;
    return result;
}
