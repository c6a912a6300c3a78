#include "DatabaseFactory.hpp"

#include "CausalGuardConfig.hpp"
#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "causal/EventStore.hpp"
#include "causal/SqliteEventJournal.hpp"

#include "easylogging++.h"

#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

namespace {
std::string Join(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "none";
    }

    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

void LogSchemaStatus(const IDatabaseConnection& db, const SchemaValidationResult& result) {
    LOG(INFO) << "Event store backend selected: " << db.BackendName();
    LOG(INFO) << "Event store schema version: " << result.currentVersion << " (required "
              << result.requiredVersion << ")" << (result.created ? ", created" : "");
    LOG(INFO) << "Applied migrations: " << Join(result.appliedMigrations);
}

void EnsureParentDirectory(const std::string& path) {
    if (path.empty() || path == ":memory:") {
        return;
    }

    const auto parent = std::filesystem::path{path}.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code error;
    std::filesystem::create_directories(parent, error);
    if (error) {
        LOG(WARNING) << "Cannot create store directory " << parent.string() << ": " << error.message();
    }
}
} // namespace

std::unique_ptr<IDatabaseConnection> CreateDatabaseConnection(const CausalGuardConfig& config) {
    if (config.storeEngine != "sqlite") {
        throw DatabaseException("database", 0,
            "unsupported store_engine '" + config.storeEngine + "' for a database connection; expected sqlite");
    }

    if (config.storePath.empty()) {
        throw DatabaseException("database", 0, "store_engine=sqlite requires store_path");
    }

    EnsureParentDirectory(config.storePath);
    std::unique_ptr<IDatabaseConnection> connection = std::make_unique<SqliteDatabaseConnection>(config.storePath);

    const auto validation = BootstrapEventSchema(*connection);
    LogSchemaStatus(*connection, validation);

    return connection;
}

std::unique_ptr<causal::EventStore> CreateEventStore(const CausalGuardConfig& config) {
    if (config.storeEngine == "memory") {
        LOG(WARNING) << "Event store is memory only; history will not survive a restart";
        return std::make_unique<causal::EventStore>(nullptr, config.skewToleranceMs);
    }

    if (config.storeEngine != "sqlite") {
        throw DatabaseException("database", 0,
            "unsupported store_engine '" + config.storeEngine + "'; expected sqlite or memory");
    }

    auto journal = std::make_unique<causal::SqliteEventJournal>(CreateDatabaseConnection(config));
    auto store = std::make_unique<causal::EventStore>(std::move(journal), config.skewToleranceMs);
    LOG(INFO) << "Replayed " << store->EventCount() << " events across " << store->Scopes().size()
              << " scopes from " << config.storePath;
    return store;
}
