#include "DatabaseSqlite.hpp"

#include <sqlite3.h>

namespace {

constexpr int kBusyTimeoutMs = 5000;

DatabaseException MakeSqliteError(sqlite3* db, int code, const std::string& context) {
    const char* rawMessage = db ? sqlite3_errmsg(db) : nullptr;
    std::string message = rawMessage ? rawMessage : "unknown sqlite error";
    return DatabaseException("sqlite", code, context + ": " + message);
}

DatabaseException MakeSqliteError(int code, const std::string& context, const std::string& message) {
    return DatabaseException("sqlite", code, context + ": " + message);
}

void ExecuteRaw(sqlite3* db, const std::string& sql, const std::string& context) {
    char* err = nullptr;
    auto result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (result != SQLITE_OK) {
        std::string message = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw MakeSqliteError(result, context, message);
    }
}

class SqliteStatement final : public IStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql)
        : db_{db}
        , stmt_{nullptr} {
        auto result = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (result != SQLITE_OK) {
            throw MakeSqliteError(db_, result, "prepare failed");
        }
    }

    ~SqliteStatement() override { sqlite3_finalize(stmt_); }

    int BindParameterIndex(const std::string& name) const override {
        auto index = sqlite3_bind_parameter_index(stmt_, name.c_str());
        if (index == 0) {
            throw DatabaseException("sqlite", SQLITE_MISUSE, "missing parameter: " + name);
        }

        return index;
    }

    void BindInt(int index, int64_t value) override {
        if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
            throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind int failed");
        }
    }

    void BindText(int index, const std::string& value) override {
        if (sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
            throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind text failed");
        }
    }

    void BindBlob(int index, const uint8_t* data, size_t length) override {
        if (sqlite3_bind_blob(stmt_, index, data, static_cast<int>(length), SQLITE_TRANSIENT) != SQLITE_OK) {
            throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind blob failed");
        }
    }

    void BindNull(int index) override {
        if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
            throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind null failed");
        }
    }

    StatementStepResult Step() override {
        auto result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW) {
            return StatementStepResult::Row;
        }
        if (result == SQLITE_DONE) {
            return StatementStepResult::Done;
        }
        throw MakeSqliteError(db_, result, "step failed");
    }

    int64_t ColumnInt64(int index) const override { return sqlite3_column_int64(stmt_, index); }

    std::string ColumnText(int index) const override {
        auto* text = sqlite3_column_text(stmt_, index);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::vector<uint8_t> ColumnBlob(int index) const override {
        auto* data = reinterpret_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
        auto length = sqlite3_column_bytes(stmt_, index);
        if (data == nullptr || length <= 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + length);
    }

    bool ColumnIsNull(int index) const override {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class SqliteTransaction final : public ITransaction {
public:
    explicit SqliteTransaction(sqlite3* db)
        : db_{db}
        , done_{false} {
        ExecuteRaw(db_, "BEGIN IMMEDIATE", "transaction failed");
    }

    ~SqliteTransaction() override {
        if (!done_) {
            try {
                Rollback();
            } catch (const DatabaseException& e) {
                LOG(WARNING) << "sqlite rollback failed: " << e.what();
            }
        }
    }

    void Commit() override {
        ExecuteRaw(db_, "COMMIT", "transaction failed");
        done_ = true;
    }

    void Rollback() override {
        done_ = true;
        ExecuteRaw(db_, "ROLLBACK", "transaction failed");
    }

private:
    sqlite3* db_;
    bool done_;
};
} // namespace

SqliteDatabaseConnection::SqliteDatabaseConnection(const std::string& path)
    : db_{nullptr} {
    auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    auto result = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        auto error = MakeSqliteError(db_, result, "open database failed");
        sqlite3_close(db_);
        db_ = nullptr;
        throw error;
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    ExecuteRaw(db_, "PRAGMA journal_mode=WAL", "pragma failed");
    ExecuteRaw(db_, "PRAGMA synchronous=FULL", "pragma failed");
}

SqliteDatabaseConnection::~SqliteDatabaseConnection() { sqlite3_close(db_); }

std::unique_ptr<IStatement> SqliteDatabaseConnection::Prepare(const std::string& sql) {
    return std::make_unique<SqliteStatement>(db_, sql);
}

std::unique_ptr<ITransaction> SqliteDatabaseConnection::BeginTransaction() {
    return std::make_unique<SqliteTransaction>(db_);
}

void SqliteDatabaseConnection::Execute(const std::string& sql) {
    ExecuteRaw(db_, sql, "execute failed");
}

std::string SqliteDatabaseConnection::BackendName() const { return "sqlite"; }
