#pragma once

#include "Database.hpp"

struct sqlite3;

class SqliteDatabaseConnection final : public IDatabaseConnection {
public:
    explicit SqliteDatabaseConnection(const std::string& path);
    ~SqliteDatabaseConnection() override;

    SqliteDatabaseConnection(const SqliteDatabaseConnection&) = delete;
    SqliteDatabaseConnection& operator=(const SqliteDatabaseConnection&) = delete;

    std::unique_ptr<IStatement> Prepare(const std::string& sql) override;
    std::unique_ptr<ITransaction> BeginTransaction() override;
    void Execute(const std::string& sql) override;
    std::string BackendName() const override;

    sqlite3* GetNativeHandle() const { return db_; }

private:
    sqlite3* db_;
};
