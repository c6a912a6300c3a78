#pragma once

#include <string>
#include <vector>

class IDatabaseConnection;

struct SchemaValidationResult {
    int currentVersion = 0;
    int requiredVersion = 0;
    bool created = false;
    std::vector<std::string> appliedMigrations;
};

// Creates the event journal schema on an empty database and validates the
// version of an existing one. Throws DatabaseException when the stored schema
// is newer than this binary understands.
SchemaValidationResult BootstrapEventSchema(IDatabaseConnection& db);
