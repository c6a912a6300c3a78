#pragma once

#include "Database.hpp"

#include <memory>

struct CausalGuardConfig;

namespace causal {
class EventStore;
}

std::unique_ptr<IDatabaseConnection> CreateDatabaseConnection(const CausalGuardConfig& config);

// Opens the configured store, bootstrapping the schema and replaying and
// verifying every stored chain. Throws DatabaseException or
// causal::StoreIntegrityException.
std::unique_ptr<causal::EventStore> CreateEventStore(const CausalGuardConfig& config);
