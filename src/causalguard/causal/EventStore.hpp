#pragma once

#include "causal/AuditRecord.hpp"
#include "causal/EventChain.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace causal {

class StoreIntegrityException : public std::runtime_error {
public:
    StoreIntegrityException(const std::string& scope, std::size_t position)
        : std::runtime_error("event chain '" + scope + "' fails verification at position "
              + std::to_string(position))
        , scope_{scope}
        , position_{position} {}

    const std::string& Scope() const { return scope_; }
    std::size_t Position() const { return position_; }

private:
    std::string scope_;
    std::size_t position_;
};

struct JournaledEvent {
    std::string scope;
    Event event;
};

// Durable backing for the event store. Implementations throw
// DatabaseException when a write cannot be made durable.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual void WriteEvent(const std::string& scope, const Event& event) = 0;
    virtual void WriteAudit(const AuditRecord& record) = 0;

    // Events in global append order.
    virtual std::vector<JournaledEvent> LoadEvents() = 0;
    virtual std::vector<AuditRecord> LoadAudit() = 0;
};

// Append-only, hash-linked history partitioned by causal scope. Events are
// linked by value (prevHash) rather than by pointer. Without a journal the
// store is memory only.
class EventStore {
public:
    explicit EventStore(std::unique_ptr<IEventJournal> journal = nullptr,
        uint64_t skewToleranceMs = kDefaultSkewToleranceMs);

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    // Links the event to the scope tail, makes it durable and publishes it.
    // Returns the stored event. Throws DatabaseException if the journal fails;
    // in that case nothing is published.
    Event Append(const std::string& scope, Event event);

    EventChain Snapshot(const std::string& scope) const;
    std::optional<Event> Tail(const std::string& scope) const;
    std::optional<Event> EventAt(const std::string& scope, std::size_t position) const;
    std::vector<std::string> Scopes() const;
    std::size_t EventCount() const;

    void RecordAudit(const AuditRecord& record);
    std::vector<AuditRecord> AuditTrail() const;

    bool IsDurable() const { return journal_ != nullptr; }

private:
    // Snapshots share events with the scope. An append copies them first only
    // while an outstanding snapshot still holds them.
    struct ScopeState {
        std::mutex appendMutex;
        std::shared_ptr<std::vector<Event>> events = std::make_shared<std::vector<Event>>();
    };

    ScopeState& GetOrCreateScope(const std::string& scope);
    void LoadFromJournal(uint64_t skewToleranceMs);

    std::unique_ptr<IEventJournal> journal_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<ScopeState>> scopes_;
    std::size_t eventCount_ = 0;

    mutable std::mutex auditMutex_;
    std::vector<AuditRecord> audit_;
};

} // namespace causal
