#include "causal/EventStore.hpp"

#include "easylogging++.h"

namespace causal {

EventStore::EventStore(std::unique_ptr<IEventJournal> journal, uint64_t skewToleranceMs)
    : journal_{std::move(journal)} {
    if (journal_) {
        LoadFromJournal(skewToleranceMs);
    }
}

Event EventStore::Append(const std::string& scope, Event event) {
    auto& state = GetOrCreateScope(scope);
    std::lock_guard<std::mutex> appendLock{state.appendMutex};

    {
        std::shared_lock<std::shared_mutex> readLock{mutex_};
        if (state.events->empty()) {
            event.prevHash.reset();
        } else {
            event.prevHash = state.events->back().eventHash;
        }
    }
    event.eventHash = ComputeEventHash(event);

    if (journal_) {
        journal_->WriteEvent(scope, event);
    }

    std::unique_lock<std::shared_mutex> writeLock{mutex_};
    if (state.events.use_count() > 1) {
        state.events = std::make_shared<std::vector<Event>>(*state.events);
    }
    state.events->push_back(event);
    ++eventCount_;
    return event;
}

EventChain EventStore::Snapshot(const std::string& scope) const {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    auto iter = scopes_.find(scope);
    if (iter == scopes_.end()) {
        return EventChain{scope, std::vector<Event>{}};
    }

    return EventChain{scope, iter->second->events};
}

std::optional<Event> EventStore::Tail(const std::string& scope) const {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    auto iter = scopes_.find(scope);
    if (iter == scopes_.end() || iter->second->events->empty()) {
        return std::nullopt;
    }

    return iter->second->events->back();
}

std::optional<Event> EventStore::EventAt(const std::string& scope, std::size_t position) const {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    auto iter = scopes_.find(scope);
    if (iter == scopes_.end() || position >= iter->second->events->size()) {
        return std::nullopt;
    }

    return (*iter->second->events)[position];
}

std::vector<std::string> EventStore::Scopes() const {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    std::vector<std::string> names;
    names.reserve(scopes_.size());
    for (const auto& entry : scopes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::size_t EventStore::EventCount() const {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    return eventCount_;
}

void EventStore::RecordAudit(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock{auditMutex_};
    if (journal_) {
        journal_->WriteAudit(record);
    }
    audit_.push_back(record);
}

std::vector<AuditRecord> EventStore::AuditTrail() const {
    std::lock_guard<std::mutex> lock{auditMutex_};
    return audit_;
}

EventStore::ScopeState& EventStore::GetOrCreateScope(const std::string& scope) {
    {
        std::shared_lock<std::shared_mutex> readLock{mutex_};
        auto iter = scopes_.find(scope);
        if (iter != scopes_.end()) {
            return *iter->second;
        }
    }

    std::unique_lock<std::shared_mutex> writeLock{mutex_};
    auto& slot = scopes_[scope];
    if (!slot) {
        slot = std::make_unique<ScopeState>();
    }
    return *slot;
}

void EventStore::LoadFromJournal(uint64_t skewToleranceMs) {
    auto journaled = journal_->LoadEvents();
    for (auto& entry : journaled) {
        GetOrCreateScope(entry.scope).events->push_back(std::move(entry.event));
        ++eventCount_;
    }

    for (const auto& scope : scopes_) {
        EventChain chain{scope.first, scope.second->events};
        auto broken = chain.FindFirstBrokenLink(skewToleranceMs);
        if (broken) {
            LOG(ERROR) << "Stored chain " << scope.first << " is corrupt at position " << *broken;
            throw StoreIntegrityException(scope.first, *broken);
        }
    }

    audit_ = journal_->LoadAudit();

    LOG(INFO) << "Event store loaded " << eventCount_ << " events in " << scopes_.size()
              << " scopes, " << audit_.size() << " audit records";
}

} // namespace causal
