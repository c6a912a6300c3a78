#pragma once

#include "causal/EventStore.hpp"
#include "causal/Ordering.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace causal {

enum class LogError {
    PayloadTooLarge,
    InvalidProposal,
    OrderingViolation,
    StoreUnavailable,
};

const char* ToString(LogError error);

class LogException : public std::runtime_error {
public:
    LogException(LogError code, const std::string& message,
        OrderingViolation ordering = OrderingViolation::None)
        : std::runtime_error(message)
        , code_{code}
        , ordering_{ordering} {}

    LogError Code() const { return code_; }
    OrderingViolation Ordering() const { return ordering_; }

    // StoreUnavailable is fatal to the request but may be retried with backoff.
    bool IsRetryable() const { return code_ == LogError::StoreUnavailable; }

private:
    LogError code_;
    OrderingViolation ordering_;
};

enum class ScopeGranularity {
    PerAgent,
    Global,
};

struct LoggerOptions {
    std::size_t maxPayloadBytes = 4096;
    uint64_t skewToleranceMs = kDefaultSkewToleranceMs;
    ScopeGranularity granularity = ScopeGranularity::PerAgent;
};

struct LogReceipt {
    ActionId actionId{};
    bool duplicate = false;
    std::string scope;
    Event event;
    // The scope as it stood immediately before this event was appended. Empty
    // for duplicates, which are not re-evaluated.
    EventChain history;
};

// Admits proposals into history. The idempotency index is keyed by action id:
// a resubmission of an already logged proposal yields the original id and no
// new event.
class CausalEventLogger {
public:
    CausalEventLogger(EventStore& store, LoggerOptions options);

    CausalEventLogger(const CausalEventLogger&) = delete;
    CausalEventLogger& operator=(const CausalEventLogger&) = delete;

    // Throws LogException.
    LogReceipt Log(const Proposal& proposal);
    // Logs into an explicit scope instead of the agent's own.
    LogReceipt Log(const Proposal& proposal, const std::string& scope);

    std::string ScopeFor(const std::string& agentId) const;
    bool Contains(const ActionId& actionId) const;
    std::size_t IndexSize() const;

    const LoggerOptions& Options() const { return options_; }

private:
    struct IndexEntry {
        std::string scope;
        std::size_t position;
    };

    std::mutex& ScopeMutex(const std::string& scope);
    void RebuildIndex();

    EventStore& store_;
    LoggerOptions options_;

    std::mutex scopeMutexesGuard_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> scopeMutexes_;

    mutable std::mutex indexMutex_;
    std::unordered_map<ActionId, IndexEntry, DigestHash> index_;
};

} // namespace causal
