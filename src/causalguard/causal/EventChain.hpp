#pragma once

#include "causal/Event.hpp"
#include "causal/Merkle.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace causal {

constexpr uint64_t kDefaultSkewToleranceMs = 500;

// Read-only snapshot of one causal scope in append order. Copies share the
// underlying events, which are never modified once a chain refers to them.
class EventChain {
public:
    using const_iterator = std::vector<Event>::const_iterator;
    using const_reverse_iterator = std::vector<Event>::const_reverse_iterator;

    EventChain();
    EventChain(std::string scope, std::vector<Event> events);
    EventChain(std::string scope, std::shared_ptr<const std::vector<Event>> events);

    const std::string& Scope() const { return scope_; }

    bool Empty() const { return size_ == 0; }
    std::size_t Size() const { return size_; }
    const Event& Back() const { return (*events_)[size_ - 1]; }
    const Event& operator[](std::size_t position) const { return (*events_)[position]; }

    const_iterator begin() const { return events_->begin(); }
    const_iterator end() const { return events_->begin() + static_cast<std::ptrdiff_t>(size_); }
    const_reverse_iterator rbegin() const { return const_reverse_iterator{end()}; }
    const_reverse_iterator rend() const { return const_reverse_iterator{begin()}; }

    // The first count events, sharing storage with this chain.
    EventChain Prefix(std::size_t count) const;
    std::vector<Event> CopyEvents() const { return {begin(), end()}; }

    std::vector<Digest> EventHashes() const;
    Digest MerkleRoot() const;
    std::optional<MerkleProof> ProveInclusion(std::size_t position) const;

    // Re-derives every identifier and link. Returns the position of the first
    // event that does not verify, or nothing when the whole chain is intact.
    std::optional<std::size_t> FindFirstBrokenLink(uint64_t skewToleranceMs = kDefaultSkewToleranceMs) const;
    bool VerifyIntegrity(uint64_t skewToleranceMs = kDefaultSkewToleranceMs) const {
        return !FindFirstBrokenLink(skewToleranceMs).has_value();
    }

private:
    std::string scope_;
    std::shared_ptr<const std::vector<Event>> events_;
    std::size_t size_ = 0;
};

} // namespace causal
