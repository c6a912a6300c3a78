#include "causal/EventChain.hpp"

#include "causal/Ordering.hpp"

#include <algorithm>
#include <utility>

namespace causal {

EventChain::EventChain()
    : events_{std::make_shared<std::vector<Event>>()} {}

EventChain::EventChain(std::string scope, std::vector<Event> events)
    : scope_{std::move(scope)}
    , events_{std::make_shared<std::vector<Event>>(std::move(events))}
    , size_{events_->size()} {}

EventChain::EventChain(std::string scope, std::shared_ptr<const std::vector<Event>> events)
    : scope_{std::move(scope)}
    , events_{std::move(events)} {
    if (!events_) {
        events_ = std::make_shared<std::vector<Event>>();
    }
    size_ = events_->size();
}

EventChain EventChain::Prefix(std::size_t count) const {
    EventChain prefix{*this};
    prefix.size_ = std::min(count, size_);
    return prefix;
}

std::vector<Digest> EventChain::EventHashes() const {
    std::vector<Digest> hashes;
    hashes.reserve(size_);
    for (const auto& event : *this) {
        hashes.push_back(event.eventHash);
    }
    return hashes;
}

Digest EventChain::MerkleRoot() const { return ComputeMerkleRoot(EventHashes()); }

std::optional<MerkleProof> EventChain::ProveInclusion(std::size_t position) const {
    return causal::ProveInclusion(EventHashes(), position);
}

std::optional<std::size_t> EventChain::FindFirstBrokenLink(uint64_t skewToleranceMs) const {
    const auto& events = *events_;
    for (std::size_t i = 0; i < size_; ++i) {
        const auto& event = events[i];

        auto expectedId = ComputeActionId(event.nonce, event.timestampMs, event.agentId, event.payloadDigest);
        if (!DigestEquals(expectedId, event.actionId)) {
            return i;
        }

        if (!DigestEquals(ComputeEventHash(event), event.eventHash)) {
            return i;
        }

        if (i == 0) {
            if (event.prevHash) {
                return i;
            }
            continue;
        }

        const auto& previous = events[i - 1];
        if (!event.prevHash || !DigestEquals(*event.prevHash, previous.eventHash)) {
            return i;
        }
        if (!CheckNonce(&previous, event).Ok() || !CheckTimestamp(&previous, event, skewToleranceMs).Ok()) {
            return i;
        }
    }

    return std::nullopt;
}

} // namespace causal
