#pragma once

#include "causal/Digest.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace causal {

using ActionId = Digest;

constexpr std::size_t kMaxAgentIdBytes = 256;

enum class ActionType : uint8_t {
    SignatureRequest = 0x01,
    AddressVerification = 0x02,
    BalanceCheck = 0x03,
    WaitInterval = 0x04,
    PolicyQuery = 0x05,
    GovernanceUpdate = 0x10,
};

const char* ToString(ActionType type);
std::optional<ActionType> ParseActionType(const std::string& name);
std::optional<ActionType> ActionTypeFromCode(int code);

// An inbound action as submitted by an agent, before it is accepted into history.
struct Proposal {
    std::string agentId;
    ActionType type = ActionType::SignatureRequest;
    uint64_t nonce = 0;
    uint64_t timestampMs = 0;
    std::vector<uint8_t> payload;
    std::optional<uint64_t> value;
    std::string recipient;
    uint16_t destinationChain = 0;
};

// One accepted action. Events are immutable once appended; prevHash links each
// event to the hash of its predecessor in the same causal scope.
struct Event {
    ActionId actionId{};
    std::string agentId;
    ActionType type = ActionType::SignatureRequest;
    uint64_t nonce = 0;
    uint64_t timestampMs = 0;
    Digest payloadDigest{};
    std::optional<uint64_t> value;
    std::string recipient;
    uint16_t destinationChain = 0;
    std::optional<Digest> prevHash;
    Digest eventHash{};
};

// H(nonce || timestamp || agent_id || payload_digest)
ActionId ComputeActionId(uint64_t nonce, uint64_t timestampMs, const std::string& agentId,
    const Digest& payloadDigest);

Digest ComputeEventHash(const Event& event);

// Builds the unlinked event for a proposal: action id and payload digest are
// derived, prevHash and eventHash are left for the store to fill.
Event MakeCandidate(const Proposal& proposal);

} // namespace causal
