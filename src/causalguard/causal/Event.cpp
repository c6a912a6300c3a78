#include "causal/Event.hpp"

namespace causal {

namespace {

struct ActionTypeName {
    ActionType type;
    const char* name;
};

constexpr ActionTypeName kActionTypeNames[] = {
    {ActionType::SignatureRequest, "signature_request"},
    {ActionType::AddressVerification, "address_verification"},
    {ActionType::BalanceCheck, "balance_check"},
    {ActionType::WaitInterval, "wait_interval"},
    {ActionType::PolicyQuery, "policy_query"},
    {ActionType::GovernanceUpdate, "governance_update"},
};

} // namespace

const char* ToString(ActionType type) {
    for (const auto& entry : kActionTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }

    return "unknown";
}

std::optional<ActionType> ParseActionType(const std::string& name) {
    for (const auto& entry : kActionTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }

    return std::nullopt;
}

std::optional<ActionType> ActionTypeFromCode(int code) {
    for (const auto& entry : kActionTypeNames) {
        if (static_cast<int>(entry.type) == code) {
            return entry.type;
        }
    }

    return std::nullopt;
}

ActionId ComputeActionId(uint64_t nonce, uint64_t timestampMs, const std::string& agentId,
    const Digest& payloadDigest) {
    Sha3Hasher hasher;
    hasher.UpdateU64(nonce).UpdateU64(timestampMs).Update(agentId).Update(payloadDigest);
    return hasher.Finalize();
}

Digest ComputeEventHash(const Event& event) {
    Sha3Hasher hasher;
    hasher.Update(event.actionId)
        .Update(event.agentId)
        .UpdateU8(static_cast<uint8_t>(event.type))
        .UpdateU64(event.nonce)
        .UpdateU64(event.timestampMs)
        .Update(event.payloadDigest);

    hasher.UpdateU8(event.value ? 1 : 0);
    if (event.value) {
        hasher.UpdateU64(*event.value);
    }

    hasher.Update(event.recipient).UpdateU16(event.destinationChain);

    hasher.UpdateU8(event.prevHash ? 1 : 0);
    if (event.prevHash) {
        hasher.Update(*event.prevHash);
    }

    return hasher.Finalize();
}

Event MakeCandidate(const Proposal& proposal) {
    Event event;
    event.agentId = proposal.agentId;
    event.type = proposal.type;
    event.nonce = proposal.nonce;
    event.timestampMs = proposal.timestampMs;
    event.payloadDigest = HashBytes(proposal.payload);
    event.value = proposal.value;
    event.recipient = proposal.recipient;
    event.destinationChain = proposal.destinationChain;
    event.actionId = ComputeActionId(event.nonce, event.timestampMs, event.agentId, event.payloadDigest);
    return event;
}

} // namespace causal
