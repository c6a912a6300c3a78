#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct CausalGuardConfig {
    CausalGuardConfig() = default;

    const uint32_t version = 1;

    // Proposal gateway
    uint32_t maxPayloadBytes = 4096;
    uint32_t maxProposalsPerMinute = 10;
    uint32_t rateWindowSeconds = 60;

    // Causal history. causalScope is "agent" (one chain per agent) or "global".
    std::string causalScope = "agent";
    uint64_t skewToleranceMs = 500;

    // Event store. storeEngine is "sqlite" (default) or "memory".
    std::string storeEngine = "sqlite";
    std::string storePath = "var/lib/causalguard/events.db";

    // Policy
    std::string policyName = "default";
    std::string policyFloorTier = "low";
    std::vector<std::string> policyConditions;
    uint64_t dailyOutflowWindowSeconds = 86400;
    uint64_t nominalEventValue = 1000;
    uint64_t mediumValueBreakpoint = 100;
    uint64_t highValueBreakpoint = 1000;

    // Signature collection
    uint64_t signatureDeadlineMs = 30000;
    uint32_t signatureWorkers = 4;
    uint32_t sequencerWorkers = 4;
    std::string signerMode = "loopback";
    uint32_t loopbackValidators = 7;

    // Governance. Both are hex encoded SHA3-256 digests.
    std::string aggregateKeyRoot;
    std::string governanceKeyDigest;

    std::string proposalsPath;
    bool verifyStore = false;
    std::string loggerConfig;
};
