#pragma once

#include "causal/AuditRecord.hpp"
#include "policy/Policy.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace causal {
class CausalEventLogger;
class EventStore;
} // namespace causal

namespace runtime {

// Current aggregate key root for threshold signatures.
class KeyRootRegistry {
public:
    explicit KeyRootRegistry(const causal::Digest& root)
        : root_{root} {}

    causal::Digest Current() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return root_;
    }

    void Replace(const causal::Digest& root) {
        std::lock_guard<std::mutex> lock{mutex_};
        root_ = root;
    }

private:
    mutable std::mutex mutex_;
    causal::Digest root_;
};

// Active policy. Readers take a snapshot per evaluation so a swap never
// changes the policy under an evaluation in progress.
class PolicyRegistry {
public:
    explicit PolicyRegistry(policy::Policy initial)
        : current_{std::make_shared<const policy::Policy>(std::move(initial))} {}

    std::shared_ptr<const policy::Policy> Current() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return current_;
    }

    void Replace(std::shared_ptr<const policy::Policy> next) {
        std::lock_guard<std::mutex> lock{mutex_};
        current_ = std::move(next);
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const policy::Policy> current_;
};

enum class GovernanceStatus {
    Applied,
    Unauthorized,
    Invalid,
    LogFailed,
};

inline const char* ToString(GovernanceStatus status) {
    switch (status) {
    case GovernanceStatus::Applied:
        return "applied";
    case GovernanceStatus::Unauthorized:
        return "unauthorized";
    case GovernanceStatus::Invalid:
        return "invalid";
    case GovernanceStatus::LogFailed:
        return "log-failed";
    }

    return "unknown";
}

struct GovernanceResult {
    GovernanceStatus status = GovernanceStatus::Unauthorized;
    std::string reason;
    causal::ActionId actionId{};

    bool Applied() const { return status == GovernanceStatus::Applied; }
};

// Privileged updates: aggregate key root rotation and policy replacement.
// Callers authenticate with a credential whose SHA3-256 digest must equal the
// configured governor digest. Every applied update is itself an event in the
// "governance" scope; refused attempts leave an audit record.
class Governance {
public:
    static constexpr const char* kScope = "governance";
    static constexpr const char* kAgentId = "governance";

    Governance(const causal::Digest& governorKeyDigest, causal::CausalEventLogger& logger,
        causal::EventStore& store, KeyRootRegistry& keyRoots, PolicyRegistry& policies);

    GovernanceResult UpdateKeyRoot(const std::string& credential, const causal::Digest& newRoot, uint64_t nowMs);
    GovernanceResult ReplacePolicy(const std::string& credential, policy::Policy next, uint64_t nowMs);

private:
    bool Authenticate(const std::string& credential) const;
    GovernanceResult Refuse(GovernanceStatus status, const std::string& reason, uint64_t nowMs);
    GovernanceResult Record(const std::string& payload, uint64_t nowMs);

    causal::Digest governorKeyDigest_;
    causal::CausalEventLogger& logger_;
    causal::EventStore& store_;
    KeyRootRegistry& keyRoots_;
    PolicyRegistry& policies_;

    std::mutex mutex_;
};

} // namespace runtime
