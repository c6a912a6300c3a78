#include "CausalGuardApp.hpp"

#include "DatabaseFactory.hpp"
#include "causal/EventStore.hpp"
#include "policy/PolicyLoader.hpp"
#include "runtime/CausalGuardRuntime.hpp"
#include "runtime/LoopbackSignatureCollector.hpp"

#include "easylogging++.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
uint64_t ParseNumber(const std::string& text, const std::string& field) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid " + field + ": '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(field + " out of range: '" + text + "'");
    }
}

causal::ActionType ParseType(const std::string& text) {
    if (auto named = causal::ParseActionType(text)) {
        return *named;
    }

    const auto code = ParseNumber(text, "action_type");
    if (code > 0xff) {
        throw std::invalid_argument("unknown action type '" + text + "'");
    }
    if (auto coded = causal::ActionTypeFromCode(static_cast<int>(code))) {
        return *coded;
    }
    throw std::invalid_argument("unknown action type '" + text + "'");
}

std::string Describe(const runtime::ProposalOutcome& outcome) {
    std::ostringstream out;
    out << runtime::ToString(outcome.result);
    if (outcome.actionId) {
        out << " " << causal::ToHex(*outcome.actionId);
    }
    if (outcome.status) {
        out << " status=" << runtime::ToString(*outcome.status);
    }
    if (outcome.decision) {
        out << " tier=" << policy::ToString(outcome.decision->riskTier)
            << " threshold=" << outcome.decision->requiredThreshold;
        if (!outcome.decision->Passed()) {
            out << " rule=" << policy::ToString(outcome.decision->failedRule);
        }
    }
    if (outcome.retryable) {
        out << " retryable";
    }
    if (!outcome.reason.empty()) {
        out << " reason=\"" << outcome.reason << "\"";
    }
    return out.str();
}
} // namespace

causal::Proposal ParseProposalLine(const std::string& line) {
    std::istringstream in{line};
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }

    if (fields.size() < 6 || fields.size() > 8) {
        throw std::invalid_argument("expected 6 to 8 fields, got " + std::to_string(fields.size()));
    }

    causal::Proposal proposal;
    proposal.agentId = fields[0];
    proposal.nonce = ParseNumber(fields[1], "nonce");
    proposal.timestampMs = ParseNumber(fields[2], "timestamp_ms");
    proposal.type = ParseType(fields[3]);
    if (fields[4] != "-") {
        proposal.value = ParseNumber(fields[4], "value");
    }
    if (fields[5] != "-") {
        proposal.payload = causal::BytesFromHex(fields[5]);
    }
    if (fields.size() > 6) {
        proposal.recipient = fields[6];
    }
    if (fields.size() > 7) {
        const auto chain = ParseNumber(fields[7], "destination_chain");
        if (chain > 0xffff) {
            throw std::invalid_argument("destination_chain out of range: '" + fields[7] + "'");
        }
        proposal.destinationChain = static_cast<uint16_t>(chain);
    }
    return proposal;
}

CausalGuardApp::CausalGuardApp(const CausalGuardConfig& config)
    : config_{config} {
    auto policy = policy::BuildPolicy(config_);
    auto options = runtime::BuildRuntimeOptions(config_);

    if (config_.signerMode != "loopback") {
        throw std::invalid_argument("unsupported signer_mode '" + config_.signerMode + "'; expected loopback");
    }
    if (config_.loopbackValidators == 0 || config_.loopbackValidators > 0xffff) {
        throw std::invalid_argument("loopback_validators must be between 1 and 65535");
    }

    store_ = CreateEventStore(config_);
    collector_ = std::make_unique<runtime::LoopbackSignatureCollector>(
        static_cast<uint16_t>(config_.loopbackValidators), config_.storePath);

    auto keyRoot = collector_->KeyRoot();
    if (!config_.aggregateKeyRoot.empty()) {
        keyRoot = causal::DigestFromHex(config_.aggregateKeyRoot);
    }

    causal::Digest governorDigest{};
    if (config_.governanceKeyDigest.empty()) {
        LOG(WARNING) << "No governance_key_digest configured; governance updates are disabled";
    } else {
        governorDigest = causal::DigestFromHex(config_.governanceKeyDigest);
    }

    LOG(INFO) << "Loopback signer with " << config_.loopbackValidators << " validators, key root "
              << causal::ToHex(keyRoot);

    runtime_ = std::make_unique<runtime::CausalGuardRuntime>(
        *store_, *collector_, options, std::move(policy), keyRoot, governorDigest);
}

CausalGuardApp::~CausalGuardApp() = default;

int CausalGuardApp::Run(std::istream& in, std::ostream& out) {
    int malformed = 0;
    std::vector<causal::ActionId> accepted;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        try {
            if (line[first] == '!') {
                HandleCommand(line.substr(first + 1), out);
                continue;
            }

            const auto outcome = runtime_->Propose(ParseProposalLine(line), NowMs());
            out << lineNumber << ": " << Describe(outcome) << "\n";
            if (outcome.result == runtime::ProposalResult::Accepted) {
                accepted.push_back(*outcome.actionId);
            }
        } catch (const std::invalid_argument& e) {
            ++malformed;
            LOG(WARNING) << "Skipping line " << lineNumber << ": " << e.what();
            out << lineNumber << ": malformed reason=\"" << e.what() << "\"\n";
        }
    }

    runtime_->Drain();

    for (const auto& actionId : accepted) {
        auto signatures = runtime_->Signatures(actionId);
        if (!signatures) {
            continue;
        }
        out << causal::ToHex(actionId) << " " << runtime::ToString(signatures->state) << " "
            << signatures->signerCount << "/" << signatures->requiredThreshold;
        if (!signatures->Signed()) {
            out << " reason=\"" << signatures->reason << "\"";
        }
        out << "\n";
    }

    return malformed;
}

void CausalGuardApp::DescribeStore(std::ostream& out) const {
    out << "events: " << store_->EventCount() << "\n";
    for (const auto& scope : store_->Scopes()) {
        auto chain = store_->Snapshot(scope);
        out << scope << " length=" << chain.Size() << " root=" << causal::ToHex(chain.MerkleRoot()) << "\n";
    }
    out << "audit records: " << store_->AuditTrail().size() << "\n";
}

void CausalGuardApp::HandleCommand(const std::string& line, std::ostream& out) {
    std::istringstream in{line};
    std::string command;
    std::string credential;
    in >> command >> credential;

    runtime::GovernanceResult result;
    if (command == "key_root") {
        std::string root;
        in >> root;
        result = runtime_->GetGovernance().UpdateKeyRoot(credential, causal::DigestFromHex(root), NowMs());
    } else if (command == "policy") {
        auto next = policy::BuildPolicy(config_);
        next.conditions.clear();
        in >> next.name;
        std::string condition;
        while (in >> condition) {
            next.conditions.push_back(policy::ParseCondition(condition));
        }
        result = runtime_->GetGovernance().ReplacePolicy(credential, std::move(next), NowMs());
    } else {
        throw std::invalid_argument("unknown command '" + command + "'");
    }

    out << "governance " << command << ": " << runtime::ToString(result.status);
    if (!result.reason.empty()) {
        out << " reason=\"" << result.reason << "\"";
    }
    out << "\n";
}

uint64_t CausalGuardApp::NowMs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}
