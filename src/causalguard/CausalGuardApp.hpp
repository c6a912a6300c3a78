#pragma once

#include "CausalGuardConfig.hpp"

#include "causal/Event.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace causal {
class EventStore;
}

namespace runtime {
class CausalGuardRuntime;
class LoopbackSignatureCollector;
} // namespace runtime

// One proposal per line:
//   <agent_id> <nonce> <timestamp_ms> <action_type> <value|-> <payload_hex|-> [recipient] [destination_chain]
// action_type is a name (signature_request) or a numeric code. Throws
// std::invalid_argument on malformed input.
causal::Proposal ParseProposalLine(const std::string& line);

class CausalGuardApp {
public:
    explicit CausalGuardApp(const CausalGuardConfig& config);
    ~CausalGuardApp();

    // Feeds every line of in through the runtime and reports on out. Blank
    // lines and lines starting with '#' are skipped. Governance commands:
    //   !key_root <credential> <root_hex>
    //   !policy <credential> <name> [condition...]
    // Returns the number of lines that could not be parsed.
    int Run(std::istream& in, std::ostream& out);

    // Prints each scope's length and Merkle root. The chains were already
    // verified when the store was opened.
    void DescribeStore(std::ostream& out) const;

private:
    void HandleCommand(const std::string& line, std::ostream& out);
    static uint64_t NowMs();

    CausalGuardConfig config_;
    std::unique_ptr<causal::EventStore> store_;
    std::unique_ptr<runtime::LoopbackSignatureCollector> collector_;
    std::unique_ptr<runtime::CausalGuardRuntime> runtime_;
};
