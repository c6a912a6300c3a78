#include "catch.hpp"

#include "CausalGuardApp.hpp"

#include <sstream>
#include <stdexcept>

SCENARIO("proposal lines parse into proposals", "[app]") {
    auto proposal = ParseProposalLine("treasury-bot 3 1700000010000 signature_request 1500 beef 0xabc 137");

    REQUIRE(proposal.agentId == "treasury-bot");
    REQUIRE(proposal.nonce == 3);
    REQUIRE(proposal.timestampMs == 1700000010000);
    REQUIRE(proposal.type == causal::ActionType::SignatureRequest);
    REQUIRE(proposal.value == std::optional<uint64_t>{1500});
    REQUIRE(proposal.payload == std::vector<uint8_t>{0xbe, 0xef});
    REQUIRE(proposal.recipient == "0xabc");
    REQUIRE(proposal.destinationChain == 137);

    auto minimal = ParseProposalLine("bot 1 1000 3 - -");
    REQUIRE(minimal.type == causal::ActionType::BalanceCheck);
    REQUIRE_FALSE(minimal.value.has_value());
    REQUIRE(minimal.payload.empty());
    REQUIRE(minimal.recipient.empty());
}

SCENARIO("malformed proposal lines are rejected", "[app]") {
    REQUIRE_THROWS_AS(ParseProposalLine("bot 1 1000"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseProposalLine("bot one 1000 balance_check - -"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseProposalLine("bot 1 1000 transfer - -"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseProposalLine("bot 1 1000 balance_check - xyz"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseProposalLine("bot 1 1000 balance_check - - 0xabc 70000"), std::invalid_argument);
}

SCENARIO("the app replays a proposal stream against a memory store", "[app]") {
    CausalGuardConfig config;
    config.storeEngine = "memory";
    config.policyConditions = {"max_daily_outflow:1000"};
    config.signatureDeadlineMs = 5000;

    CausalGuardApp app{config};

    std::istringstream in{
        "# comment\n"
        "\n"
        "bot 1 1000 signature_request 50 cafe 0xabc\n"
        "bot 2 2000 signature_request 5000 cafe 0xabc\n"
        "bot 3\n"
        "!key_root not-the-credential 0101010101010101010101010101010101010101010101010101010101010101\n"};
    std::ostringstream out;

    REQUIRE(app.Run(in, out) == 1);

    const auto report = out.str();
    REQUIRE(report.find("3: accepted") != std::string::npos);
    REQUIRE(report.find("4: policy-violation") != std::string::npos);
    REQUIRE(report.find("5: malformed") != std::string::npos);
    REQUIRE(report.find("governance key_root: unauthorized") != std::string::npos);
    REQUIRE(report.find("signed 2/2") != std::string::npos);

    std::ostringstream description;
    app.DescribeStore(description);
    REQUIRE(description.str().find("events: 2") != std::string::npos);
    REQUIRE(description.str().find("agent:bot length=2") != std::string::npos);
}

SCENARIO("unsupported signer modes are refused", "[app]") {
    CausalGuardConfig config;
    config.storeEngine = "memory";
    config.signerMode = "remote";

    REQUIRE_THROWS_AS(CausalGuardApp{config}, std::invalid_argument);
}
