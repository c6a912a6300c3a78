#define ELPP_DEFAULT_LOG_FILE "var/log/causalguard.log"
#include "easylogging++.h"

#include "CausalGuardApp.hpp"
#include "Database.hpp"
#include "causal/EventStore.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef __GNUC__
#include <execinfo.h>
#include <unistd.h>
#endif

INITIALIZE_EASYLOGGINGPP

CausalGuardConfig BuildConfiguration(int argc, const char* argv[]);

#ifdef __GNUC__
void SignalHandler(int sig);
#endif

int main(int argc, const char* argv[]) {
#ifdef __GNUC__
    signal(SIGSEGV, SignalHandler);
#endif

    auto config = BuildConfiguration(argc, argv);

    el::Loggers::setDefaultConfigurations(config.loggerConfig, true);
    START_EASYLOGGINGPP(argc, argv);

    try {
        CausalGuardApp app{config};

        if (config.verifyStore) {
            app.DescribeStore(std::cout);
            return 0;
        }

        int malformed = 0;
        if (config.proposalsPath.empty() || config.proposalsPath == "-") {
            malformed = app.Run(std::cin, std::cout);
        } else {
            std::ifstream proposals(config.proposalsPath.c_str());
            if (!proposals) {
                LOG(ERROR) << "Cannot open proposals file: " << config.proposalsPath;
                return EXIT_FAILURE;
            }
            malformed = app.Run(proposals, std::cout);
        }

        return malformed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const causal::StoreIntegrityException& e) {
        LOG(ERROR) << "Event store failed verification: " << e.what();
        std::cerr << "integrity failure in " << e.Scope() << " at position " << e.Position() << "\n";
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Event store unavailable: " << e.what();
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
    }

    return EXIT_FAILURE;
}

CausalGuardConfig BuildConfiguration(int argc, const char* argv[]) {
    namespace po = boost::program_options;
    CausalGuardConfig config;
    std::string configFile;

    auto ResolveDefaultPath = [](const std::vector<std::string>& candidatePaths) {
        for (const auto& candidatePath : candidatePaths) {
            std::ifstream candidate(candidatePath.c_str());
            if (candidate.good()) {
                return candidatePath;
            }
        }

        return candidatePaths.empty() ? std::string{} : candidatePaths.front();
    };

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&configFile)->default_value("etc/causalguard/causalguard.cfg"),
            "sets path to the configuration file")
        ("logger_config", po::value<std::string>(&config.loggerConfig)->default_value("etc/causalguard/logger.cfg"),
            "sets path to the logger configuration file")
        ("proposals,p", po::value<std::string>(&config.proposalsPath)->default_value("-"),
            "file of proposals, one per line; - reads standard input")
        ("verify_store", po::bool_switch(&config.verifyStore),
            "verifies every stored chain, prints its Merkle root and exits")
        ;

    po::options_description options("Configuration");
    options.add_options()
        ("max_payload_bytes", po::value<uint32_t>(&config.maxPayloadBytes)->default_value(4096),
            "largest accepted proposal payload in bytes")
        ("max_proposals_per_minute", po::value<uint32_t>(&config.maxProposalsPerMinute)->default_value(10),
            "proposals admitted per agent within the rate window")
        ("rate_window_seconds", po::value<uint32_t>(&config.rateWindowSeconds)->default_value(60),
            "length of the per-agent rate window")
        ("causal_scope", po::value<std::string>(&config.causalScope)->default_value("agent"),
            "causal chain granularity: agent|global")
        ("skew_tolerance_ms", po::value<uint64_t>(&config.skewToleranceMs)->default_value(500),
            "how far a timestamp may trail its predecessor")
        ("store_engine", po::value<std::string>(&config.storeEngine)->default_value("sqlite"),
            "event store engine: sqlite|memory")
        ("store_path", po::value<std::string>(&config.storePath)->default_value("var/lib/causalguard/events.db"),
            "path to the event store (used when store_engine=sqlite)")
        ("policy_name", po::value<std::string>(&config.policyName)->default_value("default"),
            "name of the initial policy")
        ("policy_floor_tier", po::value<std::string>(&config.policyFloorTier)->default_value("low"),
            "lowest risk tier any action is assigned: low|medium|high")
        ("policy_condition", po::value<std::vector<std::string>>(&config.policyConditions)->composing(),
            "policy condition, repeatable; evaluated in the order given")
        ("daily_outflow_window_s", po::value<uint64_t>(&config.dailyOutflowWindowSeconds)->default_value(86400),
            "window summed by max_daily_outflow")
        ("nominal_event_value", po::value<uint64_t>(&config.nominalEventValue)->default_value(1000),
            "value assumed for actions that carry none")
        ("medium_value_breakpoint", po::value<uint64_t>(&config.mediumValueBreakpoint)->default_value(100),
            "values at or above this are at least medium risk")
        ("high_value_breakpoint", po::value<uint64_t>(&config.highValueBreakpoint)->default_value(1000),
            "values at or above this are high risk")
        ("signature_deadline_ms", po::value<uint64_t>(&config.signatureDeadlineMs)->default_value(30000),
            "time allowed to collect threshold signatures")
        ("signature_workers", po::value<uint32_t>(&config.signatureWorkers)->default_value(4),
            "threads collecting signatures")
        ("sequencer_workers", po::value<uint32_t>(&config.sequencerWorkers)->default_value(4),
            "threads processing proposals")
        ("signer_mode", po::value<std::string>(&config.signerMode)->default_value("loopback"),
            "signature collector (must be loopback)")
        ("loopback_validators", po::value<uint32_t>(&config.loopbackValidators)->default_value(7),
            "validators in the loopback signer set")
        ("aggregate_key_root", po::value<std::string>(&config.aggregateKeyRoot)->default_value(""),
            "hex aggregate key root; defaults to the loopback set's root")
        ("governance_key_digest", po::value<std::string>(&config.governanceKeyDigest)->default_value(""),
            "hex SHA3-256 of the governance credential (can be overridden by CAUSALGUARD_GOVERNANCE_KEY_DIGEST)")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(options);

    po::options_description config_file_options;
    config_file_options.add(options);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cmdline_options).allow_unregistered().run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << cmdline_options << "\n";
        exit(EXIT_SUCCESS);
    }

    if (vm["config"].defaulted()) {
        configFile = ResolveDefaultPath({"causalguard.cfg", configFile});
    }
    if (vm["logger_config"].defaulted()) {
        config.loggerConfig = ResolveDefaultPath({"logger.cfg", config.loggerConfig});
    }

    std::ifstream ifs(configFile.c_str());
    if (!ifs) {
        throw std::runtime_error("Cannot open configuration file: " + configFile);
    }

    po::store(po::parse_config_file(ifs, config_file_options), vm);
    po::notify(vm);

    const char* digestFromEnv = std::getenv("CAUSALGUARD_GOVERNANCE_KEY_DIGEST");
    if (digestFromEnv != nullptr) {
        config.governanceKeyDigest = digestFromEnv;
    }

    return config;
}

#ifdef __GNUC__
void SignalHandler(int sig) {
    const int BACKTRACE_LIMIT = 10;
    void *arr[BACKTRACE_LIMIT];
    auto size = backtrace(arr, BACKTRACE_LIMIT);

    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(arr, size, STDERR_FILENO);
    exit(1);
}
#endif
