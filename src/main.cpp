#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <vector>
#include <memory>
#include <cstdlib>
#include <cmath>
#include <getopt.h>

#include "infrastructure/error_handling.h"
#include "quantum/bb84.h"
#include "quantum/channel.h"
#include "quantum/simulation.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#if QKDSIM_BUILD_TUI
#include "tui/tui.h"
#endif

#ifndef QKDSIM_VERSION
#define QKDSIM_VERSION "0.1.0"
#endif

namespace qkdsim {

static std::atomic<bool> g_cancelled{false};

static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_CONFIG = 2;
static constexpr int EXIT_RUN_FAILED = 3;
static constexpr int EXIT_CANCELLED = 130;

static constexpr uint64_t DEFAULT_SELFTEST_SAMPLES = 100000;
static constexpr double SELFTEST_TOLERANCE = 0.01;

struct CliConfig {
    std::string configPath;
    std::string writeConfigPath;
    std::string logLevel;
    std::string logFile;
    std::string oracle;
    uint64_t rounds = 0;
    uint64_t seed = 0;
    uint64_t attempts = 0;
    bool hasRounds = false;
    bool hasSeed = false;
    bool hasAttempts = false;
    bool batch = false;
    bool tui = false;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> commandArgs;
};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancelled = true;
    }
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printHelp(const char* progName) {
    std::cout << "QKDSim v" << QKDSIM_VERSION << " - BB84 key agreement and XOR message cipher\n\n";
    std::cout << "Usage: " << progName << " [options] <message>\n";
    std::cout << "       " << progName << " [options] selftest [samples]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  <message>           Agree on a key, encrypt and decrypt the message\n";
    std::cout << "  selftest [N]        Check the channel oracle over N samples (default: 100000)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Load settings from FILE\n";
    std::cout << "  -n, --rounds N      BB84 rounds per attempt (default: 8)\n";
    std::cout << "  -s, --seed S        Seed the random source and oracle for a reproducible run\n";
    std::cout << "  -o, --oracle NAME   Channel oracle: ideal|circuit (default: ideal)\n";
    std::cout << "  -b, --batch         Query the oracle once for all rounds\n";
    std::cout << "  -a, --attempts N    Attempts on key agreement failure (default: 1)\n";
    std::cout << "  -l, --loglevel LVL  Log level (trace/debug/info/warn/error/off)\n";
    std::cout << "  -L, --logfile FILE  Also write logs to FILE\n";
#if QKDSIM_BUILD_TUI
    std::cout << "  -t, --tui           Show the transcript in the terminal viewer\n";
#endif
    std::cout << "  -w, --write-config FILE  Write the effective settings to FILE\n";
}

void printVersion() {
    std::cout << "QKDSim v" << QKDSIM_VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
#if QKDSIM_BUILD_TUI
    std::cout << "Terminal viewer: ncurses\n";
#else
    std::cout << "Terminal viewer: disabled\n";
#endif
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"rounds", required_argument, nullptr, 'n'},
        {"seed", required_argument, nullptr, 's'},
        {"oracle", required_argument, nullptr, 'o'},
        {"batch", no_argument, nullptr, 'b'},
        {"attempts", required_argument, nullptr, 'a'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"logfile", required_argument, nullptr, 'L'},
        {"tui", no_argument, nullptr, 't'},
        {"write-config", required_argument, nullptr, 'w'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:n:s:o:ba:l:L:tw:",
                              longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'n':
                if (!utils::Config::parseUnsigned(optarg, config.rounds) || config.rounds == 0) {
                    std::cerr << "Invalid round count: " << optarg << "\n";
                    return false;
                }
                config.hasRounds = true;
                break;
            case 's':
                if (!utils::Config::parseUnsigned(optarg, config.seed)) {
                    std::cerr << "Invalid seed: " << optarg << "\n";
                    return false;
                }
                config.hasSeed = true;
                break;
            case 'o':
                config.oracle = optarg;
                break;
            case 'b':
                config.batch = true;
                break;
            case 'a':
                if (!utils::Config::parseUnsigned(optarg, config.attempts) || config.attempts == 0) {
                    std::cerr << "Invalid attempt count: " << optarg << "\n";
                    return false;
                }
                config.hasAttempts = true;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'L':
                config.logFile = optarg;
                break;
            case 't':
                config.tui = true;
                break;
            case 'w':
                config.writeConfigPath = optarg;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.commandArgs.emplace_back(argv[i]);
    }
    return true;
}

static void applyOverrides(const CliConfig& cli, utils::Config& config) {
    if (cli.hasRounds) config.set("protocol.rounds", static_cast<int64_t>(cli.rounds));
    if (cli.hasSeed) config.set("protocol.seed", cli.seed);
    if (!cli.oracle.empty()) config.set("protocol.oracle", cli.oracle);
    if (cli.batch) config.set("protocol.batch_oracle", true);
    if (cli.hasAttempts) config.set("retry.max_attempts", static_cast<int64_t>(cli.attempts));
    if (!cli.logLevel.empty()) config.set("log.level", cli.logLevel);
    if (!cli.logFile.empty()) config.set("log.file", cli.logFile);
    if (cli.tui) config.setTuiEnabled(true);
}

static Result<void> checkLoggingConfig(const utils::Config& config) {
    for (const char* key : {"log.console", "log.allow_sensitive", "ui.tui"}) {
        QKDSIM_CHECK(config.isBool(key), ErrorCode::CONFIG_ERROR,
                     std::string(key) + " must be true or false, got '" + config.getString(key) + "'");
    }
    for (const char* key : {"log.max_file_size", "log.max_files"}) {
        QKDSIM_CHECK(config.isUnsigned(key), ErrorCode::CONFIG_ERROR,
                     std::string(key) + " must be a decimal integer, got '" + config.getString(key) + "'");
    }
    return Result<void>();
}

static bool initLogging(const utils::LoggingConfig& logging) {
    utils::LogLevel level;
    if (!utils::parseLogLevel(logging.level, level)) {
        std::cerr << "Unknown log level: " << logging.level << "\n";
        return false;
    }

    utils::Logger::setMaxFileSize(logging.maxFileSize);
    utils::Logger::setMaxFiles(logging.maxFiles);
    utils::Logger::init(logging.file);
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logging.console);
    if (logging.allowSensitive) {
        utils::Logger::setAllowSensitiveLogging(true);
    }

    ErrorHandler::instance().setHandler([](const Error& error) {
        utils::LogLevel lvl = error.severity == ErrorSeverity::CRITICAL ? utils::LogLevel::FATAL
                                                                         : utils::LogLevel::WARN;
        utils::Logger::log(lvl, "error", describeError(error));
    });
    return true;
}

static int runSelftest(const quantum::SimulationConfig& sim, const std::vector<std::string>& args) {
    uint64_t samples = DEFAULT_SELFTEST_SAMPLES;
    if (args.size() > 1 && (!utils::Config::parseUnsigned(args[1], samples) || samples == 0)) {
        std::cerr << "Invalid sample count: " << args[1] << "\n";
        return EXIT_USAGE;
    }

    auto oracle = quantum::makeChannelOracle(sim.oracle, sim.seeded, sim.seed);
    if (oracle.failed()) {
        std::cerr << describeError(oracle.error()) << "\n";
        return EXIT_CONFIG;
    }

    std::unique_ptr<quantum::RandomSource> rng;
    if (sim.seeded) {
        rng = std::make_unique<quantum::SeededRandomSource>(sim.seed);
    } else {
        rng = std::make_unique<quantum::EntropyRandomSource>();
    }

    LOG_INFO("Running oracle self-test: " + std::to_string(samples) + " samples over " +
             oracle.value()->name() + " channel");
    quantum::OracleStatistics stats = quantum::measureOracleStatistics(*oracle.value(), *rng, samples);

    double freq = stats.mismatchedZeroFrequency();
    bool matchedOk = stats.matchedDisagreements == 0;
    bool mismatchedOk = stats.mismatchedSamples > 0 && std::fabs(freq - 0.5) <= SELFTEST_TOLERANCE;

    utils::TableFormatter table;
    table.setHeaders({"Check", "Samples", "Value", "Status"});
    table.setRightAligned(1);
    table.addRow({"matched bases reproduce bit",
                  utils::Formatter::formatNumber(stats.matchedSamples),
                  std::to_string(stats.matchedDisagreements) + " disagreements",
                  matchedOk ? "PASS" : "FAIL"});
    table.addRow({"mismatched bases are fair",
                  utils::Formatter::formatNumber(stats.mismatchedSamples),
                  "P(0) = " + utils::Formatter::formatRatio(freq),
                  mismatchedOk ? "PASS" : "FAIL"});

    std::cout << "Oracle self-test (" << oracle.value()->name() << " channel)\n\n";
    std::cout << table.render();

    if (!matchedOk || !mismatchedOk) {
        ErrorHandler::instance().handle(ErrorCode::INVALID_STATE,
                                        oracle.value()->name() + " channel violates the oracle contract");
        return EXIT_RUN_FAILED;
    }
    return 0;
}

static int runMessage(const quantum::SimulationConfig& sim, const std::string& message, bool useTui) {
    if (message.empty()) {
        std::cerr << "Enter a message to send.\n";
        return EXIT_USAGE;
    }

    quantum::QkdSimulator simulator(sim);
    simulator.setCancelFlag(&g_cancelled);

    auto result = simulator.run(message);
    if (result.failed()) {
        if (result.error().code == ErrorCode::CANCELLED) {
            std::cerr << "Cancelled.\n";
            return EXIT_CANCELLED;
        }
        std::cerr << "Simulation failed: " << describeError(result.error()) << "\n";
        return EXIT_RUN_FAILED;
    }

    const quantum::SimulationReport& report = result.value();

#if QKDSIM_BUILD_TUI
    if (useTui) {
        tui::TUI ui;
        if (ui.init()) {
            ui.setStopFlag(&g_cancelled);
            ui.showReport(report);
            ui.run();
            ui.shutdown();
            return 0;
        }
        LOG_WARN("Terminal viewer unavailable, printing the report instead");
    }
#else
    if (useTui) {
        LOG_WARN("Built without the terminal viewer, printing the report instead");
    }
#endif

    std::cout << formatReport(report) << "\n";
    std::cout << formatTranscriptTable(report.transcript);
    std::cout << "\nSimulation complete!\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    qkdsim::registerSignalHandlers();

    qkdsim::CliConfig cli;
    if (!qkdsim::parseArgs(argc, argv, cli)) {
        std::cerr << "Try '" << argv[0] << " --help' for usage.\n";
        return qkdsim::EXIT_USAGE;
    }

    if (cli.showHelp) {
        qkdsim::printHelp(argv[0]);
        return 0;
    }

    if (cli.showVersion) {
        qkdsim::printVersion();
        return 0;
    }

    auto& config = qkdsim::utils::Config::instance();
    if (!cli.configPath.empty() && !config.load(cli.configPath)) {
        std::cerr << "Cannot read config file: " << cli.configPath << "\n";
        return qkdsim::EXIT_CONFIG;
    }
    qkdsim::applyOverrides(cli, config);

    auto loggingValid = qkdsim::checkLoggingConfig(config);
    if (loggingValid.failed()) {
        std::cerr << qkdsim::describeError(loggingValid.error()) << "\n";
        return qkdsim::EXIT_CONFIG;
    }
    if (!qkdsim::initLogging(config.getLoggingConfig())) {
        return qkdsim::EXIT_CONFIG;
    }

    auto parsed = qkdsim::quantum::SimulationConfig::checkConfig(config);
    if (parsed.failed()) {
        std::cerr << qkdsim::describeError(parsed.error()) << "\n";
        return qkdsim::EXIT_CONFIG;
    }

    auto sim = qkdsim::quantum::SimulationConfig::fromConfig(config);
    auto valid = sim.validate();
    if (valid.failed()) {
        std::cerr << qkdsim::describeError(valid.error()) << "\n";
        return qkdsim::EXIT_CONFIG;
    }

    if (!cli.writeConfigPath.empty()) {
        if (!config.save(cli.writeConfigPath)) {
            std::cerr << "Cannot write config file: " << cli.writeConfigPath << "\n";
            return qkdsim::EXIT_CONFIG;
        }
        std::cout << "Configuration written to " << cli.writeConfigPath << "\n";
        if (cli.commandArgs.empty()) return 0;
    }

    if (cli.commandArgs.empty()) {
        qkdsim::printHelp(argv[0]);
        return qkdsim::EXIT_USAGE;
    }

    int rc;
    if (cli.commandArgs[0] == "selftest") {
        rc = qkdsim::runSelftest(sim, cli.commandArgs);
    } else {
        rc = qkdsim::runMessage(sim, qkdsim::utils::Formatter::join(cli.commandArgs, " "), config.isTuiEnabled());
    }

    auto& errors = qkdsim::ErrorHandler::instance();
    if (errors.hasErrors()) {
        LOG_DEBUG(std::to_string(errors.getErrorCount()) + " error(s) recorded, " +
                  std::to_string(errors.getErrorCount(qkdsim::ErrorCode::KEY_AGREEMENT_FAILURE)) +
                  " key agreement failure(s), last: " + qkdsim::describeError(errors.getLastError()));
    }

    qkdsim::utils::Logger::shutdown();
    return rc;
}
