#include "core/coordinator.h"
#include "core/report.h"
#include "core/submitter.h"
#include "database/journal.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <getopt.h>

namespace spendguard {

static const char* LOG_CAT = "main";

struct CliOptions {
    std::string configPath;
    std::string envPath = ".env";
    std::string logLevel;
    std::string logFile;
    std::string journalPath;
    uint32_t workers = 0;
    bool json = false;
    bool quiet = false;
    bool showHelp = false;
    bool showVersion = false;
};

static core::Coordinator* g_coordinator = nullptr;
static volatile std::sig_atomic_t g_signalled = 0;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_signalled = 1;
        if (g_coordinator) g_coordinator->requestStop();
    }
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void printHelp(const char* progName) {
    std::cout << "SpendGuard v0.1.0 - Concurrent spend-budget coordinator\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Parameters are read from the environment or a .env file:\n";
    std::cout << "  WALLET, TOKEN       Passed through to every purchase\n";
    std::cout << "  TOTAL_AMOUNT        Budget in minor units\n";
    std::cout << "  MAX_TRANSACTIONS    Maximum number of purchases\n";
    std::cout << "  PRICE               Amount per purchase\n";
    std::cout << "  COMMISSION          Base fee; COMMISSION_CHANGE gives the +/- spread\n";
    std::cout << "  FEE_MIN, FEE_MAX    Explicit fee range (instead of COMMISSION)\n";
    std::cout << "  MAX_THREADS         Worker count (capped to CPU count)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Load key=value config file\n";
    std::cout << "  -e, --env FILE      Dotenv file (default: .env)\n";
    std::cout << "  -w, --workers N     Number of workers\n";
    std::cout << "  -l, --loglevel LEVEL Log level (trace/debug/info/warn/error)\n";
    std::cout << "  -L, --logfile FILE  Also write logs to FILE\n";
    std::cout << "  -j, --journal FILE  Record receipts in a SQLite journal\n";
    std::cout << "      --json          Print the final report as JSON\n";
    std::cout << "  -q, --quiet         Do not list receipts\n";
}

void printVersion() {
    std::cout << "SpendGuard v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& cli) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"env", required_argument, nullptr, 'e'},
        {"workers", required_argument, nullptr, 'w'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"logfile", required_argument, nullptr, 'L'},
        {"journal", required_argument, nullptr, 'j'},
        {"json", no_argument, nullptr, 'J'},
        {"quiet", no_argument, nullptr, 'q'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:e:w:l:L:j:q", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                cli.showHelp = true;
                return true;
            case 'v':
                cli.showVersion = true;
                return true;
            case 'c':
                cli.configPath = optarg;
                break;
            case 'e':
                cli.envPath = optarg;
                break;
            case 'w': {
                uint64_t n = 0;
                if (!utils::parseUnsigned(optarg, n) || n == 0 || n > 4096) {
                    std::cerr << "Invalid worker count: " << optarg << "\n";
                    return false;
                }
                cli.workers = static_cast<uint32_t>(n);
                break;
            }
            case 'l': {
                utils::LogLevel level;
                if (!utils::Logger::parseLevel(optarg, level)) {
                    std::cerr << "Unknown log level: " << optarg << "\n";
                    return false;
                }
                cli.logLevel = optarg;
                break;
            }
            case 'L':
                cli.logFile = optarg;
                break;
            case 'j':
                cli.journalPath = optarg;
                break;
            case 'J':
                cli.json = true;
                break;
            case 'q':
                cli.quiet = true;
                break;
            default:
                return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

static void printReceipts(const std::vector<core::CommitEvent>& receipts) {
    std::cout << "\nTransaction receipts:\n";
    if (receipts.empty()) {
        std::cout << "  (none)\n";
        return;
    }
    size_t width = std::to_string(receipts.size()).size();
    for (size_t i = 0; i < receipts.size(); i++) {
        const auto& r = receipts[i];
        std::cout << "  " << utils::Formatter::padLeft(std::to_string(i + 1), width) << ". "
                  << r.receipt.reference << "  debited " << utils::Formatter::formatNumber(r.receipt.debited)
                  << " (fee " << r.fee << ", worker " << r.workerId << ")\n";
    }
}

static int exitCodeFor(const core::FinalReport& report) {
    switch (report.reason) {
        case core::TerminationReason::BUDGET_EXHAUSTED:
        case core::TerminationReason::COUNT_EXHAUSTED:
            return report.success ? 0 : 1;
        case core::TerminationReason::CANCELLED:
            return 130;
        default:
            return 1;
    }
}

int run(const CliOptions& cli) {
    auto& config = utils::Config::instance();
    if (!cli.configPath.empty() && !config.load(cli.configPath)) {
        std::cerr << "Cannot read config file: " << cli.configPath << "\n";
        return 1;
    }
    config.loadEnvironment(cli.envPath);
    if (cli.workers > 0) config.set("spend.workers", static_cast<int>(cli.workers));
    if (!cli.logLevel.empty()) config.set("log.level", cli.logLevel);
    if (!cli.logFile.empty()) config.set("log.file", cli.logFile);
    if (!cli.journalPath.empty()) config.set("journal.path", cli.journalPath);

    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::Logger::parseLevel(config.getString("log.level", "info"), level)) {
        std::cerr << "Unknown log level: " << config.getString("log.level") << "\n";
        return 1;
    }
    utils::Logger::setLevel(level);
    std::string logFile = config.getString("log.file");
    if (!logFile.empty()) {
        utils::Logger::init(logFile);
    } else {
        utils::Logger::enableFile(false);
    }
    if (cli.json) utils::Logger::enableConsole(false);

    auto parsed = config.getSpendConfig();
    if (parsed.failed()) {
        LOG_ERROR(LOG_CAT, "configuration error: " + parsed.error().message);
        std::cerr << "Configuration error: " << parsed.error().message << "\n";
        return 1;
    }
    const utils::SpendConfig& spend = parsed.value();
    if (spend.workers < spend.requestedWorkers) {
        LOG_WARN(LOG_CAT, "worker count capped from " + std::to_string(spend.requestedWorkers) + " to " +
                 std::to_string(spend.workers) + " (CPU count)");
    }

    core::SpendLimit limit;
    limit.maxTotalAmount = spend.totalAmount;
    limit.maxTransactionCount = spend.maxTransactions;

    core::CoordinatorOptions options;
    options.workerCount = spend.workers;
    options.amountPerTransaction = spend.amountPerTransaction;
    options.fee.min = spend.feeMin;
    options.fee.max = spend.feeMax;
    options.feeSeed = spend.feeSeed;
    options.retryPause = std::chrono::milliseconds(spend.retryPauseMs);

    core::SimulatedSubmitterConfig submitterConfig;
    submitterConfig.wallet = spend.wallet;
    submitterConfig.token = spend.token;
    submitterConfig.failureRate = spend.failureRate;
    submitterConfig.latency = std::chrono::milliseconds(spend.latencyMs);
    submitterConfig.seed = spend.feeSeed ? *spend.feeSeed : std::random_device{}();
    core::SimulatedSubmitter submitter(submitterConfig);

    database::ReceiptJournal journal;
    if (!spend.journalPath.empty()) {
        if (!journal.open(spend.journalPath) || !journal.beginRun()) {
            std::cerr << "Cannot open journal: " << spend.journalPath << "\n";
            return 1;
        }
        LOG_INFO(LOG_CAT, "journal opened at " + spend.journalPath + ", run #" +
                 std::to_string(journal.currentRunId()));
    }

    std::vector<core::CommitEvent> receipts;
    core::Coordinator coordinator(limit, options);
    coordinator.onCommit([&](const core::CommitEvent& event) {
        receipts.push_back(event);
        if (journal.isOpen() && !journal.record(event)) {
            ErrorHandler::instance().handle(ErrorCode::DATABASE_ERROR,
                                            "receipt " + event.receipt.reference + " not journaled");
        }
    });

    g_coordinator = &coordinator;
    if (g_signalled) coordinator.requestStop();
    core::FinalReport report = coordinator.run(submitter);
    g_coordinator = nullptr;

    if (journal.isOpen()) {
        if (!journal.finishRun(report)) {
            LOG_ERROR(LOG_CAT, "failed to record the run outcome in the journal");
        }
        journal.close();
    }

    if (cli.json) {
        std::cout << core::reportToJson(report).dump(2) << std::endl;
    } else {
        if (!cli.quiet) printReceipts(receipts);
        std::cout << "\n" << core::formatReport(report);
    }

    auto& errors = ErrorHandler::instance();
    if (errors.hasErrors()) {
        std::cerr << errors.getErrorCount() << " further error(s) recorded during the run:\n";
        for (const auto& err : errors.getRecentErrors(5)) {
            std::cerr << "  " << err.describe() << "\n";
        }
    }

    utils::Logger::shutdown();
    return exitCodeFor(report);
}

}

int main(int argc, char* argv[]) {
    spendguard::registerSignalHandlers();

    spendguard::CliOptions cli;
    if (!spendguard::parseArgs(argc, argv, cli)) {
        spendguard::printHelp(argv[0]);
        return 1;
    }

    if (cli.showHelp) {
        spendguard::printHelp(argv[0]);
        return 0;
    }

    if (cli.showVersion) {
        spendguard::printVersion();
        return 0;
    }

    return spendguard::run(cli);
}
