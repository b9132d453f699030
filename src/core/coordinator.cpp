#include "core/coordinator.h"
#include "utils/logger.h"
#include "utils/threading.h"
#include <atomic>
#include <exception>
#include <future>
#include <limits>
#include <mutex>
#include <random>
#include <vector>

namespace spendguard {
namespace core {

static const char* LOG_CAT = "coordinator";

struct Coordinator::Impl {
    SpendLimit limit;
    CoordinatorOptions options;
    std::atomic<bool> stopFlag{false};
    std::atomic<bool> cancelRequested{false};
    std::atomic<bool> running{false};
    std::function<void(const CommitEvent&)> commitCallback;
    std::mutex callbackMtx;

    uint64_t workerSeed(uint32_t index) const {
        if (!options.feeSeed) {
            return (static_cast<uint64_t>(std::random_device{}()) << 32) | std::random_device{}();
        }
        uint64_t seed = *options.feeSeed;
        std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32), index};
        uint32_t out[2];
        seq.generate(out, out + 2);
        return (static_cast<uint64_t>(out[0]) << 32) | out[1];
    }

    FinalReport failedBeforeStart(const Error& err) const {
        FinalReport report;
        report.success = false;
        report.reason = TerminationReason::FATAL_ERROR;
        report.error = err;
        report.maxTotalAmount = limit.maxTotalAmount;
        report.maxTransactionCount = limit.maxTransactionCount;
        return report;
    }
};

Coordinator::Coordinator(const SpendLimit& limit, const CoordinatorOptions& options)
    : impl_(std::make_unique<Impl>()) {
    impl_->limit = limit;
    impl_->options = options;
}

Coordinator::~Coordinator() = default;

uint64_t Coordinator::reservationAmount() const {
    const auto& opt = impl_->options;
    if (opt.fee.max > std::numeric_limits<uint64_t>::max() - opt.amountPerTransaction) {
        return std::numeric_limits<uint64_t>::max();
    }
    return opt.amountPerTransaction + opt.fee.max;
}

Result<void> Coordinator::validate() const {
    auto limitCheck = impl_->limit.validate();
    if (limitCheck.failed()) return limitCheck;

    const auto& opt = impl_->options;
    SPENDGUARD_CHECK(opt.workerCount > 0, ErrorCode::VALIDATION_FAILED, "worker count must be positive");
    SPENDGUARD_CHECK(opt.amountPerTransaction > 0, ErrorCode::VALIDATION_FAILED,
                     "per-transaction amount must be positive");
    SPENDGUARD_CHECK(opt.fee.valid(), ErrorCode::VALIDATION_FAILED,
                     "fee range " + opt.fee.toString() + " has min > max");
    SPENDGUARD_CHECK(reservationAmount() != std::numeric_limits<uint64_t>::max(), ErrorCode::VALIDATION_FAILED,
                     "per-transaction amount plus maximum fee overflows");
    return Result<void>();
}

void Coordinator::requestStop() {
    impl_->cancelRequested.store(true);
    impl_->stopFlag.store(true);
}

bool Coordinator::stopRequested() const {
    return impl_->cancelRequested.load();
}

void Coordinator::onCommit(std::function<void(const CommitEvent&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callbackMtx);
    impl_->commitCallback = callback;
}

FinalReport Coordinator::run(TransactionSubmitter& submitter) {
    auto valid = validate();
    if (valid.failed()) {
        LOG_ERROR(LOG_CAT, "configuration rejected: " + valid.error().describe());
        return impl_->failedBeforeStart(valid.error());
    }
    if (impl_->running.exchange(true)) {
        return impl_->failedBeforeStart(makeError(ErrorCode::INVALID_STATE, "coordinator is already running"));
    }

    // A stop requested at any point before this line must survive the reset.
    impl_->stopFlag.store(false);
    if (impl_->cancelRequested.load()) {
        impl_->stopFlag.store(true);
    }

    const auto& opt = impl_->options;
    uint64_t reserve = reservationAmount();

    SpendLimit effective = impl_->limit;
    if (effective.minTransactionAmount < reserve) {
        effective.minTransactionAmount = reserve;
    }
    if (reserve > effective.maxTotalAmount) {
        LOG_WARN(LOG_CAT, "insufficient funds for a single transaction (needs " + std::to_string(reserve) +
                 ", budget " + std::to_string(effective.maxTotalAmount) + ")");
    }

    SpendLedger ledger(effective);

    WorkerOptions workerOptions;
    workerOptions.amountPerTransaction = opt.amountPerTransaction;
    workerOptions.reserveAmount = reserve;
    workerOptions.retryPause = opt.retryPause;

    std::function<void(const CommitEvent&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->callbackMtx);
        callback = impl_->commitCallback;
    }
    std::mutex commitMtx;

    LOG_INFO(LOG_CAT, "starting " + std::to_string(opt.workerCount) + " worker(s): budget=" +
             std::to_string(effective.maxTotalAmount) + ", max transactions=" +
             std::to_string(effective.maxTransactionCount) + ", amount=" + std::to_string(opt.amountPerTransaction) +
             ", fee=" + opt.fee.toString());

    auto started = std::chrono::steady_clock::now();

    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(opt.workerCount);
    for (uint32_t i = 0; i < opt.workerCount; i++) {
        auto worker = std::make_unique<Worker>(i, ledger, FeeSampler(opt.fee, impl_->workerSeed(i)),
                                               submitter, workerOptions, impl_->stopFlag);
        if (callback) {
            worker->onCommit([&callback, &commitMtx](const CommitEvent& event) {
                std::lock_guard<std::mutex> lock(commitMtx);
                callback(event);
            });
        }
        workers.push_back(std::move(worker));
    }

    std::vector<WorkerOutcome> outcomes;
    {
        utils::ThreadPool pool(opt.workerCount);
        std::vector<std::future<WorkerOutcome>> futures;
        futures.reserve(workers.size());
        for (auto& worker : workers) {
            Worker* w = worker.get();
            futures.push_back(pool.enqueue([w] { return w->run(); }));
        }

        auto aborted = [this](size_t index, const std::string& what) {
            WorkerOutcome failed;
            failed.workerId = static_cast<uint32_t>(index);
            failed.stopReason = WorkerStopReason::FATAL;
            failed.error = makeError(ErrorCode::INTERNAL_ERROR, "worker threw: " + what);
            failed.raisedStop = !impl_->stopFlag.exchange(true);
            LOG_ERROR(LOG_CAT, "worker " + std::to_string(index) + " aborted: " + what);
            return failed;
        };

        for (size_t i = 0; i < futures.size(); i++) {
            try {
                outcomes.push_back(futures[i].get());
            } catch (const std::exception& e) {
                outcomes.push_back(aborted(i, e.what()));
            } catch (...) {
                outcomes.push_back(aborted(i, "non-standard exception"));
            }
        }
    }

    FinalReport report;
    report.workers = opt.workerCount;
    report.maxTotalAmount = effective.maxTotalAmount;
    report.maxTransactionCount = effective.maxTransactionCount;
    report.elapsedMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());

    report.outcomes = std::move(outcomes);

    const WorkerOutcome* firstFatal = nullptr;
    for (const auto& o : report.outcomes) {
        report.attempts += o.attempts;
        report.transientFailures += o.transientFailures;
        if (o.stopReason != WorkerStopReason::FATAL) continue;
        if (!firstFatal || (o.raisedStop && !firstFatal->raisedStop)) {
            firstFatal = &o;
        }
    }
    for (const auto& o : report.outcomes) {
        if (o.stopReason == WorkerStopReason::FATAL && &o != firstFatal) {
            ErrorHandler::instance().handle(o.error);
        }
    }

    LedgerStatus st = ledger.status();
    report.committedAmount = st.committedAmount;
    report.committedCount = st.committedCount;

    if (firstFatal) {
        report.reason = TerminationReason::FATAL_ERROR;
        report.error = firstFatal->error;
    } else if (st.overrun || st.committedCount > effective.maxTransactionCount) {
        report.reason = TerminationReason::FATAL_ERROR;
        report.error = makeError(ErrorCode::LIMIT_EXCEEDED, "committed totals exceed the configured limits");
    } else if (impl_->cancelRequested.load()) {
        report.reason = TerminationReason::CANCELLED;
    } else if (ledger.exhaustionReason() == ExhaustionReason::COUNT) {
        report.reason = TerminationReason::COUNT_EXHAUSTED;
    } else {
        report.reason = TerminationReason::BUDGET_EXHAUSTED;
    }
    report.success = report.reason == TerminationReason::BUDGET_EXHAUSTED ||
                     report.reason == TerminationReason::COUNT_EXHAUSTED;

    if (report.success) {
        LOG_INFO(LOG_CAT, std::string("run finished: ") + terminationReasonToString(report.reason) +
                 ", committed " + std::to_string(report.committedAmount) + " in " +
                 std::to_string(report.committedCount) + " transaction(s)");
    } else {
        LOG_WARN(LOG_CAT, std::string("run ended: ") + terminationReasonToString(report.reason) +
                 (report.error.isError() ? " (" + report.error.describe() + ")" : std::string()));
    }

    impl_->running.store(false);
    return report;
}

}
}
