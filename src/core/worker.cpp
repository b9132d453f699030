#include "core/worker.h"
#include "utils/logger.h"
#include <algorithm>
#include <exception>
#include <thread>

namespace spendguard {
namespace core {

static const char* LOG_CAT = "worker";

const char* workerStopReasonToString(WorkerStopReason reason) {
    switch (reason) {
        case WorkerStopReason::LIMIT_REACHED: return "limit reached";
        case WorkerStopReason::DENIED: return "reservation denied";
        case WorkerStopReason::STOP_REQUESTED: return "stop requested";
        case WorkerStopReason::FATAL: return "fatal error";
        default: return "unknown";
    }
}

Worker::Worker(uint32_t id,
               SpendLedger& ledger,
               FeeSampler sampler,
               TransactionSubmitter& submitter,
               const WorkerOptions& options,
               std::atomic<bool>& stopFlag)
    : id_(id),
      ledger_(ledger),
      sampler_(std::move(sampler)),
      submitter_(submitter),
      options_(options),
      stopFlag_(stopFlag) {}

void Worker::onCommit(std::function<void(const CommitEvent&)> callback) {
    commitCallback_ = callback;
}

bool Worker::pause(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (stopFlag_.load()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(10)));
    }
    return !stopFlag_.load();
}

WorkerOutcome Worker::finish(WorkerOutcome outcome, WorkerStopReason reason) const {
    outcome.stopReason = reason;
    LOG_DEBUG(LOG_CAT, "worker " + std::to_string(id_) + " stopped: " + workerStopReasonToString(reason) +
              " (commits=" + std::to_string(outcome.commits) +
              ", transient failures=" + std::to_string(outcome.transientFailures) + ")");
    return outcome;
}

WorkerOutcome Worker::fail(WorkerOutcome outcome) {
    outcome.raisedStop = !stopFlag_.exchange(true);
    return finish(outcome, WorkerStopReason::FATAL);
}

WorkerOutcome Worker::run() {
    WorkerOutcome outcome;
    outcome.workerId = id_;

    while (true) {
        if (stopFlag_.load()) {
            return finish(outcome, WorkerStopReason::STOP_REQUESTED);
        }
        if (ledger_.status().exhausted) {
            return finish(outcome, WorkerStopReason::LIMIT_REACHED);
        }

        auto ticket = ledger_.tryReserve(options_.reserveAmount);
        if (!ticket) {
            return finish(outcome, WorkerStopReason::DENIED);
        }

        uint64_t fee = sampler_.sample();
        outcome.attempts++;

        Result<SubmitReceipt> result = Error(makeError(ErrorCode::INTERNAL_ERROR, "submission did not run"));
        try {
            result = submitter_.submit(options_.amountPerTransaction, fee);
        } catch (const std::exception& e) {
            result = Error(makeError(ErrorCode::INTERNAL_ERROR, std::string("submitter threw: ") + e.what()));
        } catch (...) {
            result = Error(makeError(ErrorCode::INTERNAL_ERROR, "submitter threw a non-standard exception"));
        }

        if (result.ok()) {
            const SubmitReceipt& receipt = result.value();
            auto committed = ledger_.commit(*ticket, receipt.debited);
            if (committed.failed()) {
                outcome.error = committed.error();
                return fail(outcome);
            }
            outcome.commits++;
            outcome.committedAmount += receipt.debited;
            LOG_DEBUG(LOG_CAT, "worker " + std::to_string(id_) + " committed " + std::to_string(receipt.debited) +
                      " (ref " + receipt.reference + ")");

            if (commitCallback_) {
                CommitEvent event;
                event.workerId = id_;
                event.ticketId = ticket->id;
                event.amount = options_.amountPerTransaction;
                event.fee = fee;
                event.receipt = receipt;
                commitCallback_(event);
            }
            continue;
        }

        auto released = ledger_.release(*ticket);
        if (released.failed()) {
            outcome.error = released.error();
            return fail(outcome);
        }

        const Error& err = result.error();
        if (isTransientError(err.code)) {
            outcome.transientFailures++;
            LOG_INFO(LOG_CAT, "worker " + std::to_string(id_) + " transient failure, retrying: " + err.describe());
            if (options_.retryPause.count() > 0 && !pause(options_.retryPause)) {
                return finish(outcome, WorkerStopReason::STOP_REQUESTED);
            }
            continue;
        }

        LOG_ERROR(LOG_CAT, "worker " + std::to_string(id_) + " fatal submission error: " + err.describe());
        outcome.error = err;
        return fail(outcome);
    }
}

}
}
