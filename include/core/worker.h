#pragma once

#include "core/fee_sampler.h"
#include "core/spend_ledger.h"
#include "core/submitter.h"
#include "infrastructure/error_handling.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace spendguard {
namespace core {

enum class WorkerStopReason : uint8_t {
    LIMIT_REACHED = 0,
    DENIED = 1,
    STOP_REQUESTED = 2,
    FATAL = 3
};

struct WorkerOptions {
    uint64_t amountPerTransaction = 0;
    // Claimed from the ledger per attempt; must cover amount plus the largest fee.
    uint64_t reserveAmount = 0;
    std::chrono::milliseconds retryPause{0};
};

struct WorkerOutcome {
    uint32_t workerId = 0;
    WorkerStopReason stopReason = WorkerStopReason::LIMIT_REACHED;
    Error error;
    uint64_t attempts = 0;
    uint64_t commits = 0;
    uint64_t transientFailures = 0;
    uint64_t committedAmount = 0;
    // Set when this worker's fatal error was the one that halted the others.
    bool raisedStop = false;
};

struct CommitEvent {
    uint32_t workerId = 0;
    uint64_t ticketId = 0;
    uint64_t amount = 0;
    uint64_t fee = 0;
    SubmitReceipt receipt;
};

class Worker {
public:
    Worker(uint32_t id,
           SpendLedger& ledger,
           FeeSampler sampler,
           TransactionSubmitter& submitter,
           const WorkerOptions& options,
           std::atomic<bool>& stopFlag);

    // Loops until a limit, a denial, a stop request or a fatal error. Every
    // ticket it takes is committed or released before it returns.
    WorkerOutcome run();

    void onCommit(std::function<void(const CommitEvent&)> callback);

    uint32_t id() const { return id_; }

private:
    bool pause(std::chrono::milliseconds duration) const;
    WorkerOutcome finish(WorkerOutcome outcome, WorkerStopReason reason) const;
    WorkerOutcome fail(WorkerOutcome outcome);

    uint32_t id_;
    SpendLedger& ledger_;
    FeeSampler sampler_;
    TransactionSubmitter& submitter_;
    WorkerOptions options_;
    std::atomic<bool>& stopFlag_;
    std::function<void(const CommitEvent&)> commitCallback_;
};

const char* workerStopReasonToString(WorkerStopReason reason);

}
}
