#pragma once

#include "core/fee_sampler.h"
#include "core/report.h"
#include "core/spend_ledger.h"
#include "core/submitter.h"
#include "core/worker.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace spendguard {
namespace core {

struct CoordinatorOptions {
    uint32_t workerCount = 1;
    uint64_t amountPerTransaction = 0;
    FeeRange fee;
    // Fixed seed makes every worker's fee sequence reproducible.
    std::optional<uint64_t> feeSeed;
    std::chrono::milliseconds retryPause{0};
};

class Coordinator {
public:
    Coordinator(const SpendLimit& limit, const CoordinatorOptions& options);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    Result<void> validate() const;

    // Blocks until every worker has stopped. A configuration error is
    // reported as a failed run without starting any worker.
    FinalReport run(TransactionSubmitter& submitter);

    // Async-signal-safe: only stores to atomics.
    void requestStop();
    bool stopRequested() const;

    void onCommit(std::function<void(const CommitEvent&)> callback);

    uint64_t reservationAmount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
