#pragma once

#include "infrastructure/error_handling.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace spendguard {
namespace core {

struct SubmitReceipt {
    uint64_t debited = 0;
    std::string reference;
    std::string memo;
};

// Performs one purchase. Implementations must be callable from several
// worker threads at once and must not retry internally.
class TransactionSubmitter {
public:
    virtual ~TransactionSubmitter() = default;
    virtual Result<SubmitReceipt> submit(uint64_t amount, uint64_t fee) = 0;
};

// Errors worth a fresh attempt; anything else stops the run.
bool isTransientError(ErrorCode code);

struct SimulatedSubmitterConfig {
    std::string wallet;
    std::string token;
    double failureRate = 0.1;
    std::chrono::milliseconds latency{0};
    uint64_t seed = 0;
};

// Stand-in for the real purchase: debits amount + fee and fails transiently
// with the configured probability.
class SimulatedSubmitter : public TransactionSubmitter {
public:
    explicit SimulatedSubmitter(const SimulatedSubmitterConfig& config);

    Result<SubmitReceipt> submit(uint64_t amount, uint64_t fee) override;

    uint64_t submitted() const;
    uint64_t failed() const;

private:
    SimulatedSubmitterConfig config_;
    mutable std::mutex mtx_;
    std::mt19937_64 rng_;
    uint64_t submitted_ = 0;
    uint64_t failed_ = 0;
};

}
}
