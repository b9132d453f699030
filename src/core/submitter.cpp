#include "core/submitter.h"
#include "utils/logger.h"
#include <iomanip>
#include <sstream>
#include <thread>

namespace spendguard {
namespace core {

bool isTransientError(ErrorCode code) {
    switch (code) {
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::TIMEOUT:
        case ErrorCode::RATE_LIMITED:
            return true;
        default:
            return false;
    }
}

SimulatedSubmitter::SimulatedSubmitter(const SimulatedSubmitterConfig& config)
    : config_(config), rng_(config.seed ? config.seed : std::random_device{}()) {}

Result<SubmitReceipt> SimulatedSubmitter::submit(uint64_t amount, uint64_t fee) {
    if (config_.latency.count() > 0) {
        std::this_thread::sleep_for(config_.latency);
    }

    bool fail = false;
    uint64_t refBits = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        fail = coin(rng_) < config_.failureRate;
        refBits = rng_();
        submitted_++;
        if (fail) failed_++;
    }

    if (fail) {
        LOG_WARN("submitter", "simulated submission failed (amount=" + std::to_string(amount) +
                 ", fee=" + std::to_string(fee) + ")");
        return Error(makeError(ErrorCode::NETWORK_ERROR, "failed tx"));
    }

    SubmitReceipt receipt;
    receipt.debited = amount + fee;

    std::ostringstream ref;
    ref << std::hex << std::setw(16) << std::setfill('0') << refBits;
    receipt.reference = ref.str();

    receipt.memo = "Wallet: " + utils::Logger::redactAddress(config_.wallet) +
                   ", Token: " + config_.token +
                   ", Commission: " + std::to_string(fee) +
                   ", Price: " + std::to_string(amount) +
                   ", Amount: " + std::to_string(receipt.debited);
    return receipt;
}

uint64_t SimulatedSubmitter::submitted() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return submitted_;
}

uint64_t SimulatedSubmitter::failed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failed_;
}

}
}
