#pragma once

#include "core/worker.h"
#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace spendguard {
namespace core {

enum class TerminationReason : uint8_t {
    BUDGET_EXHAUSTED = 0,
    COUNT_EXHAUSTED = 1,
    FATAL_ERROR = 2,
    CANCELLED = 3
};

struct FinalReport {
    bool success = false;
    TerminationReason reason = TerminationReason::FATAL_ERROR;
    Error error;
    uint64_t committedAmount = 0;
    uint64_t committedCount = 0;
    uint64_t maxTotalAmount = 0;
    uint64_t maxTransactionCount = 0;
    uint64_t attempts = 0;
    uint64_t transientFailures = 0;
    uint32_t workers = 0;
    uint64_t elapsedMs = 0;
    std::vector<WorkerOutcome> outcomes;
};

const char* terminationReasonToString(TerminationReason reason);

std::string formatReport(const FinalReport& report);
nlohmann::json reportToJson(const FinalReport& report);

}
}
