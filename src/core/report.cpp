#include "core/report.h"
#include "utils/utils.h"

namespace spendguard {
namespace core {

const char* terminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::BUDGET_EXHAUSTED: return "BudgetExhausted";
        case TerminationReason::COUNT_EXHAUSTED: return "CountExhausted";
        case TerminationReason::FATAL_ERROR: return "FatalError";
        case TerminationReason::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

static double utilization(uint64_t used, uint64_t limit) {
    if (limit == 0) return 0.0;
    return 100.0 * static_cast<double>(used) / static_cast<double>(limit);
}

std::string formatReport(const FinalReport& report) {
    using utils::Formatter;

    utils::TableFormatter summary;
    summary.setHeaders({"Field", "Value"});
    summary.addRow({"Result", report.success ? "success" : "failed"});
    summary.addRow({"Terminated", terminationReasonToString(report.reason)});
    summary.addRow({"Committed amount", Formatter::formatNumber(report.committedAmount) + " / " +
                    Formatter::formatNumber(report.maxTotalAmount) + " (" +
                    Formatter::formatPercent(utilization(report.committedAmount, report.maxTotalAmount)) + ")"});
    summary.addRow({"Committed count", Formatter::formatNumber(report.committedCount) + " / " +
                    Formatter::formatNumber(report.maxTransactionCount)});
    summary.addRow({"Attempts", Formatter::formatNumber(report.attempts)});
    summary.addRow({"Transient failures", Formatter::formatNumber(report.transientFailures)});
    summary.addRow({"Workers", std::to_string(report.workers)});
    summary.addRow({"Elapsed", Formatter::formatDurationMs(report.elapsedMs)});
    if (report.error.isError()) {
        summary.addRow({"Error", report.error.describe()});
    }

    std::string out = summary.render();

    if (!report.outcomes.empty()) {
        utils::TableFormatter workers;
        workers.setHeaders({"Worker", "Stopped", "Attempts", "Commits", "Retries", "Amount"});
        for (const auto& w : report.outcomes) {
            workers.addRow({std::to_string(w.workerId),
                            workerStopReasonToString(w.stopReason),
                            std::to_string(w.attempts),
                            std::to_string(w.commits),
                            std::to_string(w.transientFailures),
                            Formatter::formatNumber(w.committedAmount)});
        }
        out += "\n" + workers.render();
    }
    return out;
}

nlohmann::json reportToJson(const FinalReport& report) {
    nlohmann::json j;
    j["success"] = report.success;
    j["terminated_reason"] = terminationReasonToString(report.reason);
    j["committed_amount"] = report.committedAmount;
    j["committed_count"] = report.committedCount;
    j["max_total_amount"] = report.maxTotalAmount;
    j["max_transaction_count"] = report.maxTransactionCount;
    j["attempts"] = report.attempts;
    j["transient_failures"] = report.transientFailures;
    j["workers"] = report.workers;
    j["elapsed_ms"] = report.elapsedMs;
    if (report.error.isError()) {
        j["error"] = {
            {"code", errorToString(report.error.code)},
            {"message", report.error.message}
        };
    }

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& w : report.outcomes) {
        outcomes.push_back({
            {"worker", w.workerId},
            {"stopped", workerStopReasonToString(w.stopReason)},
            {"attempts", w.attempts},
            {"commits", w.commits},
            {"transient_failures", w.transientFailures},
            {"committed_amount", w.committedAmount}
        });
    }
    j["worker_outcomes"] = outcomes;
    return j;
}

}
}
