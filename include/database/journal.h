#pragma once

#include "core/report.h"
#include "core/worker.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace spendguard {
namespace database {

struct ReceiptRecord {
    uint64_t id = 0;
    uint64_t runId = 0;
    uint32_t workerId = 0;
    uint64_t ticketId = 0;
    uint64_t amount = 0;
    uint64_t fee = 0;
    uint64_t debited = 0;
    std::string reference;
    std::string memo;
    uint64_t createdAt = 0;
};

struct RunRecord {
    uint64_t id = 0;
    uint64_t startedAt = 0;
    uint64_t finishedAt = 0;
    std::string reason;
    bool success = false;
    uint64_t committedAmount = 0;
    uint64_t committedCount = 0;
    std::string error;
};

// SQLite record of committed receipts and run outcomes. Lives outside the
// spend core; it is fed through Coordinator::onCommit.
class ReceiptJournal {
public:
    ReceiptJournal();
    ~ReceiptJournal();

    ReceiptJournal(const ReceiptJournal&) = delete;
    ReceiptJournal& operator=(const ReceiptJournal&) = delete;
    
    bool open(const std::string& path);
    void close();
    bool isOpen() const;
    std::string getPath() const;

    bool beginRun();
    bool record(const core::CommitEvent& event);
    bool finishRun(const core::FinalReport& report);
    uint64_t currentRunId() const;

    std::vector<ReceiptRecord> receipts(uint64_t runId) const;
    size_t receiptCount(uint64_t runId) const;
    uint64_t totalDebited(uint64_t runId) const;
    RunRecord getRun(uint64_t runId) const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
