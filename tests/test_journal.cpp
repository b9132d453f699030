#include "database/journal.h"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

namespace spendguard {
namespace tests {

class JournalTests {
public:
    static void runAll() {
        testOpenClose();
        testRecordReceipts();
        testFinishRun();
        testRunsAreSeparate();
        testRecordWithoutRun();
        std::cout << "All journal tests passed!" << std::endl;
    }

    static std::string tempPath(const std::string& name) {
        auto dir = std::filesystem::temp_directory_path() / "spendguard_journal_test";
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
        return path.string();
    }

    static core::CommitEvent makeEvent(uint32_t worker, uint64_t ticket, uint64_t amount, uint64_t fee) {
        core::CommitEvent event;
        event.workerId = worker;
        event.ticketId = ticket;
        event.amount = amount;
        event.fee = fee;
        event.receipt.debited = amount + fee;
        event.receipt.reference = "ref" + std::to_string(ticket);
        event.receipt.memo = "Price: " + std::to_string(amount);
        return event;
    }

    static void testOpenClose() {
        std::cout << "Testing open/close..." << std::endl;

        std::string path = tempPath("open.db");
        database::ReceiptJournal journal;
        assert(!journal.isOpen());
        assert(journal.open(path));
        assert(journal.isOpen());
        assert(journal.getPath() == path);
        assert(!journal.open(path));
        journal.close();
        assert(!journal.isOpen());
        assert(std::filesystem::exists(path));

        std::cout << "  Open/close: PASSED" << std::endl;
    }

    static void testRecordReceipts() {
        std::cout << "Testing receipt recording..." << std::endl;

        database::ReceiptJournal journal;
        assert(journal.open(tempPath("receipts.db")));
        assert(journal.beginRun());
        uint64_t run = journal.currentRunId();
        assert(run > 0);

        assert(journal.record(makeEvent(0, 1, 30, 2)));
        assert(journal.record(makeEvent(1, 2, 30, 5)));
        assert(journal.record(makeEvent(0, 3, 30, 0)));

        assert(journal.receiptCount(run) == 3);
        assert(journal.totalDebited(run) == 97);

        auto rows = journal.receipts(run);
        assert(rows.size() == 3);
        assert(rows[1].workerId == 1);
        assert(rows[1].ticketId == 2);
        assert(rows[1].fee == 5);
        assert(rows[1].debited == 35);
        assert(rows[1].reference == "ref2");
        assert(rows[1].memo == "Price: 30");
        assert(rows[1].runId == run);

        std::cout << "  Receipt recording: PASSED" << std::endl;
    }

    static void testFinishRun() {
        std::cout << "Testing run outcome..." << std::endl;

        database::ReceiptJournal journal;
        assert(journal.open(tempPath("finish.db")));
        assert(journal.beginRun());
        uint64_t run = journal.currentRunId();

        core::FinalReport report;
        report.success = false;
        report.reason = core::TerminationReason::FATAL_ERROR;
        report.error = makeError(ErrorCode::INVALID_SIGNATURE, "rejected");
        report.committedAmount = 40;
        report.committedCount = 2;
        assert(journal.finishRun(report));

        auto stored = journal.getRun(run);
        assert(stored.id == run);
        assert(stored.reason == "FatalError");
        assert(!stored.success);
        assert(stored.committedAmount == 40);
        assert(stored.committedCount == 2);
        assert(stored.error.find("rejected") != std::string::npos);
        assert(stored.finishedAt >= stored.startedAt);

        std::cout << "  Run outcome: PASSED" << std::endl;
    }

    static void testRunsAreSeparate() {
        std::cout << "Testing separate runs..." << std::endl;

        std::string path = tempPath("runs.db");
        uint64_t firstRun = 0;
        {
            database::ReceiptJournal journal;
            assert(journal.open(path));
            assert(journal.beginRun());
            firstRun = journal.currentRunId();
            assert(journal.record(makeEvent(0, 1, 10, 1)));
        }

        database::ReceiptJournal journal;
        assert(journal.open(path));
        assert(journal.currentRunId() == 0);
        assert(journal.beginRun());
        uint64_t secondRun = journal.currentRunId();
        assert(secondRun != firstRun);
        assert(journal.record(makeEvent(0, 1, 20, 2)));

        assert(journal.receiptCount(firstRun) == 1);
        assert(journal.totalDebited(firstRun) == 11);
        assert(journal.receiptCount(secondRun) == 1);
        assert(journal.totalDebited(secondRun) == 22);

        std::cout << "  Separate runs: PASSED" << std::endl;
    }

    static void testRecordWithoutRun() {
        std::cout << "Testing record without run..." << std::endl;

        database::ReceiptJournal closed;
        assert(!closed.record(makeEvent(0, 1, 1, 0)));
        assert(!closed.beginRun());
        assert(closed.receipts(1).empty());

        database::ReceiptJournal journal;
        assert(journal.open(tempPath("norun.db")));
        assert(!journal.record(makeEvent(0, 1, 1, 0)));

        std::cout << "  Record without run: PASSED" << std::endl;
    }
};

}
}

int main() {
    spendguard::tests::JournalTests::runAll();
    return 0;
}
