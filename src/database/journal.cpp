#include "database/journal.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <ctime>
#include <mutex>

namespace spendguard {
namespace database {

static const char* LOG_CAT = "journal";

static uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

static std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

struct ReceiptJournal::Impl {
    sqlite3* db = nullptr;
    std::string path;
    uint64_t runId = 0;
    mutable std::mutex mtx;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(LOG_CAT, std::string("sqlite: ") + (errMsg ? errMsg : sqlite3_errmsg(db)));
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }
};

ReceiptJournal::ReceiptJournal() : impl_(std::make_unique<Impl>()) {}

ReceiptJournal::~ReceiptJournal() { close(); }

bool ReceiptJournal::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;
    
    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(LOG_CAT, "cannot open " + path + ": " + sqlite3_errmsg(impl_->db));
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    
    const char* schema =
        "CREATE TABLE IF NOT EXISTS runs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "started_at INTEGER NOT NULL,"
        "finished_at INTEGER,"
        "reason TEXT,"
        "success INTEGER,"
        "committed_amount INTEGER,"
        "committed_count INTEGER,"
        "error TEXT"
        ");"
        "CREATE TABLE IF NOT EXISTS receipts ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "run_id INTEGER NOT NULL REFERENCES runs(id),"
        "worker INTEGER NOT NULL,"
        "ticket INTEGER NOT NULL,"
        "amount INTEGER NOT NULL,"
        "fee INTEGER NOT NULL,"
        "debited INTEGER NOT NULL,"
        "reference TEXT,"
        "memo TEXT,"
        "created_at INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS receipts_by_run ON receipts(run_id);";
    
    if (!impl_->exec(schema)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    
    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");
    
    impl_->path = path;
    impl_->runId = 0;
    return true;
}

void ReceiptJournal::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    impl_->runId = 0;
}

bool ReceiptJournal::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

std::string ReceiptJournal::getPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

uint64_t ReceiptJournal::currentRunId() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->runId;
}

bool ReceiptJournal::beginRun() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    
    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO runs (started_at) VALUES (?);";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(nowSeconds()));
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return false;
    
    impl_->runId = static_cast<uint64_t>(sqlite3_last_insert_rowid(impl_->db));
    return true;
}

bool ReceiptJournal::record(const core::CommitEvent& event) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || impl_->runId == 0) return false;
    
    sqlite3_stmt* stmt;
    const char* sql =
        "INSERT INTO receipts (run_id, worker, ticket, amount, fee, debited, reference, memo, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(impl_->runId));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(event.workerId));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(event.ticketId));
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(event.amount));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(event.fee));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(event.receipt.debited));
    sqlite3_bind_text(stmt, 7, event.receipt.reference.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, event.receipt.memo.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(nowSeconds()));
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(LOG_CAT, std::string("failed to record receipt: ") + sqlite3_errmsg(impl_->db));
        return false;
    }
    return true;
}

bool ReceiptJournal::finishRun(const core::FinalReport& report) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || impl_->runId == 0) return false;
    
    sqlite3_stmt* stmt;
    const char* sql =
        "UPDATE runs SET finished_at = ?, reason = ?, success = ?, committed_amount = ?, "
        "committed_count = ?, error = ? WHERE id = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    
    std::string error = report.error.isError() ? report.error.describe() : "";
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(nowSeconds()));
    sqlite3_bind_text(stmt, 2, core::terminationReasonToString(report.reason), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, report.success ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(report.committedAmount));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(report.committedCount));
    sqlite3_bind_text(stmt, 6, error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(impl_->runId));
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<ReceiptRecord> ReceiptJournal::receipts(uint64_t runId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<ReceiptRecord> result;
    if (!impl_->db) return result;
    
    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT id, run_id, worker, ticket, amount, fee, debited, reference, memo, created_at "
        "FROM receipts WHERE run_id = ? ORDER BY id;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return result;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(runId));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ReceiptRecord r;
        r.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        r.runId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        r.workerId = static_cast<uint32_t>(sqlite3_column_int64(stmt, 2));
        r.ticketId = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        r.amount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        r.fee = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        r.debited = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        r.reference = columnText(stmt, 7);
        r.memo = columnText(stmt, 8);
        r.createdAt = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
        result.push_back(r);
    }
    
    sqlite3_finalize(stmt);
    return result;
}

size_t ReceiptJournal::receiptCount(uint64_t runId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;
    
    sqlite3_stmt* stmt;
    const char* sql = "SELECT COUNT(*) FROM receipts WHERE run_id = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(runId));
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

uint64_t ReceiptJournal::totalDebited(uint64_t runId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;
    
    sqlite3_stmt* stmt;
    const char* sql = "SELECT COALESCE(SUM(debited), 0) FROM receipts WHERE run_id = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(runId));
    uint64_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

RunRecord ReceiptJournal::getRun(uint64_t runId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    RunRecord run;
    if (!impl_->db) return run;
    
    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT id, started_at, finished_at, reason, success, committed_amount, committed_count, error "
        "FROM runs WHERE id = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return run;
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(runId));
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        run.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        run.startedAt = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        run.finishedAt = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        run.reason = columnText(stmt, 3);
        run.success = sqlite3_column_int(stmt, 4) != 0;
        run.committedAmount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        run.committedCount = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        run.error = columnText(stmt, 7);
    }
    sqlite3_finalize(stmt);
    return run;
}

}
}
