#include "core/spend_ledger.h"
#include "utils/logger.h"
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace spendguard {
namespace core {

static const char* LOG_CAT = "ledger";

Result<void> SpendLimit::validate() const {
    SPENDGUARD_CHECK(maxTotalAmount > 0, ErrorCode::VALIDATION_FAILED, "max total amount must be positive");
    SPENDGUARD_CHECK(maxTransactionCount > 0, ErrorCode::VALIDATION_FAILED, "max transaction count must be positive");
    SPENDGUARD_CHECK(minTransactionAmount <= maxTotalAmount, ErrorCode::VALIDATION_FAILED,
                     "minimum transaction amount exceeds the total budget");
    return Result<void>();
}

const char* exhaustionReasonToString(ExhaustionReason reason) {
    switch (reason) {
        case ExhaustionReason::NONE: return "none";
        case ExhaustionReason::BUDGET: return "budget";
        case ExhaustionReason::COUNT: return "count";
        default: return "unknown";
    }
}

struct SpendLedger::Impl {
    SpendLimit limit;
    uint64_t committedAmount = 0;
    uint64_t committedCount = 0;
    uint64_t reservedAmount = 0;
    uint64_t nextTicketId = 1;
    uint64_t reservations = 0;
    uint64_t releases = 0;
    bool overrun = false;
    std::unordered_map<uint64_t, uint64_t> outstanding;
    mutable std::mutex mtx;

    uint64_t remainingAmount() const {
        return committedAmount >= limit.maxTotalAmount ? 0 : limit.maxTotalAmount - committedAmount;
    }

    uint64_t remainingCount() const {
        return committedCount >= limit.maxTransactionCount ? 0 : limit.maxTransactionCount - committedCount;
    }

    bool exhausted() const {
        if (committedCount >= limit.maxTransactionCount) return true;
        uint64_t remaining = remainingAmount();
        if (remaining == 0) return true;
        return remaining < limit.minTransactionAmount;
    }

    // Caller holds mtx.
    Result<uint64_t> takeTicket(const ReservationTicket& ticket, const char* op) {
        auto it = outstanding.find(ticket.id);
        if (it == outstanding.end()) {
            std::string msg = std::string(op) + " on unknown or already resolved ticket #" + std::to_string(ticket.id);
            LOG_ERROR(LOG_CAT, msg);
            return Error(SPENDGUARD_ERROR(ErrorCode::INVALID_STATE, msg));
        }
        uint64_t reserved = it->second;
        outstanding.erase(it);
        reservedAmount -= reserved;
        return reserved;
    }
};

SpendLedger::SpendLedger(const SpendLimit& limit) : impl_(std::make_unique<Impl>()) {
    impl_->limit = limit;
}

SpendLedger::~SpendLedger() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->outstanding.empty()) {
        LOG_ERROR(LOG_CAT, std::to_string(impl_->outstanding.size()) +
                  " reservation(s) were never resolved");
    }
}

std::optional<ReservationTicket> SpendLedger::tryReserve(uint64_t amount) {
    if (amount == 0) {
        throw std::invalid_argument("reservation amount must be positive");
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    const SpendLimit& lim = impl_->limit;

    uint64_t pendingCount = impl_->committedCount + impl_->outstanding.size();
    if (pendingCount >= lim.maxTransactionCount) {
        return std::nullopt;
    }

    uint64_t claimed = impl_->committedAmount + impl_->reservedAmount;
    if (claimed >= lim.maxTotalAmount || amount > lim.maxTotalAmount - claimed) {
        return std::nullopt;
    }

    ReservationTicket ticket;
    ticket.id = impl_->nextTicketId++;
    ticket.amount = amount;
    impl_->outstanding.emplace(ticket.id, amount);
    impl_->reservedAmount += amount;
    impl_->reservations++;
    return ticket;
}

Result<void> SpendLedger::commit(const ReservationTicket& ticket, uint64_t actualAmount) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto taken = impl_->takeTicket(ticket, "commit");
    if (taken.failed()) return Result<void>(taken.error());

    impl_->committedAmount += actualAmount;
    impl_->committedCount++;

    if (actualAmount > taken.value()) {
        LOG_WARN(LOG_CAT, "ticket #" + std::to_string(ticket.id) + " debited " + std::to_string(actualAmount) +
                 " against a reservation of " + std::to_string(taken.value()));
    }
    if (impl_->committedAmount > impl_->limit.maxTotalAmount) {
        impl_->overrun = true;
        LOG_ERROR(LOG_CAT, "committed amount " + std::to_string(impl_->committedAmount) +
                  " exceeds budget " + std::to_string(impl_->limit.maxTotalAmount));
    }
    return Result<void>();
}

Result<void> SpendLedger::release(const ReservationTicket& ticket) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto taken = impl_->takeTicket(ticket, "release");
    if (taken.failed()) return Result<void>(taken.error());
    impl_->releases++;
    return Result<void>();
}

LedgerStatus SpendLedger::status() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    LedgerStatus st;
    st.committedAmount = impl_->committedAmount;
    st.committedCount = impl_->committedCount;
    st.reservedAmount = impl_->reservedAmount;
    st.outstanding = impl_->outstanding.size();
    st.remainingAmount = impl_->remainingAmount();
    st.remainingCount = impl_->remainingCount();
    uint64_t claimed = impl_->committedAmount + impl_->reservedAmount;
    st.availableAmount = claimed >= impl_->limit.maxTotalAmount ? 0 : impl_->limit.maxTotalAmount - claimed;
    st.exhausted = impl_->exhausted();
    st.overrun = impl_->overrun;
    return st;
}

ExhaustionReason SpendLedger::exhaustionReason() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->committedCount >= impl_->limit.maxTransactionCount) return ExhaustionReason::COUNT;
    if (impl_->exhausted()) return ExhaustionReason::BUDGET;
    return ExhaustionReason::NONE;
}

const SpendLimit& SpendLedger::limit() const {
    return impl_->limit;
}

uint64_t SpendLedger::totalReservations() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->reservations;
}

uint64_t SpendLedger::totalReleases() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->releases;
}

}
}
