#pragma once

#include "infrastructure/error_handling.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace spendguard {
namespace core {

struct SpendLimit {
    uint64_t maxTotalAmount = 0;
    uint64_t maxTransactionCount = 0;
    // Remaining budget below this admits nothing further; 0 means "remaining == 0".
    uint64_t minTransactionAmount = 0;

    Result<void> validate() const;
};

// Opaque claim on budget and count. Resolve exactly once via commit or release.
struct ReservationTicket {
    uint64_t id = 0;
    uint64_t amount = 0;
};

enum class ExhaustionReason : uint8_t {
    NONE = 0,
    BUDGET = 1,
    COUNT = 2
};

struct LedgerStatus {
    uint64_t committedAmount = 0;
    uint64_t committedCount = 0;
    uint64_t reservedAmount = 0;
    uint64_t outstanding = 0;
    uint64_t remainingAmount = 0;
    uint64_t remainingCount = 0;
    uint64_t availableAmount = 0;
    bool exhausted = false;
    bool overrun = false;
};

// Single source of truth for both global limits. Every operation takes the
// same mutex and does O(1) work under it.
class SpendLedger {
public:
    explicit SpendLedger(const SpendLimit& limit);
    ~SpendLedger();

    SpendLedger(const SpendLedger&) = delete;
    SpendLedger& operator=(const SpendLedger&) = delete;

    // Empty when admission would break either limit. Throws
    // std::invalid_argument for a zero amount.
    std::optional<ReservationTicket> tryReserve(uint64_t amount);

    Result<void> commit(const ReservationTicket& ticket, uint64_t actualAmount);
    Result<void> release(const ReservationTicket& ticket);

    LedgerStatus status() const;
    ExhaustionReason exhaustionReason() const;
    const SpendLimit& limit() const;

    uint64_t totalReservations() const;
    uint64_t totalReleases() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* exhaustionReasonToString(ExhaustionReason reason);

}
}
