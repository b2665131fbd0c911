// ============================================================================
// InMemoryLedger Implementation
// ============================================================================

#include "pactum/escrow/ledger.hpp"

#include <limits>

#include "pactum/core/logging.hpp"

namespace pactum {

namespace {

constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

}  // namespace

Error InMemoryLedger::Collect(const Identity& from, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = balances_.find(from);
    Amount available = it == balances_.end() ? 0 : it->second;
    if (available < amount) {
        PACTUM_LOG_DEBUG("ledger: " << from << " cannot cover " << amount << " (balance " << available << ")");
        return Errc::TransferFailure;
    }

    if (amount == 0) return {};
    if (amount > kMaxAmount - custody_) {
        PACTUM_LOG_WARN("ledger: custody " << custody_ << " cannot absorb " << amount);
        return Errc::TransferFailure;
    }
    it->second -= amount;
    custody_ += amount;
    return {};
}

Error InMemoryLedger::Settle(const std::vector<Payment>& payments) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate the whole batch before moving anything
    Amount total = 0;
    for (const auto& payment : payments) {
        if (rejecting_.contains(payment.to)) {
            PACTUM_LOG_DEBUG("ledger: " << payment.to << " rejects incoming value");
            return Errc::TransferFailure;
        }
        if (payment.amount > kMaxAmount - total) {
            PACTUM_LOG_WARN("ledger: settlement total overflows");
            return Errc::TransferFailure;
        }
        total += payment.amount;
    }
    if (total > custody_) {
        PACTUM_LOG_DEBUG("ledger: custody " << custody_ << " cannot cover settlement of " << total);
        return Errc::TransferFailure;
    }

    for (const auto& payment : payments) {
        balances_[payment.to] += payment.amount;
    }
    custody_ -= total;
    return {};
}

Error InMemoryLedger::Mint(const Identity& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Balances, custody and settlement totals never exceed the supply
    if (amount > kMaxAmount - supply_) {
        PACTUM_LOG_WARN("ledger: minting " << amount << " to " << to << " exceeds the supply limit");
        return Errc::TransferFailure;
    }
    balances_[to] += amount;
    supply_ += amount;
    return {};
}

void InMemoryLedger::RejectIncoming(const Identity& who) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejecting_.insert(who);
}

void InMemoryLedger::AcceptIncoming(const Identity& who) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejecting_.erase(who);
}

Amount InMemoryLedger::BalanceOf(const Identity& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(who);
    return it == balances_.end() ? 0 : it->second;
}

Amount InMemoryLedger::Custody() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custody_;
}

Amount InMemoryLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = custody_;
    for (const auto& [who, balance] : balances_) {
        total += balance;
    }
    return total;
}

}  // namespace pactum
