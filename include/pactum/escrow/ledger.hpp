// ============================================================================
// pactum/escrow/ledger.hpp - In-Memory Value Transfer Backend
// ============================================================================
//
// InMemoryLedger keeps a balance per identity plus the custody balance held
// on behalf of the registry. It is the reference ValueTransfer used by the
// examples, benchmarks and tests.
//
// USAGE:
// ------
//   InMemoryLedger ledger;
//   if (auto ec = ledger.Mint(client, 1'000)) { ... }
//   ledger.RejectIncoming(freelancer);   // simulate a recipient that bounces
//
// ============================================================================

#pragma once

#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pactum/escrow/value_transfer.hpp"

namespace pactum {

class InMemoryLedger : public ValueTransfer {
   public:
    InMemoryLedger() = default;

    InMemoryLedger(const InMemoryLedger&) = delete;
    InMemoryLedger& operator=(const InMemoryLedger&) = delete;

    // ========================================================================
    // ValueTransfer
    // ========================================================================

    // TransferFailure if `from` cannot cover the amount
    Error Collect(const Identity& from, Amount amount) override;

    // TransferFailure if custody cannot cover the batch or any recipient
    // rejects incoming value
    Error Settle(const std::vector<Payment>& payments) override;

    // ========================================================================
    // Account Management
    // ========================================================================

    // Credit new value to an identity (outside custody). TransferFailure if
    // the total supply would no longer fit in an Amount.
    [[nodiscard]] Error Mint(const Identity& to, Amount amount);

    void RejectIncoming(const Identity& who);
    void AcceptIncoming(const Identity& who);

    [[nodiscard]] Amount BalanceOf(const Identity& who) const;
    [[nodiscard]] Amount Custody() const;

    // Sum of all account balances plus custody; constant under Collect/Settle
    [[nodiscard]] Amount TotalSupply() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<Identity, Amount> balances_;
    std::unordered_set<Identity> rejecting_;
    Amount custody_ = 0;
    Amount supply_ = 0;
};

}  // namespace pactum
