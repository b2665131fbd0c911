// ============================================================================
// pactum/escrow/value_transfer.hpp - Value Movement Abstraction
// ============================================================================
//
// The registry never touches balances itself. It asks the host to pull value
// into custody when a task is funded and to push value out of custody on
// payout, refund or sweep. Both calls are all-or-nothing: a non-zero error
// means nothing moved, and the registry aborts the whole operation.
//
// DESIGN:
// -------
// Payouts are a batch (freelancer share + owner fee) so that a backend can
// refuse the whole settlement when any recipient cannot accept funds. The
// registry never sends zero-amount legs.
//
// ============================================================================

#pragma once

#include <vector>

#include "pactum/core/error.hpp"
#include "pactum/escrow/types.hpp"

namespace pactum {

struct Payment {
    Identity to;
    Amount amount = 0;
};

class ValueTransfer {
   public:
    virtual ~ValueTransfer() = default;

    // Move `amount` from `from` into registry custody
    [[nodiscard]] virtual Error Collect(const Identity& from, Amount amount) = 0;

    // Deliver every payment out of custody, or none of them
    [[nodiscard]] virtual Error Settle(const std::vector<Payment>& payments) = 0;
};

}  // namespace pactum
