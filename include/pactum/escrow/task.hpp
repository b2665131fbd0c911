// ============================================================================
// pactum/escrow/task.hpp - Escrowed Task Record
// ============================================================================

#pragma once

#include <string>

#include "pactum/escrow/types.hpp"

namespace pactum {

struct Task {
    TaskId id = 0;
    std::string title;
    std::string description;

    // Fixed at creation; paid out (minus fee) or refunded exactly once
    Amount reward = 0;

    // Value currently held for this task. Equal to reward while Open or
    // Assigned, zero after payout, refund or an emergency sweep.
    Amount escrow = 0;

    Identity client;
    Identity freelancer;  // Identity::None() until accepted

    TaskStatus status = TaskStatus::Open;
    Timestamp deadline{};
    Timestamp created_at{};

    // Both must be true for payout
    bool freelancer_submitted = false;
    bool client_approved = false;

    [[nodiscard]] bool IsAssigned() const noexcept { return !freelancer.IsNone(); }
};

}  // namespace pactum
