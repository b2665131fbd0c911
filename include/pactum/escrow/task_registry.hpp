// ============================================================================
// pactum/escrow/task_registry.hpp - Escrowed Task Lifecycle
// ============================================================================
//
// TaskRegistry owns every task, the value escrowed for it, and the rules for
// moving between states:
//
//   Open --AcceptTask--> Assigned --CompleteTask x2--> Completed
//   Open --CancelTask--> Cancelled
//
// Payout requires dual confirmation: the freelancer submits, then the client
// approves (either may repeat the call). The call that sets the second flag
// pays reward minus fee to the freelancer and the fee to the owner, exactly
// once. Fees use the percentage in effect at payout time.
//
// GUARANTEES:
// -----------
// - Every call either fully applies or is rejected with no state change, no
//   value movement and no event.
// - Mutations are serialized by one exclusive lock; reads share the lock and
//   return copies, so callers always observe consistent snapshots.
// - A task's escrow moves at most once (payout, refund or emergency sweep).
//
// USAGE:
// ------
//   InMemoryLedger ledger;
//   SystemClock clock;
//   EventLog events;
//   auto registry = TaskRegistry::Create({Identity("platform")}, ledger, clock, &events);
//
//   auto id = registry.Value()->CreateTask(client, "Logo", "SVG please", deadline, 100);
//   registry.Value()->AcceptTask(freelancer, id.Value());
//   registry.Value()->CompleteTask(freelancer, id.Value());   // submit
//   registry.Value()->CompleteTask(client, id.Value());       // approve + pay
//
// ============================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pactum/core/clock.hpp"
#include "pactum/core/result.hpp"
#include "pactum/core/undo_log.hpp"
#include "pactum/escrow/config.hpp"
#include "pactum/escrow/events.hpp"
#include "pactum/escrow/fee.hpp"
#include "pactum/escrow/task.hpp"
#include "pactum/escrow/value_transfer.hpp"

namespace pactum {

class TaskRegistry {
   public:
    // `transfer`, `clock` and `sink` must outlive the registry. A null sink
    // discards events.
    TaskRegistry(const RegistryConfig& config, ValueTransfer& transfer, const Clock& clock,
                 EventSink* sink = nullptr);

    // Validating factory; InvalidInput for a bad config
    static Result<std::unique_ptr<TaskRegistry>> Create(const RegistryConfig& config, ValueTransfer& transfer,
                                                        const Clock& clock, EventSink* sink = nullptr);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Escrows `amount` from `caller` and opens a new task.
    // InvalidInput: zero amount, deadline not in the future, empty title.
    // TransferFailure: value could not be collected from the caller.
    Result<TaskId> CreateTask(const Identity& caller, std::string title, std::string description,
                              Timestamp deadline, Amount amount);

    // Claims an Open task before its deadline.
    // NotFound, InvalidState (not Open / deadline reached), Unauthorized
    // (caller is the client).
    Result<void> AcceptTask(const Identity& caller, TaskId id);

    // Freelancer: records submission (requires Assigned).
    // Client: records approval (requires a prior submission).
    // When both are recorded the task completes and funds are released.
    // Unauthorized if the caller is neither party.
    Result<void> CompleteTask(const Identity& caller, TaskId id);

    // Refunds an Open task to its client.
    // NotFound, Unauthorized (not the client), InvalidState (not Open).
    Result<void> CancelTask(const Identity& caller, TaskId id);

    // ========================================================================
    // Owner Controls
    // ========================================================================

    // Unauthorized unless owner; InvalidInput above kMaxPlatformFeePercent
    Result<void> UpdatePlatformFee(const Identity& caller, std::uint32_t new_fee_percent);

    // Sweeps every escrow, of every task, to the owner and returns the amount.
    // Statuses are left untouched; swept tasks can no longer pay out or
    // refund (TransferFailure).
    Result<Amount> EmergencyWithdraw(const Identity& caller);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] Result<Task> GetTask(TaskId id) const;
    [[nodiscard]] std::vector<TaskId> GetUserTasks(const Identity& who) const;
    [[nodiscard]] std::uint64_t GetTotalTasks() const;

    [[nodiscard]] std::uint64_t GetCompletedTaskCount(const Identity& who) const;
    [[nodiscard]] std::uint32_t GetPlatformFee() const;
    [[nodiscard]] const Identity& GetOwner() const noexcept { return owner_; }

    // Value currently in custody across all tasks
    [[nodiscard]] Amount GetHeldBalance() const;

    // Snapshot of all tasks in `status`, ordered by id
    [[nodiscard]] std::vector<Task> GetTasksByStatus(TaskStatus status) const;

   private:
    // Internal: lookup under an already-held lock
    Task* FindLocked(TaskId id);

    // Internal: log a rejection and build the error result
    static ErrTag<Error> Reject(std::string_view op, TaskId id, const Identity& caller, Errc code,
                                std::string_view why);

    // Internal: move a fully confirmed task to Completed and settle its
    // escrow. Every mutation is journaled in `undo`; the caller commits.
    Result<RewardSplit> ReleasePaymentLocked(Task& task, UndoLog& undo);

    void Emit(const Event& event);

    const Identity owner_;
    ValueTransfer& transfer_;
    const Clock& clock_;
    EventSink* sink_;

    mutable std::shared_mutex mutex_;
    std::uint32_t platform_fee_percent_;
    std::uint64_t task_counter_ = 0;
    Amount held_balance_ = 0;
    std::map<TaskId, Task> tasks_;
    std::unordered_map<Identity, std::vector<TaskId>> user_tasks_;
    std::unordered_map<Identity, std::uint64_t> completed_count_;
};

}  // namespace pactum
