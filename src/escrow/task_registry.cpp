// ============================================================================
// TaskRegistry Implementation
// ============================================================================

#include "pactum/escrow/task_registry.hpp"

#include <exception>
#include <limits>
#include <mutex>
#include <utility>

#include "pactum/core/check.hpp"
#include "pactum/core/logging.hpp"

namespace pactum {

// ============================================================================
// Construction
// ============================================================================

TaskRegistry::TaskRegistry(const RegistryConfig& config, ValueTransfer& transfer, const Clock& clock,
                           EventSink* sink)
    : owner_(config.owner),
      transfer_(transfer),
      clock_(clock),
      sink_(sink),
      platform_fee_percent_(config.platform_fee_percent) {
    PACTUM_CHECK(config.Validate().IsOk(), "invalid RegistryConfig, use TaskRegistry::Create to validate");
    PACTUM_LOG_INFO("registry: created, owner=" << owner_ << " fee=" << platform_fee_percent_ << "%");
}

Result<std::unique_ptr<TaskRegistry>> TaskRegistry::Create(const RegistryConfig& config, ValueTransfer& transfer,
                                                           const Clock& clock, EventSink* sink) {
    auto valid = config.Validate();
    if (valid.IsErr()) {
        return Err(valid.Error());
    }
    return Ok(std::make_unique<TaskRegistry>(config, transfer, clock, sink));
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<TaskId> TaskRegistry::CreateTask(const Identity& caller, std::string title, std::string description,
                                        Timestamp deadline, Amount amount) {
    std::unique_lock lock(mutex_);

    if (caller.IsNone()) {
        return Reject("CreateTask", 0, caller, Errc::Unauthorized, "anonymous caller");
    }
    if (amount == 0) {
        return Reject("CreateTask", 0, caller, Errc::InvalidInput, "reward must be greater than zero");
    }
    Timestamp now = clock_.Now();
    if (deadline <= now) {
        return Reject("CreateTask", 0, caller, Errc::InvalidInput, "deadline must be in the future");
    }
    if (title.empty()) {
        return Reject("CreateTask", 0, caller, Errc::InvalidInput, "title must not be empty");
    }

    if (amount > std::numeric_limits<Amount>::max() - held_balance_) {
        return Reject("CreateTask", 0, caller, Errc::InvalidInput, "reward exceeds remaining custody capacity");
    }

    // Record the task first so a failed or throwing collection unwinds it
    UndoLog undo;
    TaskId id = task_counter_ + 1;
    Task task;
    task.id = id;
    task.title = std::move(title);
    task.description = std::move(description);
    task.reward = amount;
    task.escrow = amount;
    task.client = caller;
    task.deadline = deadline;
    task.created_at = now;

    undo.Push([this, id, caller] {
        tasks_.erase(id);
        auto list = user_tasks_.find(caller);
        if (list == user_tasks_.end()) return;
        if (!list->second.empty() && list->second.back() == id) list->second.pop_back();
        if (list->second.empty()) user_tasks_.erase(list);
    });
    auto it = tasks_.emplace(id, std::move(task)).first;
    user_tasks_[caller].push_back(id);

    if (auto ec = transfer_.Collect(caller, amount)) {
        PACTUM_LOG_WARN("registry: could not escrow " << amount << " from " << caller << ": " << ec.message());
        return Reject("CreateTask", 0, caller, Errc::TransferFailure, "escrow collection failed");
    }
    undo.Commit();

    task_counter_ = id;
    held_balance_ += amount;

    PACTUM_LOG_INFO("registry: task " << id << " created by " << caller << " reward=" << amount);
    Emit(TaskCreated{id, caller, it->second.title, amount});
    return Ok(id);
}

Result<void> TaskRegistry::AcceptTask(const Identity& caller, TaskId id) {
    std::unique_lock lock(mutex_);

    if (caller.IsNone()) {
        return Reject("AcceptTask", id, caller, Errc::Unauthorized, "anonymous caller");
    }
    Task* task = FindLocked(id);
    if (task == nullptr) {
        return Reject("AcceptTask", id, caller, Errc::NotFound, "no such task");
    }
    if (task->status != TaskStatus::Open) {
        return Reject("AcceptTask", id, caller, Errc::InvalidState, "task is not open");
    }
    if (caller == task->client) {
        return Reject("AcceptTask", id, caller, Errc::Unauthorized, "client cannot accept own task");
    }
    if (clock_.Now() >= task->deadline) {
        return Reject("AcceptTask", id, caller, Errc::InvalidState, "deadline has passed");
    }

    task->freelancer = caller;
    task->status = TaskStatus::Assigned;
    user_tasks_[caller].push_back(id);

    PACTUM_LOG_INFO("registry: task " << id << " assigned to " << caller);
    Emit(TaskAssigned{id, caller});
    return Ok();
}

Result<void> TaskRegistry::CompleteTask(const Identity& caller, TaskId id) {
    std::unique_lock lock(mutex_);

    if (caller.IsNone()) {
        return Reject("CompleteTask", id, caller, Errc::Unauthorized, "anonymous caller");
    }
    Task* task = FindLocked(id);
    if (task == nullptr) {
        return Reject("CompleteTask", id, caller, Errc::NotFound, "no such task");
    }

    UndoLog undo;
    if (task->IsAssigned() && caller == task->freelancer) {
        if (task->status != TaskStatus::Assigned) {
            return Reject("CompleteTask", id, caller, Errc::InvalidState, "task is not assigned");
        }
        undo.Assign(task->freelancer_submitted, true);
        PACTUM_LOG_DEBUG("registry: task " << id << " submitted by " << caller);
    } else if (caller == task->client) {
        if (!task->freelancer_submitted) {
            return Reject("CompleteTask", id, caller, Errc::InvalidState, "freelancer has not submitted");
        }
        if (task->status != TaskStatus::Assigned) {
            return Reject("CompleteTask", id, caller, Errc::InvalidState, "task is not assigned");
        }
        undo.Assign(task->client_approved, true);
        PACTUM_LOG_DEBUG("registry: task " << id << " approved by " << caller);
    } else {
        return Reject("CompleteTask", id, caller, Errc::Unauthorized, "caller is neither client nor freelancer");
    }

    if (!(task->freelancer_submitted && task->client_approved)) {
        undo.Commit();
        return Ok();
    }

    auto released = ReleasePaymentLocked(*task, undo);
    if (released.IsErr()) {
        // `undo` restores flags, status, escrow and counters on return
        return Reject("CompleteTask", id, caller, Errc::TransferFailure, released.Error().message());
    }
    undo.Commit();

    const RewardSplit& split = released.Value();
    PACTUM_LOG_INFO("registry: task " << id << " completed, paid " << split.freelancer_share << " to "
                                      << task->freelancer << ", fee " << split.platform_fee << " to " << owner_);
    Emit(TaskCompleted{id, task->freelancer, task->client});
    Emit(PaymentReleased{id, task->freelancer, split.freelancer_share});
    return Ok();
}

Result<void> TaskRegistry::CancelTask(const Identity& caller, TaskId id) {
    std::unique_lock lock(mutex_);

    Task* task = FindLocked(id);
    if (task == nullptr) {
        return Reject("CancelTask", id, caller, Errc::NotFound, "no such task");
    }
    if (caller.IsNone() || caller != task->client) {
        return Reject("CancelTask", id, caller, Errc::Unauthorized, "only the client may cancel");
    }
    if (task->status != TaskStatus::Open) {
        return Reject("CancelTask", id, caller, Errc::InvalidState, "only open tasks can be cancelled");
    }
    if (task->escrow != task->reward) {
        return Reject("CancelTask", id, caller, Errc::TransferFailure, "escrow is no longer held");
    }

    if (auto ec = transfer_.Settle({Payment{task->client, task->reward}})) {
        PACTUM_LOG_WARN("registry: refund of task " << id << " to " << task->client << " failed: " << ec.message());
        return Reject("CancelTask", id, caller, Errc::TransferFailure, "refund failed");
    }

    task->status = TaskStatus::Cancelled;
    task->escrow = 0;
    held_balance_ -= task->reward;

    PACTUM_LOG_INFO("registry: task " << id << " cancelled, refunded " << task->reward << " to " << task->client);
    Emit(TaskCancelled{id, task->client});
    return Ok();
}

// ============================================================================
// Owner Controls
// ============================================================================

Result<void> TaskRegistry::UpdatePlatformFee(const Identity& caller, std::uint32_t new_fee_percent) {
    std::unique_lock lock(mutex_);

    if (caller != owner_) {
        return Reject("UpdatePlatformFee", 0, caller, Errc::Unauthorized, "only the owner may change the fee");
    }
    if (new_fee_percent > kMaxPlatformFeePercent) {
        return Reject("UpdatePlatformFee", 0, caller, Errc::InvalidInput, "fee above cap");
    }

    std::uint32_t old_fee = std::exchange(platform_fee_percent_, new_fee_percent);
    PACTUM_LOG_INFO("registry: platform fee " << old_fee << "% -> " << new_fee_percent << "%");
    Emit(PlatformFeeUpdated{old_fee, new_fee_percent});
    return Ok();
}

Result<Amount> TaskRegistry::EmergencyWithdraw(const Identity& caller) {
    std::unique_lock lock(mutex_);

    if (caller != owner_) {
        return Reject("EmergencyWithdraw", 0, caller, Errc::Unauthorized, "only the owner may withdraw");
    }

    Amount amount = held_balance_;
    if (amount == 0) {
        PACTUM_LOG_INFO("registry: emergency withdraw requested with nothing in custody");
        return Ok(Amount{0});
    }

    if (auto ec = transfer_.Settle({Payment{owner_, amount}})) {
        PACTUM_LOG_WARN("registry: emergency withdraw of " << amount << " failed: " << ec.message());
        return Reject("EmergencyWithdraw", 0, caller, Errc::TransferFailure, "sweep failed");
    }

    for (auto& [task_id, task] : tasks_) {
        task.escrow = 0;
    }
    held_balance_ = 0;

    PACTUM_LOG_WARN("registry: emergency withdraw swept " << amount << " to " << owner_);
    Emit(EmergencyWithdrawal{owner_, amount});
    return Ok(amount);
}

// ============================================================================
// Queries
// ============================================================================

Result<Task> TaskRegistry::GetTask(TaskId id) const {
    std::shared_lock lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return Err(Errc::NotFound);
    }
    return Ok(it->second);
}

std::vector<TaskId> TaskRegistry::GetUserTasks(const Identity& who) const {
    std::shared_lock lock(mutex_);
    auto it = user_tasks_.find(who);
    if (it == user_tasks_.end()) return {};
    return it->second;
}

std::uint64_t TaskRegistry::GetTotalTasks() const {
    std::shared_lock lock(mutex_);
    return task_counter_;
}

std::uint64_t TaskRegistry::GetCompletedTaskCount(const Identity& who) const {
    std::shared_lock lock(mutex_);
    auto it = completed_count_.find(who);
    return it == completed_count_.end() ? 0 : it->second;
}

std::uint32_t TaskRegistry::GetPlatformFee() const {
    std::shared_lock lock(mutex_);
    return platform_fee_percent_;
}

Amount TaskRegistry::GetHeldBalance() const {
    std::shared_lock lock(mutex_);
    return held_balance_;
}

std::vector<Task> TaskRegistry::GetTasksByStatus(TaskStatus status) const {
    std::shared_lock lock(mutex_);
    std::vector<Task> out;
    for (const auto& [id, task] : tasks_) {
        if (task.status == status) out.push_back(task);
    }
    return out;
}

// ============================================================================
// Internals
// ============================================================================

Task* TaskRegistry::FindLocked(TaskId id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

ErrTag<Error> TaskRegistry::Reject(std::string_view op, TaskId id, const Identity& caller, Errc code,
                                   std::string_view why) {
    Error ec = code;
    PACTUM_LOG_DEBUG("registry: " << op << " rejected (task " << id << ", caller " << caller << "): " << ec.message()
                                  << " - " << why);
    return Err(ec);
}

Result<RewardSplit> TaskRegistry::ReleasePaymentLocked(Task& task, UndoLog& undo) {
    if (task.escrow != task.reward) {
        PACTUM_LOG_WARN("registry: task " << task.id << " has no escrow left to release");
        return Err(Errc::TransferFailure);
    }

    RewardSplit split = SplitReward(task.reward, platform_fee_percent_);

    undo.Assign(task.status, TaskStatus::Completed);
    undo.Assign(task.escrow, Amount{0});
    undo.Assign(held_balance_, held_balance_ - task.reward);

    for (const Identity* who : {&task.freelancer, &task.client}) {
        ++completed_count_[*who];
        undo.Push([this, identity = *who] {
            auto it = completed_count_.find(identity);
            if (--it->second == 0) completed_count_.erase(it);
        });
    }

    std::vector<Payment> payments;
    if (split.freelancer_share > 0) payments.push_back(Payment{task.freelancer, split.freelancer_share});
    if (split.platform_fee > 0) payments.push_back(Payment{owner_, split.platform_fee});

    if (auto ec = transfer_.Settle(payments)) {
        PACTUM_LOG_WARN("registry: settlement of task " << task.id << " failed: " << ec.message());
        return Err(Errc::TransferFailure);
    }
    return Ok(split);
}

void TaskRegistry::Emit(const Event& event) {
    if (sink_ == nullptr) return;
    try {
        sink_->OnEvent(event);
    } catch (const std::exception& e) {
        PACTUM_LOG_ERROR("registry: event sink failed on " << EventName(event) << ": " << e.what());
    } catch (...) {
        PACTUM_LOG_ERROR("registry: event sink failed on " << EventName(event) << ": unknown exception");
    }
}

}  // namespace pactum
