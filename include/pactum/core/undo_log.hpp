// ============================================================================
// pactum/core/undo_log.hpp - Scoped Rollback Journal
// ============================================================================
//
// UndoLog records one compensating action per in-memory mutation. If the
// log goes out of scope without Commit(), the actions run in reverse
// (LIFO) order, restoring the state that existed before the call began.
// The registry mutates a task first, then asks the value-transfer backend
// to move funds; a failed transfer simply drops the log.
//
// USAGE:
// ------
//   UndoLog undo;
//   undo.Assign(task.status, TaskStatus::Completed);
//   undo.Push([&] { counts.erase(id); });
//   if (auto ec = transfer.Settle(payments)) return Err(ec);  // rolled back
//   undo.Commit();
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace pactum {

class UndoLog {
   public:
    UndoLog() = default;

    ~UndoLog() { Rollback(); }

    UndoLog(const UndoLog&) = delete;
    UndoLog& operator=(const UndoLog&) = delete;

    UndoLog(UndoLog&& other) noexcept : actions_(std::move(other.actions_)) { other.actions_.clear(); }
    UndoLog& operator=(UndoLog&&) = delete;

    // Register a compensating action
    template <typename F>
    void Push(F&& undo) {
        actions_.emplace_back(std::forward<F>(undo));
    }

    // Overwrite `slot` with `value`, remembering the previous value
    template <typename T, typename U>
    void Assign(T& slot, U&& value) {
        T previous = slot;
        slot = std::forward<U>(value);
        actions_.emplace_back([&slot, previous = std::move(previous)]() mutable { slot = std::move(previous); });
    }

    // Keep every change; nothing will be undone
    void Commit() noexcept { actions_.clear(); }

    // Undo every recorded change now, newest first
    void Rollback() {
        while (!actions_.empty()) {
            auto action = std::move(actions_.back());
            actions_.pop_back();
            action();
        }
    }

    [[nodiscard]] std::size_t Size() const noexcept { return actions_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return actions_.empty(); }

   private:
    std::vector<std::function<void()>> actions_;
};

}  // namespace pactum
