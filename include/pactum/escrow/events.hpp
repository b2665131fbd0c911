// ============================================================================
// pactum/escrow/events.hpp - Registry Notifications
// ============================================================================
//
// The registry reports every committed state change to an EventSink, in the
// order the changes happened. A completed task always produces TaskCompleted
// followed by PaymentReleased. Rejected calls produce nothing.
//
// Sinks are invoked synchronously while the registry holds its write lock,
// so a sink must not call back into the registry.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "pactum/escrow/types.hpp"

namespace pactum {

struct TaskCreated {
    TaskId task_id;
    Identity client;
    std::string title;
    Amount reward;
};

struct TaskAssigned {
    TaskId task_id;
    Identity freelancer;
};

struct TaskCompleted {
    TaskId task_id;
    Identity freelancer;
    Identity client;
};

struct TaskCancelled {
    TaskId task_id;
    Identity client;
};

// amount is what the freelancer received, after the platform fee
struct PaymentReleased {
    TaskId task_id;
    Identity freelancer;
    Amount amount;
};

struct PlatformFeeUpdated {
    std::uint32_t old_fee_percent;
    std::uint32_t new_fee_percent;
};

struct EmergencyWithdrawal {
    Identity owner;
    Amount amount;
};

using Event = std::variant<TaskCreated, TaskAssigned, TaskCompleted, TaskCancelled, PaymentReleased,
                           PlatformFeeUpdated, EmergencyWithdrawal>;

// Short name of the event type, e.g. "TaskCreated"
std::string_view EventName(const Event& event) noexcept;

// ============================================================================
// EventSink - Consumer of registry notifications
// ============================================================================
class EventSink {
   public:
    virtual ~EventSink() = default;

    virtual void OnEvent(const Event& event) = 0;
};

class NullEventSink : public EventSink {
   public:
    void OnEvent(const Event&) override {}
};

// Thread-safe in-memory recorder, useful for indexers and tests
class EventLog : public EventSink {
   public:
    void OnEvent(const Event& event) override;

    [[nodiscard]] std::vector<Event> Events() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::vector<std::string_view> Names() const;
    void Clear();

    // All recorded events of one type, in delivery order
    template <typename E>
    [[nodiscard]] std::vector<E> OfType() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<E> out;
        for (const auto& event : events_) {
            if (const auto* e = std::get_if<E>(&event)) out.push_back(*e);
        }
        return out;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

}  // namespace pactum
