// ============================================================================
// pactum/escrow/events.cpp
// ============================================================================

#include "pactum/escrow/events.hpp"

namespace pactum {

namespace {

struct NameVisitor {
    std::string_view operator()(const TaskCreated&) const noexcept { return "TaskCreated"; }
    std::string_view operator()(const TaskAssigned&) const noexcept { return "TaskAssigned"; }
    std::string_view operator()(const TaskCompleted&) const noexcept { return "TaskCompleted"; }
    std::string_view operator()(const TaskCancelled&) const noexcept { return "TaskCancelled"; }
    std::string_view operator()(const PaymentReleased&) const noexcept { return "PaymentReleased"; }
    std::string_view operator()(const PlatformFeeUpdated&) const noexcept { return "PlatformFeeUpdated"; }
    std::string_view operator()(const EmergencyWithdrawal&) const noexcept { return "EmergencyWithdrawal"; }
};

}  // namespace

std::string_view EventName(const Event& event) noexcept {
    return std::visit(NameVisitor{}, event);
}

void EventLog::OnEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> EventLog::Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::size_t EventLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::vector<std::string_view> EventLog::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string_view> names;
    names.reserve(events_.size());
    for (const auto& event : events_) {
        names.push_back(EventName(event));
    }
    return names;
}

void EventLog::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

}  // namespace pactum
