// ============================================================================
// pactum/escrow/types.hpp - Vocabulary Types of the Escrow Domain
// ============================================================================

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "pactum/core/clock.hpp"

namespace pactum {

using TaskId = std::uint64_t;

// Smallest indivisible unit of value
using Amount = std::uint64_t;

// ============================================================================
// Identity - An authenticated principal (client, freelancer or owner)
// ============================================================================
// The host authenticates callers; the registry only compares identities for
// equality. The empty identity is the "none" sentinel used for an unassigned
// freelancer.
class Identity {
   public:
    Identity() = default;
    explicit Identity(std::string name) : name_(std::move(name)) {}

    static Identity None() { return Identity{}; }

    [[nodiscard]] bool IsNone() const noexcept { return name_.empty(); }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    friend bool operator==(const Identity&, const Identity&) = default;
    friend auto operator<=>(const Identity&, const Identity&) = default;

   private:
    std::string name_;
};

inline std::ostream& operator<<(std::ostream& os, const Identity& id) {
    return os << (id.IsNone() ? std::string_view("<none>") : std::string_view(id.Name()));
}

// ============================================================================
// TaskStatus
// ============================================================================
//   Open --accept--> Assigned --dual confirm--> Completed
//   Open --cancel--> Cancelled
// Disputed is reserved: no operation enters or leaves it.
enum class TaskStatus : std::uint8_t {
    Open = 0,
    Assigned,
    Completed,
    Disputed,
    Cancelled,
};

std::string_view ToString(TaskStatus status) noexcept;

inline std::ostream& operator<<(std::ostream& os, TaskStatus status) { return os << ToString(status); }

// No transition leaves Completed or Cancelled
constexpr bool IsTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Cancelled;
}

}  // namespace pactum

namespace std {
template <>
struct hash<pactum::Identity> {
    size_t operator()(const pactum::Identity& id) const noexcept { return hash<string>{}(id.Name()); }
};
}  // namespace std
