// ============================================================================
// pactum/core/error.hpp - Error Codes for pactum
// ============================================================================
//
// Every rejected registry call is reported as a std::error_code in the
// pactum category. The taxonomy is deliberately small: a caller can always
// tell whether it named a bad task, lacked the role, raced a state change,
// passed a bad value, or hit a failing value-transfer backend.
//
// USAGE:
// ------
//   auto result = registry.AcceptTask(alice, id);
//   if (result.IsErr() && result.Error() == Errc::InvalidState) { ... }
//
// ============================================================================

#pragma once

#include <system_error>

namespace pactum {

enum class Errc {
    NotFound = 1,     // referenced task id does not exist
    Unauthorized,     // caller is not owner / client / freelancer as required
    InvalidState,     // transition illegal from the task's current status
    InvalidInput,     // caller-supplied value violates a precondition
    TransferFailure,  // value could not be collected or delivered
};

const std::error_category& PactumCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

}  // namespace pactum

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<pactum::Errc> : true_type {};
}  // namespace std
