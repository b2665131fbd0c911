// ============================================================================
// pactum/escrow/types.cpp
// ============================================================================

#include "pactum/escrow/types.hpp"

namespace pactum {

std::string_view ToString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Open:
            return "Open";
        case TaskStatus::Assigned:
            return "Assigned";
        case TaskStatus::Completed:
            return "Completed";
        case TaskStatus::Disputed:
            return "Disputed";
        case TaskStatus::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

}  // namespace pactum
