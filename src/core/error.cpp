// ============================================================================
// pactum/core/error.cpp - Error Category Implementation
// ============================================================================

#include "pactum/core/error.hpp"

#include <string>

namespace pactum {

namespace {

class PactumCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "pactum"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::NotFound:
                return "Task not found";
            case Errc::Unauthorized:
                return "Caller is not authorized for this operation";
            case Errc::InvalidState:
                return "Operation not allowed in the current task state";
            case Errc::InvalidInput:
                return "Invalid input";
            case Errc::TransferFailure:
                return "Value transfer failed";
            default:
                return "Unknown pactum error";
        }
    }
};

}  // namespace

const std::error_category& PactumCategory() noexcept {
    static const PactumCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), PactumCategory()};
}

}  // namespace pactum
