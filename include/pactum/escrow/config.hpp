// ============================================================================
// pactum/escrow/config.hpp - Registry Configuration
// ============================================================================
//
// USAGE:
// ------
//   auto config = RegistryConfig::FromEnvironment(Identity("platform"));
//   if (config.IsErr()) { ... }              // bad PACTUM_PLATFORM_FEE
//   auto registry = TaskRegistry::Create(config.Value(), ledger, clock);
//
// ENVIRONMENT:
// ------------
//   PACTUM_PLATFORM_FEE   initial platform fee percent, 0..10 (default 5)
//   PACTUM_LOG_LEVEL      see pactum/core/logging.hpp
//
// ============================================================================

#pragma once

#include <cstdint>

#include "pactum/core/result.hpp"
#include "pactum/escrow/fee.hpp"
#include "pactum/escrow/types.hpp"

namespace pactum {

struct RegistryConfig {
    // Receives platform fees and holds emergency withdrawal rights
    Identity owner;

    std::uint32_t platform_fee_percent = kDefaultPlatformFeePercent;

    // InvalidInput if the owner is unset or the fee exceeds the cap
    [[nodiscard]] Result<void> Validate() const;

    // Defaults overridden by PACTUM_PLATFORM_FEE; InvalidInput if the
    // variable is set but is not a valid fee
    static Result<RegistryConfig> FromEnvironment(Identity owner);
};

}  // namespace pactum
