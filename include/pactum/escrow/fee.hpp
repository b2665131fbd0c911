// ============================================================================
// pactum/escrow/fee.hpp - Platform Fee Arithmetic
// ============================================================================

#pragma once

#include <cstdint>

#include "pactum/escrow/types.hpp"

namespace pactum {

inline constexpr std::uint32_t kMaxPlatformFeePercent = 10;
inline constexpr std::uint32_t kDefaultPlatformFeePercent = 5;

struct RewardSplit {
    Amount freelancer_share = 0;
    Amount platform_fee = 0;
};

// platform_fee = floor(reward * percent / 100), computed without forming
// reward * percent so that rewards near the Amount limit cannot overflow.
constexpr RewardSplit SplitReward(Amount reward, std::uint32_t percent) noexcept {
    Amount fee = (reward / 100) * percent + ((reward % 100) * percent) / 100;
    return RewardSplit{reward - fee, fee};
}

}  // namespace pactum
