// ============================================================================
// RegistryConfig Implementation
// ============================================================================

#include "pactum/escrow/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <utility>

#include "pactum/core/logging.hpp"

namespace pactum {

Result<void> RegistryConfig::Validate() const {
    if (owner.IsNone()) {
        PACTUM_LOG_ERROR("config: registry owner must be set");
        return Err(Errc::InvalidInput);
    }
    if (platform_fee_percent > kMaxPlatformFeePercent) {
        PACTUM_LOG_ERROR("config: platform fee " << platform_fee_percent << "% exceeds cap of "
                                                 << kMaxPlatformFeePercent << "%");
        return Err(Errc::InvalidInput);
    }
    return Ok();
}

Result<RegistryConfig> RegistryConfig::FromEnvironment(Identity owner) {
    RegistryConfig config;
    config.owner = std::move(owner);

    if (const char* raw = std::getenv("PACTUM_PLATFORM_FEE")) {
        std::string_view text(raw);
        std::uint32_t fee = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), fee);
        if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
            PACTUM_LOG_ERROR("config: PACTUM_PLATFORM_FEE='" << text << "' is not a number");
            return Err(Errc::InvalidInput);
        }
        config.platform_fee_percent = fee;
    }

    auto valid = config.Validate();
    if (valid.IsErr()) {
        return Err(valid.Error());
    }
    return Ok(std::move(config));
}

}  // namespace pactum
