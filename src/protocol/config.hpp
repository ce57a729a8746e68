#ifndef SEALFUND_PROTOCOL_CONFIG_HPP
#define SEALFUND_PROTOCOL_CONFIG_HPP

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace protocol {

constexpr uint64_t SECONDS_PER_DAY = 24 * 60 * 60;

// Ceiling for every configured period, so doubled periods stay far from 2^64
constexpr uint64_t MAX_PERIOD = uint64_t(1) << 40;

// True while fewer than `period` seconds have passed since `start`
inline bool period_pending(Timestamp start, uint64_t period, Timestamp now) {
    return now < start || now - start < period;
}

// -----------------------------------------------------------------------------
// PlatformConfig - every tunable of the settlement protocol
// -----------------------------------------------------------------------------
struct PlatformConfig {
    // Funding window
    uint64_t min_duration = 7 * SECONDS_PER_DAY;
    uint64_t max_duration = 90 * SECONDS_PER_DAY;

    // After deadline + grace anyone may request finalization
    uint64_t grace_period = 7 * SECONDS_PER_DAY;

    // Reveal protocol
    uint64_t reveal_timeout = 60 * 60;
    uint32_t max_retries = 3;

    // Amount ceilings (headroom for the obfuscation multiplier)
    Amount max_target = Amount(1) << 40;
    Amount max_contribution = Amount(1) << 40;
    Amount max_raised = Amount(1) << 48;

    // Obfuscation multiplier range [multiplier_min, multiplier_max)
    uint64_t multiplier_min = 1000;
    uint64_t multiplier_max = 1000000;

    // Metadata bounds
    std::size_t max_title_len = 100;
    std::size_t max_description_len = 2000;
    std::size_t max_category_len = 50;
    std::size_t max_content_ref_len = 128;
    std::size_t max_message_len = 280;

    // Throws ValidationError on inconsistent settings
    void validate() const;

    // Serialize to environment variable format (KEY=value lines)
    std::string to_env_string() const;

    // Deserialize from environment variable format. Missing keys keep their
    // defaults; unknown keys and malformed numbers are rejected.
    static PlatformConfig from_env_string(const std::string& env_content);
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_CONFIG_HPP
