#ifndef SEALFUND_PROTOCOL_OBFUSCATION_HPP
#define SEALFUND_PROTOCOL_OBFUSCATION_HPP

#include "capability.hpp"
#include "config.hpp"

#include <set>

namespace protocol {

struct Obfuscation {
    uint64_t   multiplier = 0;
    Ciphertext obfuscated_target;  // target * multiplier
};

// -----------------------------------------------------------------------------
// ObfuscationGenerator
//
// The multiplier is SHA-256(time, beacon draw, creator, sequence, campaign id,
// attempt) reduced into [multiplier_min, multiplier_max). The beacon draw is
// outside the creator's control and the time is outside the beacon's, so no
// single input owner can steer the result. Multipliers are never handed out
// twice: a collision re-derives with the next attempt counter.
// -----------------------------------------------------------------------------
class ObfuscationGenerator {
public:
    ObfuscationGenerator(const PlatformConfig& config,
                         const RevealCapability& capability,
                         RandomnessBeacon& beacon);

    // Throws ResourceError once every value in the range has been used.
    Obfuscation derive(CampaignId campaign_id,
                       const Identity& creator,
                       uint64_t sequence,
                       const Ciphertext& target,
                       Timestamp now);

    bool is_used(uint64_t multiplier) const { return used_.count(multiplier) != 0; }
    std::size_t used_count() const { return used_.size(); }

private:
    const PlatformConfig&   config_;
    const RevealCapability& capability_;
    RandomnessBeacon&       beacon_;
    std::set<uint64_t>      used_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_OBFUSCATION_HPP
