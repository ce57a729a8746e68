#include "obfuscation.hpp"
#include "../helpers.hpp"

namespace protocol {

using sealfund::utils::hash_all;
using sealfund::utils::to_bytes;
using sealfund::utils::u64_bytes;

ObfuscationGenerator::ObfuscationGenerator(const PlatformConfig& config,
                                           const RevealCapability& capability,
                                           RandomnessBeacon& beacon)
    : config_(config)
    , capability_(capability)
    , beacon_(beacon)
{}

Obfuscation ObfuscationGenerator::derive(CampaignId campaign_id,
                                         const Identity& creator,
                                         uint64_t sequence,
                                         const Ciphertext& target,
                                         Timestamp now) {
    const uint64_t span = config_.multiplier_max - config_.multiplier_min;
    if (used_.size() >= span) {
        throw ResourceError("obfuscation multiplier range exhausted");
    }

    Bytes beacon = beacon_.next();

    uint64_t multiplier = 0;
    for (uint64_t attempt = 0; ; ++attempt) {
        Bytes digest = hash_all({
            to_bytes("sealfund/obfuscation"),
            u64_bytes(now),
            beacon,
            to_bytes(creator),
            u64_bytes(sequence),
            u64_bytes(campaign_id),
            u64_bytes(attempt)
        });

        uint64_t mixed = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            mixed = (mixed << 8) | digest[i];
        }
        multiplier = config_.multiplier_min + mixed % span;
        if (!is_used(multiplier)) break;
    }

    Obfuscation out;
    out.obfuscated_target = capability_.mul(target, multiplier);
    out.multiplier = multiplier;

    used_.insert(multiplier);
    return out;
}

} // namespace protocol
