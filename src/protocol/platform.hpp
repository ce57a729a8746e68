#ifndef SEALFUND_PROTOCOL_PLATFORM_HPP
#define SEALFUND_PROTOCOL_PLATFORM_HPP

#include "audit.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "obfuscation.hpp"
#include "reveal.hpp"
#include "settlement.hpp"
#include "timeout.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace protocol {

// Public view of a campaign. Amounts appear only once they were revealed.
struct CampaignView {
    CampaignId       id = 0;
    Identity         creator;
    CampaignMetadata metadata;
    Timestamp        created_at = 0;
    Timestamp        deadline = 0;
    CampaignStatus   status = CampaignStatus::Active;
    uint32_t         backer_count = 0;
    uint32_t         refunded_count = 0;
    bool             withdrawn = false;
    bool             paused = false;
    uint32_t         retry_count = 0;
    RequestId        request_id = 0;
    uint64_t         multiplier = 0;
    Amount           held = 0;
    std::optional<Amount> revealed_raised;
    std::optional<Amount> revealed_target;
};

struct ContributionView {
    CampaignId  campaign_id = 0;
    Identity    contributor;
    Timestamp   first_contributed_at = 0;
    Timestamp   last_contributed_at = 0;
    bool        refund_requested = false;
    Timestamp   refund_requested_at = 0;
    RequestId   refund_request_id = 0;
    bool        refunded = false;
    Amount      refunded_amount = 0;
    std::string message;
};

struct EncryptedAmounts {
    Ciphertext raised;
    Ciphertext target;
};

// -----------------------------------------------------------------------------
// Platform
//
// Wires ledger, obfuscation, reveal, timeout and settlement together. Every
// public call takes one mutex, so operations never interleave even when the
// host calls in from several threads. `now` is read once by the host and
// passed in; nothing below looks at a clock.
// -----------------------------------------------------------------------------
class Platform {
public:
    Platform(const Identity& owner,
             const PlatformConfig& config,
             RevealCapability& capability,
             FundsTransfer& funds,
             RandomnessBeacon& beacon);

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    // --- Campaigns and contributions ---
    CampaignId create_campaign(const Identity& creator,
                               const CampaignMetadata& metadata,
                               Amount target,
                               uint64_t funding_duration,
                               Timestamp now);

    void contribute(CampaignId campaign_id,
                    const Identity& contributor,
                    Amount amount,
                    const std::string& message,
                    Timestamp now);

    // --- Reveal protocol ---
    RequestId finalize(CampaignId campaign_id, const Identity& caller, Timestamp now);

    CampaignStatus on_reveal_response(RequestId request_id,
                                      const Bytes& plaintexts,
                                      const Bytes& proof,
                                      const Bytes& context,
                                      Timestamp now);

    TimeoutOutcome on_timeout_check(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // --- Settlement ---
    Amount withdraw(CampaignId campaign_id, const Identity& caller, Timestamp now);
    std::optional<RequestId> request_refund(CampaignId campaign_id, const Identity& caller, Timestamp now);
    Amount on_refund_reveal(RequestId request_id,
                            const Bytes& plaintexts,
                            const Bytes& proof,
                            const Bytes& context,
                            Timestamp now);
    RequestId retry_refund_reveal(CampaignId campaign_id, const Identity& caller, Timestamp now);
    Amount emergency_refund(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // --- Owner controls ---
    void pause(CampaignId campaign_id, const Identity& caller, Timestamp now);
    void resume(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // --- Queries ---
    const Identity& owner() const { return owner_; }
    CampaignView campaign(CampaignId campaign_id) const;
    std::optional<ContributionView> contribution(CampaignId campaign_id, const Identity& contributor) const;
    EncryptedAmounts encrypted_amounts(CampaignId campaign_id, const Identity& caller) const;
    std::size_t campaign_count() const;
    std::vector<CampaignId> creator_campaigns(const Identity& creator) const;
    std::vector<CampaignId> backer_campaigns(const Identity& backer) const;
    std::optional<RevealRequest> reveal_request(RequestId request_id) const;
    PlatformStats stats() const;

    // Copy of the audit trail
    AuditLog audit() const;

    const PlatformConfig& config() const { return config_; }

private:
    const Identity       owner_;
    const PlatformConfig config_;

    mutable std::mutex   mu_;
    AuditLog             audit_;
    ObfuscationGenerator obfuscation_;
    CampaignLedger       ledger_;
    RevealRequestManager reveals_;
    TimeoutController    timeouts_;
    SettlementEngine     settlement_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_PLATFORM_HPP
