#ifndef SEALFUND_PROTOCOL_LEDGER_HPP
#define SEALFUND_PROTOCOL_LEDGER_HPP

#include "audit.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "obfuscation.hpp"

#include <map>
#include <utility>
#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// CampaignLedger - owns campaigns, contributions and the platform counters
//
// Every mutating call validates first and writes last, so a throwing call
// leaves the ledger untouched. Status changes go through set_status(), which
// keeps PlatformStats in step without rescanning campaigns.
// -----------------------------------------------------------------------------
class CampaignLedger {
public:
    CampaignLedger(const PlatformConfig& config,
                   const RevealCapability& capability,
                   ObfuscationGenerator& obfuscation,
                   AuditLog& audit);

    CampaignId create_campaign(const Identity& creator,
                               const CampaignMetadata& metadata,
                               Amount target,
                               uint64_t funding_duration,
                               Timestamp now);

    void record_contribution(CampaignId campaign_id,
                             const Identity& contributor,
                             Amount amount,
                             const std::string& message,
                             Timestamp now);

    // Throws ValidationError for unknown ids
    Campaign& campaign(CampaignId id);
    const Campaign& campaign(CampaignId id) const;

    // nullptr when `contributor` never funded the campaign
    Contribution* find_contribution(CampaignId id, const Identity& contributor);
    const Contribution* find_contribution(CampaignId id, const Identity& contributor) const;

    // Status change plus counters, no audit entry
    void set_status(Campaign& c, CampaignStatus to);

    // Status change, counters and audit entry
    void transition(Campaign& c, CampaignStatus to, Timestamp now, const std::string& operation);

    // Custody. debit() throws ResourceError when the balance is short.
    void debit(Campaign& c, Amount amount);

    std::size_t campaign_count() const { return campaigns_.size(); }
    const std::vector<CampaignId>& creator_campaigns(const Identity& creator) const;
    const std::vector<CampaignId>& backer_campaigns(const Identity& backer) const;

    const PlatformStats& stats() const { return stats_; }
    void restore_stats(const PlatformStats& saved) { stats_ = saved; }

private:
    void validate_metadata(const CampaignMetadata& metadata) const;

    const PlatformConfig&   config_;
    const RevealCapability& capability_;
    ObfuscationGenerator&   obfuscation_;
    AuditLog&               audit_;

    CampaignId next_id_ = 1;
    uint64_t   sequence_ = 0;
    std::map<CampaignId, Campaign> campaigns_;
    std::map<std::pair<CampaignId, Identity>, Contribution> contributions_;
    std::map<Identity, std::vector<CampaignId>> by_creator_;
    std::map<Identity, std::vector<CampaignId>> by_backer_;
    PlatformStats stats_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_LEDGER_HPP
