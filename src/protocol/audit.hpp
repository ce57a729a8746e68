#ifndef SEALFUND_PROTOCOL_AUDIT_HPP
#define SEALFUND_PROTOCOL_AUDIT_HPP

#include "types.hpp"

#include <string>
#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// CampaignEvent - one status transition (creation is Active -> Active)
// -----------------------------------------------------------------------------
struct CampaignEvent {
    CampaignId     campaign_id = 0;
    Timestamp      at = 0;
    CampaignStatus from = CampaignStatus::Active;
    CampaignStatus to = CampaignStatus::Active;
    std::string    operation;

    Bytes serialize() const;
    static CampaignEvent deserialize(const Bytes& data);
};

enum class ContributionEventKind : uint8_t {
    Created           = 1,
    Increased         = 2,
    RefundRequested   = 3,
    Refunded          = 4,
    EmergencyRefunded = 5
};

// -----------------------------------------------------------------------------
// ContributionEvent - amount is only set once it is public (payouts)
// -----------------------------------------------------------------------------
struct ContributionEvent {
    CampaignId            campaign_id = 0;
    Identity              contributor;
    Timestamp             at = 0;
    ContributionEventKind kind = ContributionEventKind::Created;
    Amount                amount = 0;

    Bytes serialize() const;
    static ContributionEvent deserialize(const Bytes& data);
};

// -----------------------------------------------------------------------------
// AuditLog - append-only record of everything that changed
// -----------------------------------------------------------------------------
class AuditLog {
public:
    void record(const CampaignEvent& event);
    void record(const ContributionEvent& event);

    const std::vector<CampaignEvent>& campaign_events() const { return campaign_events_; }
    const std::vector<ContributionEvent>& contribution_events() const { return contribution_events_; }

    std::vector<CampaignEvent> campaign_history(CampaignId id) const;
    std::vector<ContributionEvent> contribution_history(CampaignId id, const Identity& contributor) const;

    // Export both streams for replay
    Bytes serialize() const;
    static AuditLog deserialize(const Bytes& data);

private:
    std::vector<CampaignEvent>     campaign_events_;
    std::vector<ContributionEvent> contribution_events_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_AUDIT_HPP
