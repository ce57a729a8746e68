#ifndef SEALFUND_PROTOCOL_SETTLEMENT_HPP
#define SEALFUND_PROTOCOL_SETTLEMENT_HPP

#include "audit.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "reveal.hpp"

#include <optional>

namespace protocol {

// -----------------------------------------------------------------------------
// SettlementEngine - the only component that moves money
//
// State is written before FundsTransfer::transfer() is called, so a reentrant
// call sees the campaign already settled. If the transfer throws, the
// campaign, the contribution and the platform counters are put back as they
// were and the call fails with ResourceError.
// -----------------------------------------------------------------------------
class SettlementEngine {
public:
    SettlementEngine(const PlatformConfig& config,
                     CampaignLedger& ledger,
                     RevealRequestManager& reveals,
                     const RevealCapability& capability,
                     FundsTransfer& funds,
                     AuditLog& audit);

    // Successful -> Withdrawn, pays revealed_raised to the creator
    Amount withdraw(CampaignId campaign_id, const Identity& caller, Timestamp now);

    /**
     * Open a refund for the caller's contribution. From Failed a reveal of
     * that one contribution is issued and its id returned; from
     * DecryptionFailed the request is only recorded (no oracle to ask) and
     * the return value is empty.
     */
    std::optional<RequestId> request_refund(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // Pays the revealed amount to the contributor carried in the request
    Amount on_refund_reveal(RequestId request_id,
                            const Bytes& plaintexts,
                            const Bytes& proof,
                            const Bytes& context,
                            Timestamp now);

    // held / (backers not yet refunded), for campaigns stuck in DecryptionFailed
    Amount emergency_refund(CampaignId campaign_id, const Identity& caller, Timestamp now);

private:
    void pay(Campaign& c, Contribution* contrib, const Campaign& saved_campaign,
             const Contribution* saved_contrib, const PlatformStats& saved_stats,
             const Identity& recipient, Amount amount);

    const PlatformConfig&   config_;
    CampaignLedger&         ledger_;
    RevealRequestManager&   reveals_;
    const RevealCapability& capability_;
    FundsTransfer&          funds_;
    AuditLog&               audit_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_SETTLEMENT_HPP
