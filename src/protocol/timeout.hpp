#ifndef SEALFUND_PROTOCOL_TIMEOUT_HPP
#define SEALFUND_PROTOCOL_TIMEOUT_HPP

#include "audit.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "reveal.hpp"

namespace protocol {

enum class TimeoutOutcome {
    Retried,  // replacement request issued, campaign still DecryptionPending
    Failed    // retries exhausted, campaign is DecryptionFailed
};

// -----------------------------------------------------------------------------
// TimeoutController
//
// Abandons reveal requests the oracle did not answer in time. A superseded
// request is marked timed out, so a late answer to it is rejected as stale.
// -----------------------------------------------------------------------------
class TimeoutController {
public:
    TimeoutController(const PlatformConfig& config,
                      CampaignLedger& ledger,
                      RevealRequestManager& reveals,
                      AuditLog& audit);

    // Anyone may call once the current finalization request is overdue
    TimeoutOutcome on_timeout_check(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // Re-issue the caller's own overdue refund reveal
    RequestId retry_refund_reveal(CampaignId campaign_id, const Identity& caller, Timestamp now);

private:
    const PlatformConfig& config_;
    CampaignLedger&       ledger_;
    RevealRequestManager& reveals_;
    AuditLog&             audit_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_TIMEOUT_HPP
