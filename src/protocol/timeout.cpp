#include "timeout.hpp"

namespace protocol {

TimeoutController::TimeoutController(const PlatformConfig& config,
                                     CampaignLedger& ledger,
                                     RevealRequestManager& reveals,
                                     AuditLog& audit)
    : config_(config)
    , ledger_(ledger)
    , reveals_(reveals)
    , audit_(audit)
{}

TimeoutOutcome TimeoutController::on_timeout_check(CampaignId campaign_id,
                                                   const Identity& caller,
                                                   Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);

    if (c.status != CampaignStatus::DecryptionPending) {
        throw StateError("No reveal pending");
    }
    if (period_pending(c.requested_at, config_.reveal_timeout, now)) {
        throw StateError("Reveal timeout not reached");
    }
    RevealRequest& stalled = reveals_.request(c.request_id);
    if (!stalled.active()) {
        throw StateError("Reveal request already settled");
    }

    const uint32_t attempts = c.retry_count + 1;

    if (attempts >= config_.max_retries) {
        stalled.timed_out = true;
        c.retry_count = attempts;
        ledger_.transition(c, CampaignStatus::DecryptionFailed, now, "timeout");
        return TimeoutOutcome::Failed;
    }

    // Issue first: if the capability throws nothing has changed
    RequestId replacement = reveals_.issue(RevealKind::Finalization, campaign_id, caller,
                                           Identity(), {c.raised, c.target}, now);

    stalled.timed_out = true;
    c.request_id = replacement;
    c.requested_at = now;
    c.retry_count = attempts;
    audit_.record(CampaignEvent{campaign_id, now,
                                CampaignStatus::DecryptionPending,
                                CampaignStatus::DecryptionPending,
                                "retry"});
    return TimeoutOutcome::Retried;
}

RequestId TimeoutController::retry_refund_reveal(CampaignId campaign_id,
                                                 const Identity& caller,
                                                 Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);
    if (c.status != CampaignStatus::Failed) {
        throw StateError("Campaign has no refund reveals");
    }

    Contribution* contrib = ledger_.find_contribution(campaign_id, caller);
    if (contrib == nullptr) {
        throw AuthorizationError("No contribution from caller");
    }
    if (contrib->refunded) {
        throw StateError("Contribution already refunded");
    }
    if (!contrib->refund_requested || contrib->refund_request_id == 0) {
        throw StateError("No refund reveal pending");
    }

    RevealRequest& stalled = reveals_.request(contrib->refund_request_id);
    if (!stalled.active()) {
        throw StateError("Refund reveal already settled");
    }
    if (period_pending(stalled.issued_at, config_.reveal_timeout, now)) {
        throw StateError("Reveal timeout not reached");
    }

    RequestId replacement = reveals_.issue(RevealKind::Refund, campaign_id, caller, caller,
                                           {contrib->amount}, now);
    stalled.timed_out = true;
    contrib->refund_request_id = replacement;
    return replacement;
}

} // namespace protocol
