#include "settlement.hpp"

namespace protocol {

SettlementEngine::SettlementEngine(const PlatformConfig& config,
                                   CampaignLedger& ledger,
                                   RevealRequestManager& reveals,
                                   const RevealCapability& capability,
                                   FundsTransfer& funds,
                                   AuditLog& audit)
    : config_(config)
    , ledger_(ledger)
    , reveals_(reveals)
    , capability_(capability)
    , funds_(funds)
    , audit_(audit)
{}

void SettlementEngine::pay(Campaign& c, Contribution* contrib, const Campaign& saved_campaign,
                           const Contribution* saved_contrib, const PlatformStats& saved_stats,
                           const Identity& recipient, Amount amount) {
    try {
        ledger_.debit(c, amount);
        funds_.transfer(recipient, amount);
    } catch (const std::exception& e) {
        c = saved_campaign;
        if (contrib != nullptr && saved_contrib != nullptr) {
            *contrib = *saved_contrib;
        }
        ledger_.restore_stats(saved_stats);
        throw ResourceError(std::string("Transfer failed: ") + e.what());
    }
}

// -----------------------------------------------------------------------------
// Withdrawal
// -----------------------------------------------------------------------------

Amount SettlementEngine::withdraw(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);

    if (caller != c.creator) {
        throw AuthorizationError("Only the creator may withdraw");
    }
    if (c.withdrawn) {
        throw StateError("Funds already withdrawn");
    }
    if (c.status != CampaignStatus::Successful) {
        throw StateError("Campaign is not successful");
    }
    if (!c.revealed) {
        throw StateError("Campaign totals not revealed");
    }
    const Amount amount = c.revealed_raised;
    if (amount > c.held) {
        throw ResourceError("Insufficient held balance");
    }

    const Campaign saved = c;
    const PlatformStats saved_stats = ledger_.stats();

    c.withdrawn = true;
    ledger_.set_status(c, CampaignStatus::Withdrawn);
    pay(c, nullptr, saved, nullptr, saved_stats, c.creator, amount);

    audit_.record(CampaignEvent{campaign_id, now, CampaignStatus::Successful,
                                CampaignStatus::Withdrawn, "withdraw"});
    return amount;
}

// -----------------------------------------------------------------------------
// Refunds
// -----------------------------------------------------------------------------

std::optional<RequestId> SettlementEngine::request_refund(CampaignId campaign_id,
                                                          const Identity& caller,
                                                          Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);

    if (!is_refund_eligible(c.status)) {
        throw StateError("Campaign is not refundable");
    }
    Contribution* contrib = ledger_.find_contribution(campaign_id, caller);
    if (contrib == nullptr) {
        throw AuthorizationError("No contribution from caller");
    }
    if (contrib->refunded) {
        throw StateError("Contribution already refunded");
    }
    if (contrib->refund_requested) {
        throw StateError("Refund already requested");
    }

    std::optional<RequestId> issued;
    if (c.status == CampaignStatus::Failed) {
        issued = reveals_.issue(RevealKind::Refund, campaign_id, caller, caller,
                                {contrib->amount}, now);
        contrib->refund_request_id = *issued;
    }

    contrib->refund_requested = true;
    contrib->refund_requested_at = now;
    audit_.record(ContributionEvent{campaign_id, caller, now,
                                    ContributionEventKind::RefundRequested, 0});
    return issued;
}

Amount SettlementEngine::on_refund_reveal(RequestId request_id,
                                          const Bytes& plaintexts,
                                          const Bytes& proof,
                                          const Bytes& context,
                                          Timestamp now) {
    RevealRequest& req = reveals_.request(request_id);
    if (req.kind != RevealKind::Refund) {
        throw StateError("Not a refund reveal");
    }

    std::vector<Amount> values = reveals_.verify_and_decode(req, plaintexts, proof, context, 1);

    Campaign& c = ledger_.campaign(req.campaign_id);
    Contribution* contrib = ledger_.find_contribution(req.campaign_id, req.contributor);
    if (!req.active() || contrib == nullptr || contrib->refunded ||
        contrib->refund_request_id != request_id) {
        throw StateError("Stale reveal response");
    }

    const Amount amount = values[0];
    if (amount > c.held) {
        throw ResourceError("Insufficient held balance");
    }
    Ciphertext remaining = capability_.sub(c.raised, contrib->amount);

    const Campaign saved = c;
    const Contribution saved_contrib = *contrib;
    const PlatformStats saved_stats = ledger_.stats();

    contrib->refunded = true;
    contrib->refunded_amount = amount;
    c.raised = std::move(remaining);
    c.refunded_count += 1;
    pay(c, contrib, saved, &saved_contrib, saved_stats, req.contributor, amount);

    req.completed = true;
    audit_.record(ContributionEvent{c.id, req.contributor, now,
                                    ContributionEventKind::Refunded, amount});
    return amount;
}

Amount SettlementEngine::emergency_refund(CampaignId campaign_id,
                                          const Identity& caller,
                                          Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);

    if (c.status != CampaignStatus::DecryptionFailed) {
        throw StateError("Emergency refund requires a failed decryption");
    }
    if (period_pending(c.requested_at, 2 * config_.reveal_timeout, now)) {
        throw StateError("Emergency refund not yet available");
    }
    Contribution* contrib = ledger_.find_contribution(campaign_id, caller);
    if (contrib == nullptr) {
        throw AuthorizationError("No contribution from caller");
    }
    if (contrib->refunded) {
        throw StateError("Contribution already refunded");
    }

    // Every unrefunded backer is counted, so eligible >= 1 here
    const uint32_t eligible = c.backer_count - c.refunded_count;
    const Amount share = c.held / eligible;
    Ciphertext remaining = capability_.sub(c.raised, contrib->amount);

    const Campaign saved = c;
    const Contribution saved_contrib = *contrib;
    const PlatformStats saved_stats = ledger_.stats();

    contrib->refunded = true;
    contrib->refunded_amount = share;
    c.raised = std::move(remaining);
    c.refunded_count += 1;
    pay(c, contrib, saved, &saved_contrib, saved_stats, caller, share);

    audit_.record(ContributionEvent{campaign_id, caller, now,
                                    ContributionEventKind::EmergencyRefunded, share});
    return share;
}

} // namespace protocol
