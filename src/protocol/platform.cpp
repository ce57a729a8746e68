#include "platform.hpp"

namespace protocol {

namespace {

const PlatformConfig& checked(const PlatformConfig& config) {
    config.validate();
    return config;
}

} // namespace

Platform::Platform(const Identity& owner,
                   const PlatformConfig& config,
                   RevealCapability& capability,
                   FundsTransfer& funds,
                   RandomnessBeacon& beacon)
    : owner_(owner)
    , config_(checked(config))
    , obfuscation_(config_, capability, beacon)
    , ledger_(config_, capability, obfuscation_, audit_)
    , reveals_(config_, ledger_, capability)
    , timeouts_(config_, ledger_, reveals_, audit_)
    , settlement_(config_, ledger_, reveals_, capability, funds, audit_)
{
    if (owner_.empty()) {
        throw ValidationError("Owner identity required");
    }
}

// -----------------------------------------------------------------------------
// Campaigns and contributions
// -----------------------------------------------------------------------------

CampaignId Platform::create_campaign(const Identity& creator,
                                     const CampaignMetadata& metadata,
                                     Amount target,
                                     uint64_t funding_duration,
                                     Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.create_campaign(creator, metadata, target, funding_duration, now);
}

void Platform::contribute(CampaignId campaign_id,
                          const Identity& contributor,
                          Amount amount,
                          const std::string& message,
                          Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    ledger_.record_contribution(campaign_id, contributor, amount, message, now);
}

// -----------------------------------------------------------------------------
// Reveal protocol
// -----------------------------------------------------------------------------

RequestId Platform::finalize(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return reveals_.request_finalization(campaign_id, caller, now);
}

CampaignStatus Platform::on_reveal_response(RequestId request_id,
                                            const Bytes& plaintexts,
                                            const Bytes& proof,
                                            const Bytes& context,
                                            Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return reveals_.on_reveal_response(request_id, plaintexts, proof, context, now);
}

TimeoutOutcome Platform::on_timeout_check(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return timeouts_.on_timeout_check(campaign_id, caller, now);
}

// -----------------------------------------------------------------------------
// Settlement
// -----------------------------------------------------------------------------

Amount Platform::withdraw(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return settlement_.withdraw(campaign_id, caller, now);
}

std::optional<RequestId> Platform::request_refund(CampaignId campaign_id,
                                                  const Identity& caller,
                                                  Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return settlement_.request_refund(campaign_id, caller, now);
}

Amount Platform::on_refund_reveal(RequestId request_id,
                                  const Bytes& plaintexts,
                                  const Bytes& proof,
                                  const Bytes& context,
                                  Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return settlement_.on_refund_reveal(request_id, plaintexts, proof, context, now);
}

RequestId Platform::retry_refund_reveal(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return timeouts_.retry_refund_reveal(campaign_id, caller, now);
}

Amount Platform::emergency_refund(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    return settlement_.emergency_refund(campaign_id, caller, now);
}

// -----------------------------------------------------------------------------
// Owner controls
// -----------------------------------------------------------------------------

void Platform::pause(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    Campaign& c = ledger_.campaign(campaign_id);
    if (caller != owner_) {
        throw AuthorizationError("Only the owner may pause");
    }
    if (c.paused) {
        throw StateError("Campaign already paused");
    }
    c.paused = true;
    audit_.record(CampaignEvent{campaign_id, now, c.status, c.status, "pause"});
}

void Platform::resume(CampaignId campaign_id, const Identity& caller, Timestamp now) {
    std::lock_guard<std::mutex> lock(mu_);
    Campaign& c = ledger_.campaign(campaign_id);
    if (caller != owner_) {
        throw AuthorizationError("Only the owner may resume");
    }
    if (!c.paused) {
        throw StateError("Campaign is not paused");
    }
    c.paused = false;
    audit_.record(CampaignEvent{campaign_id, now, c.status, c.status, "resume"});
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

CampaignView Platform::campaign(CampaignId campaign_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const Campaign& c = ledger_.campaign(campaign_id);

    CampaignView view;
    view.id = c.id;
    view.creator = c.creator;
    view.metadata = c.metadata;
    view.created_at = c.created_at;
    view.deadline = c.deadline;
    view.status = c.status;
    view.backer_count = c.backer_count;
    view.refunded_count = c.refunded_count;
    view.withdrawn = c.withdrawn;
    view.paused = c.paused;
    view.retry_count = c.retry_count;
    view.request_id = c.request_id;
    view.multiplier = c.multiplier;
    view.held = c.held;
    if (c.revealed) {
        view.revealed_raised = c.revealed_raised;
        view.revealed_target = c.revealed_target;
    }
    return view;
}

std::optional<ContributionView> Platform::contribution(CampaignId campaign_id,
                                                       const Identity& contributor) const {
    std::lock_guard<std::mutex> lock(mu_);
    ledger_.campaign(campaign_id);  // throws for unknown ids
    const Contribution* c = ledger_.find_contribution(campaign_id, contributor);
    if (c == nullptr) {
        return std::nullopt;
    }

    ContributionView view;
    view.campaign_id = c->campaign_id;
    view.contributor = c->contributor;
    view.first_contributed_at = c->first_contributed_at;
    view.last_contributed_at = c->last_contributed_at;
    view.refund_requested = c->refund_requested;
    view.refund_requested_at = c->refund_requested_at;
    view.refund_request_id = c->refund_request_id;
    view.refunded = c->refunded;
    view.refunded_amount = c->refunded_amount;
    view.message = c->message;
    return view;
}

EncryptedAmounts Platform::encrypted_amounts(CampaignId campaign_id, const Identity& caller) const {
    std::lock_guard<std::mutex> lock(mu_);
    const Campaign& c = ledger_.campaign(campaign_id);
    if (caller != c.creator && caller != owner_) {
        throw AuthorizationError("Only the creator or the owner may read encrypted amounts");
    }
    return EncryptedAmounts{c.raised, c.target};
}

std::size_t Platform::campaign_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.campaign_count();
}

std::vector<CampaignId> Platform::creator_campaigns(const Identity& creator) const {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.creator_campaigns(creator);
}

std::vector<CampaignId> Platform::backer_campaigns(const Identity& backer) const {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.backer_campaigns(backer);
}

std::optional<RevealRequest> Platform::reveal_request(RequestId request_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const RevealRequest* req = reveals_.find(request_id);
    if (req == nullptr) {
        return std::nullopt;
    }
    return *req;
}

PlatformStats Platform::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.stats();
}

AuditLog Platform::audit() const {
    std::lock_guard<std::mutex> lock(mu_);
    return audit_;
}

} // namespace protocol
