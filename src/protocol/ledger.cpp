#include "ledger.hpp"

#include <limits>

namespace protocol {

namespace {

uint64_t& counter_for(PlatformStats& stats, CampaignStatus status) {
    switch (status) {
        case CampaignStatus::Active:            return stats.active;
        case CampaignStatus::DecryptionPending: return stats.pending;
        case CampaignStatus::Successful:        return stats.successful;
        case CampaignStatus::Failed:            return stats.failed;
        case CampaignStatus::Withdrawn:         return stats.withdrawn;
        case CampaignStatus::DecryptionFailed:  return stats.decryption_failed;
    }
    throw StateError("unknown campaign status");
}

const std::vector<CampaignId>& lookup(const std::map<Identity, std::vector<CampaignId>>& index,
                                      const Identity& who) {
    static const std::vector<CampaignId> empty;
    auto it = index.find(who);
    return it == index.end() ? empty : it->second;
}

} // namespace

CampaignLedger::CampaignLedger(const PlatformConfig& config,
                               const RevealCapability& capability,
                               ObfuscationGenerator& obfuscation,
                               AuditLog& audit)
    : config_(config)
    , capability_(capability)
    , obfuscation_(obfuscation)
    , audit_(audit)
{}

void CampaignLedger::validate_metadata(const CampaignMetadata& m) const {
    if (m.title.empty()) {
        throw ValidationError("Title required");
    }
    if (m.title.size() > config_.max_title_len) {
        throw ValidationError("Title too long");
    }
    if (m.description.size() > config_.max_description_len) {
        throw ValidationError("Description too long");
    }
    if (m.category.size() > config_.max_category_len) {
        throw ValidationError("Category too long");
    }
    if (m.content_ref.size() > config_.max_content_ref_len) {
        throw ValidationError("Content reference too long");
    }
}

// -----------------------------------------------------------------------------
// Campaign creation
// -----------------------------------------------------------------------------

CampaignId CampaignLedger::create_campaign(const Identity& creator,
                                           const CampaignMetadata& metadata,
                                           Amount target,
                                           uint64_t funding_duration,
                                           Timestamp now) {
    if (creator.empty()) {
        throw ValidationError("Creator identity required");
    }
    validate_metadata(metadata);
    if (funding_duration < config_.min_duration) {
        throw ValidationError("Funding period too short");
    }
    if (funding_duration > config_.max_duration) {
        throw ValidationError("Funding period too long");
    }
    if (funding_duration > std::numeric_limits<Timestamp>::max() - now) {
        throw ValidationError("Deadline out of range");
    }
    if (target == 0) {
        throw ValidationError("Target must be positive");
    }
    if (target > config_.max_target) {
        throw ValidationError("Target exceeds maximum");
    }

    Campaign c;
    c.id = next_id_;
    c.creator = creator;
    c.metadata = metadata;
    c.created_at = now;
    c.deadline = now + funding_duration;
    c.status = CampaignStatus::Active;
    c.target = capability_.encrypt(target);
    c.raised = capability_.encrypt(0);

    Obfuscation ob = obfuscation_.derive(c.id, creator, sequence_, c.target, now);
    c.multiplier = ob.multiplier;
    c.obfuscated_target = std::move(ob.obfuscated_target);

    ++next_id_;
    ++sequence_;
    by_creator_[creator].push_back(c.id);
    stats_.total += 1;
    stats_.active += 1;
    audit_.record(CampaignEvent{c.id, now, CampaignStatus::Active, CampaignStatus::Active, "create"});

    CampaignId id = c.id;
    campaigns_.emplace(id, std::move(c));
    return id;
}

// -----------------------------------------------------------------------------
// Contributions
// -----------------------------------------------------------------------------

void CampaignLedger::record_contribution(CampaignId campaign_id,
                                         const Identity& contributor,
                                         Amount amount,
                                         const std::string& message,
                                         Timestamp now) {
    Campaign& c = campaign(campaign_id);

    if (contributor.empty()) {
        throw ValidationError("Contributor identity required");
    }
    if (c.status != CampaignStatus::Active) {
        throw StateError("Campaign is not active");
    }
    if (c.paused) {
        throw StateError("Campaign is paused");
    }
    if (now >= c.deadline) {
        throw StateError("Funding period ended");
    }
    if (amount == 0) {
        throw ValidationError("Contribution must be positive");
    }
    if (amount > config_.max_contribution) {
        throw ValidationError("Contribution exceeds maximum");
    }
    if (amount > config_.max_raised - c.held) {
        throw ValidationError("Contribution exceeds campaign capacity");
    }
    if (message.size() > config_.max_message_len) {
        throw ValidationError("Message too long");
    }

    auto key = std::make_pair(campaign_id, contributor);
    auto it = contributions_.find(key);
    bool first = it == contributions_.end();
    if (!first && (it->second.refund_requested || it->second.refunded)) {
        throw StateError("Contribution is closed for refund");
    }

    // All ciphertext work happens before anything is written
    Ciphertext encrypted = capability_.encrypt(amount);
    Ciphertext new_raised = capability_.add(c.raised, encrypted);
    Ciphertext new_amount = first ? encrypted : capability_.add(it->second.amount, encrypted);

    if (first) {
        Contribution contrib;
        contrib.campaign_id = campaign_id;
        contrib.contributor = contributor;
        contrib.first_contributed_at = now;
        it = contributions_.emplace(key, std::move(contrib)).first;
        c.backer_count += 1;
        c.backers.push_back(contributor);
        by_backer_[contributor].push_back(campaign_id);
    }

    Contribution& contrib = it->second;
    contrib.amount = std::move(new_amount);
    contrib.last_contributed_at = now;
    if (!message.empty()) {
        contrib.message = message;
    }

    c.raised = std::move(new_raised);
    c.held += amount;
    stats_.held_balance += amount;

    audit_.record(ContributionEvent{
        campaign_id, contributor, now,
        first ? ContributionEventKind::Created : ContributionEventKind::Increased,
        0
    });
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------

Campaign& CampaignLedger::campaign(CampaignId id) {
    auto it = campaigns_.find(id);
    if (it == campaigns_.end()) {
        throw ValidationError("Campaign does not exist");
    }
    return it->second;
}

const Campaign& CampaignLedger::campaign(CampaignId id) const {
    auto it = campaigns_.find(id);
    if (it == campaigns_.end()) {
        throw ValidationError("Campaign does not exist");
    }
    return it->second;
}

Contribution* CampaignLedger::find_contribution(CampaignId id, const Identity& contributor) {
    auto it = contributions_.find(std::make_pair(id, contributor));
    return it == contributions_.end() ? nullptr : &it->second;
}

const Contribution* CampaignLedger::find_contribution(CampaignId id, const Identity& contributor) const {
    auto it = contributions_.find(std::make_pair(id, contributor));
    return it == contributions_.end() ? nullptr : &it->second;
}

const std::vector<CampaignId>& CampaignLedger::creator_campaigns(const Identity& creator) const {
    return lookup(by_creator_, creator);
}

const std::vector<CampaignId>& CampaignLedger::backer_campaigns(const Identity& backer) const {
    return lookup(by_backer_, backer);
}

// -----------------------------------------------------------------------------
// Status and custody
// -----------------------------------------------------------------------------

void CampaignLedger::set_status(Campaign& c, CampaignStatus to) {
    if (c.status == to) return;
    counter_for(stats_, c.status) -= 1;
    counter_for(stats_, to) += 1;
    c.status = to;
}

void CampaignLedger::transition(Campaign& c, CampaignStatus to, Timestamp now, const std::string& operation) {
    CampaignStatus from = c.status;
    set_status(c, to);
    audit_.record(CampaignEvent{c.id, now, from, to, operation});
}

void CampaignLedger::debit(Campaign& c, Amount amount) {
    if (amount > c.held) {
        throw ResourceError("Insufficient held balance");
    }
    c.held -= amount;
    stats_.held_balance -= amount;
}

} // namespace protocol
