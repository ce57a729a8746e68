#include "reveal.hpp"
#include "../crypto/oracle.hpp"
#include "../helpers.hpp"

namespace protocol {

using sealfund::utils::append_u64_be;
using sealfund::utils::append_lp;
using sealfund::utils::to_bytes;

Bytes finalization_context(CampaignId campaign_id) {
    Bytes out;
    out.push_back(static_cast<uint8_t>(RevealKind::Finalization));
    append_u64_be(out, campaign_id);
    return out;
}

Bytes refund_context(CampaignId campaign_id, const Identity& contributor) {
    Bytes out;
    out.push_back(static_cast<uint8_t>(RevealKind::Refund));
    append_u64_be(out, campaign_id);
    append_lp(out, to_bytes(contributor));
    return out;
}

RevealRequestManager::RevealRequestManager(const PlatformConfig& config,
                                           CampaignLedger& ledger,
                                           RevealCapability& capability)
    : config_(config)
    , ledger_(ledger)
    , capability_(capability)
{}

// -----------------------------------------------------------------------------
// Request bookkeeping
// -----------------------------------------------------------------------------

RequestId RevealRequestManager::issue(RevealKind kind,
                                      CampaignId campaign_id,
                                      const Identity& requester,
                                      const Identity& contributor,
                                      const std::vector<Ciphertext>& ciphertexts,
                                      Timestamp now) {
    Bytes context = kind == RevealKind::Finalization
        ? finalization_context(campaign_id)
        : refund_context(campaign_id, contributor);

    RequestId id = capability_.request_reveal(ciphertexts, context);
    if (id == 0 || requests_.count(id) != 0) {
        throw StateError("Reveal capability returned a used request id");
    }

    RevealRequest req;
    req.id = id;
    req.kind = kind;
    req.campaign_id = campaign_id;
    req.requester = requester;
    req.contributor = contributor;
    req.issued_at = now;
    req.context = std::move(context);
    requests_.emplace(id, std::move(req));
    return id;
}

RevealRequest& RevealRequestManager::request(RequestId id) {
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        throw ProofVerificationError("Unknown reveal request");
    }
    return it->second;
}

const RevealRequest* RevealRequestManager::find(RequestId id) const {
    auto it = requests_.find(id);
    return it == requests_.end() ? nullptr : &it->second;
}

std::vector<Amount> RevealRequestManager::verify_and_decode(const RevealRequest& req,
                                                            const Bytes& plaintexts,
                                                            const Bytes& proof,
                                                            const Bytes& context,
                                                            std::size_t expected) const {
    if (context != req.context) {
        throw ProofVerificationError("Reveal context does not match request");
    }
    if (!capability_.verify(req.id, plaintexts, context, proof)) {
        throw ProofVerificationError("Invalid reveal proof");
    }
    try {
        return crypto::decode_plaintexts(plaintexts, expected);
    } catch (const std::runtime_error& e) {
        throw ProofVerificationError(std::string("Malformed reveal payload: ") + e.what());
    }
}

// -----------------------------------------------------------------------------
// Finalization
// -----------------------------------------------------------------------------

RequestId RevealRequestManager::request_finalization(CampaignId campaign_id,
                                                     const Identity& caller,
                                                     Timestamp now) {
    Campaign& c = ledger_.campaign(campaign_id);

    if (c.status != CampaignStatus::Active) {
        throw StateError("Campaign is not active");
    }
    if (c.paused) {
        throw StateError("Campaign is paused");
    }
    if (now < c.deadline) {
        throw StateError("Funding period not ended");
    }
    if (caller != c.creator && period_pending(c.deadline, config_.grace_period, now)) {
        throw AuthorizationError("Only the creator may finalize before the grace period ends");
    }

    RequestId id = issue(RevealKind::Finalization, campaign_id, caller, Identity(),
                         {c.raised, c.target}, now);

    c.request_id = id;
    c.requested_at = now;
    c.retry_count = 0;
    ledger_.transition(c, CampaignStatus::DecryptionPending, now, "finalize");
    return id;
}

CampaignStatus RevealRequestManager::on_reveal_response(RequestId request_id,
                                                        const Bytes& plaintexts,
                                                        const Bytes& proof,
                                                        const Bytes& context,
                                                        Timestamp now) {
    RevealRequest& req = request(request_id);
    if (req.kind != RevealKind::Finalization) {
        throw StateError("Not a finalization reveal");
    }

    std::vector<Amount> values = verify_and_decode(req, plaintexts, proof, context, 2);

    Campaign& c = ledger_.campaign(req.campaign_id);
    if (!req.active() ||
        c.status != CampaignStatus::DecryptionPending ||
        c.request_id != request_id) {
        throw StateError("Stale reveal response");
    }

    req.completed = true;
    c.revealed = true;
    c.revealed_raised = values[0];
    c.revealed_target = values[1];

    CampaignStatus outcome = c.revealed_raised >= c.revealed_target
        ? CampaignStatus::Successful
        : CampaignStatus::Failed;
    ledger_.transition(c, outcome, now, "reveal");
    return outcome;
}

} // namespace protocol
