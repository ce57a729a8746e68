#include "audit.hpp"
#include "../helpers.hpp"

namespace protocol {

using sealfund::utils::append_u32_be;
using sealfund::utils::read_u32_be;
using sealfund::utils::append_u64_be;
using sealfund::utils::read_u64_be;
using sealfund::utils::append_lp;
using sealfund::utils::read_lp;
using sealfund::utils::read_string;
using sealfund::utils::to_bytes;
using sealfund::utils::expect_consumed;

namespace {

CampaignStatus read_status(const Bytes& in, std::size_t& off) {
    if (off >= in.size()) throw std::runtime_error("decode: truncated status");
    uint8_t raw = in[off++];
    if (raw > static_cast<uint8_t>(CampaignStatus::DecryptionFailed)) {
        throw std::runtime_error("decode: invalid campaign status");
    }
    return static_cast<CampaignStatus>(raw);
}

} // namespace

// -----------------------------------------------------------------------------
// Event serialization
// -----------------------------------------------------------------------------

Bytes CampaignEvent::serialize() const {
    Bytes out;
    append_u64_be(out, campaign_id);
    append_u64_be(out, at);
    out.push_back(static_cast<uint8_t>(from));
    out.push_back(static_cast<uint8_t>(to));
    append_lp(out, to_bytes(operation));
    return out;
}

CampaignEvent CampaignEvent::deserialize(const Bytes& data) {
    CampaignEvent ev;
    std::size_t off = 0;
    ev.campaign_id = read_u64_be(data, off);
    ev.at          = read_u64_be(data, off);
    ev.from        = read_status(data, off);
    ev.to          = read_status(data, off);
    ev.operation   = read_string(data, off);
    expect_consumed(data, off);
    return ev;
}

Bytes ContributionEvent::serialize() const {
    Bytes out;
    append_u64_be(out, campaign_id);
    append_lp(out, to_bytes(contributor));
    append_u64_be(out, at);
    out.push_back(static_cast<uint8_t>(kind));
    append_u64_be(out, amount);
    return out;
}

ContributionEvent ContributionEvent::deserialize(const Bytes& data) {
    ContributionEvent ev;
    std::size_t off = 0;
    ev.campaign_id = read_u64_be(data, off);
    ev.contributor = read_string(data, off);
    ev.at          = read_u64_be(data, off);
    if (off >= data.size()) throw std::runtime_error("decode: truncated event kind");
    uint8_t kind = data[off++];
    if (kind < static_cast<uint8_t>(ContributionEventKind::Created) ||
        kind > static_cast<uint8_t>(ContributionEventKind::EmergencyRefunded)) {
        throw std::runtime_error("decode: invalid contribution event kind");
    }
    ev.kind   = static_cast<ContributionEventKind>(kind);
    ev.amount = read_u64_be(data, off);
    expect_consumed(data, off);
    return ev;
}

// -----------------------------------------------------------------------------
// AuditLog
// -----------------------------------------------------------------------------

void AuditLog::record(const CampaignEvent& event) {
    campaign_events_.push_back(event);
}

void AuditLog::record(const ContributionEvent& event) {
    contribution_events_.push_back(event);
}

std::vector<CampaignEvent> AuditLog::campaign_history(CampaignId id) const {
    std::vector<CampaignEvent> out;
    for (const auto& ev : campaign_events_) {
        if (ev.campaign_id == id) out.push_back(ev);
    }
    return out;
}

std::vector<ContributionEvent> AuditLog::contribution_history(CampaignId id,
                                                              const Identity& contributor) const {
    std::vector<ContributionEvent> out;
    for (const auto& ev : contribution_events_) {
        if (ev.campaign_id == id && ev.contributor == contributor) out.push_back(ev);
    }
    return out;
}

Bytes AuditLog::serialize() const {
    Bytes out;
    append_u32_be(out, static_cast<uint32_t>(campaign_events_.size()));
    for (const auto& ev : campaign_events_) {
        append_lp(out, ev.serialize());
    }
    append_u32_be(out, static_cast<uint32_t>(contribution_events_.size()));
    for (const auto& ev : contribution_events_) {
        append_lp(out, ev.serialize());
    }
    return out;
}

AuditLog AuditLog::deserialize(const Bytes& data) {
    AuditLog log;
    std::size_t off = 0;

    uint32_t n = read_u32_be(data, off);
    for (uint32_t i = 0; i < n; ++i) {
        log.campaign_events_.push_back(CampaignEvent::deserialize(read_lp(data, off)));
    }

    n = read_u32_be(data, off);
    for (uint32_t i = 0; i < n; ++i) {
        log.contribution_events_.push_back(ContributionEvent::deserialize(read_lp(data, off)));
    }

    expect_consumed(data, off);
    return log;
}

} // namespace protocol
