#include "sealfund/sealfund_c.h"
#include "../crypto/ecgroup.hpp"
#include "../crypto/oracle.hpp"
#include "../protocol/elgamal_capability.hpp"
#include "../protocol/platform.hpp"

#include <sodium.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace protocol;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

namespace {

// Payout sink that keeps every transfer for inspection
class RecordingTransfer : public FundsTransfer {
public:
    void transfer(const Identity& recipient, Amount amount) override {
        if (fail_) {
            throw std::runtime_error("transfer rejected");
        }
        payouts.emplace_back(recipient, amount);
    }

    void set_failure(bool fail) { fail_ = fail; }

    std::vector<std::pair<Identity, Amount>> payouts;

private:
    bool fail_ = false;
};

} // namespace

struct sf_config_t {
    PlatformConfig config;
};

struct sf_platform_t {
    std::unique_ptr<crypto::RevealOracle>            oracle;
    std::unique_ptr<ElGamalRevealCapability>         capability;
    RecordingTransfer                                transfer;
    SodiumBeacon                                     beacon;
    std::unique_ptr<Platform>                        platform;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static void copy_to_c_bytes(const Bytes& vec, unsigned char** out, size_t* out_len) {
    *out_len = vec.size();
    if (vec.empty()) {
        *out = nullptr;
        return;
    }
    *out = new unsigned char[*out_len];
    std::memcpy(*out, vec.data(), *out_len);
}

// Run `fn` and translate the exception taxonomy into status codes
template <typename F>
static int guarded(F&& fn) {
    try {
        fn();
        return SF_OK;
    } catch (const ValidationError&) {
        return SF_ERR_VALIDATION;
    } catch (const AuthorizationError&) {
        return SF_ERR_AUTH;
    } catch (const StateError&) {
        return SF_ERR_STATE;
    } catch (const ProofVerificationError&) {
        return SF_ERR_VERIFY_FAIL;
    } catch (const ResourceError&) {
        return SF_ERR_RESOURCE;
    } catch (const crypto::OracleError&) {
        return SF_ERR_INVALID_ARG;
    } catch (const std::exception&) {
        return SF_ERR;
    }
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int sf_init(void) {
    if (sodium_init() < 0) return SF_ERR;
    return guarded([] { ecgroup::init_curve(); });
}

void sf_free_string(char* str) {
    delete[] str;
}

void sf_free_bytes(unsigned char* buf) {
    delete[] buf;
}

const char* sf_status_name(int status) {
    if (status < SF_STATUS_ACTIVE || status > SF_STATUS_DECRYPTION_FAILED) {
        return "Unknown";
    }
    return status_name(static_cast<CampaignStatus>(status));
}

/*==============================================================================
 * Config API
 *============================================================================*/

int sf_config_default(sf_config_t** out) {
    if (!out) return SF_ERR_INVALID_ARG;
    *out = new sf_config_t();
    return SF_OK;
}

int sf_config_from_env_string(const char* env_content, sf_config_t** out) {
    if (!env_content || !out) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        auto cfg = std::make_unique<sf_config_t>();
        cfg->config = PlatformConfig::from_env_string(std::string(env_content));
        *out = cfg.release();
    });
}

int sf_config_to_env_string(const sf_config_t* cfg, char** out) {
    if (!cfg || !out) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        *out = copy_to_c_string(cfg->config.to_env_string());
    });
}

void sf_config_destroy(sf_config_t* cfg) {
    delete cfg;
}

/*==============================================================================
 * Platform lifecycle
 *============================================================================*/

int sf_platform_create(const char* owner,
                       const sf_config_t* cfg,
                       unsigned dlog_bits,
                       sf_platform_t** out) {
    if (!owner || !out || dlog_bits > 63) return SF_ERR_INVALID_ARG;
    if (dlog_bits == 0) dlog_bits = 48;
    // Even split between table and search, table capped at 2^22 entries
    const unsigned baby_bits = std::min((dlog_bits + 1) / 2, 22u);

    return guarded([&] {
        auto p = std::make_unique<sf_platform_t>();
        p->oracle = std::make_unique<crypto::RevealOracle>(dlog_bits, baby_bits);
        p->capability = std::make_unique<ElGamalRevealCapability>(*p->oracle);
        p->platform = std::make_unique<Platform>(
            owner, cfg ? cfg->config : PlatformConfig(), *p->capability, p->transfer, p->beacon);
        *out = p.release();
    });
}

void sf_platform_destroy(sf_platform_t* p) {
    delete p;
}

/*==============================================================================
 * Campaigns and contributions
 *============================================================================*/

int sf_campaign_create(sf_platform_t* p,
                       const char* creator,
                       const char* title,
                       const char* description,
                       const char* category,
                       const char* content_ref,
                       uint64_t target,
                       uint64_t duration,
                       uint64_t now,
                       uint64_t* out_id) {
    if (!p || !creator || !title || !out_id) return SF_ERR_INVALID_ARG;

    CampaignMetadata meta;
    meta.title = title;
    meta.description = description ? description : "";
    meta.category = category ? category : "";
    meta.content_ref = content_ref ? content_ref : "";

    return guarded([&] {
        *out_id = p->platform->create_campaign(creator, meta, target, duration, now);
    });
}

int sf_contribute(sf_platform_t* p,
                  uint64_t campaign_id,
                  const char* contributor,
                  uint64_t amount,
                  const char* message,
                  uint64_t now) {
    if (!p || !contributor) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        p->platform->contribute(campaign_id, contributor, amount, message ? message : "", now);
    });
}

/*==============================================================================
 * Reveal protocol
 *============================================================================*/

int sf_finalize(sf_platform_t* p,
                uint64_t campaign_id,
                const char* caller,
                uint64_t now,
                uint64_t* out_request_id) {
    if (!p || !caller || !out_request_id) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        *out_request_id = p->platform->finalize(campaign_id, caller, now);
    });
}

int sf_oracle_fulfill(sf_platform_t* p, uint64_t request_id, uint64_t now) {
    if (!p) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        auto req = p->platform->reveal_request(request_id);
        if (!req) {
            throw crypto::OracleError("unknown request");
        }
        crypto::RevealResponse resp = p->oracle->fulfill(request_id);
        if (req->kind == RevealKind::Finalization) {
            p->platform->on_reveal_response(resp.request_id, resp.plaintexts, resp.proof,
                                            resp.context, now);
        } else {
            p->platform->on_refund_reveal(resp.request_id, resp.plaintexts, resp.proof,
                                          resp.context, now);
        }
    });
}

int sf_oracle_drop(sf_platform_t* p, uint64_t request_id) {
    if (!p) return SF_ERR_INVALID_ARG;
    return guarded([&] { p->oracle->drop(request_id); });
}

int sf_oracle_pending_count(const sf_platform_t* p, size_t* out) {
    if (!p || !out) return SF_ERR_INVALID_ARG;
    return guarded([&] { *out = p->oracle->pending().size(); });
}

int sf_timeout_check(sf_platform_t* p,
                     uint64_t campaign_id,
                     const char* caller,
                     uint64_t now,
                     int* out_outcome) {
    if (!p || !caller || !out_outcome) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        TimeoutOutcome outcome = p->platform->on_timeout_check(campaign_id, caller, now);
        *out_outcome = outcome == TimeoutOutcome::Retried ? SF_TIMEOUT_RETRIED : SF_TIMEOUT_FAILED;
    });
}

/*==============================================================================
 * Settlement
 *============================================================================*/

int sf_withdraw(sf_platform_t* p,
                uint64_t campaign_id,
                const char* caller,
                uint64_t now,
                uint64_t* out_amount) {
    if (!p || !caller || !out_amount) return SF_ERR_INVALID_ARG;
    return guarded([&] { *out_amount = p->platform->withdraw(campaign_id, caller, now); });
}

int sf_request_refund(sf_platform_t* p,
                      uint64_t campaign_id,
                      const char* caller,
                      uint64_t now,
                      uint64_t* out_request_id) {
    if (!p || !caller || !out_request_id) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        auto id = p->platform->request_refund(campaign_id, caller, now);
        *out_request_id = id ? *id : 0;
    });
}

int sf_retry_refund_reveal(sf_platform_t* p,
                           uint64_t campaign_id,
                           const char* caller,
                           uint64_t now,
                           uint64_t* out_request_id) {
    if (!p || !caller || !out_request_id) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        *out_request_id = p->platform->retry_refund_reveal(campaign_id, caller, now);
    });
}

int sf_emergency_refund(sf_platform_t* p,
                        uint64_t campaign_id,
                        const char* caller,
                        uint64_t now,
                        uint64_t* out_amount) {
    if (!p || !caller || !out_amount) return SF_ERR_INVALID_ARG;
    return guarded([&] { *out_amount = p->platform->emergency_refund(campaign_id, caller, now); });
}

/*==============================================================================
 * Owner controls
 *============================================================================*/

int sf_pause(sf_platform_t* p, uint64_t campaign_id, const char* caller, uint64_t now) {
    if (!p || !caller) return SF_ERR_INVALID_ARG;
    return guarded([&] { p->platform->pause(campaign_id, caller, now); });
}

int sf_resume(sf_platform_t* p, uint64_t campaign_id, const char* caller, uint64_t now) {
    if (!p || !caller) return SF_ERR_INVALID_ARG;
    return guarded([&] { p->platform->resume(campaign_id, caller, now); });
}

/*==============================================================================
 * Queries
 *============================================================================*/

int sf_campaign_status(const sf_platform_t* p, uint64_t campaign_id, int* out_status) {
    if (!p || !out_status) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        *out_status = static_cast<int>(p->platform->campaign(campaign_id).status);
    });
}

int sf_campaign_revealed(const sf_platform_t* p,
                         uint64_t campaign_id,
                         uint64_t* out_raised,
                         uint64_t* out_target) {
    if (!p || !out_raised || !out_target) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        CampaignView view = p->platform->campaign(campaign_id);
        if (!view.revealed_raised || !view.revealed_target) {
            throw StateError("Campaign totals not revealed");
        }
        *out_raised = *view.revealed_raised;
        *out_target = *view.revealed_target;
    });
}

int sf_campaign_held(const sf_platform_t* p, uint64_t campaign_id, uint64_t* out_held) {
    if (!p || !out_held) return SF_ERR_INVALID_ARG;
    return guarded([&] { *out_held = p->platform->campaign(campaign_id).held; });
}

int sf_platform_stats(const sf_platform_t* p, sf_stats_t* out) {
    if (!p || !out) return SF_ERR_INVALID_ARG;

    return guarded([&] {
        PlatformStats s = p->platform->stats();
        out->total = s.total;
        out->active = s.active;
        out->pending = s.pending;
        out->successful = s.successful;
        out->failed = s.failed;
        out->withdrawn = s.withdrawn;
        out->decryption_failed = s.decryption_failed;
        out->held_balance = s.held_balance;
    });
}

/*==============================================================================
 * Payouts
 *============================================================================*/

int sf_payout_count(const sf_platform_t* p, size_t* out) {
    if (!p || !out) return SF_ERR_INVALID_ARG;
    *out = p->transfer.payouts.size();
    return SF_OK;
}

int sf_payout_get(const sf_platform_t* p,
                  size_t index,
                  char** out_recipient,
                  uint64_t* out_amount) {
    if (!p || !out_recipient || !out_amount) return SF_ERR_INVALID_ARG;
    if (index >= p->transfer.payouts.size()) return SF_ERR_INVALID_ARG;

    const auto& payout = p->transfer.payouts[index];
    *out_recipient = copy_to_c_string(payout.first);
    *out_amount = payout.second;
    return SF_OK;
}

int sf_set_transfer_failure(sf_platform_t* p, int fail) {
    if (!p) return SF_ERR_INVALID_ARG;
    p->transfer.set_failure(fail != 0);
    return SF_OK;
}

/*==============================================================================
 * Audit
 *============================================================================*/

int sf_audit_export(const sf_platform_t* p, unsigned char** out, size_t* out_len) {
    if (!p || !out || !out_len) return SF_ERR_INVALID_ARG;
    return guarded([&] { copy_to_c_bytes(p->platform->audit().serialize(), out, out_len); });
}
