#ifndef SEALFUND_C_H
#define SEALFUND_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define SF_OK                0
#define SF_ERR              -1
#define SF_ERR_INVALID_ARG  -2
#define SF_ERR_VERIFY_FAIL  -3
#define SF_ERR_VALIDATION   -4
#define SF_ERR_AUTH         -5
#define SF_ERR_STATE        -6
#define SF_ERR_RESOURCE     -7

/*==============================================================================
 * Campaign status values
 *============================================================================*/
#define SF_STATUS_ACTIVE              0
#define SF_STATUS_DECRYPTION_PENDING  1
#define SF_STATUS_SUCCESSFUL          2
#define SF_STATUS_FAILED              3
#define SF_STATUS_WITHDRAWN           4
#define SF_STATUS_DECRYPTION_FAILED   5

/*==============================================================================
 * Timeout check outcomes
 *============================================================================*/
#define SF_TIMEOUT_RETRIED  0
#define SF_TIMEOUT_FAILED   1

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct sf_config_t sf_config_t;

/* A platform bundled with an in-process reveal oracle and a payout recorder */
typedef struct sf_platform_t sf_platform_t;

typedef struct sf_stats_t {
    uint64_t total;
    uint64_t active;
    uint64_t pending;
    uint64_t successful;
    uint64_t failed;
    uint64_t withdrawn;
    uint64_t decryption_failed;
    uint64_t held_balance;
} sf_stats_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int sf_init(void);

/** Free a heap-allocated string returned by sf_* functions. */
void sf_free_string(char* str);

/** Free a heap-allocated byte buffer returned by sf_* functions. */
void sf_free_bytes(unsigned char* buf);

/** Static name of a status value ("Unknown" for out-of-range input). */
const char* sf_status_name(int status);

/*==============================================================================
 * Config API
 *============================================================================*/

/** Default configuration. */
int sf_config_default(sf_config_t** out);

/**
 * Parse a configuration from environment variable format.
 * Format: KEY=value lines, '#' comments. Missing keys keep their defaults.
 */
int sf_config_from_env_string(const char* env_content, sf_config_t** out);

/** Caller must free the returned string with sf_free_string(). */
int sf_config_to_env_string(const sf_config_t* cfg, char** out);

void sf_config_destroy(sf_config_t* cfg);

/*==============================================================================
 * Platform lifecycle
 *============================================================================*/

/**
 * Create a platform.
 * @param owner      Owner identity (may pause and resume campaigns)
 * @param cfg        Configuration, or NULL for the defaults
 * @param dlog_bits  Largest revealable value is 2^dlog_bits - 1; 0 means 48,
 *                   more than 63 is SF_ERR_INVALID_ARG. The oracle builds a
 *                   table of 2^b entries once, b = min(ceil(dlog_bits/2), 22),
 *                   and a reveal takes at most 2^(dlog_bits - b) search steps
 *                   (2^26 for the default of 48 bits).
 * @param out        Output: new platform handle
 */
int sf_platform_create(const char* owner,
                       const sf_config_t* cfg,
                       unsigned dlog_bits,
                       sf_platform_t** out);

void sf_platform_destroy(sf_platform_t* p);

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
                       uint64_t* out_id);

/** `message` may be NULL. */
int sf_contribute(sf_platform_t* p,
                  uint64_t campaign_id,
                  const char* contributor,
                  uint64_t amount,
                  const char* message,
                  uint64_t now);

/*==============================================================================
 * Reveal protocol
 *============================================================================*/

int sf_finalize(sf_platform_t* p,
                uint64_t campaign_id,
                const char* caller,
                uint64_t now,
                uint64_t* out_request_id);

/**
 * Let the oracle answer a queued request and deliver the answer to the
 * platform (finalization or refund, whichever the request was).
 */
int sf_oracle_fulfill(sf_platform_t* p, uint64_t request_id, uint64_t now);

/** Make the oracle forget a queued request. */
int sf_oracle_drop(sf_platform_t* p, uint64_t request_id);

int sf_oracle_pending_count(const sf_platform_t* p, size_t* out);

/** @param out_outcome SF_TIMEOUT_RETRIED or SF_TIMEOUT_FAILED */
int sf_timeout_check(sf_platform_t* p,
                     uint64_t campaign_id,
                     const char* caller,
                     uint64_t now,
                     int* out_outcome);

/*==============================================================================
 * Settlement
 *============================================================================*/

int sf_withdraw(sf_platform_t* p,
                uint64_t campaign_id,
                const char* caller,
                uint64_t now,
                uint64_t* out_amount);

/** *out_request_id is 0 when no reveal was needed (DecryptionFailed). */
int sf_request_refund(sf_platform_t* p,
                      uint64_t campaign_id,
                      const char* caller,
                      uint64_t now,
                      uint64_t* out_request_id);

int sf_retry_refund_reveal(sf_platform_t* p,
                           uint64_t campaign_id,
                           const char* caller,
                           uint64_t now,
                           uint64_t* out_request_id);

int sf_emergency_refund(sf_platform_t* p,
                        uint64_t campaign_id,
                        const char* caller,
                        uint64_t now,
                        uint64_t* out_amount);

/*==============================================================================
 * Owner controls
 *============================================================================*/

int sf_pause(sf_platform_t* p, uint64_t campaign_id, const char* caller, uint64_t now);
int sf_resume(sf_platform_t* p, uint64_t campaign_id, const char* caller, uint64_t now);

/*==============================================================================
 * Queries
 *============================================================================*/

int sf_campaign_status(const sf_platform_t* p, uint64_t campaign_id, int* out_status);

/** SF_ERR_STATE until a finalization reveal has been verified. */
int sf_campaign_revealed(const sf_platform_t* p,
                         uint64_t campaign_id,
                         uint64_t* out_raised,
                         uint64_t* out_target);

int sf_campaign_held(const sf_platform_t* p, uint64_t campaign_id, uint64_t* out_held);

int sf_platform_stats(const sf_platform_t* p, sf_stats_t* out);

/*==============================================================================
 * Payouts (recorded transfers)
 *============================================================================*/

int sf_payout_count(const sf_platform_t* p, size_t* out);

/** Caller must free *out_recipient with sf_free_string(). */
int sf_payout_get(const sf_platform_t* p,
                  size_t index,
                  char** out_recipient,
                  uint64_t* out_amount);

/** While non-zero, every transfer fails (funds stay held). */
int sf_set_transfer_failure(sf_platform_t* p, int fail);

/*==============================================================================
 * Audit
 *============================================================================*/

/** Serialized audit log. Caller must free with sf_free_bytes(). */
int sf_audit_export(const sf_platform_t* p, unsigned char** out, size_t* out_len);

#ifdef __cplusplus
}
#endif

#endif /* SEALFUND_C_H */
