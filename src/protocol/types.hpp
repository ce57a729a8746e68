#ifndef SEALFUND_PROTOCOL_TYPES_HPP
#define SEALFUND_PROTOCOL_TYPES_HPP

#include "../crypto/ecgroup.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace protocol {

using Bytes      = ecgroup::Bytes;
using Identity   = std::string;
using Amount     = uint64_t;
using Timestamp  = uint64_t;  // seconds, supplied by the host once per operation
using CampaignId = uint64_t;
using RequestId  = uint64_t;

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
class CrowdfundError : public std::runtime_error {
public:
    explicit CrowdfundError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad input: lengths, amounts, durations, unknown campaign
class ValidationError : public CrowdfundError {
public:
    explicit ValidationError(const std::string& msg) : CrowdfundError(msg) {}
};

// Wrong caller for a creator-only, owner-only or contributor-only action
class AuthorizationError : public CrowdfundError {
public:
    explicit AuthorizationError(const std::string& msg) : CrowdfundError(msg) {}
};

// Operation not valid in the current state
class StateError : public CrowdfundError {
public:
    explicit StateError(const std::string& msg) : CrowdfundError(msg) {}
};

// Forged, replayed, mismatched or malformed reveal response
class ProofVerificationError : public CrowdfundError {
public:
    explicit ProofVerificationError(const std::string& msg) : CrowdfundError(msg) {}
};

// Held balance too small, or the transfer itself failed
class ResourceError : public CrowdfundError {
public:
    explicit ResourceError(const std::string& msg) : CrowdfundError(msg) {}
};

// -----------------------------------------------------------------------------
// Ciphertext - opaque handle produced by the reveal capability
// -----------------------------------------------------------------------------
struct Ciphertext {
    Bytes bytes;

    bool operator==(const Ciphertext& other) const { return bytes == other.bytes; }
    bool operator!=(const Ciphertext& other) const { return bytes != other.bytes; }
};

// -----------------------------------------------------------------------------
// CampaignStatus
//
//   Active -> DecryptionPending -> {Successful, Failed}
//   DecryptionPending -> DecryptionPending     (timeout, retries remain)
//   DecryptionPending -> DecryptionFailed      (timeout, retries exhausted)
//   Successful -> Withdrawn
// -----------------------------------------------------------------------------
enum class CampaignStatus : uint8_t {
    Active            = 0,
    DecryptionPending = 1,
    Successful        = 2,
    Failed            = 3,
    Withdrawn         = 4,
    DecryptionFailed  = 5
};

const char* status_name(CampaignStatus status);

// Failed and DecryptionFailed
bool is_refund_eligible(CampaignStatus status);

struct CampaignMetadata {
    std::string title;
    std::string description;
    std::string category;
    std::string content_ref;  // e.g. an IPFS hash
};

struct Campaign {
    CampaignId       id = 0;
    Identity         creator;
    CampaignMetadata metadata;

    Ciphertext target;
    Ciphertext raised;             // homomorphic sum of non-refunded contributions
    Ciphertext obfuscated_target;  // target * multiplier
    uint64_t   multiplier = 0;

    Timestamp      created_at = 0;
    Timestamp      deadline = 0;
    CampaignStatus status = CampaignStatus::Active;
    bool           withdrawn = false;
    bool           paused = false;

    // Pending reveal bookkeeping
    RequestId request_id = 0;
    Timestamp requested_at = 0;
    uint32_t  retry_count = 0;

    // Valid once a finalization reveal has been verified
    bool   revealed = false;
    Amount revealed_raised = 0;
    Amount revealed_target = 0;

    uint32_t backer_count = 0;
    uint32_t refunded_count = 0;
    Amount   held = 0;  // plaintext custody balance
    std::vector<Identity> backers;
};

struct Contribution {
    CampaignId  campaign_id = 0;
    Identity    contributor;
    Ciphertext  amount;
    Timestamp   first_contributed_at = 0;
    Timestamp   last_contributed_at = 0;
    bool        refund_requested = false;
    Timestamp   refund_requested_at = 0;
    RequestId   refund_request_id = 0;  // 0 while no refund reveal is in flight
    bool        refunded = false;
    Amount      refunded_amount = 0;
    std::string message;
};

enum class RevealKind : uint8_t {
    Finalization = 1,  // [raised, target]
    Refund       = 2   // [one contributor's amount]
};

struct RevealRequest {
    RequestId  id = 0;
    RevealKind kind = RevealKind::Finalization;
    CampaignId campaign_id = 0;
    Identity   requester;
    Identity   contributor;  // refunds only
    Timestamp  issued_at = 0;
    Bytes      context;
    bool       completed = false;
    bool       timed_out = false;

    bool active() const { return !completed && !timed_out; }
};

struct PlatformStats {
    uint64_t total = 0;
    uint64_t active = 0;
    uint64_t pending = 0;
    uint64_t successful = 0;
    uint64_t failed = 0;
    uint64_t withdrawn = 0;
    uint64_t decryption_failed = 0;
    Amount   held_balance = 0;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_TYPES_HPP
