#ifndef SEALFUND_PROTOCOL_REVEAL_HPP
#define SEALFUND_PROTOCOL_REVEAL_HPP

#include "capability.hpp"
#include "config.hpp"
#include "ledger.hpp"

#include <map>
#include <vector>

namespace protocol {

// Context bytes round-tripped through the oracle
Bytes finalization_context(CampaignId campaign_id);
Bytes refund_context(CampaignId campaign_id, const Identity& contributor);

// -----------------------------------------------------------------------------
// RevealRequestManager
//
// Issues reveal requests, keeps one RevealRequest record per identifier and
// is the only place where an oracle response is checked. A response is used
// only after (1) its context matches what was sent, (2) the capability
// verifies the proof, (3) the payload decodes to the expected shape. Any
// failure throws ProofVerificationError before state is touched.
// -----------------------------------------------------------------------------
class RevealRequestManager {
public:
    RevealRequestManager(const PlatformConfig& config,
                         CampaignLedger& ledger,
                         RevealCapability& capability);

    // Active -> DecryptionPending, submitting [raised, target]
    RequestId request_finalization(CampaignId campaign_id, const Identity& caller, Timestamp now);

    // DecryptionPending -> Successful | Failed
    CampaignStatus on_reveal_response(RequestId request_id,
                                      const Bytes& plaintexts,
                                      const Bytes& proof,
                                      const Bytes& context,
                                      Timestamp now);

    // Submit ciphertexts and record the request
    RequestId issue(RevealKind kind,
                    CampaignId campaign_id,
                    const Identity& requester,
                    const Identity& contributor,
                    const std::vector<Ciphertext>& ciphertexts,
                    Timestamp now);

    // Throws ProofVerificationError for identifiers this manager never issued
    RevealRequest& request(RequestId id);
    const RevealRequest* find(RequestId id) const;

    // Checks context, proof and shape; returns the decoded plaintexts
    std::vector<Amount> verify_and_decode(const RevealRequest& req,
                                          const Bytes& plaintexts,
                                          const Bytes& proof,
                                          const Bytes& context,
                                          std::size_t expected) const;

private:
    const PlatformConfig& config_;
    CampaignLedger&       ledger_;
    RevealCapability&     capability_;
    std::map<RequestId, RevealRequest> requests_;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_REVEAL_HPP
