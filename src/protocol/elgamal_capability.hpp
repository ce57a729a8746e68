#ifndef SEALFUND_PROTOCOL_ELGAMAL_CAPABILITY_HPP
#define SEALFUND_PROTOCOL_ELGAMAL_CAPABILITY_HPP

#include "capability.hpp"
#include "../crypto/elgamal.hpp"
#include "../crypto/oracle.hpp"

#include <map>

namespace protocol {

// -----------------------------------------------------------------------------
// ElGamalRevealCapability - RevealCapability over lifted ElGamal on BN254
//
// Encrypts under the oracle's public key and forwards reveal requests to it.
// Every submission is remembered so verify() checks the oracle's proofs
// against the ciphertexts this side actually sent, never against anything
// carried in the response.
// -----------------------------------------------------------------------------
class ElGamalRevealCapability : public RevealCapability {
public:
    explicit ElGamalRevealCapability(crypto::RevealOracle& oracle);

    Ciphertext encrypt(Amount value) const override;
    Ciphertext add(const Ciphertext& a, const Ciphertext& b) const override;
    Ciphertext sub(const Ciphertext& a, const Ciphertext& b) const override;
    Ciphertext mul(const Ciphertext& ct, uint64_t scalar) const override;

    RequestId request_reveal(const std::vector<Ciphertext>& ciphertexts,
                             const Bytes& context) override;

    bool verify(RequestId request_id,
                const Bytes& plaintexts,
                const Bytes& context,
                const Bytes& proof) const override;

private:
    struct Submission {
        std::vector<elgamal::Ciphertext> ciphertexts;
        Bytes context;
    };

    crypto::RevealOracle& oracle_;
    elgamal::G1Point pk_;
    std::map<RequestId, Submission> submitted_;
};

// Conversions between opaque handles and ElGamal ciphertexts
Ciphertext wrap(const elgamal::Ciphertext& ct);
elgamal::Ciphertext unwrap(const Ciphertext& ct);

} // namespace protocol

#endif // SEALFUND_PROTOCOL_ELGAMAL_CAPABILITY_HPP
