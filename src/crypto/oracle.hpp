#ifndef SEALFUND_CRYPTO_ORACLE_HPP
#define SEALFUND_CRYPTO_ORACLE_HPP

#include "elgamal.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace crypto {

using Bytes = ecgroup::Bytes;

class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// RevealResponse - what the oracle hands back for one request
// -----------------------------------------------------------------------------
struct RevealResponse {
    uint64_t request_id = 0;
    Bytes    plaintexts;  // encode_plaintexts() of the revealed values
    Bytes    proof;       // encode_proofs(), one DLEQ proof per ciphertext
    Bytes    context;     // caller context, returned unchanged
};

// Plaintext tuple: u32 count followed by u64 big-endian values
Bytes encode_plaintexts(const std::vector<uint64_t>& values);

// Throws std::runtime_error unless the payload holds exactly `expected` values
std::vector<uint64_t> decode_plaintexts(const Bytes& data, std::size_t expected);

Bytes encode_proofs(const std::vector<elgamal::DecryptionProof>& proofs);
std::vector<elgamal::DecryptionProof> decode_proofs(const Bytes& data);

// Transcript label binding a proof to one request and its context
Bytes proof_label(uint64_t request_id, const Bytes& context);

// -----------------------------------------------------------------------------
// RevealOracle - in-process decryption service
//
// Holds the ElGamal secret key. Requests are queued by submit() and answered
// only when fulfill() is called, which lets callers model an oracle that is
// slow or never answers (drop()). Request ids start at 1 and are never reused.
// -----------------------------------------------------------------------------
class RevealOracle {
public:
    explicit RevealOracle(unsigned dlog_bits = 48, unsigned baby_bits = 16);
    ~RevealOracle();

    RevealOracle(const RevealOracle&) = delete;
    RevealOracle& operator=(const RevealOracle&) = delete;

    const elgamal::G1Point& public_key() const;

    uint64_t submit(const std::vector<elgamal::Ciphertext>& ciphertexts, const Bytes& context);

    /**
     * Decrypt every ciphertext of a queued request and prove each result.
     * The request leaves the queue. Throws OracleError for unknown or
     * already answered ids.
     */
    RevealResponse fulfill(uint64_t request_id);

    // Forget a queued request without answering it
    void drop(uint64_t request_id);

    bool is_pending(uint64_t request_id) const;
    std::vector<uint64_t> pending() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace crypto

#endif // SEALFUND_CRYPTO_ORACLE_HPP
