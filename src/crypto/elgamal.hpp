#ifndef SEALFUND_CRYPTO_ELGAMAL_HPP
#define SEALFUND_CRYPTO_ELGAMAL_HPP

#include "ecgroup.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace elgamal {

using ecgroup::Bytes;
using ecgroup::G1Point;
using ecgroup::Scalar;

class ElGamalError : public std::runtime_error {
public:
    explicit ElGamalError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// KeyPair - decryption key held by the reveal oracle
// -----------------------------------------------------------------------------
struct KeyPair {
    Scalar  sk;
    G1Point pk;  // sk * G
};

KeyPair keygen();

// -----------------------------------------------------------------------------
// Ciphertext - lifted ElGamal encryption of a 64-bit unsigned integer
//   c1 = r * G
//   c2 = m * G + r * pk
// -----------------------------------------------------------------------------
struct Ciphertext {
    G1Point c1;
    G1Point c2;

    Bytes serialize() const;
    static Ciphertext deserialize(const Bytes& data);

    bool operator==(const Ciphertext& other) const {
        return c1 == other.c1 && c2 == other.c2;
    }
    bool operator!=(const Ciphertext& other) const { return !(*this == other); }
};

// Encrypt with fresh randomness
Ciphertext encrypt(const G1Point& pk, uint64_t m);

// Encrypt with caller-chosen randomness (benchmarks and tests)
Ciphertext encrypt(const G1Point& pk, uint64_t m, const Scalar& r);

// Homomorphic operations. None of them needs a key.
Ciphertext add(const Ciphertext& a, const Ciphertext& b);
Ciphertext sub(const Ciphertext& a, const Ciphertext& b);
Ciphertext mul(const Ciphertext& ct, uint64_t k);

// -----------------------------------------------------------------------------
// DlogTable - baby-step/giant-step table for recovering m from m * G
//
// The table stores j * G for j in [0, 2^baby_bits). solve() walks at most
// 2^(max_bits - baby_bits) giant steps, so plaintexts up to 2^max_bits - 1
// are recoverable.
// -----------------------------------------------------------------------------
class DlogTable {
public:
    explicit DlogTable(unsigned baby_bits = 16, unsigned max_bits = 48);

    std::optional<uint64_t> solve(const G1Point& point) const;

    unsigned max_bits() const { return max_bits_; }

private:
    unsigned baby_bits_;
    unsigned max_bits_;
    G1Point  giant_step_;  // 2^baby_bits * G
    std::unordered_map<std::string, uint32_t> baby_steps_;
};

// Decrypt and solve the discrete log. Throws ElGamalError when the
// plaintext is outside the table's range.
uint64_t decrypt(const Scalar& sk, const Ciphertext& ct, const DlogTable& table);

// -----------------------------------------------------------------------------
// DecryptionProof - Chaum-Pedersen proof that ct decrypts to m under pk
//
// Proves log_G(pk) == log_c1(c2 - m*G) without revealing sk. The Fiat-Shamir
// challenge is bound to `label`, so a proof made for one request cannot be
// replayed under another.
// -----------------------------------------------------------------------------
struct DecryptionProof {
    Scalar challenge;
    Scalar response;

    Bytes serialize() const;
    static DecryptionProof deserialize(const Bytes& data);
};

DecryptionProof prove_decryption(const KeyPair& kp,
                                 const Ciphertext& ct,
                                 uint64_t m,
                                 const Bytes& label);

bool verify_decryption(const G1Point& pk,
                       const Ciphertext& ct,
                       uint64_t m,
                       const DecryptionProof& proof,
                       const Bytes& label);

} // namespace elgamal

#endif // SEALFUND_CRYPTO_ELGAMAL_HPP
