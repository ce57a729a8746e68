#include "elgamal.hpp"
#include "../helpers.hpp"

namespace elgamal {

using sealfund::utils::append_lp;
using sealfund::utils::read_lp;
using sealfund::utils::expect_consumed;
using sealfund::utils::hash_all;
using sealfund::utils::to_bytes;
using sealfund::utils::u64_bytes;

static std::string point_key(const G1Point& p) {
    Bytes b = p.to_bytes();
    return std::string(b.begin(), b.end());
}

static Scalar challenge_for(const Bytes& label,
                            const G1Point& pk,
                            const Ciphertext& ct,
                            uint64_t m,
                            const G1Point& a,
                            const G1Point& b) {
    Bytes digest = hash_all({
        to_bytes("sealfund/elgamal/dleq"),
        label,
        G1Point::generator().to_bytes(),
        pk.to_bytes(),
        ct.c1.to_bytes(),
        ct.c2.to_bytes(),
        u64_bytes(m),
        a.to_bytes(),
        b.to_bytes()
    });
    return Scalar::hash_to_scalar(digest);
}

KeyPair keygen() {
    ecgroup::init_curve();
    KeyPair kp;
    do {
        kp.sk.set_random();
    } while (kp.sk.is_zero());
    kp.pk = G1Point::mul(G1Point::generator(), kp.sk);
    return kp;
}

// -----------------------------------------------------------------------------
// Ciphertext
// -----------------------------------------------------------------------------

Bytes Ciphertext::serialize() const {
    Bytes out;
    append_lp(out, c1.to_bytes());
    append_lp(out, c2.to_bytes());
    return out;
}

Ciphertext Ciphertext::deserialize(const Bytes& data) {
    Ciphertext ct;
    std::size_t off = 0;
    ct.c1 = G1Point::from_bytes(read_lp(data, off));
    ct.c2 = G1Point::from_bytes(read_lp(data, off));
    expect_consumed(data, off);
    return ct;
}

Ciphertext encrypt(const G1Point& pk, uint64_t m) {
    return encrypt(pk, m, Scalar::get_random());
}

Ciphertext encrypt(const G1Point& pk, uint64_t m, const Scalar& r) {
    const G1Point& g = G1Point::generator();
    Ciphertext ct;
    ct.c1 = G1Point::mul(g, r);
    ct.c2 = G1Point::mul(g, Scalar::from_u64(m)).add(G1Point::mul(pk, r));
    return ct;
}

Ciphertext add(const Ciphertext& a, const Ciphertext& b) {
    return Ciphertext{a.c1 + b.c1, a.c2 + b.c2};
}

Ciphertext sub(const Ciphertext& a, const Ciphertext& b) {
    return Ciphertext{a.c1 - b.c1, a.c2 - b.c2};
}

Ciphertext mul(const Ciphertext& ct, uint64_t k) {
    Scalar s = Scalar::from_u64(k);
    return Ciphertext{G1Point::mul(ct.c1, s), G1Point::mul(ct.c2, s)};
}

// -----------------------------------------------------------------------------
// Bounded discrete log
// -----------------------------------------------------------------------------

DlogTable::DlogTable(unsigned baby_bits, unsigned max_bits)
    : baby_bits_(baby_bits)
    , max_bits_(max_bits)
{
    if (baby_bits == 0 || baby_bits > 24) {
        throw ElGamalError("DlogTable: baby_bits must be in [1, 24]");
    }
    if (max_bits < baby_bits || max_bits > 63) {
        throw ElGamalError("DlogTable: max_bits must be in [baby_bits, 63]");
    }

    ecgroup::init_curve();
    const G1Point& g = G1Point::generator();
    const uint32_t baby_count = uint32_t(1) << baby_bits;
    baby_steps_.reserve(baby_count);

    G1Point acc = G1Point::identity();
    for (uint32_t j = 0; j < baby_count; ++j) {
        baby_steps_.emplace(point_key(acc), j);
        acc = acc + g;
    }
    giant_step_ = acc;
}

std::optional<uint64_t> DlogTable::solve(const G1Point& point) const {
    const uint64_t giant_count = uint64_t(1) << (max_bits_ - baby_bits_);
    G1Point cur = point;
    for (uint64_t i = 0; i < giant_count; ++i) {
        auto it = baby_steps_.find(point_key(cur));
        if (it != baby_steps_.end()) {
            return (i << baby_bits_) + it->second;
        }
        cur = cur - giant_step_;
    }
    return std::nullopt;
}

uint64_t decrypt(const Scalar& sk, const Ciphertext& ct, const DlogTable& table) {
    G1Point m_point = ct.c2 - G1Point::mul(ct.c1, sk);
    auto m = table.solve(m_point);
    if (!m) {
        throw ElGamalError("decrypt: plaintext exceeds " +
                           std::to_string(table.max_bits()) + "-bit range");
    }
    return *m;
}

// -----------------------------------------------------------------------------
// Chaum-Pedersen decryption proof
// -----------------------------------------------------------------------------

Bytes DecryptionProof::serialize() const {
    Bytes out;
    append_lp(out, challenge.to_bytes());
    append_lp(out, response.to_bytes());
    return out;
}

DecryptionProof DecryptionProof::deserialize(const Bytes& data) {
    DecryptionProof proof;
    std::size_t off = 0;
    proof.challenge = Scalar::from_bytes(read_lp(data, off));
    proof.response  = Scalar::from_bytes(read_lp(data, off));
    expect_consumed(data, off);
    return proof;
}

DecryptionProof prove_decryption(const KeyPair& kp,
                                 const Ciphertext& ct,
                                 uint64_t m,
                                 const Bytes& label) {
    const G1Point& g = G1Point::generator();

    Scalar k = Scalar::get_random();
    G1Point a = G1Point::mul(g, k);
    G1Point b = G1Point::mul(ct.c1, k);

    DecryptionProof proof;
    proof.challenge = challenge_for(label, kp.pk, ct, m, a, b);
    proof.response  = k + proof.challenge * kp.sk;
    return proof;
}

bool verify_decryption(const G1Point& pk,
                       const Ciphertext& ct,
                       uint64_t m,
                       const DecryptionProof& proof,
                       const Bytes& label) {
    const G1Point& g = G1Point::generator();

    // d = c2 - m*G must equal sk * c1
    G1Point d = ct.c2 - G1Point::mul(g, Scalar::from_u64(m));

    G1Point a = G1Point::mul(g, proof.response) - G1Point::mul(pk, proof.challenge);
    G1Point b = G1Point::mul(ct.c1, proof.response) - G1Point::mul(d, proof.challenge);

    return challenge_for(label, pk, ct, m, a, b) == proof.challenge;
}

} // namespace elgamal
