#include "elgamal_capability.hpp"

namespace protocol {

Ciphertext wrap(const elgamal::Ciphertext& ct) {
    return Ciphertext{ct.serialize()};
}

elgamal::Ciphertext unwrap(const Ciphertext& ct) {
    return elgamal::Ciphertext::deserialize(ct.bytes);
}

ElGamalRevealCapability::ElGamalRevealCapability(crypto::RevealOracle& oracle)
    : oracle_(oracle)
    , pk_(oracle.public_key())
{}

Ciphertext ElGamalRevealCapability::encrypt(Amount value) const {
    return wrap(elgamal::encrypt(pk_, value));
}

Ciphertext ElGamalRevealCapability::add(const Ciphertext& a, const Ciphertext& b) const {
    return wrap(elgamal::add(unwrap(a), unwrap(b)));
}

Ciphertext ElGamalRevealCapability::sub(const Ciphertext& a, const Ciphertext& b) const {
    return wrap(elgamal::sub(unwrap(a), unwrap(b)));
}

Ciphertext ElGamalRevealCapability::mul(const Ciphertext& ct, uint64_t scalar) const {
    return wrap(elgamal::mul(unwrap(ct), scalar));
}

RequestId ElGamalRevealCapability::request_reveal(const std::vector<Ciphertext>& ciphertexts,
                                                  const Bytes& context) {
    Submission submission;
    submission.context = context;
    for (const auto& ct : ciphertexts) {
        submission.ciphertexts.push_back(unwrap(ct));
    }

    RequestId id = oracle_.submit(submission.ciphertexts, context);
    submitted_[id] = std::move(submission);
    return id;
}

bool ElGamalRevealCapability::verify(RequestId request_id,
                                     const Bytes& plaintexts,
                                     const Bytes& context,
                                     const Bytes& proof) const {
    auto it = submitted_.find(request_id);
    if (it == submitted_.end()) return false;

    const Submission& sub = it->second;
    if (sub.context != context) return false;

    std::vector<uint64_t> values;
    std::vector<elgamal::DecryptionProof> proofs;
    try {
        values = crypto::decode_plaintexts(plaintexts, sub.ciphertexts.size());
        proofs = crypto::decode_proofs(proof);
    } catch (const std::runtime_error&) {
        return false;  // malformed payloads never verify
    }
    if (proofs.size() != sub.ciphertexts.size()) return false;

    Bytes label = crypto::proof_label(request_id, context);
    for (std::size_t i = 0; i < sub.ciphertexts.size(); ++i) {
        if (!elgamal::verify_decryption(pk_, sub.ciphertexts[i], values[i], proofs[i], label)) {
            return false;
        }
    }
    return true;
}

} // namespace protocol
