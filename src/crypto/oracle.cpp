#include "oracle.hpp"
#include "../helpers.hpp"

#include <map>
#include <mutex>

namespace crypto {

using sealfund::utils::append_u32_be;
using sealfund::utils::read_u32_be;
using sealfund::utils::append_u64_be;
using sealfund::utils::read_u64_be;
using sealfund::utils::append_lp;
using sealfund::utils::read_lp;
using sealfund::utils::expect_consumed;
using sealfund::utils::hash_all;
using sealfund::utils::to_bytes;
using sealfund::utils::u64_bytes;

// -----------------------------------------------------------------------------
// Payload codecs
// -----------------------------------------------------------------------------

Bytes encode_plaintexts(const std::vector<uint64_t>& values) {
    Bytes out;
    append_u32_be(out, static_cast<uint32_t>(values.size()));
    for (uint64_t v : values) {
        append_u64_be(out, v);
    }
    return out;
}

std::vector<uint64_t> decode_plaintexts(const Bytes& data, std::size_t expected) {
    std::size_t off = 0;
    uint32_t count = read_u32_be(data, off);
    if (count != expected) {
        throw std::runtime_error("decode: expected " + std::to_string(expected) +
                                 " plaintexts, got " + std::to_string(count));
    }
    std::vector<uint64_t> values;
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        values.push_back(read_u64_be(data, off));
    }
    expect_consumed(data, off);
    return values;
}

Bytes encode_proofs(const std::vector<elgamal::DecryptionProof>& proofs) {
    Bytes out;
    append_u32_be(out, static_cast<uint32_t>(proofs.size()));
    for (const auto& p : proofs) {
        append_lp(out, p.serialize());
    }
    return out;
}

std::vector<elgamal::DecryptionProof> decode_proofs(const Bytes& data) {
    std::size_t off = 0;
    uint32_t count = read_u32_be(data, off);
    std::vector<elgamal::DecryptionProof> proofs;
    for (uint32_t i = 0; i < count; ++i) {
        proofs.push_back(elgamal::DecryptionProof::deserialize(read_lp(data, off)));
    }
    expect_consumed(data, off);
    return proofs;
}

Bytes proof_label(uint64_t request_id, const Bytes& context) {
    return hash_all({to_bytes("sealfund/reveal"), u64_bytes(request_id), context});
}

// -----------------------------------------------------------------------------
// RevealOracle::Impl
// -----------------------------------------------------------------------------

struct RevealJob {
    std::vector<elgamal::Ciphertext> ciphertexts;
    Bytes context;
};

class RevealOracle::Impl {
public:
    elgamal::KeyPair   keypair;
    elgamal::DlogTable table;
    uint64_t           next_id = 1;
    std::map<uint64_t, RevealJob> queue;
    mutable std::mutex mu;

    Impl(unsigned dlog_bits, unsigned baby_bits)
        : keypair(elgamal::keygen())
        , table(baby_bits, dlog_bits)
    {}
};

RevealOracle::RevealOracle(unsigned dlog_bits, unsigned baby_bits)
    : impl_(std::make_unique<Impl>(dlog_bits, baby_bits)) {}

RevealOracle::~RevealOracle() = default;

const elgamal::G1Point& RevealOracle::public_key() const {
    return impl_->keypair.pk;
}

uint64_t RevealOracle::submit(const std::vector<elgamal::Ciphertext>& ciphertexts, const Bytes& context) {
    if (ciphertexts.empty()) {
        throw OracleError("reveal request carries no ciphertexts");
    }
    std::lock_guard<std::mutex> lock(impl_->mu);
    uint64_t id = impl_->next_id++;
    impl_->queue.emplace(id, RevealJob{ciphertexts, context});
    return id;
}

RevealResponse RevealOracle::fulfill(uint64_t request_id) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto it = impl_->queue.find(request_id);
    if (it == impl_->queue.end()) {
        throw OracleError("unknown or already answered reveal request " + std::to_string(request_id));
    }

    const RevealJob& job = it->second;
    Bytes label = proof_label(request_id, job.context);

    std::vector<uint64_t> values;
    std::vector<elgamal::DecryptionProof> proofs;
    for (const auto& ct : job.ciphertexts) {
        uint64_t m = elgamal::decrypt(impl_->keypair.sk, ct, impl_->table);
        values.push_back(m);
        proofs.push_back(elgamal::prove_decryption(impl_->keypair, ct, m, label));
    }

    RevealResponse resp;
    resp.request_id = request_id;
    resp.plaintexts = encode_plaintexts(values);
    resp.proof = encode_proofs(proofs);
    resp.context = job.context;

    impl_->queue.erase(it);
    return resp;
}

void RevealOracle::drop(uint64_t request_id) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (impl_->queue.erase(request_id) == 0) {
        throw OracleError("unknown reveal request " + std::to_string(request_id));
    }
}

bool RevealOracle::is_pending(uint64_t request_id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->queue.count(request_id) != 0;
}

std::vector<uint64_t> RevealOracle::pending() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    std::vector<uint64_t> ids;
    for (const auto& entry : impl_->queue) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace crypto
