#include "helpers.hpp"
#include "crypto/ecgroup.hpp"
#include <stdexcept>
#include <sodium.h>

namespace sealfund {
namespace utils {

using ecgroup::Bytes;

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

void append_u32_be(Bytes& out, uint32_t v) {
    out.push_back(uint8_t((v >> 24) & 0xFF));
    out.push_back(uint8_t((v >> 16) & 0xFF));
    out.push_back(uint8_t((v >>  8) & 0xFF));
    out.push_back(uint8_t((v >>  0) & 0xFF));
}

uint32_t read_u32_be(const Bytes& in, std::size_t& off) {
    if (off + 4 > in.size()) throw std::runtime_error("decode: truncated u32");
    uint32_t v = (uint32_t(in[off+0]) << 24) |
                 (uint32_t(in[off+1]) << 16) |
                 (uint32_t(in[off+2]) <<  8) |
                 (uint32_t(in[off+3]) <<  0);
    off += 4;
    return v;
}

void append_u64_be(Bytes& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(uint8_t((v >> shift) & 0xFF));
    }
}

uint64_t read_u64_be(const Bytes& in, std::size_t& off) {
    if (off + 8 > in.size()) throw std::runtime_error("decode: truncated u64");
    uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        v = (v << 8) | uint64_t(in[off + i]);
    }
    off += 8;
    return v;
}

void append_lp(Bytes& out, const Bytes& b) {
    append_u32_be(out, static_cast<uint32_t>(b.size()));
    out.insert(out.end(), b.begin(), b.end());
}

Bytes read_lp(const Bytes& in, std::size_t& off) {
    uint32_t n = read_u32_be(in, off);
    if (off + n > in.size()) throw std::runtime_error("decode: truncated lp");
    Bytes out(in.begin() + off, in.begin() + off + n);
    off += n;
    return out;
}

std::string read_string(const Bytes& in, std::size_t& off) {
    Bytes b = read_lp(in, off);
    return std::string(b.begin(), b.end());
}

void expect_consumed(const Bytes& in, std::size_t off) {
    if (off != in.size()) throw std::runtime_error("decode: trailing bytes");
}

Bytes u64_bytes(uint64_t v) {
    Bytes out;
    out.reserve(8);
    append_u64_be(out, v);
    return out;
}

Bytes hash_all(std::initializer_list<Bytes> inputs) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    for (const auto& input : inputs) {
        crypto_hash_sha256_update(&state, input.data(), input.size());
    }

    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, result.data());
    return result;
}

} // namespace utils
} // namespace sealfund
