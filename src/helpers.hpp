#ifndef SEALFUND_HELPERS_HPP
#define SEALFUND_HELPERS_HPP

#include "crypto/ecgroup.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <initializer_list>
#include <vector>

namespace sealfund {
namespace utils {

    // Generic serialization primitives
    ecgroup::Bytes to_bytes(const std::string& s);

    void        append_u32_be(ecgroup::Bytes& out, uint32_t v);
    uint32_t    read_u32_be(const ecgroup::Bytes& in, std::size_t& off);

    void        append_u64_be(ecgroup::Bytes& out, uint64_t v);
    uint64_t    read_u64_be(const ecgroup::Bytes& in, std::size_t& off);

    void            append_lp(ecgroup::Bytes& out, const ecgroup::Bytes& b);
    ecgroup::Bytes  read_lp(const ecgroup::Bytes& in, std::size_t& off);

    // Strings as LP
    std::string read_string(const ecgroup::Bytes& in, std::size_t& off);

    // Throws unless every byte of `in` was consumed
    void expect_consumed(const ecgroup::Bytes& in, std::size_t off);

    // Fixed-width encodings used in transcripts
    ecgroup::Bytes u64_bytes(uint64_t v);

    // Hash utilities (SHA-256)
    ecgroup::Bytes hash_all(std::initializer_list<ecgroup::Bytes> inputs);

} // namespace utils
} // namespace sealfund

#endif // SEALFUND_HELPERS_HPP
