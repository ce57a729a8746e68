#include "capability.hpp"

#include <sodium.h>

namespace protocol {

SodiumBeacon::SodiumBeacon() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Bytes SodiumBeacon::next() {
    Bytes out(32);
    randombytes_buf(out.data(), out.size());
    return out;
}

} // namespace protocol
