#ifndef SEALFUND_PROTOCOL_CAPABILITY_HPP
#define SEALFUND_PROTOCOL_CAPABILITY_HPP

#include "types.hpp"

#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// RevealCapability - ciphertext algebra plus the reveal oracle boundary
//
// The settlement core only ever sees opaque Ciphertext handles. A reveal
// request is fire-and-forget: the response arrives later through
// Platform::on_reveal_response / on_refund_reveal and must pass verify()
// before any decoded value is used.
// -----------------------------------------------------------------------------
class RevealCapability {
public:
    virtual ~RevealCapability() = default;

    virtual Ciphertext encrypt(Amount value) const = 0;
    virtual Ciphertext add(const Ciphertext& a, const Ciphertext& b) const = 0;
    virtual Ciphertext sub(const Ciphertext& a, const Ciphertext& b) const = 0;
    virtual Ciphertext mul(const Ciphertext& ct, uint64_t scalar) const = 0;

    // Submit ciphertexts for decryption. `context` is returned unchanged by
    // the oracle and is bound into its proof.
    virtual RequestId request_reveal(const std::vector<Ciphertext>& ciphertexts,
                                     const Bytes& context) = 0;

    // True only if `proof` shows that the ciphertexts submitted under
    // `request_id` decrypt to `plaintexts`, for exactly this context.
    virtual bool verify(RequestId request_id,
                        const Bytes& plaintexts,
                        const Bytes& context,
                        const Bytes& proof) const = 0;
};

// -----------------------------------------------------------------------------
// FundsTransfer - moves custody out of the platform. Throws on failure.
// -----------------------------------------------------------------------------
class FundsTransfer {
public:
    virtual ~FundsTransfer() = default;
    virtual void transfer(const Identity& recipient, Amount amount) = 0;
};

// -----------------------------------------------------------------------------
// RandomnessBeacon - external unpredictable value, one draw per campaign
// -----------------------------------------------------------------------------
class RandomnessBeacon {
public:
    virtual ~RandomnessBeacon() = default;
    virtual Bytes next() = 0;
};

// 32 bytes from libsodium's CSPRNG per draw
class SodiumBeacon : public RandomnessBeacon {
public:
    SodiumBeacon();
    Bytes next() override;
};

} // namespace protocol

#endif // SEALFUND_PROTOCOL_CAPABILITY_HPP
