#include <catch2/catch_test_macros.hpp>

#include "crypto/elgamal.hpp"
#include "helpers.hpp"

#include <stdexcept>

using sealfund::utils::to_bytes;

TEST_CASE("Lifted ElGamal", "[elgamal]") {
    ecgroup::init_curve();

    elgamal::KeyPair kp = elgamal::keygen();
    elgamal::DlogTable table(10, 24);

    SECTION("decrypt recovers small plaintexts") {
        for (uint64_t m : {0ULL, 1ULL, 1023ULL, 1024ULL, 123456ULL}) {
            elgamal::Ciphertext ct = elgamal::encrypt(kp.pk, m);
            REQUIRE(elgamal::decrypt(kp.sk, ct, table) == m);
        }
    }

    SECTION("encryption is randomized") {
        elgamal::Ciphertext a = elgamal::encrypt(kp.pk, 42);
        elgamal::Ciphertext b = elgamal::encrypt(kp.pk, 42);
        REQUIRE(a != b);

        ecgroup::Scalar r = ecgroup::Scalar::get_random();
        REQUIRE(elgamal::encrypt(kp.pk, 42, r) == elgamal::encrypt(kp.pk, 42, r));
    }

    SECTION("homomorphic add, sub and scalar mul") {
        elgamal::Ciphertext a = elgamal::encrypt(kp.pk, 400);
        elgamal::Ciphertext b = elgamal::encrypt(kp.pk, 300);

        REQUIRE(elgamal::decrypt(kp.sk, elgamal::add(a, b), table) == 700);
        REQUIRE(elgamal::decrypt(kp.sk, elgamal::sub(a, b), table) == 100);
        REQUIRE(elgamal::decrypt(kp.sk, elgamal::mul(b, 1000), table) == 300000);
    }

    SECTION("out-of-range plaintext fails closed") {
        elgamal::Ciphertext ct = elgamal::encrypt(kp.pk, uint64_t(1) << 30);
        REQUIRE_THROWS_AS(elgamal::decrypt(kp.sk, ct, table), elgamal::ElGamalError);

        ecgroup::G1Point far = ecgroup::G1Point::mul(ecgroup::G1Point::generator(),
                                                     ecgroup::Scalar::get_random());
        REQUIRE_FALSE(table.solve(far).has_value());
    }

    SECTION("table bounds are validated") {
        REQUIRE_THROWS_AS(elgamal::DlogTable(0, 10), elgamal::ElGamalError);
        REQUIRE_THROWS_AS(elgamal::DlogTable(25, 30), elgamal::ElGamalError);
        REQUIRE_THROWS_AS(elgamal::DlogTable(12, 8), elgamal::ElGamalError);
        REQUIRE_THROWS_AS(elgamal::DlogTable(12, 64), elgamal::ElGamalError);
    }

    SECTION("ciphertext serialization") {
        elgamal::Ciphertext ct = elgamal::encrypt(kp.pk, 9);
        ecgroup::Bytes wire = ct.serialize();
        REQUIRE(elgamal::Ciphertext::deserialize(wire) == ct);

        wire.push_back(0);
        REQUIRE_THROWS_AS(elgamal::Ciphertext::deserialize(wire), std::runtime_error);
        REQUIRE_THROWS_AS(elgamal::Ciphertext::deserialize(ecgroup::Bytes{0, 0, 0, 9}),
                          std::runtime_error);
    }
}

TEST_CASE("Decryption proofs", "[elgamal][proof]") {
    ecgroup::init_curve();

    elgamal::KeyPair kp = elgamal::keygen();
    elgamal::Ciphertext ct = elgamal::encrypt(kp.pk, 1100);
    ecgroup::Bytes label = to_bytes("request-1");

    elgamal::DecryptionProof proof = elgamal::prove_decryption(kp, ct, 1100, label);

    SECTION("honest proof verifies") {
        REQUIRE(elgamal::verify_decryption(kp.pk, ct, 1100, proof, label));
    }

    SECTION("wrong plaintext is rejected") {
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, ct, 1101, proof, label));
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, ct, 0, proof, label));
    }

    SECTION("proof is bound to its label") {
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, ct, 1100, proof, to_bytes("request-2")));
    }

    SECTION("proof is bound to the ciphertext and key") {
        elgamal::Ciphertext other = elgamal::encrypt(kp.pk, 1100);
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, other, 1100, proof, label));

        elgamal::KeyPair stranger = elgamal::keygen();
        REQUIRE_FALSE(elgamal::verify_decryption(stranger.pk, ct, 1100, proof, label));
    }

    SECTION("a proof from the wrong key does not verify") {
        elgamal::KeyPair stranger = elgamal::keygen();
        elgamal::DecryptionProof forged = elgamal::prove_decryption(stranger, ct, 1100, label);
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, ct, 1100, forged, label));
    }

    SECTION("tampered proof is rejected") {
        elgamal::DecryptionProof bad = proof;
        bad.response = bad.response + ecgroup::Scalar::from_u64(1);
        REQUIRE_FALSE(elgamal::verify_decryption(kp.pk, ct, 1100, bad, label));
    }

    SECTION("proof serialization") {
        elgamal::DecryptionProof back = elgamal::DecryptionProof::deserialize(proof.serialize());
        REQUIRE(back.challenge == proof.challenge);
        REQUIRE(back.response == proof.response);
        REQUIRE(elgamal::verify_decryption(kp.pk, ct, 1100, back, label));
    }
}
