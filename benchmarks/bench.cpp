#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>

#include "crypto/ecgroup.hpp"
#include "crypto/elgamal.hpp"
#include "crypto/oracle.hpp"
#include "helpers.hpp"
#include "protocol/elgamal_capability.hpp"
#include "protocol/platform.hpp"

using ecgroup::Bytes;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

// Transfer sink that only counts
class NullTransfer : public protocol::FundsTransfer {
public:
    void transfer(const protocol::Identity&, protocol::Amount amount) override { total += amount; }
    protocol::Amount total = 0;
};

int main() {
    ecgroup::init_curve();

    BenchmarkRunner primitive_runner(1000); // fast ops
    BenchmarkRunner protocol_runner(20);    // slower ops

    // =====================================================================
    // SECTION 1: Lifted ElGamal
    // =====================================================================
    std::cout << "\n--- Lifted ElGamal (Avg over "
              << primitive_runner.num_iters << " iters) ---" << std::endl;

    elgamal::KeyPair kp = elgamal::keygen();
    elgamal::Ciphertext a = elgamal::encrypt(kp.pk, 400);
    elgamal::Ciphertext b = elgamal::encrypt(kp.pk, 700);

    primitive_runner.run("Encrypt", [&]() {
        auto ct = elgamal::encrypt(kp.pk, 123456);
        (void)ct;
    });

    primitive_runner.run("Homomorphic Add", [&]() {
        auto ct = elgamal::add(a, b);
        (void)ct;
    });

    primitive_runner.run("Scalar Mul (obfuscation)", [&]() {
        auto ct = elgamal::mul(a, 987654);
        (void)ct;
    });

    {
        Bytes wire = a.serialize();
        std::cout << "Ciphertext size: " << wire.size() << " bytes\n";
        primitive_runner.run("Ciphertext Deserialize", [&]() {
            auto ct = elgamal::Ciphertext::deserialize(wire);
            volatile bool sink = (ct == a);
            (void)sink;
        });
    }

    // =====================================================================
    // SECTION 2: Decryption and proofs
    // =====================================================================
    std::cout << "\n--- Decryption and proofs (Avg over "
              << protocol_runner.num_iters << " iters) ---" << std::endl;

    auto table_start = std::chrono::high_resolution_clock::now();
    elgamal::DlogTable table(16, 40);
    auto table_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> table_ms = table_end - table_start;
    std::cout << std::left << std::setw(34) << "DlogTable build (2^16)"
              << ": " << std::fixed << std::setprecision(6) << table_ms.count() << " ms" << std::endl;

    elgamal::Ciphertext small = elgamal::encrypt(kp.pk, 1100);
    protocol_runner.run("Decrypt (1100)", [&]() {
        volatile uint64_t m = elgamal::decrypt(kp.sk, small, table);
        (void)m;
    });

    elgamal::Ciphertext medium = elgamal::encrypt(kp.pk, uint64_t(1) << 24);
    protocol_runner.run("Decrypt (2^24)", [&]() {
        volatile uint64_t m = elgamal::decrypt(kp.sk, medium, table);
        (void)m;
    });

    Bytes label = sealfund::utils::to_bytes("bench");
    protocol_runner.run("DLEQ Prove", [&]() {
        auto proof = elgamal::prove_decryption(kp, small, 1100, label);
        (void)proof;
    });

    elgamal::DecryptionProof proof = elgamal::prove_decryption(kp, small, 1100, label);
    protocol_runner.run("DLEQ Verify", [&]() {
        volatile bool ok = elgamal::verify_decryption(kp.pk, small, 1100, proof, label);
        (void)ok;
    });

    // =====================================================================
    // SECTION 3: Full settlement cycle
    // =====================================================================
    std::cout << "\n--- Settlement cycle (Avg over "
              << protocol_runner.num_iters << " iters) ---" << std::endl;

    crypto::RevealOracle oracle(32, 16);
    protocol::ElGamalRevealCapability capability(oracle);
    NullTransfer funds;
    protocol::SodiumBeacon beacon;
    protocol::Platform platform("owner", protocol::PlatformConfig(), capability, funds, beacon);

    const uint64_t t0 = 1700000000;
    const uint64_t duration = 30 * protocol::SECONDS_PER_DAY;
    protocol::CampaignMetadata meta;
    meta.title = "Benchmark campaign";

    protocol_runner.run("Create + 3 contributions", [&]() {
        auto id = platform.create_campaign("alice", meta, 1000, duration, t0);
        platform.contribute(id, "bob", 400, "", t0 + 1);
        platform.contribute(id, "carol", 400, "", t0 + 2);
        platform.contribute(id, "dave", 300, "", t0 + 3);
    });

    protocol_runner.run("Create/contribute/finalize/settle", [&]() {
        auto id = platform.create_campaign("alice", meta, 1000, duration, t0);
        platform.contribute(id, "bob", 400, "", t0 + 1);
        platform.contribute(id, "carol", 700, "", t0 + 2);
        auto rid = platform.finalize(id, "alice", t0 + duration);
        crypto::RevealResponse r = oracle.fulfill(rid);
        platform.on_reveal_response(r.request_id, r.plaintexts, r.proof, r.context, t0 + duration + 1);
        platform.withdraw(id, "alice", t0 + duration + 2);
    });

    std::cout << "\nCampaigns created: " << platform.campaign_count()
              << ", paid out: " << funds.total << std::endl;
    return 0;
}
