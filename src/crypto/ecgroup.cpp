#include "ecgroup.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace ecgroup {

    // BN254 Fr and compressed G1 both serialize to 32 bytes
    static constexpr size_t SERIALIZED_SIZE = 32;

    void init_curve() {
        static std::once_flag once;
        std::call_once(once, [] { mcl::bn::initPairing(mcl::BN254); });
    }

    // --- Scalar Implementation ---
    Scalar::Scalar() { value.clear(); }

    void Scalar::set_random() { value.setByCSPRNG(); }

    Scalar Scalar::get_random() {
        Scalar s;
        s.set_random();
        return s;
    }

    Scalar Scalar::from_u64(uint64_t v) {
        Scalar s;
        s.value.setStr(std::to_string(v), 10);
        return s;
    }

    bool Scalar::is_zero() const { return value.isZero(); }

    Bytes Scalar::to_bytes() const {
        Bytes b(SERIALIZED_SIZE);
        size_t n = value.serialize(b.data(), b.size());
        if (n == 0) throw std::runtime_error("ecgroup: scalar serialization failed");
        b.resize(n);
        return b;
    }

    Scalar Scalar::hash_to_scalar(const Bytes& data) {
        Scalar s;
        // setHashOf is designed to take raw byte buffers
        s.value.setHashOf(data.data(), data.size());
        return s;
    }

    Scalar Scalar::from_bytes(const Bytes& b) {
        Scalar scalar;
        if (b.empty() || scalar.value.deserialize(b.data(), b.size()) != b.size()) {
            throw std::runtime_error("decode: invalid scalar encoding");
        }
        return scalar;
    }

    bool Scalar::operator==(const Scalar& other) const { return value == other.value; }

    Scalar Scalar::operator+(const Scalar& other) const {
        Scalar result;
        mcl::bn::Fr::add(result.value, value, other.value);
        return result;
    }

    Scalar Scalar::operator-(const Scalar& other) const {
        Scalar result;
        mcl::bn::Fr::sub(result.value, value, other.value);
        return result;
    }

    Scalar Scalar::operator*(const Scalar& other) const {
        Scalar result;
        mcl::bn::Fr::mul(result.value, value, other.value);
        return result;
    }

    // --- G1Point Implementation ---
    G1Point::G1Point() { value.clear(); }

    Bytes G1Point::to_bytes() const {
        Bytes b(SERIALIZED_SIZE);
        size_t n = value.serialize(b.data(), b.size());
        if (n == 0) throw std::runtime_error("ecgroup: point serialization failed");
        b.resize(n);
        return b;
    }

    const G1Point& G1Point::generator() {
        static const G1Point g = [] {
            G1Point p;
            mcl::bn::hashAndMapToG1(p.value, "sealfund_g1_generator");
            return p;
        }();
        return g;
    }

    G1Point G1Point::identity() { return G1Point(); }

    G1Point G1Point::mul(const G1Point& p, const Scalar& s) {
        G1Point result;
        mcl::bn::G1::mul(result.value, p.value, s.value);
        return result;
    }

    G1Point G1Point::from_bytes(const Bytes& b) {
        G1Point p;
        if (b.empty() || p.value.deserialize(b.data(), b.size()) != b.size()) {
            throw std::runtime_error("decode: invalid G1 encoding");
        }
        return p;
    }

    G1Point G1Point::add(const G1Point& other) const {
        G1Point result;
        mcl::bn::G1::add(result.value, this->value, other.value);
        return result;
    }

    G1Point G1Point::sub(const G1Point& other) const {
        G1Point result;
        mcl::bn::G1::sub(result.value, this->value, other.value);
        return result;
    }

    bool G1Point::operator==(const G1Point& other) const { return value == other.value; }

} // namespace ecgroup
