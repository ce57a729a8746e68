#ifndef SEALFUND_CRYPTO_ECGROUP_HPP
#define SEALFUND_CRYPTO_ECGROUP_HPP

#include <mcl/bn.hpp>
#include <cstdint>
#include <vector>

namespace ecgroup {

    // Define a byte vector type for clarity
    using Bytes = std::vector<uint8_t>;

    class G1Point;

    // Must run once per process before any group operation.
    void init_curve();

    class Scalar {
    public:
        Scalar();
        Scalar(const mcl::bn::Fr& v): value(v) {};

        void set_random();
        static Scalar get_random();
        static Scalar from_u64(uint64_t v);
        bool is_zero() const;

        Bytes to_bytes() const;

        static Scalar hash_to_scalar(const Bytes& data);
        static Scalar from_bytes(const Bytes& b);

        bool operator==(const Scalar& other) const;
        bool operator!=(const Scalar& other) const { return !(*this == other); }
        Scalar operator+(const Scalar& other) const;
        Scalar operator-(const Scalar& other) const;
        Scalar operator*(const Scalar& other) const;

    private:
        friend class G1Point;
        mcl::bn::Fr value;
    };

    class G1Point {
    public:
        G1Point();

        Bytes to_bytes() const;

        // Fixed generator shared by every ciphertext and proof
        static const G1Point& generator();
        static G1Point identity();
        static G1Point mul(const G1Point& p, const Scalar& s);
        static G1Point from_bytes(const Bytes& b);
        G1Point add(const G1Point& other) const;
        G1Point sub(const G1Point& other) const;

        bool operator==(const G1Point& other) const;
        bool operator!=(const G1Point& other) const { return !(*this == other); }
        G1Point operator+(const G1Point& other) const { return add(other); }
        G1Point operator-(const G1Point& other) const { return sub(other); }

    private:
        mcl::bn::G1 value;
    };

} // namespace ecgroup

#endif // SEALFUND_CRYPTO_ECGROUP_HPP
