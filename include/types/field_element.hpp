#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace stark_sync {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * FieldElement - Element of the Stark prime field
 *
 * Modulus p = 2^251 + 17 * 2^192 + 1, the base field of the Stark curve that
 * StarkNet uses for felts, Pedersen hashing and state commitments.
 *
 * Values are kept in Montgomery form (R = 2^256) over four little-endian
 * 64-bit limbs. Everything crossing the API boundary (hex, bytes, limbs) is
 * canonical.
 */
class FieldElement {
public:
    using Limbs = std::array<uint64_t, 4>;
    using Bytes32 = std::array<uint8_t, 32>;

    // p = 0x800000000000011000000000000000000000000000000000000000000000001
    static constexpr Limbs MODULUS = {
        0x0000000000000001ULL, 0x0000000000000000ULL,
        0x0000000000000000ULL, 0x0800000000000011ULL
    };

    // -p^(-1) mod 2^64
    static constexpr uint64_t MONTGOMERY_INV = 0xFFFFFFFFFFFFFFFFULL;

    // R mod p and R^2 mod p
    static constexpr Limbs MONTGOMERY_R = {
        0xFFFFFFFFFFFFFFE1ULL, 0xFFFFFFFFFFFFFFFFULL,
        0xFFFFFFFFFFFFFFFFULL, 0x07FFFFFFFFFFFDF0ULL
    };
    static constexpr Limbs MONTGOMERY_R2 = {
        0xFFFFFD737E000401ULL, 0x00000001330FFFFFULL,
        0xFFFFFFFFFF6F8000ULL, 0x07FFD4AB5E008810ULL
    };

    static constexpr size_t NUM_BITS = 252;
    static constexpr size_t NUM_BYTES = 32;

    // Constructors
    constexpr FieldElement() : limbs_{0, 0, 0, 0} {}
    explicit FieldElement(uint64_t value);

    // Factory methods
    static FieldElement zero() { return FieldElement(); }
    static FieldElement one();
    static FieldElement from_u64(uint64_t value) { return FieldElement(value); }

    /**
     * Parse a canonical value. Accepts an optional "0x" prefix and at most
     * 64 hex digits.
     *
     * @throws std::invalid_argument on malformed input or a value >= p
     */
    static FieldElement from_hex(const std::string& hex);

    // Big-endian 32-byte encoding; throws std::invalid_argument if >= p
    static FieldElement from_bytes_be(const Bytes32& bytes);

    // Canonical little-endian limbs; throws std::invalid_argument if >= p
    static FieldElement from_canonical_limbs(const Limbs& limbs);

    // Accessors
    Limbs canonical_limbs() const;
    Bytes32 to_bytes_be() const;

    // Bit i of the canonical value (bit 0 = least significant)
    bool bit(size_t i) const;

    // Arithmetic operations
    FieldElement operator+(const FieldElement& rhs) const;
    FieldElement operator-(const FieldElement& rhs) const;
    FieldElement operator*(const FieldElement& rhs) const;
    FieldElement operator/(const FieldElement& rhs) const;
    FieldElement operator-() const;

    FieldElement& operator+=(const FieldElement& rhs);
    FieldElement& operator-=(const FieldElement& rhs);
    FieldElement& operator*=(const FieldElement& rhs);

    // Comparison (on canonical values)
    bool operator==(const FieldElement& rhs) const;
    bool operator!=(const FieldElement& rhs) const;
    bool operator<(const FieldElement& rhs) const;

    // Field operations
    FieldElement square() const;
    FieldElement pow(const Limbs& exp) const;
    FieldElement inverse() const;
    bool is_zero() const;

    // Lowercase hex without "0x" and without leading zeros ("0" for zero)
    std::string to_hex() const;

    friend std::ostream& operator<<(std::ostream& os, const FieldElement& elem);

private:
    Limbs limbs_;  // Montgomery form

    static Limbs mont_mul(const Limbs& a, const Limbs& b);
    static bool less_than(const Limbs& a, const Limbs& b);
    static uint64_t add_in_place(Limbs& a, const Limbs& b);
    static uint64_t sub_in_place(Limbs& a, const Limbs& b);
};

// Type alias for convenience
using Felt = FieldElement;

} // namespace stark_sync
