#include "types/field_element.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stark_sync {

namespace {

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr FieldElement::Limbs P_MINUS_TWO = {
    0xFFFFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL,
    0xFFFFFFFFFFFFFFFFULL, 0x0800000000000010ULL
};

} // namespace

bool FieldElement::less_than(const Limbs& a, const Limbs& b) {
    for (size_t i = 4; i-- > 0;) {
        if (a[i] != b[i]) {
            return a[i] < b[i];
        }
    }
    return false;
}

uint64_t FieldElement::add_in_place(Limbs& a, const Limbs& b) {
    uint64_t carry = 0;
    for (size_t i = 0; i < 4; ++i) {
        uint128_t sum = static_cast<uint128_t>(a[i]) + b[i] + carry;
        a[i] = static_cast<uint64_t>(sum);
        carry = static_cast<uint64_t>(sum >> 64);
    }
    return carry;
}

uint64_t FieldElement::sub_in_place(Limbs& a, const Limbs& b) {
    uint64_t borrow = 0;
    for (size_t i = 0; i < 4; ++i) {
        uint128_t diff = static_cast<uint128_t>(a[i]) - b[i] - borrow;
        a[i] = static_cast<uint64_t>(diff);
        borrow = static_cast<uint64_t>(diff >> 127);  // 1 if wrapped
    }
    return borrow;
}

// CIOS Montgomery multiplication: returns a * b * R^(-1) mod p
FieldElement::Limbs FieldElement::mont_mul(const Limbs& a, const Limbs& b) {
    uint64_t t[6] = {0, 0, 0, 0, 0, 0};

    for (size_t i = 0; i < 4; ++i) {
        uint128_t carry = 0;
        for (size_t j = 0; j < 4; ++j) {
            uint128_t cur = static_cast<uint128_t>(t[j])
                          + static_cast<uint128_t>(a[j]) * b[i]
                          + carry;
            t[j] = static_cast<uint64_t>(cur);
            carry = cur >> 64;
        }
        uint128_t cur = static_cast<uint128_t>(t[4]) + carry;
        t[4] = static_cast<uint64_t>(cur);
        t[5] = static_cast<uint64_t>(cur >> 64);

        uint64_t m = t[0] * MONTGOMERY_INV;
        cur = static_cast<uint128_t>(t[0]) + static_cast<uint128_t>(m) * MODULUS[0];
        carry = cur >> 64;
        for (size_t j = 1; j < 4; ++j) {
            cur = static_cast<uint128_t>(t[j])
                + static_cast<uint128_t>(m) * MODULUS[j]
                + carry;
            t[j - 1] = static_cast<uint64_t>(cur);
            carry = cur >> 64;
        }
        cur = static_cast<uint128_t>(t[4]) + carry;
        t[3] = static_cast<uint64_t>(cur);
        t[4] = t[5] + static_cast<uint64_t>(cur >> 64);
    }

    Limbs result = {t[0], t[1], t[2], t[3]};
    if (t[4] != 0 || !less_than(result, MODULUS)) {
        sub_in_place(result, MODULUS);
    }
    return result;
}

FieldElement::FieldElement(uint64_t value) : limbs_{value, 0, 0, 0} {
    limbs_ = mont_mul(limbs_, MONTGOMERY_R2);
}

FieldElement FieldElement::one() {
    FieldElement result;
    result.limbs_ = MONTGOMERY_R;
    return result;
}

FieldElement FieldElement::from_canonical_limbs(const Limbs& limbs) {
    if (!less_than(limbs, MODULUS)) {
        throw std::invalid_argument("Value is not a canonical field element");
    }
    FieldElement result;
    result.limbs_ = mont_mul(limbs, MONTGOMERY_R2);
    return result;
}

FieldElement FieldElement::from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if (start == hex.size()) {
        throw std::invalid_argument("Empty hex string for FieldElement");
    }
    if (hex.size() - start > 64) {
        throw std::invalid_argument("Hex string too long for FieldElement: " + hex);
    }

    Limbs limbs = {0, 0, 0, 0};
    size_t nibble = 0;
    for (size_t pos = hex.size(); pos-- > start; ++nibble) {
        int v = hex_digit_value(hex[pos]);
        if (v < 0) {
            throw std::invalid_argument("Invalid hex digit in FieldElement: " + hex);
        }
        limbs[nibble / 16] |= static_cast<uint64_t>(v) << ((nibble % 16) * 4);
    }
    return from_canonical_limbs(limbs);
}

FieldElement FieldElement::from_bytes_be(const Bytes32& bytes) {
    Limbs limbs = {0, 0, 0, 0};
    for (size_t i = 0; i < NUM_BYTES; ++i) {
        // bytes[31] is the least significant byte
        size_t le_index = NUM_BYTES - 1 - i;
        limbs[le_index / 8] |= static_cast<uint64_t>(bytes[i]) << ((le_index % 8) * 8);
    }
    return from_canonical_limbs(limbs);
}

FieldElement::Limbs FieldElement::canonical_limbs() const {
    return mont_mul(limbs_, Limbs{1, 0, 0, 0});
}

FieldElement::Bytes32 FieldElement::to_bytes_be() const {
    Limbs limbs = canonical_limbs();
    Bytes32 bytes{};
    for (size_t i = 0; i < NUM_BYTES; ++i) {
        size_t le_index = NUM_BYTES - 1 - i;
        bytes[i] = static_cast<uint8_t>(limbs[le_index / 8] >> ((le_index % 8) * 8));
    }
    return bytes;
}

bool FieldElement::bit(size_t i) const {
    if (i >= 256) {
        throw std::out_of_range("Bit index out of range");
    }
    Limbs limbs = canonical_limbs();
    return ((limbs[i / 64] >> (i % 64)) & 1ULL) != 0;
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const {
    // Both operands < p < 2^252, so the sum never overflows 256 bits
    FieldElement result = *this;
    add_in_place(result.limbs_, rhs.limbs_);
    if (!less_than(result.limbs_, MODULUS)) {
        sub_in_place(result.limbs_, MODULUS);
    }
    return result;
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const {
    FieldElement result = *this;
    if (sub_in_place(result.limbs_, rhs.limbs_) != 0) {
        add_in_place(result.limbs_, MODULUS);
    }
    return result;
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const {
    FieldElement result;
    result.limbs_ = mont_mul(limbs_, rhs.limbs_);
    return result;
}

FieldElement FieldElement::operator/(const FieldElement& rhs) const {
    return *this * rhs.inverse();
}

FieldElement FieldElement::operator-() const {
    return FieldElement::zero() - *this;
}

FieldElement& FieldElement::operator+=(const FieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

// Montgomery form is a bijection, so comparing the raw limbs is enough for
// equality. Ordering must use the canonical value.
bool FieldElement::operator==(const FieldElement& rhs) const {
    return limbs_ == rhs.limbs_;
}

bool FieldElement::operator!=(const FieldElement& rhs) const {
    return limbs_ != rhs.limbs_;
}

bool FieldElement::operator<(const FieldElement& rhs) const {
    return less_than(canonical_limbs(), rhs.canonical_limbs());
}

FieldElement FieldElement::square() const {
    return *this * *this;
}

FieldElement FieldElement::pow(const Limbs& exp) const {
    FieldElement result = FieldElement::one();
    for (size_t i = 256; i-- > 0;) {
        result = result.square();
        if ((exp[i / 64] >> (i % 64)) & 1ULL) {
            result *= *this;
        }
    }
    return result;
}

FieldElement FieldElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }

    // Use Fermat's little theorem: a^(-1) = a^(p-2) mod p
    return pow(P_MINUS_TWO);
}

bool FieldElement::is_zero() const {
    return limbs_[0] == 0 && limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

std::string FieldElement::to_hex() const {
    Limbs limbs = canonical_limbs();
    std::ostringstream oss;
    bool leading = true;
    for (size_t i = 4; i-- > 0;) {
        if (leading) {
            if (limbs[i] == 0) {
                continue;
            }
            oss << std::hex << limbs[i];
            leading = false;
        } else {
            oss << std::hex << std::setfill('0') << std::setw(16) << limbs[i];
        }
    }
    if (leading) {
        return "0";
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const FieldElement& elem) {
    return os << "0x" << elem.to_hex();
}

} // namespace stark_sync
