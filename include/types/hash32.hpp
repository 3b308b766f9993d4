#pragma once

#include "types/field_element.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stark_sync {

using Bytes = std::vector<uint8_t>;

/**
 * FixedBytes - N-byte big-endian value (hashes, addresses)
 *
 * Hex parsing follows Ethereum conventions: an optional "0x" prefix, and
 * input shorter than 2*N digits is left-padded with zeros.
 */
template <size_t N>
class FixedBytes {
public:
    static constexpr size_t LEN = N;

    FixedBytes() : bytes_{} {}
    explicit FixedBytes(const std::array<uint8_t, N>& bytes) : bytes_(bytes) {}

    static FixedBytes zero() { return FixedBytes(); }

    /**
     * Take the last N bytes of `data`, left-padding when shorter.
     */
    static FixedBytes from_bytes(const uint8_t* data, size_t len);
    static FixedBytes from_bytes(const Bytes& data) { return from_bytes(data.data(), data.size()); }

    // @throws std::invalid_argument on non-hex input or more than 2*N digits
    static FixedBytes from_hex(const std::string& hex);

    const std::array<uint8_t, N>& bytes() const { return bytes_; }
    uint8_t operator[](size_t i) const { return bytes_[i]; }

    bool is_zero() const;

    // "0x" followed by exactly 2*N lowercase hex digits
    std::string to_hex() const;

    bool operator==(const FixedBytes& rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const FixedBytes& rhs) const { return bytes_ != rhs.bytes_; }
    bool operator<(const FixedBytes& rhs) const { return bytes_ < rhs.bytes_; }

private:
    std::array<uint8_t, N> bytes_;
};

using Hash32 = FixedBytes<32>;
using EthAddress = FixedBytes<20>;

// Field element <-> 32-byte hash. to_felt throws std::invalid_argument if >= p.
FieldElement to_felt(const Hash32& hash);
Hash32 to_hash32(const FieldElement& felt);

// Shared hex helpers
std::string bytes_to_hex(const uint8_t* data, size_t len);
inline std::string bytes_to_hex(const Bytes& data) { return bytes_to_hex(data.data(), data.size()); }
Bytes hex_to_bytes(const std::string& hex);

template <size_t N>
FixedBytes<N> FixedBytes<N>::from_bytes(const uint8_t* data, size_t len) {
    FixedBytes result;
    if (len >= N) {
        for (size_t i = 0; i < N; ++i) {
            result.bytes_[i] = data[len - N + i];
        }
    } else {
        for (size_t i = 0; i < len; ++i) {
            result.bytes_[N - len + i] = data[i];
        }
    }
    return result;
}

template <size_t N>
FixedBytes<N> FixedBytes<N>::from_hex(const std::string& hex) {
    Bytes raw = hex_to_bytes(hex);
    if (raw.size() > N) {
        throw std::invalid_argument("Hex string too long for " + std::to_string(N) + " bytes: " + hex);
    }
    return from_bytes(raw);
}

template <size_t N>
bool FixedBytes<N>::is_zero() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

template <size_t N>
std::string FixedBytes<N>::to_hex() const {
    return "0x" + bytes_to_hex(bytes_.data(), N);
}

template <size_t M>
std::ostream& operator<<(std::ostream& os, const FixedBytes<M>& value) {
    return os << value.to_hex();
}

} // namespace stark_sync

namespace std {

template <size_t N>
struct hash<stark_sync::FixedBytes<N>> {
    size_t operator()(const stark_sync::FixedBytes<N>& value) const noexcept {
        // Inputs are hashes already; fold the leading bytes
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t) && i < N; ++i) {
            h = (h << 8) | value[i];
        }
        return h ^ (static_cast<size_t>(value[N - 1]) << 3);
    }
};

} // namespace std
