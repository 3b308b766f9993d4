#include "types/hash32.hpp"
#include <stdexcept>

namespace stark_sync {

namespace {

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string bytes_to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

Bytes hex_to_bytes(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    size_t digits = hex.size() - start;

    // An odd digit count gets an implicit leading zero
    Bytes out((digits + 1) / 2, 0);
    size_t out_index = out.size();
    bool low = true;
    for (size_t pos = hex.size(); pos-- > start;) {
        int v = nibble(hex[pos]);
        if (v < 0) {
            throw std::invalid_argument("Invalid hex string: " + hex);
        }
        if (low) {
            --out_index;
            out[out_index] = static_cast<uint8_t>(v);
        } else {
            out[out_index] |= static_cast<uint8_t>(v << 4);
        }
        low = !low;
    }
    return out;
}

FieldElement to_felt(const Hash32& hash) {
    return FieldElement::from_bytes_be(hash.bytes());
}

Hash32 to_hash32(const FieldElement& felt) {
    return Hash32(felt.to_bytes_be());
}

} // namespace stark_sync
