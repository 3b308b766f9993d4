#pragma once

#include "types/field_element.hpp"
#include <array>
#include <vector>

namespace stark_sync {

/**
 * Point on the Stark curve y^2 = x^3 + alpha * x + beta in affine coordinates.
 */
struct AffinePoint {
    FieldElement x;
    FieldElement y;

    bool operator==(const AffinePoint& rhs) const { return x == rhs.x && y == rhs.y; }
};

/**
 * Pedersen - StarkNet's Pedersen hash over the Stark curve
 *
 * Reference: starkware-libs/cairo-lang, crypto/signature/fast_pedersen_hash.py
 * with the constant points of pedersen_params.json. Bit-for-bit
 * compatibility with that implementation is required, since the result
 * feeds state commitments that the L2 network computes itself.
 *
 *   H(a, b) = [P0 + a_low * P1 + a_high * P2 + b_low * P3 + b_high * P4].x
 *
 * where x_low is the low 248 bits of x and x_high the remaining 4 bits.
 */
class Pedersen {
public:
    static constexpr size_t LOW_PART_BITS = 248;
    static constexpr size_t HIGH_PART_BITS = 4;
    static constexpr size_t NUM_CONSTANT_POINTS = 5;

    // Curve parameters
    static const FieldElement& alpha();
    static const FieldElement& beta();

    // P0 (shift point) followed by P1..P4
    static const std::array<AffinePoint, NUM_CONSTANT_POINTS>& constant_points();

    /**
     * Hash two field elements.
     *
     * @throws CommitmentError if an intermediate addition is degenerate
     *         (both summands share an x-coordinate), which the reference
     *         rejects as unhashable input.
     */
    static FieldElement hash(const FieldElement& a, const FieldElement& b);

    /**
     * Chained hash with the length folded in last:
     *   H(...H(H(0, x1), x2)..., n)
     * Defined for the empty sequence, where it is H(0, 0).
     */
    static FieldElement hash_array(const std::vector<FieldElement>& elements);

    // Point membership check, used when loading constants
    static bool is_on_curve(const AffinePoint& point);

    // Force the one-time generator table precomputation
    static void warm_up();
};

} // namespace stark_sync
