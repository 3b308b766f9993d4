#include "hash/pedersen.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <omp.h>

namespace stark_sync {

namespace {

struct JacobianPoint {
    // (X, Y, Z) represents the affine point (X / Z^2, Y / Z^3)
    FieldElement x;
    FieldElement y;
    FieldElement z;
};

AffinePoint affine_double(const AffinePoint& p) {
    if (p.y.is_zero()) {
        throw std::domain_error("Cannot double a point of order two");
    }
    const FieldElement three(3);
    const FieldElement two(2);
    FieldElement lambda = (three * p.x.square() + Pedersen::alpha()) / (two * p.y);
    FieldElement x3 = lambda.square() - p.x - p.x;
    FieldElement y3 = lambda * (p.x - x3) - p.y;
    return AffinePoint{x3, y3};
}

// Mixed addition, Jacobian + affine. Throws on the cases the reference
// implementation treats as unhashable (equal x-coordinates).
void add_affine(JacobianPoint& acc, const AffinePoint& q) {
    FieldElement z1z1 = acc.z.square();
    FieldElement u2 = q.x * z1z1;
    FieldElement s2 = q.y * acc.z * z1z1;
    FieldElement h = u2 - acc.x;
    FieldElement r = s2 - acc.y;
    if (h.is_zero()) {
        throw CommitmentError("Unhashable input: summands share an x-coordinate");
    }
    FieldElement hh = h.square();
    FieldElement hhh = h * hh;
    FieldElement v = acc.x * hh;
    FieldElement x3 = r.square() - hhh - v - v;
    FieldElement y3 = r * (v - x3) - acc.y * hhh;
    acc.z = acc.z * h;
    acc.x = x3;
    acc.y = y3;
}

/**
 * Doubling tables: tables[k][i] = G_k * 2^i for the four generators
 * P1 (low a), P2 (high a), P3 (low b), P4 (high b).
 */
struct GeneratorTables {
    std::array<std::vector<AffinePoint>, 4> points;

    GeneratorTables() {
        const auto& constants = Pedersen::constant_points();
        const std::array<size_t, 4> sizes = {
            Pedersen::LOW_PART_BITS, Pedersen::HIGH_PART_BITS,
            Pedersen::LOW_PART_BITS, Pedersen::HIGH_PART_BITS
        };

        // Each generator's chain of doublings is independent
        #pragma omp parallel for schedule(static)
        for (int k = 0; k < 4; ++k) {
            std::vector<AffinePoint>& table = points[k];
            table.reserve(sizes[k]);
            table.push_back(constants[k + 1]);
            for (size_t i = 1; i < sizes[k]; ++i) {
                table.push_back(affine_double(table.back()));
            }
        }
    }
};

const GeneratorTables& generator_tables() {
    static const GeneratorTables tables;
    return tables;
}

void add_element(JacobianPoint& acc, const FieldElement& element,
                 const std::vector<AffinePoint>& low_table,
                 const std::vector<AffinePoint>& high_table) {
    FieldElement::Limbs limbs = element.canonical_limbs();
    for (size_t i = 0; i < Pedersen::LOW_PART_BITS + Pedersen::HIGH_PART_BITS; ++i) {
        if (((limbs[i / 64] >> (i % 64)) & 1ULL) == 0) {
            continue;
        }
        if (i < Pedersen::LOW_PART_BITS) {
            add_affine(acc, low_table[i]);
        } else {
            add_affine(acc, high_table[i - Pedersen::LOW_PART_BITS]);
        }
    }
}

} // namespace

const FieldElement& Pedersen::alpha() {
    static const FieldElement value = FieldElement::one();
    return value;
}

const FieldElement& Pedersen::beta() {
    static const FieldElement value = FieldElement::from_hex(
        "0x6f21413efbe40de150e596d72f7a8c5609ad26c15c915c1f4cdfcb99cee9e89");
    return value;
}

const std::array<AffinePoint, Pedersen::NUM_CONSTANT_POINTS>& Pedersen::constant_points() {
    static const std::array<AffinePoint, NUM_CONSTANT_POINTS> points = {{
        {FieldElement::from_hex("0x49ee3eba8c1600700ee1b87eb599f16716b0b1022947733551fde4050ca6804"),
         FieldElement::from_hex("0x3ca0cfe4b3bc6ddf346d49d06ea0ed34e621062c0e056c1d0405d266e10268a")},
        {FieldElement::from_hex("0x234287dcbaffe7f969c748655fca9e58fa8120b6d56eb0c1080d17957ebe47b"),
         FieldElement::from_hex("0x3b056f100f96fb21e889527d41f4e39940135dd7a6c94cc6ed0268ee89e5615")},
        {FieldElement::from_hex("0x4fa56f376c83db33f9dab2656558f3399099ec1de5e3018b7a6932dba8aa378"),
         FieldElement::from_hex("0x3fa0984c931c9e38113e0c0e47e4401562761f92a7a23b45168f4e80ff5b54d")},
        {FieldElement::from_hex("0x4ba4cc166be8dec764910f75b45f74b40c690c74709e90f3aa372f0bd2d6997"),
         FieldElement::from_hex("0x40301cf5c1751f4b971e46c4ede85fcac5c59a5ce5ae7c48151f27b24b219c")},
        {FieldElement::from_hex("0x54302dcb0e6cc1c6e44cca8f61a63bb2ca65048d53fb325d36ff12c49a58202"),
         FieldElement::from_hex("0x1b77b3e37d13504b348046268d8ae25ce98ad783c25561a879dcc77e99c2426")},
    }};
    return points;
}

bool Pedersen::is_on_curve(const AffinePoint& point) {
    FieldElement lhs = point.y.square();
    FieldElement rhs = point.x.square() * point.x + alpha() * point.x + beta();
    return lhs == rhs;
}

void Pedersen::warm_up() {
    (void)generator_tables();
}

FieldElement Pedersen::hash(const FieldElement& a, const FieldElement& b) {
    const GeneratorTables& tables = generator_tables();
    const AffinePoint& shift = constant_points()[0];

    JacobianPoint acc{shift.x, shift.y, FieldElement::one()};
    add_element(acc, a, tables.points[0], tables.points[1]);
    add_element(acc, b, tables.points[2], tables.points[3]);

    // z is a product of non-zero h values, so it is invertible
    FieldElement z_inv = acc.z.inverse();
    return acc.x * z_inv.square();
}

FieldElement Pedersen::hash_array(const std::vector<FieldElement>& elements) {
    FieldElement digest = FieldElement::zero();
    for (const FieldElement& element : elements) {
        digest = hash(digest, element);
    }
    return hash(digest, FieldElement(static_cast<uint64_t>(elements.size())));
}

} // namespace stark_sync
