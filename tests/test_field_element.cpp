#include <gtest/gtest.h>
#include "types/field_element.hpp"
#include <sstream>
#include <stdexcept>

using namespace stark_sync;

class FieldElementTest : public ::testing::Test {
protected:
    const std::string p_hex = "800000000000011000000000000000000000000000000000000000000000001";
    const std::string p_minus_one_hex = "800000000000011000000000000000000000000000000000000000000000000";
};

TEST_F(FieldElementTest, DefaultIsZero) {
    FieldElement zero;
    EXPECT_TRUE(zero.is_zero());
    EXPECT_EQ(zero.to_hex(), "0");
    EXPECT_EQ(zero, FieldElement::zero());
}

TEST_F(FieldElementTest, SmallValuesRoundTripThroughHex) {
    EXPECT_EQ(FieldElement(255).to_hex(), "ff");
    EXPECT_EQ(FieldElement::from_hex("0xff"), FieldElement(255));
    EXPECT_EQ(FieldElement::from_hex("FF"), FieldElement(255));
    EXPECT_EQ(FieldElement::from_u64(1).to_hex(), "1");
}

TEST_F(FieldElementTest, ModulusIsRejected) {
    EXPECT_THROW(FieldElement::from_hex(p_hex), std::invalid_argument);
    EXPECT_NO_THROW(FieldElement::from_hex(p_minus_one_hex));
}

TEST_F(FieldElementTest, MalformedHexIsRejected) {
    EXPECT_THROW(FieldElement::from_hex("0xzz"), std::invalid_argument);
    EXPECT_THROW(FieldElement::from_hex(std::string(65, '1')), std::invalid_argument);
}

TEST_F(FieldElementTest, AdditionWrapsAtModulus) {
    FieldElement max = FieldElement::from_hex(p_minus_one_hex);
    EXPECT_EQ(max + FieldElement(2), FieldElement(1));
    EXPECT_EQ(FieldElement(1) - FieldElement(2), max);
    EXPECT_EQ(-FieldElement(1), max);
}

TEST_F(FieldElementTest, MultiplicationAndInverse) {
    FieldElement a(123456789);
    FieldElement b(987654321);
    EXPECT_EQ((a * b).to_hex(), "1b13114fbff5385");
    EXPECT_EQ(a * a.inverse(), FieldElement::one());
    EXPECT_EQ((a * b) / b, a);
    EXPECT_EQ(a.square(), a * a);
}

TEST_F(FieldElementTest, InverseOfZeroThrows) {
    EXPECT_THROW(FieldElement::zero().inverse(), std::domain_error);
}

TEST_F(FieldElementTest, BytesAreBigEndian) {
    FieldElement value = FieldElement::from_hex("0x0102");
    auto bytes = value.to_bytes_be();
    EXPECT_EQ(bytes[31], 0x02);
    EXPECT_EQ(bytes[30], 0x01);
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(FieldElement::from_bytes_be(bytes), value);
}

TEST_F(FieldElementTest, BytesAtOrAboveModulusAreRejected) {
    FieldElement::Bytes32 bytes{};
    bytes.fill(0xFF);
    EXPECT_THROW(FieldElement::from_bytes_be(bytes), std::invalid_argument);
}

TEST_F(FieldElementTest, CanonicalLimbsRoundTrip) {
    FieldElement value = FieldElement::from_hex(p_minus_one_hex);
    auto limbs = value.canonical_limbs();
    EXPECT_EQ(limbs[0], 0ULL);
    EXPECT_EQ(limbs[3], 0x0800000000000011ULL);
    EXPECT_EQ(FieldElement::from_canonical_limbs(limbs), value);
    EXPECT_THROW(FieldElement::from_canonical_limbs(FieldElement::MODULUS), std::invalid_argument);
}

TEST_F(FieldElementTest, BitAccess) {
    FieldElement value(5);  // 0b101
    EXPECT_TRUE(value.bit(0));
    EXPECT_FALSE(value.bit(1));
    EXPECT_TRUE(value.bit(2));
    EXPECT_FALSE(value.bit(251));
    EXPECT_TRUE(FieldElement::from_hex(p_minus_one_hex).bit(251));
}

TEST_F(FieldElementTest, OrderingUsesCanonicalValue) {
    EXPECT_LT(FieldElement(1), FieldElement(2));
    EXPECT_LT(FieldElement(2), FieldElement::from_hex(p_minus_one_hex));
    EXPECT_FALSE(FieldElement(3) < FieldElement(3));
}

TEST_F(FieldElementTest, StreamsWithPrefix) {
    std::ostringstream os;
    os << FieldElement(16);
    EXPECT_EQ(os.str(), "0x10");
}
