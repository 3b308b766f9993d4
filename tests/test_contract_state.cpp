#include <gtest/gtest.h>
#include "hash/pedersen.hpp"
#include "state/contract_state.hpp"

using namespace stark_sync;

class ContractStateTest : public ::testing::Test {};

TEST_F(ContractStateTest, KnownCommitment) {
    FieldElement commitment = contract_state_commitment(FieldElement(1), FieldElement(2));
    EXPECT_EQ(commitment, FieldElement::from_hex(
        "0x38aad1e8a0fc113d12fa5b0ab78cb7c2ad72c2344ec242331000eaada58b72a"));
}

TEST_F(ContractStateTest, MatchesNestedHashes) {
    FieldElement contract_hash = FieldElement::from_hex("0x1234");
    FieldElement storage_root = FieldElement::from_hex("0xabcdef");
    FieldElement inner = Pedersen::hash(contract_hash, storage_root);
    FieldElement expected = Pedersen::hash(Pedersen::hash(inner, FieldElement::zero()), FieldElement::zero());
    EXPECT_EQ(contract_state_commitment(contract_hash, storage_root), expected);
}

TEST_F(ContractStateTest, EmptyStorageStillCommits) {
    FieldElement commitment = contract_state_commitment(FieldElement(42), FieldElement::zero());
    EXPECT_FALSE(commitment.is_zero());
    EXPECT_NE(commitment, contract_state_commitment(FieldElement(43), FieldElement::zero()));
}
