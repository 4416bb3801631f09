// QUORUM - Token Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include <quorum/crypto/sha256.h>
#include <quorum/token/token.h>

#include <tuple>
#include <vector>

using namespace quorum;

class TokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = AddressFromLabel("alice");
        bob_ = AddressFromLabel("bob");
        carol_ = AddressFromLabel("carol");
    }

    MemoryToken token_;
    Address alice_, bob_, carol_;
};

// ============================================================================
// Supply
// ============================================================================

TEST_F(TokenTest, MintAndBurn) {
    EXPECT_EQ(token_.GetSymbol(), "QRM");
    ASSERT_TRUE(token_.Mint(alice_, 1000));
    EXPECT_EQ(token_.BalanceOf(alice_), 1000u);
    EXPECT_EQ(token_.TotalSupply(), 1000u);

    ASSERT_TRUE(token_.Burn(alice_, 400));
    EXPECT_EQ(token_.BalanceOf(alice_), 600u);
    EXPECT_EQ(token_.TotalSupply(), 600u);

    EXPECT_FALSE(token_.Burn(alice_, 601));
    EXPECT_FALSE(token_.Burn(bob_, 1));
    EXPECT_EQ(token_.TotalSupply(), 600u);
}

TEST_F(TokenTest, MintRejectsNullZeroAndOverflow) {
    EXPECT_FALSE(token_.Mint(Address(), 10));
    EXPECT_FALSE(token_.Mint(alice_, 0));
    ASSERT_TRUE(token_.Mint(alice_, MAX_AMOUNT));
    EXPECT_FALSE(token_.Mint(bob_, 1));
    EXPECT_EQ(token_.BalanceOf(bob_), 0u);
    EXPECT_EQ(token_.TotalSupply(), MAX_AMOUNT);
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(TokenTest, Transfer) {
    ASSERT_TRUE(token_.Mint(alice_, 100));
    EXPECT_TRUE(token_.Transfer(alice_, bob_, 30));
    EXPECT_EQ(token_.BalanceOf(alice_), 70u);
    EXPECT_EQ(token_.BalanceOf(bob_), 30u);

    EXPECT_FALSE(token_.Transfer(alice_, bob_, 71));
    EXPECT_FALSE(token_.Transfer(alice_, Address(), 1));
    EXPECT_EQ(token_.TotalSupply(), 100u);
}

TEST_F(TokenTest, TransferFromConsumesAllowance) {
    ASSERT_TRUE(token_.Mint(alice_, 100));
    ASSERT_TRUE(token_.Approve(alice_, carol_, 50));
    EXPECT_EQ(token_.Allowance(alice_, carol_), 50u);
    EXPECT_EQ(token_.Allowance(carol_, alice_), 0u);

    EXPECT_TRUE(token_.TransferFrom(carol_, alice_, bob_, 20));
    EXPECT_EQ(token_.Allowance(alice_, carol_), 30u);
    EXPECT_EQ(token_.BalanceOf(bob_), 20u);

    EXPECT_FALSE(token_.TransferFrom(carol_, alice_, bob_, 31));
    EXPECT_FALSE(token_.TransferFrom(bob_, alice_, bob_, 1));
    EXPECT_EQ(token_.BalanceOf(alice_), 80u);
}

TEST_F(TokenTest, TransferFromNeedsBalanceToo) {
    ASSERT_TRUE(token_.Mint(alice_, 10));
    ASSERT_TRUE(token_.Approve(alice_, carol_, 50));
    EXPECT_FALSE(token_.TransferFrom(carol_, alice_, bob_, 20));
    // Failed transfer leaves the allowance alone
    EXPECT_EQ(token_.Allowance(alice_, carol_), 50u);
}

TEST_F(TokenTest, ApproveOverwrites) {
    ASSERT_TRUE(token_.Approve(alice_, carol_, 50));
    ASSERT_TRUE(token_.Approve(alice_, carol_, 5));
    EXPECT_EQ(token_.Allowance(alice_, carol_), 5u);
    ASSERT_TRUE(token_.Approve(alice_, carol_, 0));
    EXPECT_EQ(token_.Allowance(alice_, carol_), 0u);
    EXPECT_FALSE(token_.Approve(alice_, Address(), 1));
}

// ============================================================================
// Hooks and Holders
// ============================================================================

TEST_F(TokenTest, TransferHookSeesMovements) {
    std::vector<std::tuple<Address, Address, Amount>> seen;
    token_.SetTransferHook([&seen](const Address& from, const Address& to, Amount amount) {
        seen.emplace_back(from, to, amount);
    });

    ASSERT_TRUE(token_.Mint(alice_, 10));
    ASSERT_TRUE(token_.Transfer(alice_, bob_, 4));
    ASSERT_TRUE(token_.Burn(bob_, 1));
    EXPECT_FALSE(token_.Transfer(alice_, bob_, 100));

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_TRUE(std::get<0>(seen[0]).IsNull());
    EXPECT_EQ(std::get<1>(seen[1]), bob_);
    EXPECT_TRUE(std::get<1>(seen[2]).IsNull());
}

TEST_F(TokenTest, HookMayCallBackIntoToken) {
    Amount observed = 0;
    token_.SetTransferHook([this, &observed](const Address&, const Address& to, Amount) {
        observed = token_.BalanceOf(to);
    });
    ASSERT_TRUE(token_.Mint(alice_, 7));
    EXPECT_EQ(observed, 7u);
}

TEST_F(TokenTest, GetHolders) {
    ASSERT_TRUE(token_.Mint(alice_, 10));
    ASSERT_TRUE(token_.Mint(bob_, 5));
    ASSERT_TRUE(token_.Transfer(bob_, alice_, 5));
    auto holders = token_.GetHolders();
    ASSERT_EQ(holders.size(), 1u);
    EXPECT_EQ(holders[0].first, alice_);
    EXPECT_EQ(holders[0].second, 15u);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(TokenTest, SerializeRestoresBalancesAndAllowances) {
    ASSERT_TRUE(token_.Mint(alice_, 100));
    ASSERT_TRUE(token_.Transfer(alice_, bob_, 25));
    ASSERT_TRUE(token_.Approve(bob_, carol_, 10));

    auto blob = token_.Serialize();
    MemoryToken restored("OTHER");
    ASSERT_TRUE(restored.Deserialize(blob.data(), blob.size()));
    EXPECT_EQ(restored.GetSymbol(), "QRM");
    EXPECT_EQ(restored.TotalSupply(), 100u);
    EXPECT_EQ(restored.BalanceOf(bob_), 25u);
    EXPECT_EQ(restored.Allowance(bob_, carol_), 10u);
}

TEST_F(TokenTest, DeserializeRejectsCorruptData) {
    ASSERT_TRUE(token_.Mint(alice_, 100));
    auto blob = token_.Serialize();

    MemoryToken target;
    ASSERT_TRUE(target.Mint(bob_, 3));
    EXPECT_FALSE(target.Deserialize(blob.data(), blob.size() - 1));

    std::vector<Byte> badVersion = blob;
    badVersion[0] = 99;
    EXPECT_FALSE(target.Deserialize(badVersion.data(), badVersion.size()));

    // Target untouched by the failed loads
    EXPECT_EQ(target.BalanceOf(bob_), 3u);
    EXPECT_EQ(target.TotalSupply(), 3u);
}
