// QUORUM - Core Types Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include <quorum/core/errors.h>
#include <quorum/core/hex.h>
#include <quorum/core/reentrancy.h>
#include <quorum/core/types.h>

#include <stdexcept>
#include <vector>

using namespace quorum;

// ============================================================================
// Amount Arithmetic
// ============================================================================

TEST(AmountTest, PercentOfFloors) {
    EXPECT_EQ(PercentOf(1000, 15), 150u);
    EXPECT_EQ(PercentOf(99, 15), 14u);   // 14.85
    EXPECT_EQ(PercentOf(0, 30), 0u);
    EXPECT_EQ(PercentOf(1000, 0), 0u);
    EXPECT_EQ(PercentOf(1000, 100), 1000u);
}

TEST(AmountTest, PercentOfDoesNotOverflow) {
    EXPECT_EQ(PercentOf(MAX_AMOUNT, 100), MAX_AMOUNT);
    EXPECT_EQ(PercentOf(MAX_AMOUNT, 50), MAX_AMOUNT / 2);
}

TEST(AmountTest, CheckedAdd) {
    Amount out = 0;
    EXPECT_TRUE(CheckedAdd(1, 2, out));
    EXPECT_EQ(out, 3u);

    out = 7;
    EXPECT_FALSE(CheckedAdd(MAX_AMOUNT, 1, out));
    EXPECT_EQ(out, 7u);
    EXPECT_TRUE(CheckedAdd(MAX_AMOUNT - 1, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);
}

// ============================================================================
// Address
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address a;
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(a, NullAddress());
    EXPECT_EQ(a.size(), 20u);
}

TEST(AddressTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    Address a = Address::FromHex(hex);
    EXPECT_FALSE(a.IsNull());
    EXPECT_EQ(a.ToHex(), hex);
    EXPECT_EQ(a.ToString(), "0x" + hex);
    EXPECT_EQ(Address::FromHex("0x" + hex), a);
    EXPECT_EQ(a.ToShortString(), "0x00112233..");
}

TEST(AddressTest, FromHexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("0011"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(AddressTest, Ordering) {
    Address a, b;
    a[19] = 1;
    b[0] = 1;
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fa0ff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, HexToBytes) {
    EXPECT_EQ(HexToBytes("000FA0ff"), (std::vector<uint8_t>{0x00, 0x0f, 0xa0, 0xff}));
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0x00"));
}

TEST(HexTest, TryParseAndPrefix) {
    EXPECT_FALSE(TryParseHex("0g").has_value());
    EXPECT_TRUE(TryParseHex("")->empty());
    EXPECT_EQ(StripHexPrefix("0XAb"), "Ab");
    EXPECT_EQ(StripHexPrefix("0"), "0");
    EXPECT_EQ(StripHexPrefix("ab0x"), "ab0x");
}

// ============================================================================
// Error Codes
// ============================================================================

TEST(ErrorsTest, CodeToString) {
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::Ok), "Ok");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::AlreadyVoted), "AlreadyVoted");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::RebateOutOfRange), "RebateOutOfRange");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::Reentrancy), "Reentrancy");
}

TEST(ErrorsTest, Categories) {
    EXPECT_EQ(GetErrorCategory(ErrorCode::Ok), ErrorCategory::None);
    EXPECT_EQ(GetErrorCategory(ErrorCode::Unauthorized), ErrorCategory::Unauthorized);
    EXPECT_EQ(GetErrorCategory(ErrorCode::ProposalExpired), ErrorCategory::InvalidState);
    EXPECT_EQ(GetErrorCategory(ErrorCode::DuplicateMerchant), ErrorCategory::InvalidState);
    EXPECT_EQ(GetErrorCategory(ErrorCode::RebateOutOfRange), ErrorCategory::InvalidAmount);
    EXPECT_EQ(GetErrorCategory(ErrorCode::Frozen), ErrorCategory::Frozen);
    EXPECT_EQ(GetErrorCategory(ErrorCode::WithdrawFailed), ErrorCategory::TransferFailed);
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::InvalidState), "InvalidState");
}

// ============================================================================
// Reentrancy Guard
// ============================================================================

TEST(ReentrancyTest, NestedScopeIsRefused) {
    ReentrancyGuard guard;
    EXPECT_FALSE(guard.IsEntered());
    {
        ReentrancyGuard::Scope outer(guard);
        EXPECT_TRUE(outer.Acquired());
        EXPECT_TRUE(guard.IsEntered());
        {
            ReentrancyGuard::Scope inner(guard);
            EXPECT_FALSE(inner.Acquired());
        }
        // Inner scope must not release the outer one
        EXPECT_TRUE(guard.IsEntered());
    }
    EXPECT_FALSE(guard.IsEntered());

    ReentrancyGuard::Scope again(guard);
    EXPECT_TRUE(again.Acquired());
}
