// QUORUM - Governance Engine Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include <quorum/core/events.h>
#include <quorum/crypto/sha256.h>
#include <quorum/governance/governance.h>
#include <quorum/ledger/merchant_ledger.h>
#include <quorum/token/token.h>
#include <quorum/util/time.h>

#include <memory>

using namespace quorum;
using namespace quorum::governance;

namespace {
constexpr int64_t START_TIME = 1700000000;
}

// ============================================================================
// Test Fixture
// ============================================================================

/// Total weight 1000: alice 100, bob 60, carol 840. Default threshold 150.
class GovernanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::SetMockTime(START_TIME);

        engineAddress_ = AddressFromLabel("governance");
        vault_ = AddressFromLabel("vault");
        alice_ = AddressFromLabel("alice");
        bob_ = AddressFromLabel("bob");
        carol_ = AddressFromLabel("carol");
        shop_ = AddressFromLabel("shop");
        user_ = AddressFromLabel("user");
        stranger_ = AddressFromLabel("stranger");

        ASSERT_TRUE(token_.Mint(alice_, 100));
        ASSERT_TRUE(token_.Mint(bob_, 60));
        ASSERT_TRUE(token_.Mint(carol_, 840));

        ledger::LedgerParams ledgerParams;
        ledgerParams.owner = engineAddress_;
        ledgerParams.vault = vault_;
        ledger_ = std::make_unique<ledger::MerchantLedger>(token_, native_, events_, ledgerParams);

        params_.address = engineAddress_;
        engine_ = std::make_unique<GovernanceEngine>(power_, token_, *ledger_, events_, params_);
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    /// Registers shop through a proposal carol passes alone
    void AddShopThroughGovernance(Amount quota = 100) {
        ASSERT_EQ(engine_->InitiateAddMerchant(carol_, shop_, "Shop", quota), ErrorCode::Ok);
        ASSERT_TRUE(ledger_->IsMerchant(shop_));
    }

    MemoryToken token_{"QRM"};
    MemoryToken native_{"NAT"};
    TokenVotingPower power_{token_};
    EventLog events_;
    GovernanceParams params_;
    std::unique_ptr<ledger::MerchantLedger> ledger_;
    std::unique_ptr<GovernanceEngine> engine_;

    Address engineAddress_, vault_, alice_, bob_, carol_, shop_, user_, stranger_;
};

// ============================================================================
// Initiation and Voting
// ============================================================================

TEST_F(GovernanceTest, ThresholdReachedBySecondVote) {
    EXPECT_EQ(engine_->GetThreshold(), 150u);

    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 500), ErrorCode::Ok);
    ProposalSlot slot = engine_->GetSlot(ProposalKind::AddMerchant);
    EXPECT_TRUE(slot.active);
    EXPECT_FALSE(slot.executed);
    EXPECT_EQ(slot.round, 1u);
    EXPECT_EQ(slot.accumulatedPower, 100u);
    EXPECT_EQ(slot.initiator, alice_);
    EXPECT_EQ(slot.deadline, START_TIME + DEFAULT_VOTING_WINDOW);
    EXPECT_FALSE(ledger_->IsMerchant(shop_));

    ASSERT_EQ(engine_->Vote(ProposalKind::AddMerchant, bob_), ErrorCode::Ok);
    slot = engine_->GetSlot(ProposalKind::AddMerchant);
    EXPECT_FALSE(slot.active);
    EXPECT_TRUE(slot.executed);
    EXPECT_EQ(slot.accumulatedPower, 160u);

    auto account = ledger_->GetMerchant(shop_);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->printQuota, 500u);
    EXPECT_EQ(account->guardian, alice_);

    auto executed = events_.FindByType(EventType::ProposalExecuted);
    ASSERT_EQ(executed.size(), 1u);
    EXPECT_EQ(executed[0].actor, alice_);
    EXPECT_EQ(executed[0].amount, 160u);
    EXPECT_EQ(executed[0].extra, 150u);

    auto ended = events_.FindByType(EventType::ProposalEnded);
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_TRUE(ended[0].flag);
}

TEST_F(GovernanceTest, SingleHolderAboveThresholdExecutesOnInitiation) {
    ASSERT_EQ(engine_->InitiateAddMerchant(carol_, shop_, "Shop", 100), ErrorCode::Ok);
    EXPECT_TRUE(engine_->GetSlot(ProposalKind::AddMerchant).executed);
    EXPECT_TRUE(ledger_->IsMerchant(shop_));

    auto all = events_.GetEvents();
    ASSERT_GE(all.size(), 4u);
    EXPECT_EQ(all[0].type, EventType::ProposalInitiated);
    EXPECT_EQ(all[1].type, EventType::VoteCast);
}

TEST_F(GovernanceTest, InitiateRequiresWeight) {
    EXPECT_EQ(engine_->InitiateAddMerchant(stranger_, shop_, "Shop", 1), ErrorCode::Unauthorized);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::AddMerchant).round, 0u);
    EXPECT_EQ(events_.Size(), 0u);
}

TEST_F(GovernanceTest, OneOpenRoundPerKind) {
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    EXPECT_EQ(engine_->InitiateAddMerchant(bob_, user_, "Other", 1),
              ErrorCode::ProposalAlreadyActive);

    // Other kinds are independent
    EXPECT_EQ(engine_->InitiateChangeParameter(bob_, 20), ErrorCode::Ok);
    EXPECT_TRUE(engine_->IsVotingOpen(ProposalKind::AddMerchant));
    EXPECT_TRUE(engine_->IsVotingOpen(ProposalKind::ChangeParameter));
    EXPECT_FALSE(engine_->IsVotingOpen(ProposalKind::WithdrawFunds));
}

TEST_F(GovernanceTest, VoteChecks) {
    EXPECT_EQ(engine_->Vote(ProposalKind::ModifyMerchant, alice_), ErrorCode::NoActiveProposal);

    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    EXPECT_EQ(engine_->Vote(ProposalKind::AddMerchant, alice_), ErrorCode::AlreadyVoted);
    EXPECT_EQ(engine_->Vote(ProposalKind::AddMerchant, stranger_), ErrorCode::Unauthorized);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::AddMerchant).accumulatedPower, 100u);
    EXPECT_TRUE(engine_->HasVoted(ProposalKind::AddMerchant, alice_));
    EXPECT_FALSE(engine_->HasVoted(ProposalKind::AddMerchant, bob_));
}

TEST_F(GovernanceTest, VoteRecordsCurrentWeight) {
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    ASSERT_TRUE(token_.Transfer(bob_, user_, 20));
    ASSERT_EQ(engine_->Vote(ProposalKind::AddMerchant, bob_), ErrorCode::Ok);

    auto votes = engine_->GetVotes(ProposalKind::AddMerchant);
    ASSERT_EQ(votes.size(), 2u);
    Amount bobWeight = 0;
    for (const auto& vote : votes) {
        if (vote.first == bob_) bobWeight = vote.second;
    }
    EXPECT_EQ(bobWeight, 40u);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::AddMerchant).accumulatedPower, 140u);
    EXPECT_TRUE(engine_->GetSlot(ProposalKind::AddMerchant).active);
}

// ============================================================================
// Deadlines
// ============================================================================

TEST_F(GovernanceTest, ExpiredRoundRejectsVotesAndReopens) {
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    util::AdvanceMockTime(DEFAULT_VOTING_WINDOW + 1);

    EXPECT_FALSE(engine_->IsVotingOpen(ProposalKind::AddMerchant));
    EXPECT_EQ(engine_->Vote(ProposalKind::AddMerchant, bob_), ErrorCode::ProposalExpired);

    ASSERT_EQ(engine_->InitiateAddMerchant(bob_, user_, "Other", 2), ErrorCode::Ok);
    ProposalSlot slot = engine_->GetSlot(ProposalKind::AddMerchant);
    EXPECT_EQ(slot.round, 2u);
    EXPECT_EQ(slot.initiator, bob_);
    EXPECT_EQ(slot.accumulatedPower, 60u);

    auto ended = events_.FindByType(EventType::ProposalEnded);
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_FALSE(ended[0].flag);
    EXPECT_EQ(ended[0].round, 1u);

    // Votes from the old round do not carry over
    EXPECT_FALSE(engine_->HasVoted(ProposalKind::AddMerchant, alice_));
    EXPECT_EQ(engine_->Vote(ProposalKind::AddMerchant, alice_), ErrorCode::Ok);
    EXPECT_TRUE(ledger_->IsMerchant(user_));
    EXPECT_FALSE(ledger_->IsMerchant(shop_));
}

TEST_F(GovernanceTest, VoteAtDeadlineCounts) {
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    util::AdvanceMockTime(DEFAULT_VOTING_WINDOW);
    ASSERT_EQ(engine_->Vote(ProposalKind::AddMerchant, bob_), ErrorCode::Ok);
    EXPECT_TRUE(ledger_->IsMerchant(shop_));
}

TEST_F(GovernanceTest, ExecutedRoundCanBeFollowedImmediately) {
    AddShopThroughGovernance();
    EXPECT_EQ(engine_->InitiateAddMerchant(alice_, user_, "Next", 1), ErrorCode::Ok);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::AddMerchant).round, 2u);
}

// ============================================================================
// Execution Failures
// ============================================================================

TEST_F(GovernanceTest, FailedExecutionOnInitiationLeavesNoTrace) {
    const Address unknownAsset = AddressFromLabel("unknown-asset");
    EXPECT_EQ(engine_->InitiateWithdrawFunds(carol_, unknownAsset, Address()),
              ErrorCode::WithdrawFailed);

    ProposalSlot slot = engine_->GetSlot(ProposalKind::WithdrawFunds);
    EXPECT_EQ(slot.round, 0u);
    EXPECT_FALSE(slot.active);
    EXPECT_TRUE(engine_->GetVotes(ProposalKind::WithdrawFunds).empty());
    EXPECT_EQ(events_.Size(), 0u);
}

TEST_F(GovernanceTest, FailedExecutionOnVoteLeavesRoundOpen) {
    const Address unknownAsset = AddressFromLabel("unknown-asset");
    ASSERT_EQ(engine_->InitiateWithdrawFunds(alice_, unknownAsset, Address()), ErrorCode::Ok);
    size_t eventsBefore = events_.Size();

    EXPECT_EQ(engine_->Vote(ProposalKind::WithdrawFunds, carol_), ErrorCode::WithdrawFailed);

    ProposalSlot slot = engine_->GetSlot(ProposalKind::WithdrawFunds);
    EXPECT_TRUE(slot.active);
    EXPECT_EQ(slot.accumulatedPower, 100u);
    EXPECT_FALSE(engine_->HasVoted(ProposalKind::WithdrawFunds, carol_));
    EXPECT_EQ(events_.Size(), eventsBefore);
}

TEST_F(GovernanceTest, LedgerRejectionPropagates) {
    AddShopThroughGovernance();
    EXPECT_EQ(engine_->InitiateAddMerchant(carol_, shop_, "Again", 1),
              ErrorCode::DuplicateMerchant);
    EXPECT_EQ(engine_->InitiateModifyMerchant(carol_, shop_, Address(), false, 1, 11),
              ErrorCode::RebateOutOfRange);
}

// ============================================================================
// Proposal Kinds
// ============================================================================

TEST_F(GovernanceTest, ModifyMerchantFreezesAndUnfreezes) {
    AddShopThroughGovernance(100);

    ASSERT_EQ(engine_->InitiateModifyMerchant(carol_, shop_, Address(), true, 100, 0),
              ErrorCode::Ok);
    EXPECT_TRUE(ledger_->GetMerchant(shop_)->frozen);
    EXPECT_EQ(ledger_->Mint(shop_, user_, 10), ErrorCode::Frozen);

    ASSERT_EQ(engine_->InitiateModifyMerchant(carol_, shop_, Address(), false, 100, 5),
              ErrorCode::Ok);
    EXPECT_EQ(ledger_->Mint(shop_, user_, 10), ErrorCode::Ok);
    EXPECT_EQ(ledger_->GetMerchant(shop_)->rebate, 5u);
    // Guardian stays the initiator of the add proposal
    EXPECT_EQ(ledger_->GetMerchant(shop_)->guardian, carol_);
}

TEST_F(GovernanceTest, QuotaCycleThroughGovernedMerchant) {
    AddShopThroughGovernance(100);

    ASSERT_EQ(ledger_->Mint(shop_, user_, 100), ErrorCode::Ok);
    EXPECT_EQ(ledger_->Mint(shop_, user_, 1), ErrorCode::InvalidAmount);
    ASSERT_EQ(ledger_->Pay(shop_, user_, 50), ErrorCode::Ok);
    EXPECT_EQ(ledger_->Mint(shop_, user_, 50), ErrorCode::Ok);
}

TEST_F(GovernanceTest, ChangeParameter) {
    ASSERT_EQ(engine_->InitiateChangeParameter(carol_, 20), ErrorCode::Ok);
    EXPECT_EQ(engine_->GetMajorityPercentage(), 20u);
    EXPECT_EQ(engine_->GetThreshold(), 200u);

    auto changed = events_.FindByType(EventType::ParameterChanged);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].amount, 15u);
    EXPECT_EQ(changed[0].extra, 20u);

    EXPECT_EQ(engine_->InitiateChangeParameter(carol_, 0), ErrorCode::InvalidParameter);
    EXPECT_EQ(engine_->InitiateChangeParameter(carol_, MAX_MAJORITY_PERCENTAGE + 1),
              ErrorCode::InvalidParameter);
    EXPECT_EQ(engine_->GetMajorityPercentage(), 20u);
}

TEST_F(GovernanceTest, ThresholdFollowsLiveSupply) {
    ASSERT_TRUE(token_.Mint(user_, 1000));
    EXPECT_EQ(engine_->GetThreshold(), 300u);

    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1), ErrorCode::Ok);
    ASSERT_EQ(engine_->Vote(ProposalKind::AddMerchant, bob_), ErrorCode::Ok);
    EXPECT_FALSE(ledger_->IsMerchant(shop_));

    ASSERT_TRUE(token_.Burn(user_, 1000));
    ASSERT_EQ(engine_->InitiateChangeParameter(bob_, 10), ErrorCode::Ok);
    // Next vote re-evaluates against the smaller supply
    ASSERT_EQ(engine_->Vote(ProposalKind::ChangeParameter, alice_), ErrorCode::Ok);
    EXPECT_EQ(engine_->GetMajorityPercentage(), 10u);
}

TEST_F(GovernanceTest, WithdrawNullBeneficiaryPaysInitiator) {
    ASSERT_TRUE(native_.Mint(vault_, 500));
    ASSERT_EQ(engine_->InitiateWithdrawFunds(carol_, Address(), Address()), ErrorCode::Ok);
    EXPECT_EQ(native_.BalanceOf(carol_), 500u);
    EXPECT_EQ(native_.BalanceOf(vault_), 0u);

    ASSERT_TRUE(native_.Mint(vault_, 7));
    ASSERT_EQ(engine_->InitiateWithdrawFunds(carol_, Address(), user_), ErrorCode::Ok);
    EXPECT_EQ(native_.BalanceOf(user_), 7u);
}

TEST_F(GovernanceTest, PayloadMustMatchKind) {
    EXPECT_EQ(engine_->Initiate(ProposalKind::AddMerchant, ChangeParameterPayload{20}, carol_),
              ErrorCode::InvalidParameter);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::AddMerchant).round, 0u);
    EXPECT_EQ(engine_->GetMajorityPercentage(), DEFAULT_MAJORITY_PERCENTAGE);
}

// ============================================================================
// Deposits
// ============================================================================

TEST_F(GovernanceTest, DepositCollectedWithAllowance) {
    ASSERT_TRUE(token_.Approve(alice_, engineAddress_, 10));
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 1, 10), ErrorCode::Ok);

    ProposalSlot slot = engine_->GetSlot(ProposalKind::AddMerchant);
    EXPECT_TRUE(slot.depositTaken);
    EXPECT_EQ(slot.depositRequested, 10u);
    EXPECT_EQ(slot.depositCollected, 10u);
    EXPECT_EQ(slot.accumulatedPower, 100u);
    EXPECT_EQ(token_.BalanceOf(vault_), 10u);
    EXPECT_EQ(token_.BalanceOf(alice_), 90u);

    auto deposits = events_.FindByType(EventType::DepositCollected);
    ASSERT_EQ(deposits.size(), 1u);
    EXPECT_EQ(deposits[0].actor, alice_);
    EXPECT_EQ(deposits[0].amount, 10u);
}

TEST_F(GovernanceTest, DepositShortfallDoesNotFailInitiation) {
    ASSERT_EQ(engine_->InitiateAddMerchant(bob_, shop_, "Shop", 1, 10), ErrorCode::Ok);

    ProposalSlot slot = engine_->GetSlot(ProposalKind::AddMerchant);
    EXPECT_TRUE(slot.active);
    EXPECT_FALSE(slot.depositTaken);
    EXPECT_EQ(slot.depositRequested, 10u);
    EXPECT_EQ(slot.depositCollected, 0u);
    EXPECT_EQ(token_.BalanceOf(bob_), 60u);
    EXPECT_TRUE(events_.FindByType(EventType::DepositCollected).empty());
}

TEST_F(GovernanceTest, ReentrantVoteFromDepositTransferIsRefused) {
    ASSERT_EQ(engine_->InitiateChangeParameter(alice_, 20), ErrorCode::Ok);
    ASSERT_TRUE(token_.Approve(bob_, engineAddress_, 5));

    ErrorCode inner = ErrorCode::Ok;
    bool fired = false;
    token_.SetTransferHook([&](const Address&, const Address&, Amount) {
        if (!fired) {
            fired = true;
            inner = engine_->Vote(ProposalKind::ChangeParameter, bob_);
        }
    });

    ASSERT_EQ(engine_->InitiateAddMerchant(bob_, shop_, "Shop", 1, 5), ErrorCode::Ok);
    EXPECT_TRUE(fired);
    EXPECT_EQ(inner, ErrorCode::Reentrancy);
    EXPECT_FALSE(engine_->HasVoted(ProposalKind::ChangeParameter, bob_));
    EXPECT_TRUE(engine_->GetSlot(ProposalKind::AddMerchant).depositTaken);
}

TEST_F(GovernanceTest, InitiateFromLedgerMintHookIsRefused) {
    AddShopThroughGovernance(100);

    ErrorCode inner = ErrorCode::Ok;
    bool fired = false;
    token_.SetTransferHook([&](const Address&, const Address&, Amount) {
        if (!fired) {
            fired = true;
            inner = engine_->InitiateChangeParameter(carol_, 25);
        }
    });

    ASSERT_EQ(ledger_->Mint(shop_, user_, 10), ErrorCode::Ok);
    EXPECT_TRUE(fired);
    EXPECT_EQ(inner, ErrorCode::Reentrancy);
    EXPECT_EQ(engine_->GetMajorityPercentage(), DEFAULT_MAJORITY_PERCENTAGE);
    EXPECT_EQ(engine_->GetSlot(ProposalKind::ChangeParameter).round, 0u);
    EXPECT_TRUE(events_.FindByType(EventType::ParameterChanged).empty());
    EXPECT_EQ(token_.BalanceOf(user_), 10u);
}

TEST_F(GovernanceTest, LedgerMintFromDepositTransferIsRefused) {
    AddShopThroughGovernance(100);
    ASSERT_TRUE(token_.Approve(alice_, engineAddress_, 5));

    ErrorCode inner = ErrorCode::Ok;
    bool fired = false;
    token_.SetTransferHook([&](const Address&, const Address&, Amount) {
        if (!fired) {
            fired = true;
            inner = ledger_->Mint(shop_, user_, 7);
        }
    });

    ASSERT_EQ(engine_->InitiateModifyMerchant(alice_, shop_, Address(), false, 100, 0, 5),
              ErrorCode::Ok);
    EXPECT_TRUE(fired);
    EXPECT_EQ(inner, ErrorCode::Reentrancy);
    EXPECT_EQ(token_.BalanceOf(user_), 0u);
    EXPECT_EQ(ledger_->GetMerchant(shop_)->totalCashReceived, 0u);
    EXPECT_TRUE(engine_->GetSlot(ProposalKind::ModifyMerchant).depositTaken);
    EXPECT_FALSE(ledger_->GetGuard().IsEntered());
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(GovernanceTest, SerializeRestoresOpenRound) {
    ASSERT_EQ(engine_->InitiateChangeParameter(carol_, 25), ErrorCode::Ok);
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 9), ErrorCode::Ok);
    auto blob = engine_->Serialize();

    GovernanceEngine restored(power_, token_, *ledger_, events_, params_);
    ASSERT_TRUE(restored.Deserialize(blob.data(), blob.size()));
    EXPECT_EQ(restored.GetMajorityPercentage(), 25u);
    EXPECT_TRUE(restored.HasVoted(ProposalKind::AddMerchant, alice_));

    ProposalSlot slot = restored.GetSlot(ProposalKind::AddMerchant);
    EXPECT_TRUE(slot.active);
    EXPECT_EQ(slot.accumulatedPower, 100u);
    ASSERT_TRUE(std::holds_alternative<AddMerchantPayload>(slot.payload));
    EXPECT_EQ(std::get<AddMerchantPayload>(slot.payload).name, "Shop");

    EXPECT_EQ(restored.Vote(ProposalKind::AddMerchant, alice_), ErrorCode::AlreadyVoted);
    // 100 + 840 >= 250
    ASSERT_EQ(restored.Vote(ProposalKind::AddMerchant, carol_), ErrorCode::Ok);
    EXPECT_TRUE(ledger_->IsMerchant(shop_));
}

TEST_F(GovernanceTest, DeserializeRejectsCorruptData) {
    ASSERT_EQ(engine_->InitiateAddMerchant(alice_, shop_, "Shop", 9), ErrorCode::Ok);
    auto blob = engine_->Serialize();

    GovernanceEngine restored(power_, token_, *ledger_, events_, params_);
    EXPECT_FALSE(restored.Deserialize(blob.data(), blob.size() - 1));

    auto badVersion = blob;
    badVersion[0] = 7;
    EXPECT_FALSE(restored.Deserialize(badVersion.data(), badVersion.size()));

    auto trailing = blob;
    trailing.push_back(0);
    EXPECT_FALSE(restored.Deserialize(trailing.data(), trailing.size()));

    EXPECT_EQ(restored.GetSlot(ProposalKind::AddMerchant).round, 0u);
}
