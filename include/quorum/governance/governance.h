// QUORUM - Governance Engine
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Threshold-gated weighted voting over the merchant ledger.
//
// Key features:
// - One proposal slot per kind (AddMerchant, ModifyMerchant,
//   ChangeParameter, WithdrawFunds), at most one open round per kind
// - Voting weight is the voter's live token balance
// - A proposal executes as soon as its accumulated weight reaches
//   majorityPercentage of the live total supply, before its deadline
// - Expired rounds are closed lazily by the next initiation of the kind
// - Every call is all-or-nothing: a failed call leaves slots, vote
//   records, the ledger and the event log untouched
// - Engine and ledger share one reentrancy guard: a token callback during
//   any in-flight call of either is refused with Reentrancy

#ifndef QUORUM_GOVERNANCE_GOVERNANCE_H
#define QUORUM_GOVERNANCE_GOVERNANCE_H

#include "quorum/core/errors.h"
#include "quorum/core/events.h"
#include "quorum/core/reentrancy.h"
#include "quorum/core/types.h"
#include "quorum/governance/dispatch.h"
#include "quorum/governance/proposal.h"
#include "quorum/governance/voting_power.h"
#include "quorum/ledger/merchant_ledger.h"
#include "quorum/token/token.h"

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace quorum {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Engine Parameters
// ============================================================================

struct GovernanceParams {
    /// The engine's own account; must be the ledger owner
    Address address;

    /// Seconds from initiation to deadline
    int64_t votingWindow{DEFAULT_VOTING_WINDOW};

    /// Initial majority percentage, (0, MAX_MAJORITY_PERCENTAGE]
    uint32_t majorityPercentage{DEFAULT_MAJORITY_PERCENTAGE};

    bool IsValid() const;

    /// Reads owner, votingwindow and majority
    static GovernanceParams FromConfig(const util::ConfigManager& config);
};

/// True for a majority percentage a ChangeParameter proposal may carry
inline bool IsValidMajority(uint32_t percentage) {
    return percentage > 0 && percentage <= MAX_MAJORITY_PERCENTAGE;
}

// ============================================================================
// Governance Engine
// ============================================================================

class GovernanceEngine {
public:
    /**
     * @param power         Source of voting weight
     * @param depositToken  Token initiation deposits are drawn from
     * @param ledger        Ledger owned by params.address
     * @param events        Event sink shared with the ledger
     */
    GovernanceEngine(const IVotingPowerSource& power, IFungibleToken& depositToken,
                     ledger::MerchantLedger& ledger, EventLog& events,
                     const GovernanceParams& params);

    // ========================================================================
    // Initiation
    // ========================================================================

    /**
     * Open a new round of `kind` and count the caller's vote.
     *
     * Fails with Unauthorized (no weight), InvalidParameter (payload does not
     * match kind, or majority outside (0, 30]) or ProposalAlreadyActive.
     * An expired open round is closed first. If the caller alone reaches the
     * threshold the proposal executes in this call, and a dispatch failure
     * fails the call.
     *
     * `deposit` is drawn from the caller with TransferFrom into the ledger
     * vault after the round opened. A missing allowance or balance does not
     * fail the call; the slot then records depositTaken=false.
     */
    ErrorCode Initiate(ProposalKind kind, const ProposalPayload& payload,
                       const Address& caller, Amount deposit = 0);

    ErrorCode InitiateAddMerchant(const Address& caller, const Address& merchant,
                                  const std::string& name, Amount quota,
                                  Amount deposit = 0);

    ErrorCode InitiateModifyMerchant(const Address& caller, const Address& merchant,
                                     const Address& newGuardian, bool freeze,
                                     Amount quota, uint32_t rebate, Amount deposit = 0);

    ErrorCode InitiateChangeParameter(const Address& caller, uint32_t majorityPercentage,
                                      Amount deposit = 0);

    ErrorCode InitiateWithdrawFunds(const Address& caller, const Address& asset,
                                    const Address& beneficiary, Amount deposit = 0);

    // ========================================================================
    // Voting
    // ========================================================================

    /// Add the caller's live weight to the open round of `kind`.
    /// A vote exactly at the deadline counts; one after it is ProposalExpired.
    ErrorCode Vote(ProposalKind kind, const Address& caller);

    // ========================================================================
    // Queries
    // ========================================================================

    ProposalSlot GetSlot(ProposalKind kind) const;

    /// Active and not past its deadline
    bool IsVotingOpen(ProposalKind kind) const;

    /// Whether voter is counted in the current round of kind
    bool HasVoted(ProposalKind kind, const Address& voter) const;

    /// Votes of the current round of kind
    std::vector<std::pair<Address, Amount>> GetVotes(ProposalKind kind) const;

    uint32_t GetMajorityPercentage() const;

    /// floor(totalWeight * majority / 100) at this moment
    Amount GetThreshold() const;

    int64_t GetVotingWindow() const { return params_.votingWindow; }

    const Address& GetAddress() const { return params_.address; }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Slots, vote records and the current majority percentage
    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    /// Threshold test and dispatch on a working copy of the slot.
    /// No-op once the deadline has passed.
    ErrorCode TryExecute(ProposalSlot& slot, Timestamp now, uint32_t& majority,
                         const ReentrancyGuard::Scope& held);

    /// Best-effort deposit into the ledger vault
    void CollectDeposit(ProposalSlot& slot, const Address& caller);

    void Emit(EventType type, const ProposalSlot& slot, const Address& actor,
              Amount amount = 0, Amount extra = 0, bool flag = false);

    ErrorCode Reject(ErrorCode code, const char* operation, ProposalKind kind,
                     const Address& caller) const;

    ProposalSlot& SlotFor(ProposalKind kind) { return slots_[static_cast<size_t>(kind)]; }
    const ProposalSlot& SlotFor(ProposalKind kind) const {
        return slots_[static_cast<size_t>(kind)];
    }

    const IVotingPowerSource& power_;
    IFungibleToken& depositToken_;
    ledger::MerchantLedger& ledger_;
    EventLog& events_;
    GovernanceParams params_;
    ExecutionDispatcher dispatcher_;

    /// Taken after the ledger's mutex; the reentrancy guard is the ledger's
    mutable std::recursive_mutex mutex_;

    std::array<ProposalSlot, PROPOSAL_KIND_COUNT> slots_;
    VoteRegistry votes_;
    uint32_t majorityPercentage_;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_GOVERNANCE_H
