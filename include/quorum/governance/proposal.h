// QUORUM - Proposal Slots and Vote Registry
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// One mutable ProposalSlot exists per proposal kind. A slot is reused for
// every round of its kind; the round id increments on each initiation and is
// never reused, so vote records from older rounds can never collide with the
// current one.

#ifndef QUORUM_GOVERNANCE_PROPOSAL_H
#define QUORUM_GOVERNANCE_PROPOSAL_H

#include "quorum/core/serialize.h"
#include "quorum/core/types.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace quorum {
namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Voting window (7 days)
constexpr int64_t DEFAULT_VOTING_WINDOW = 7 * 24 * 60 * 60;

/// Percentage of total weight a proposal must accumulate
constexpr uint32_t DEFAULT_MAJORITY_PERCENTAGE = 15;

/// Upper bound for ChangeParameter proposals (lower bound is exclusive 0)
constexpr uint32_t MAX_MAJORITY_PERCENTAGE = 30;

// ============================================================================
// Proposal Kinds and Payloads
// ============================================================================

enum class ProposalKind : uint8_t {
    AddMerchant = 0,
    ModifyMerchant = 1,
    ChangeParameter = 2,
    WithdrawFunds = 3,
};

constexpr size_t PROPOSAL_KIND_COUNT = 4;

/// All kinds, in slot order
constexpr std::array<ProposalKind, PROPOSAL_KIND_COUNT> ALL_PROPOSAL_KINDS = {
    ProposalKind::AddMerchant,
    ProposalKind::ModifyMerchant,
    ProposalKind::ChangeParameter,
    ProposalKind::WithdrawFunds,
};

const char* ProposalKindToString(ProposalKind kind);

/// Accepts "add", "modify", "param", "withdraw" and the full kind names
std::optional<ProposalKind> ParseProposalKind(const std::string& str);

struct AddMerchantPayload {
    Address merchant;
    std::string name;
    Amount quota{0};
};

struct ModifyMerchantPayload {
    Address merchant;
    /// Null keeps the current guardian
    Address newGuardian;
    bool freeze{false};
    Amount quota{0};
    uint32_t rebate{0};
};

struct ChangeParameterPayload {
    uint32_t majorityPercentage{0};
};

struct WithdrawFundsPayload {
    /// Null address selects the native currency
    Address asset;
    /// Null address pays the proposal initiator
    Address beneficiary;
};

/// Variant alternatives are ordered like ProposalKind
using ProposalPayload = std::variant<
    AddMerchantPayload,
    ModifyMerchantPayload,
    ChangeParameterPayload,
    WithdrawFundsPayload
>;

inline ProposalKind KindOf(const ProposalPayload& payload) {
    return static_cast<ProposalKind>(payload.index());
}

/// Default-constructed payload of the given kind
ProposalPayload EmptyPayload(ProposalKind kind);

std::string DescribePayload(const ProposalPayload& payload);

// ============================================================================
// Proposal Slot
// ============================================================================

/**
 * State of the single live proposal of one kind.
 *
 * Idle and Expired slots are both "not open"; a new initiation is accepted
 * from either. accumulatedPower only grows while the slot is active.
 */
struct ProposalSlot {
    ProposalKind kind{ProposalKind::AddMerchant};

    /// Open for voting (may still be past its deadline until closed lazily)
    bool active{false};

    /// Last round ended through execution
    bool executed{false};

    /// Current round id; 0 before the first initiation
    uint64_t round{0};

    Amount accumulatedPower{0};

    Timestamp openedAt{0};
    Timestamp deadline{0};

    Address initiator;

    /// Deposit the initiator offered, and what was actually collected
    Amount depositRequested{0};
    Amount depositCollected{0};
    bool depositTaken{false};

    ProposalPayload payload;

    bool IsExpired(Timestamp now) const { return now > deadline; }

    /// Active and not past the deadline
    bool IsOpen(Timestamp now) const { return active && !IsExpired(now); }

    std::string ToString() const;
};

void SerializeSlot(DataStream& s, const ProposalSlot& slot);

/// Throws std::ios_base::failure on malformed input
ProposalSlot UnserializeSlot(DataStream& s);

// ============================================================================
// Vote Registry
// ============================================================================

/// (kind, round, voter) -> weight counted when the vote was cast
class VoteRegistry {
public:
    bool HasVoted(ProposalKind kind, uint64_t round, const Address& voter) const;

    /// Returns false if the voter already has a record for this round
    bool Record(ProposalKind kind, uint64_t round, const Address& voter, Amount weight);

    /// Votes of one round, ordered by voter address
    std::vector<std::pair<Address, Amount>> GetVotes(ProposalKind kind, uint64_t round) const;

    /// Drop all records of `kind` with a round id below `round`
    void PruneBefore(ProposalKind kind, uint64_t round);

    size_t Size() const { return votes_.size(); }
    void Clear() { votes_.clear(); }

    void Serialize(DataStream& s) const;
    void Unserialize(DataStream& s);

private:
    struct Key {
        ProposalKind kind;
        uint64_t round;
        Address voter;

        bool operator<(const Key& other) const {
            if (kind != other.kind) return kind < other.kind;
            if (round != other.round) return round < other.round;
            return voter < other.voter;
        }
    };

    std::map<Key, Amount> votes_;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_PROPOSAL_H
