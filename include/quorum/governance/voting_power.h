// QUORUM - Voting Power Source
// Copyright (c) 2024 QUORUM Developers
// MIT License

#ifndef QUORUM_GOVERNANCE_VOTING_POWER_H
#define QUORUM_GOVERNANCE_VOTING_POWER_H

#include "quorum/core/types.h"
#include "quorum/token/token.h"

namespace quorum {
namespace governance {

/**
 * Read-only view of voting weight.
 *
 * Weights are read live at the moment of each call; nothing is snapshotted.
 * A holder can vote, transfer its tokens and vote again from the receiving
 * account in the same round. This is a known limitation of live-balance
 * voting and is not guarded against.
 */
class IVotingPowerSource {
public:
    virtual ~IVotingPowerSource() = default;

    virtual Amount WeightOf(const Address& account) const = 0;
    virtual Amount TotalWeight() const = 0;
};

/// Voting weight = token balance, total weight = token supply
class TokenVotingPower : public IVotingPowerSource {
public:
    explicit TokenVotingPower(const IFungibleToken& token) : token_(token) {}

    Amount WeightOf(const Address& account) const override {
        return token_.BalanceOf(account);
    }

    Amount TotalWeight() const override {
        return token_.TotalSupply();
    }

private:
    const IFungibleToken& token_;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_VOTING_POWER_H
