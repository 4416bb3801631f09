// QUORUM - Error Codes
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Result codes returned by every ledger and governance entry point.
// A non-Ok code always means the call changed nothing.

#ifndef QUORUM_CORE_ERRORS_H
#define QUORUM_CORE_ERRORS_H

#include <cstdint>

namespace quorum {

/// Result of a ledger or governance operation
enum class ErrorCode : uint8_t {
    Ok = 0,

    /// Caller has no voting weight or lacks the owner/guardian role
    Unauthorized,

    /// Vote on a kind with no open proposal
    NoActiveProposal,

    /// Initiation while an unexpired proposal of the kind is open
    ProposalAlreadyActive,

    /// Voter already counted in the current round
    AlreadyVoted,

    /// Vote after the proposal deadline
    ProposalExpired,

    /// Merchant address already registered
    DuplicateMerchant,

    /// Caller or subject is not a registered merchant
    NotRegisteredMerchant,

    /// Merchant is frozen
    Frozen,

    /// Zero amount, quota exceeded, overflow or insufficient balance
    InvalidAmount,

    /// Rebate above the ceiling
    RebateOutOfRange,

    /// Proposal or call parameter outside its allowed range
    InvalidParameter,

    /// Asset withdrawal could not be performed
    WithdrawFailed,

    /// Underlying token movement failed
    TransferFailed,

    /// Nested call into a component that is already executing
    Reentrancy,
};

/// Error taxonomy groups
enum class ErrorCategory {
    None,
    Unauthorized,
    InvalidState,
    InvalidAmount,
    Frozen,
    TransferFailed,
};

const char* ErrorCodeToString(ErrorCode code);

ErrorCategory GetErrorCategory(ErrorCode code);

const char* ErrorCategoryToString(ErrorCategory category);

} // namespace quorum

#endif // QUORUM_CORE_ERRORS_H
