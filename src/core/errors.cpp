// QUORUM - Error Codes Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/errors.h"

namespace quorum {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::NoActiveProposal: return "NoActiveProposal";
        case ErrorCode::ProposalAlreadyActive: return "ProposalAlreadyActive";
        case ErrorCode::AlreadyVoted: return "AlreadyVoted";
        case ErrorCode::ProposalExpired: return "ProposalExpired";
        case ErrorCode::DuplicateMerchant: return "DuplicateMerchant";
        case ErrorCode::NotRegisteredMerchant: return "NotRegisteredMerchant";
        case ErrorCode::Frozen: return "Frozen";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::RebateOutOfRange: return "RebateOutOfRange";
        case ErrorCode::InvalidParameter: return "InvalidParameter";
        case ErrorCode::WithdrawFailed: return "WithdrawFailed";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::Reentrancy: return "Reentrancy";
        default: return "Unknown";
    }
}

ErrorCategory GetErrorCategory(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorCategory::None;
        case ErrorCode::Unauthorized:
            return ErrorCategory::Unauthorized;
        case ErrorCode::NoActiveProposal:
        case ErrorCode::ProposalAlreadyActive:
        case ErrorCode::AlreadyVoted:
        case ErrorCode::ProposalExpired:
        case ErrorCode::DuplicateMerchant:
        case ErrorCode::NotRegisteredMerchant:
        case ErrorCode::Reentrancy:
            return ErrorCategory::InvalidState;
        case ErrorCode::InvalidAmount:
        case ErrorCode::RebateOutOfRange:
        case ErrorCode::InvalidParameter:
            return ErrorCategory::InvalidAmount;
        case ErrorCode::Frozen:
            return ErrorCategory::Frozen;
        case ErrorCode::WithdrawFailed:
        case ErrorCode::TransferFailed:
            return ErrorCategory::TransferFailed;
    }
    return ErrorCategory::InvalidState;
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Unauthorized: return "Unauthorized";
        case ErrorCategory::InvalidState: return "InvalidState";
        case ErrorCategory::InvalidAmount: return "InvalidAmount";
        case ErrorCategory::Frozen: return "Frozen";
        case ErrorCategory::TransferFailed: return "TransferFailed";
        default: return "Unknown";
    }
}

} // namespace quorum
