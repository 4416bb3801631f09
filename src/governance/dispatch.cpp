// QUORUM - Proposal Execution Dispatch Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/governance/dispatch.h"

namespace quorum {
namespace governance {

ErrorCode ExecutionDispatcher::Dispatch(const ProposalSlot& slot,
                                        const ParameterSetter& setParameter,
                                        const ReentrancyGuard::Scope& held) const {
    switch (KindOf(slot.payload)) {
        case ProposalKind::AddMerchant: {
            const auto& p = std::get<AddMerchantPayload>(slot.payload);
            return ledger_.AddMerchant(held, caller_, p.merchant, p.name, p.quota, slot.initiator);
        }
        case ProposalKind::ModifyMerchant: {
            const auto& p = std::get<ModifyMerchantPayload>(slot.payload);
            return ledger_.ModifyMerchant(held, caller_, p.merchant, p.newGuardian,
                                          p.freeze, p.quota, p.rebate);
        }
        case ProposalKind::ChangeParameter: {
            const auto& p = std::get<ChangeParameterPayload>(slot.payload);
            return setParameter ? setParameter(p.majorityPercentage) : ErrorCode::InvalidParameter;
        }
        case ProposalKind::WithdrawFunds: {
            const auto& p = std::get<WithdrawFundsPayload>(slot.payload);
            const Address& beneficiary = p.beneficiary.IsNull() ? slot.initiator : p.beneficiary;
            return ledger_.Withdraw(held, caller_, p.asset, beneficiary);
        }
    }
    return ErrorCode::InvalidParameter;
}

} // namespace governance
} // namespace quorum
