// QUORUM - Proposal Execution Dispatch
// Copyright (c) 2024 QUORUM Developers
// MIT License

#ifndef QUORUM_GOVERNANCE_DISPATCH_H
#define QUORUM_GOVERNANCE_DISPATCH_H

#include "quorum/core/errors.h"
#include "quorum/core/reentrancy.h"
#include "quorum/governance/proposal.h"
#include "quorum/ledger/merchant_ledger.h"

#include <functional>

namespace quorum {
namespace governance {

/**
 * Routes a passed proposal to the call that carries it out.
 *
 *   AddMerchant     -> MerchantLedger::AddMerchant (guardian = initiator)
 *   ModifyMerchant  -> MerchantLedger::ModifyMerchant
 *   ChangeParameter -> the engine's parameter setter
 *   WithdrawFunds   -> MerchantLedger::Withdraw (null beneficiary = initiator)
 *
 * The payload is passed through as stored. Whatever the ledger rejects is
 * returned unchanged; nothing is re-validated here.
 *
 * Runs inside an engine call, so the ledger is entered through its owner
 * path with the engine's scope on the shared guard.
 */
class ExecutionDispatcher {
public:
    using ParameterSetter = std::function<ErrorCode(uint32_t majorityPercentage)>;

    /// `caller` is the engine's own account, the ledger owner
    ExecutionDispatcher(ledger::MerchantLedger& ledger, const Address& caller)
        : ledger_(ledger), caller_(caller) {}

    ErrorCode Dispatch(const ProposalSlot& slot, const ParameterSetter& setParameter,
                       const ReentrancyGuard::Scope& held) const;

private:
    ledger::MerchantLedger& ledger_;
    Address caller_;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_DISPATCH_H
