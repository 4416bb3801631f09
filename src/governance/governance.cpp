// QUORUM - Governance Engine Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/governance/governance.h"
#include "quorum/core/serialize.h"
#include "quorum/crypto/sha256.h"
#include "quorum/util/config.h"
#include "quorum/util/logging.h"
#include "quorum/util/time.h"

namespace quorum {
namespace governance {

namespace {
constexpr uint8_t ENGINE_STATE_VERSION = 1;
}

// ============================================================================
// GovernanceParams
// ============================================================================

bool GovernanceParams::IsValid() const {
    return !address.IsNull() && votingWindow > 0 && IsValidMajority(majorityPercentage);
}

GovernanceParams GovernanceParams::FromConfig(const util::ConfigManager& config) {
    GovernanceParams params;
    params.address = ParseAddress(config.GetString(util::ConfigKeys::OWNER, "governance"));
    params.votingWindow = config.GetInt(util::ConfigKeys::VOTINGWINDOW, DEFAULT_VOTING_WINDOW);
    params.majorityPercentage = static_cast<uint32_t>(
        config.GetUInt(util::ConfigKeys::MAJORITY, DEFAULT_MAJORITY_PERCENTAGE));
    return params;
}

// ============================================================================
// GovernanceEngine
// ============================================================================

GovernanceEngine::GovernanceEngine(const IVotingPowerSource& power, IFungibleToken& depositToken,
                                   ledger::MerchantLedger& ledger, EventLog& events,
                                   const GovernanceParams& params)
    : power_(power)
    , depositToken_(depositToken)
    , ledger_(ledger)
    , events_(events)
    , params_(params)
    , dispatcher_(ledger, params.address)
    , majorityPercentage_(params.majorityPercentage) {
    for (ProposalKind kind : ALL_PROPOSAL_KINDS) {
        ProposalSlot& slot = SlotFor(kind);
        slot.kind = kind;
        slot.payload = EmptyPayload(kind);
    }
    if (!IsValidMajority(majorityPercentage_)) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Majority " << majorityPercentage_
                                                << "% out of range, using "
                                                << DEFAULT_MAJORITY_PERCENTAGE << "%";
        majorityPercentage_ = DEFAULT_MAJORITY_PERCENTAGE;
    }
    if (params_.address != ledger_.GetOwner()) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Engine account " << params_.address.ToShortString()
                                                << " does not own the ledger; executions will fail";
    }
}

void GovernanceEngine::Emit(EventType type, const ProposalSlot& slot, const Address& actor,
                            Amount amount, Amount extra, bool flag) {
    Event event;
    event.type = type;
    event.round = slot.round;
    event.actor = actor;
    event.amount = amount;
    event.extra = extra;
    event.flag = flag;
    event.detail = ProposalKindToString(slot.kind);
    events_.Emit(std::move(event));
}

ErrorCode GovernanceEngine::Reject(ErrorCode code, const char* operation, ProposalKind kind,
                                   const Address& caller) const {
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << operation << " " << ProposalKindToString(kind)
                                             << " by " << caller.ToShortString()
                                             << " rejected: " << ErrorCodeToString(code);
    return code;
}

// ============================================================================
// Execution
// ============================================================================

ErrorCode GovernanceEngine::TryExecute(ProposalSlot& slot, Timestamp now, uint32_t& majority,
                                       const ReentrancyGuard::Scope& held) {
    if (!slot.active || slot.IsExpired(now)) {
        return ErrorCode::Ok;
    }

    Amount threshold = PercentOf(power_.TotalWeight(), majority);
    if (slot.accumulatedPower < threshold) {
        return ErrorCode::Ok;
    }

    auto setParameter = [&](uint32_t newMajority) {
        Event event;
        event.type = EventType::ParameterChanged;
        event.round = slot.round;
        event.amount = majority;
        event.extra = newMajority;
        event.detail = ProposalKindToString(slot.kind);
        events_.Emit(std::move(event));
        majority = newMajority;
        return ErrorCode::Ok;
    };

    ErrorCode rc = dispatcher_.Dispatch(slot, setParameter, held);
    if (rc != ErrorCode::Ok) {
        LOG_INFO(util::LogCategory::GOVERNANCE) << ProposalKindToString(slot.kind) << " round "
                                                << slot.round << " passed but execution failed: "
                                                << ErrorCodeToString(rc);
        return rc;
    }

    slot.active = false;
    slot.executed = true;
    Emit(EventType::ProposalExecuted, slot, slot.initiator, slot.accumulatedPower, threshold);
    Emit(EventType::ProposalEnded, slot, slot.initiator, 0, 0, true);

    LOG_INFO(util::LogCategory::GOVERNANCE) << ProposalKindToString(slot.kind) << " round "
                                            << slot.round << " executed with " << slot.accumulatedPower
                                            << " of " << threshold << " required";
    return ErrorCode::Ok;
}

void GovernanceEngine::CollectDeposit(ProposalSlot& slot, const Address& caller) {
    slot.depositCollected = 0;
    slot.depositTaken = false;
    if (slot.depositRequested == 0) {
        return;
    }

    if (depositToken_.TransferFrom(params_.address, caller, ledger_.GetVault(),
                                   slot.depositRequested)) {
        slot.depositCollected = slot.depositRequested;
        slot.depositTaken = true;
        Emit(EventType::DepositCollected, slot, caller, slot.depositCollected);
    } else {
        LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Deposit of " << slot.depositRequested
                                                 << " from " << caller.ToShortString()
                                                 << " not collected, proceeding without it";
    }
}

// ============================================================================
// Initiation
// ============================================================================

ErrorCode GovernanceEngine::Initiate(ProposalKind kind, const ProposalPayload& payload,
                                     const Address& caller, Amount deposit) {
    std::lock_guard<std::recursive_mutex> ledgerLock(ledger_.GetMutex());
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(ledger_.GetGuard());
    if (!scope.Acquired()) {
        return Reject(ErrorCode::Reentrancy, "Initiate", kind, caller);
    }

    Timestamp now = util::GetTime();

    Amount weight = power_.WeightOf(caller);
    if (weight == 0) {
        return Reject(ErrorCode::Unauthorized, "Initiate", kind, caller);
    }
    if (KindOf(payload) != kind) {
        return Reject(ErrorCode::InvalidParameter, "Initiate", kind, caller);
    }
    if (kind == ProposalKind::ChangeParameter &&
        !IsValidMajority(std::get<ChangeParameterPayload>(payload).majorityPercentage)) {
        return Reject(ErrorCode::InvalidParameter, "Initiate", kind, caller);
    }

    ProposalSlot slot = SlotFor(kind);
    if (slot.IsOpen(now)) {
        return Reject(ErrorCode::ProposalAlreadyActive, "Initiate", kind, caller);
    }

    EventLog::Batch batch(events_);

    if (slot.active) {
        slot.active = false;
        slot.executed = false;
        Emit(EventType::ProposalEnded, slot, slot.initiator, 0, 0, false);
        LOG_INFO(util::LogCategory::GOVERNANCE) << ProposalKindToString(kind) << " round "
                                                << slot.round << " expired with "
                                                << slot.accumulatedPower << " votes";
    }

    slot.round += 1;
    slot.active = true;
    slot.executed = false;
    slot.accumulatedPower = weight;
    slot.openedAt = now;
    slot.deadline = now + params_.votingWindow;
    slot.initiator = caller;
    slot.depositRequested = deposit;
    slot.depositCollected = 0;
    slot.depositTaken = false;
    slot.payload = payload;

    Emit(EventType::ProposalInitiated, slot, caller, weight);
    Emit(EventType::VoteCast, slot, caller, weight, slot.accumulatedPower);

    LOG_INFO(util::LogCategory::GOVERNANCE) << ProposalKindToString(kind) << " round "
                                            << slot.round << " opened by "
                                            << caller.ToShortString() << ": "
                                            << DescribePayload(payload) << ", deadline "
                                            << util::FormatISO8601(slot.deadline);

    uint32_t majority = majorityPercentage_;
    ErrorCode rc = TryExecute(slot, now, majority, scope);
    if (rc != ErrorCode::Ok) {
        return Reject(rc, "Initiate", kind, caller);
    }

    CollectDeposit(slot, caller);

    SlotFor(kind) = slot;
    votes_.PruneBefore(kind, slot.round);
    votes_.Record(kind, slot.round, caller, weight);
    majorityPercentage_ = majority;
    batch.Commit();
    return ErrorCode::Ok;
}

ErrorCode GovernanceEngine::InitiateAddMerchant(const Address& caller, const Address& merchant,
                                                const std::string& name, Amount quota,
                                                Amount deposit) {
    AddMerchantPayload payload;
    payload.merchant = merchant;
    payload.name = name;
    payload.quota = quota;
    return Initiate(ProposalKind::AddMerchant, payload, caller, deposit);
}

ErrorCode GovernanceEngine::InitiateModifyMerchant(const Address& caller, const Address& merchant,
                                                   const Address& newGuardian, bool freeze,
                                                   Amount quota, uint32_t rebate,
                                                   Amount deposit) {
    ModifyMerchantPayload payload;
    payload.merchant = merchant;
    payload.newGuardian = newGuardian;
    payload.freeze = freeze;
    payload.quota = quota;
    payload.rebate = rebate;
    return Initiate(ProposalKind::ModifyMerchant, payload, caller, deposit);
}

ErrorCode GovernanceEngine::InitiateChangeParameter(const Address& caller,
                                                    uint32_t majorityPercentage,
                                                    Amount deposit) {
    return Initiate(ProposalKind::ChangeParameter,
                    ChangeParameterPayload{majorityPercentage}, caller, deposit);
}

ErrorCode GovernanceEngine::InitiateWithdrawFunds(const Address& caller, const Address& asset,
                                                  const Address& beneficiary, Amount deposit) {
    WithdrawFundsPayload payload;
    payload.asset = asset;
    payload.beneficiary = beneficiary;
    return Initiate(ProposalKind::WithdrawFunds, payload, caller, deposit);
}

// ============================================================================
// Voting
// ============================================================================

ErrorCode GovernanceEngine::Vote(ProposalKind kind, const Address& caller) {
    std::lock_guard<std::recursive_mutex> ledgerLock(ledger_.GetMutex());
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(ledger_.GetGuard());
    if (!scope.Acquired()) {
        return Reject(ErrorCode::Reentrancy, "Vote", kind, caller);
    }

    Timestamp now = util::GetTime();

    ProposalSlot slot = SlotFor(kind);
    if (!slot.active) {
        return Reject(ErrorCode::NoActiveProposal, "Vote", kind, caller);
    }
    if (slot.IsExpired(now)) {
        return Reject(ErrorCode::ProposalExpired, "Vote", kind, caller);
    }

    Amount weight = power_.WeightOf(caller);
    if (weight == 0) {
        return Reject(ErrorCode::Unauthorized, "Vote", kind, caller);
    }
    if (votes_.HasVoted(kind, slot.round, caller)) {
        return Reject(ErrorCode::AlreadyVoted, "Vote", kind, caller);
    }

    EventLog::Batch batch(events_);

    // Live weights can be counted twice through transfers; saturate
    if (!CheckedAdd(slot.accumulatedPower, weight, slot.accumulatedPower)) {
        slot.accumulatedPower = MAX_AMOUNT;
    }
    Emit(EventType::VoteCast, slot, caller, weight, slot.accumulatedPower);

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << caller.ToShortString() << " voted "
                                             << weight << " on " << ProposalKindToString(kind)
                                             << " round " << slot.round << ", total "
                                             << slot.accumulatedPower;

    uint32_t majority = majorityPercentage_;
    ErrorCode rc = TryExecute(slot, now, majority, scope);
    if (rc != ErrorCode::Ok) {
        return Reject(rc, "Vote", kind, caller);
    }

    SlotFor(kind) = slot;
    votes_.Record(kind, slot.round, caller, weight);
    majorityPercentage_ = majority;
    batch.Commit();
    return ErrorCode::Ok;
}

// ============================================================================
// Queries
// ============================================================================

ProposalSlot GovernanceEngine::GetSlot(ProposalKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return SlotFor(kind);
}

bool GovernanceEngine::IsVotingOpen(ProposalKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return SlotFor(kind).IsOpen(util::GetTime());
}

bool GovernanceEngine::HasVoted(ProposalKind kind, const Address& voter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const ProposalSlot& slot = SlotFor(kind);
    return slot.round > 0 && votes_.HasVoted(kind, slot.round, voter);
}

std::vector<std::pair<Address, Amount>> GovernanceEngine::GetVotes(ProposalKind kind) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return votes_.GetVotes(kind, SlotFor(kind).round);
}

uint32_t GovernanceEngine::GetMajorityPercentage() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return majorityPercentage_;
}

Amount GovernanceEngine::GetThreshold() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return PercentOf(power_.TotalWeight(), majorityPercentage_);
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<Byte> GovernanceEngine::Serialize() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    DataStream s;
    s << ENGINE_STATE_VERSION << majorityPercentage_;
    for (const auto& slot : slots_) {
        SerializeSlot(s, slot);
    }
    votes_.Serialize(s);
    return s.Data();
}

bool GovernanceEngine::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream s(data, len);
        uint8_t version = 0;
        uint32_t majority = 0;
        s >> version;
        if (version != ENGINE_STATE_VERSION) {
            return false;
        }
        s >> majority;
        if (!IsValidMajority(majority)) {
            return false;
        }

        std::array<ProposalSlot, PROPOSAL_KIND_COUNT> slots;
        for (ProposalKind kind : ALL_PROPOSAL_KINDS) {
            ProposalSlot slot = UnserializeSlot(s);
            if (slot.kind != kind) {
                return false;
            }
            slots[static_cast<size_t>(kind)] = std::move(slot);
        }

        VoteRegistry votes;
        votes.Unserialize(s);
        if (!s.empty()) {
            return false;
        }

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        majorityPercentage_ = majority;
        slots_ = std::move(slots);
        votes_ = std::move(votes);
        return true;
    } catch (const std::ios_base::failure& e) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Corrupt governance state: " << e.what();
        return false;
    }
}

} // namespace governance
} // namespace quorum
