// QUORUM - Proposal Slots and Vote Registry Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/governance/proposal.h"
#include "quorum/util/time.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace quorum {
namespace governance {

const char* ProposalKindToString(ProposalKind kind) {
    switch (kind) {
        case ProposalKind::AddMerchant: return "AddMerchant";
        case ProposalKind::ModifyMerchant: return "ModifyMerchant";
        case ProposalKind::ChangeParameter: return "ChangeParameter";
        case ProposalKind::WithdrawFunds: return "WithdrawFunds";
        default: return "Unknown";
    }
}

std::optional<ProposalKind> ParseProposalKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "add" || lower == "addmerchant") return ProposalKind::AddMerchant;
    if (lower == "modify" || lower == "modifymerchant") return ProposalKind::ModifyMerchant;
    if (lower == "param" || lower == "changeparameter") return ProposalKind::ChangeParameter;
    if (lower == "withdraw" || lower == "withdrawfunds") return ProposalKind::WithdrawFunds;
    return std::nullopt;
}

ProposalPayload EmptyPayload(ProposalKind kind) {
    switch (kind) {
        case ProposalKind::ModifyMerchant: return ModifyMerchantPayload{};
        case ProposalKind::ChangeParameter: return ChangeParameterPayload{};
        case ProposalKind::WithdrawFunds: return WithdrawFundsPayload{};
        case ProposalKind::AddMerchant:
        default:
            return AddMerchantPayload{};
    }
}

namespace {

struct PayloadDescriber {
    std::string operator()(const AddMerchantPayload& p) const {
        std::ostringstream ss;
        ss << "add " << p.merchant.ToShortString() << " \"" << p.name
           << "\" quota=" << p.quota;
        return ss.str();
    }

    std::string operator()(const ModifyMerchantPayload& p) const {
        std::ostringstream ss;
        ss << "modify " << p.merchant.ToShortString()
           << " guardian=" << (p.newGuardian.IsNull() ? std::string("keep") : p.newGuardian.ToShortString())
           << " freeze=" << (p.freeze ? "yes" : "no")
           << " quota=" << p.quota << " rebate=" << p.rebate << "%";
        return ss.str();
    }

    std::string operator()(const ChangeParameterPayload& p) const {
        return "majority=" + std::to_string(p.majorityPercentage) + "%";
    }

    std::string operator()(const WithdrawFundsPayload& p) const {
        std::ostringstream ss;
        ss << "withdraw " << (p.asset.IsNull() ? std::string("native") : p.asset.ToShortString())
           << " to " << (p.beneficiary.IsNull() ? std::string("initiator") : p.beneficiary.ToShortString());
        return ss.str();
    }
};

} // namespace

std::string DescribePayload(const ProposalPayload& payload) {
    return std::visit(PayloadDescriber{}, payload);
}

// ============================================================================
// ProposalSlot
// ============================================================================

std::string ProposalSlot::ToString() const {
    std::ostringstream ss;
    ss << ProposalKindToString(kind) << " round " << round;
    if (round == 0) {
        ss << " (never opened)";
        return ss.str();
    }
    ss << (active ? " active" : (executed ? " executed" : " closed"))
       << " power=" << accumulatedPower
       << " deadline=" << util::FormatISO8601(deadline)
       << " initiator=" << initiator.ToShortString()
       << " [" << DescribePayload(payload) << "]";
    if (depositRequested > 0) {
        ss << " deposit=" << depositCollected << "/" << depositRequested;
    }
    return ss.str();
}

void SerializeSlot(DataStream& s, const ProposalSlot& slot) {
    SerializeEnum(s, slot.kind);
    s << slot.active << slot.executed << slot.round << slot.accumulatedPower
      << slot.openedAt << slot.deadline << slot.initiator
      << slot.depositRequested << slot.depositCollected << slot.depositTaken;

    SerializeEnum(s, KindOf(slot.payload));
    switch (KindOf(slot.payload)) {
        case ProposalKind::AddMerchant: {
            const auto& p = std::get<AddMerchantPayload>(slot.payload);
            s << p.merchant << p.name << p.quota;
            break;
        }
        case ProposalKind::ModifyMerchant: {
            const auto& p = std::get<ModifyMerchantPayload>(slot.payload);
            s << p.merchant << p.newGuardian << p.freeze << p.quota << p.rebate;
            break;
        }
        case ProposalKind::ChangeParameter: {
            const auto& p = std::get<ChangeParameterPayload>(slot.payload);
            s << p.majorityPercentage;
            break;
        }
        case ProposalKind::WithdrawFunds: {
            const auto& p = std::get<WithdrawFundsPayload>(slot.payload);
            s << p.asset << p.beneficiary;
            break;
        }
    }
}

ProposalSlot UnserializeSlot(DataStream& s) {
    constexpr uint8_t maxKind = static_cast<uint8_t>(ProposalKind::WithdrawFunds);

    ProposalSlot slot;
    slot.kind = static_cast<ProposalKind>(UnserializeEnum(s, maxKind));
    s >> slot.active >> slot.executed >> slot.round >> slot.accumulatedPower
      >> slot.openedAt >> slot.deadline >> slot.initiator
      >> slot.depositRequested >> slot.depositCollected >> slot.depositTaken;

    auto payloadKind = static_cast<ProposalKind>(UnserializeEnum(s, maxKind));
    if (payloadKind != slot.kind) {
        throw std::ios_base::failure("proposal payload does not match slot kind");
    }

    switch (payloadKind) {
        case ProposalKind::AddMerchant: {
            AddMerchantPayload p;
            s >> p.merchant >> p.name >> p.quota;
            slot.payload = p;
            break;
        }
        case ProposalKind::ModifyMerchant: {
            ModifyMerchantPayload p;
            s >> p.merchant >> p.newGuardian >> p.freeze >> p.quota >> p.rebate;
            slot.payload = p;
            break;
        }
        case ProposalKind::ChangeParameter: {
            ChangeParameterPayload p;
            s >> p.majorityPercentage;
            slot.payload = p;
            break;
        }
        case ProposalKind::WithdrawFunds: {
            WithdrawFundsPayload p;
            s >> p.asset >> p.beneficiary;
            slot.payload = p;
            break;
        }
    }
    return slot;
}

// ============================================================================
// VoteRegistry
// ============================================================================

bool VoteRegistry::HasVoted(ProposalKind kind, uint64_t round, const Address& voter) const {
    return votes_.count(Key{kind, round, voter}) > 0;
}

bool VoteRegistry::Record(ProposalKind kind, uint64_t round, const Address& voter,
                          Amount weight) {
    return votes_.emplace(Key{kind, round, voter}, weight).second;
}

std::vector<std::pair<Address, Amount>> VoteRegistry::GetVotes(ProposalKind kind,
                                                               uint64_t round) const {
    std::vector<std::pair<Address, Amount>> result;
    auto it = votes_.lower_bound(Key{kind, round, Address()});
    for (; it != votes_.end() && it->first.kind == kind && it->first.round == round; ++it) {
        result.emplace_back(it->first.voter, it->second);
    }
    return result;
}

void VoteRegistry::PruneBefore(ProposalKind kind, uint64_t round) {
    auto first = votes_.lower_bound(Key{kind, 0, Address()});
    auto last = votes_.lower_bound(Key{kind, round, Address()});
    votes_.erase(first, last);
}

void VoteRegistry::Serialize(DataStream& s) const {
    WriteCompactSize(s, votes_.size());
    for (const auto& [key, weight] : votes_) {
        SerializeEnum(s, key.kind);
        s << key.round << key.voter << weight;
    }
}

void VoteRegistry::Unserialize(DataStream& s) {
    constexpr uint8_t maxKind = static_cast<uint8_t>(ProposalKind::WithdrawFunds);

    std::map<Key, Amount> votes;
    uint64_t count = ReadCompactSize(s);
    for (uint64_t i = 0; i < count; ++i) {
        Key key{};
        key.kind = static_cast<ProposalKind>(UnserializeEnum(s, maxKind));
        Amount weight = 0;
        s >> key.round >> key.voter >> weight;
        votes.emplace(key, weight);
    }
    votes_ = std::move(votes);
}

} // namespace governance
} // namespace quorum
