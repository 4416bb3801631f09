// QUORUM - Merchant Ledger Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/ledger/merchant_ledger.h"
#include "quorum/core/serialize.h"
#include "quorum/crypto/sha256.h"
#include "quorum/util/config.h"
#include "quorum/util/logging.h"

#include <sstream>

namespace quorum {
namespace ledger {

namespace {
constexpr uint8_t LEDGER_STATE_VERSION = 1;
}

// ============================================================================
// MerchantAccount
// ============================================================================

Amount MerchantAccount::Headroom() const {
    Amount limit = 0;
    if (!CheckedAdd(printQuota, totalRecycled, limit)) {
        limit = MAX_AMOUNT;
    }
    return limit > totalCashReceived ? limit - totalCashReceived : 0;
}

std::string MerchantAccount::ToString() const {
    std::ostringstream ss;
    ss << address.ToString() << " \"" << name << "\""
       << " quota=" << printQuota
       << " cash=" << totalCashReceived
       << " recycled=" << totalRecycled
       << " headroom=" << Headroom()
       << " rebate=" << rebate << "%"
       << (frozen ? " FROZEN" : "");
    if (!guardian.IsNull()) {
        ss << " guardian=" << guardian.ToShortString();
    }
    return ss.str();
}

LedgerParams LedgerParams::FromConfig(const util::ConfigManager& config) {
    LedgerParams params;
    params.owner = ParseAddress(config.GetString(util::ConfigKeys::OWNER, "governance"));
    params.vault = ParseAddress(config.GetString(util::ConfigKeys::VAULT, "vault"));
    params.registrationReward = config.GetUInt(util::ConfigKeys::REGISTRATIONREWARD, 0);
    return params;
}

// ============================================================================
// MerchantLedger
// ============================================================================

MerchantLedger::MerchantLedger(IFungibleToken& token, IFungibleToken& nativeCurrency,
                               EventLog& events, const LedgerParams& params)
    : token_(token), events_(events), params_(params) {
    assets_[NullAddress()] = &nativeCurrency;
}

void MerchantLedger::Emit(EventType type, const Address& actor, const Address& subject,
                          Amount amount, Amount extra, const std::string& detail) {
    Event event;
    event.type = type;
    event.actor = actor;
    event.subject = subject;
    event.amount = amount;
    event.extra = extra;
    event.detail = detail;
    events_.Emit(std::move(event));
}

MerchantAccount* MerchantLedger::FindLocked(const Address& merchant) {
    auto it = index_.find(merchant);
    return it == index_.end() ? nullptr : &merchants_[it->second];
}

const MerchantAccount* MerchantLedger::FindLocked(const Address& merchant) const {
    auto it = index_.find(merchant);
    return it == index_.end() ? nullptr : &merchants_[it->second];
}

ErrorCode MerchantLedger::CheckMerchantLocked(const Address& merchant,
                                              MerchantAccount*& account) {
    account = FindLocked(merchant);
    if (!account) {
        return ErrorCode::NotRegisteredMerchant;
    }
    if (account->frozen) {
        return ErrorCode::Frozen;
    }
    return ErrorCode::Ok;
}

// ============================================================================
// Vault Assets
// ============================================================================

bool MerchantLedger::RegisterAsset(const Address& asset, IFungibleToken& token) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (asset.IsNull()) {
        return false;
    }
    assets_[asset] = &token;
    return true;
}

bool MerchantLedger::IsAssetRegistered(const Address& asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return assets_.count(asset) > 0;
}

Amount MerchantLedger::GetVaultBalance(const Address& asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = assets_.find(asset);
    return it == assets_.end() ? 0 : it->second->BalanceOf(params_.vault);
}

// ============================================================================
// Merchant Management
// ============================================================================

ErrorCode MerchantLedger::AddMerchant(const Address& caller, const Address& merchant,
                                      const std::string& name, Amount quota,
                                      const Address& guardian) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }
    return AddMerchantLocked(caller, merchant, name, quota, guardian);
}

ErrorCode MerchantLedger::AddMerchant(const ReentrancyGuard::Scope& held, const Address& caller,
                                      const Address& merchant, const std::string& name,
                                      Amount quota, const Address& guardian) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!held.Holds(guard_)) {
        return ErrorCode::Reentrancy;
    }
    return AddMerchantLocked(caller, merchant, name, quota, guardian);
}

ErrorCode MerchantLedger::AddMerchantLocked(const Address& caller, const Address& merchant,
                                            const std::string& name, Amount quota,
                                            const Address& guardian) {
    if (caller != params_.owner) {
        return ErrorCode::Unauthorized;
    }
    if (merchant.IsNull() || name.size() > MAX_MERCHANT_NAME_LENGTH) {
        return ErrorCode::InvalidParameter;
    }
    if (index_.count(merchant)) {
        return ErrorCode::DuplicateMerchant;
    }

    bool rewarded = params_.registrationReward > 0 && !guardian.IsNull();
    if (rewarded && !token_.Mint(guardian, params_.registrationReward)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Registration reward for "
                                            << merchant.ToShortString() << " could not be minted";
        return ErrorCode::TransferFailed;
    }

    MerchantAccount account;
    account.address = merchant;
    account.name = name;
    account.printQuota = quota;
    account.guardian = guardian;

    index_[merchant] = merchants_.size();
    merchants_.push_back(std::move(account));

    Emit(EventType::MerchantAdded, guardian, merchant, quota, 0, name);
    if (rewarded) {
        Emit(EventType::MintedToUser, NullAddress(), guardian, params_.registrationReward);
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Merchant " << merchant.ToShortString()
                                        << " \"" << name << "\" added, quota " << quota;
    return ErrorCode::Ok;
}

ErrorCode MerchantLedger::RemoveMerchant(const Address& caller, const Address& merchant) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }

    if (caller != params_.owner) {
        return ErrorCode::Unauthorized;
    }
    auto it = index_.find(merchant);
    if (it == index_.end()) {
        return ErrorCode::NotRegisteredMerchant;
    }

    size_t pos = it->second;
    if (merchants_[pos].HasActivity()) {
        LOG_WARN(util::LogCategory::LEDGER)
            << "Removing merchant " << merchant.ToShortString()
            << " with outstanding accounting (cash=" << merchants_[pos].totalCashReceived
            << " recycled=" << merchants_[pos].totalRecycled << ")";
    }

    // Swap the last record into the freed position
    size_t last = merchants_.size() - 1;
    if (pos != last) {
        merchants_[pos] = std::move(merchants_[last]);
        index_[merchants_[pos].address] = pos;
    }
    merchants_.pop_back();
    index_.erase(merchant);

    Emit(EventType::MerchantRemoved, caller, merchant);
    LOG_INFO(util::LogCategory::LEDGER) << "Merchant " << merchant.ToShortString() << " removed";
    return ErrorCode::Ok;
}

ErrorCode MerchantLedger::ModifyMerchant(const Address& caller, const Address& merchant,
                                         const Address& newGuardian, bool freeze,
                                         Amount quota, uint32_t rebate) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }
    return ModifyMerchantLocked(caller, merchant, newGuardian, freeze, quota, rebate);
}

ErrorCode MerchantLedger::ModifyMerchant(const ReentrancyGuard::Scope& held, const Address& caller,
                                         const Address& merchant, const Address& newGuardian,
                                         bool freeze, Amount quota, uint32_t rebate) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!held.Holds(guard_)) {
        return ErrorCode::Reentrancy;
    }
    return ModifyMerchantLocked(caller, merchant, newGuardian, freeze, quota, rebate);
}

ErrorCode MerchantLedger::ModifyMerchantLocked(const Address& caller, const Address& merchant,
                                               const Address& newGuardian, bool freeze,
                                               Amount quota, uint32_t rebate) {
    MerchantAccount* account = FindLocked(merchant);
    if (!account) {
        return ErrorCode::NotRegisteredMerchant;
    }
    if (rebate > MAX_REBATE) {
        return ErrorCode::RebateOutOfRange;
    }

    bool isOwner = caller == params_.owner;
    bool isGuardian = !account->guardian.IsNull() && caller == account->guardian;
    if (!isOwner && !isGuardian) {
        return ErrorCode::Unauthorized;
    }
    bool guardianChange = !newGuardian.IsNull() && newGuardian != account->guardian;
    if (guardianChange && !isOwner) {
        return ErrorCode::Unauthorized;
    }

    bool freezeChange = account->frozen != freeze;

    account->printQuota = quota;
    account->rebate = rebate;
    account->frozen = freeze;
    if (guardianChange) {
        account->guardian = newGuardian;
    }

    Emit(EventType::MerchantModified, account->guardian, merchant, quota, rebate);
    if (freezeChange) {
        Emit(freeze ? EventType::MerchantFrozen : EventType::MerchantUnfrozen, caller, merchant);
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Merchant " << merchant.ToShortString()
                                        << " modified: quota=" << quota << " rebate=" << rebate
                                        << "% frozen=" << (freeze ? "yes" : "no");
    return ErrorCode::Ok;
}

ErrorCode MerchantLedger::SetFrozen(const Address& caller, const Address& merchant, bool frozen) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }

    MerchantAccount* account = FindLocked(merchant);
    if (!account) {
        return ErrorCode::NotRegisteredMerchant;
    }
    if (caller != params_.owner && (account->guardian.IsNull() || caller != account->guardian)) {
        return ErrorCode::Unauthorized;
    }
    if (account->frozen == frozen) {
        return ErrorCode::Ok;
    }

    account->frozen = frozen;
    Emit(frozen ? EventType::MerchantFrozen : EventType::MerchantUnfrozen, caller, merchant);
    LOG_INFO(util::LogCategory::LEDGER) << "Merchant " << merchant.ToShortString()
                                        << (frozen ? " frozen" : " unfrozen");
    return ErrorCode::Ok;
}

// ============================================================================
// Merchant Operations
// ============================================================================

ErrorCode MerchantLedger::Mint(const Address& callerMerchant, const Address& user, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }

    MerchantAccount* account = nullptr;
    ErrorCode rc = CheckMerchantLocked(callerMerchant, account);
    if (rc != ErrorCode::Ok) {
        return rc;
    }
    if (amount == 0 || user.IsNull()) {
        return ErrorCode::InvalidAmount;
    }

    Amount newCash = 0;
    if (!CheckedAdd(account->totalCashReceived, amount, newCash) ||
        amount > account->Headroom()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Mint of " << amount << " by "
                                             << callerMerchant.ToShortString()
                                             << " exceeds headroom " << account->Headroom();
        return ErrorCode::InvalidAmount;
    }

    if (!token_.Mint(user, amount)) {
        return ErrorCode::TransferFailed;
    }
    account->totalCashReceived = newCash;

    Emit(EventType::MintedToUser, callerMerchant, user, amount);
    LOG_DEBUG(util::LogCategory::LEDGER) << callerMerchant.ToShortString() << " minted "
                                         << amount << " to " << user.ToShortString();
    return ErrorCode::Ok;
}

ErrorCode MerchantLedger::Pay(const Address& callerMerchant, const Address& user, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }

    MerchantAccount* account = nullptr;
    ErrorCode rc = CheckMerchantLocked(callerMerchant, account);
    if (rc != ErrorCode::Ok) {
        return rc;
    }
    if (amount == 0 || token_.BalanceOf(user) < amount) {
        return ErrorCode::InvalidAmount;
    }

    Amount burn = PercentOf(amount, 100 - account->rebate);
    Amount newRecycled = 0;
    if (!CheckedAdd(account->totalRecycled, burn, newRecycled)) {
        return ErrorCode::InvalidAmount;
    }

    if (!token_.Burn(user, burn)) {
        return ErrorCode::TransferFailed;
    }
    account->totalRecycled = newRecycled;

    Emit(EventType::PaymentProcessed, callerMerchant, user, amount, amount - burn);
    LOG_DEBUG(util::LogCategory::LEDGER) << user.ToShortString() << " paid " << amount
                                         << " to " << callerMerchant.ToShortString()
                                         << " (burned " << burn << ")";
    return ErrorCode::Ok;
}

ErrorCode MerchantLedger::Withdraw(const Address& caller, const Address& asset,
                                   const Address& beneficiary) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.Acquired()) {
        return ErrorCode::Reentrancy;
    }
    return WithdrawLocked(caller, asset, beneficiary);
}

ErrorCode MerchantLedger::Withdraw(const ReentrancyGuard::Scope& held, const Address& caller,
                                   const Address& asset, const Address& beneficiary) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!held.Holds(guard_)) {
        return ErrorCode::Reentrancy;
    }
    return WithdrawLocked(caller, asset, beneficiary);
}

ErrorCode MerchantLedger::WithdrawLocked(const Address& caller, const Address& asset,
                                         const Address& beneficiary) {
    if (caller != params_.owner) {
        return ErrorCode::Unauthorized;
    }
    if (beneficiary.IsNull()) {
        return ErrorCode::InvalidParameter;
    }
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Withdrawal of unknown asset "
                                             << asset.ToShortString();
        return ErrorCode::WithdrawFailed;
    }

    IFungibleToken& assetToken = *it->second;
    Amount balance = assetToken.BalanceOf(params_.vault);
    if (balance == 0) {
        return ErrorCode::InvalidAmount;
    }
    if (!assetToken.Transfer(params_.vault, beneficiary, balance)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Withdrawal of " << balance << " "
                                            << assetToken.GetSymbol() << " failed";
        return ErrorCode::WithdrawFailed;
    }

    Emit(EventType::FundsWithdrawn, asset, beneficiary, balance, 0, assetToken.GetSymbol());
    LOG_INFO(util::LogCategory::LEDGER) << "Withdrew " << balance << " "
                                        << assetToken.GetSymbol() << " to "
                                        << beneficiary.ToShortString();
    return ErrorCode::Ok;
}

// ============================================================================
// Queries
// ============================================================================

bool MerchantLedger::IsMerchant(const Address& merchant) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return index_.count(merchant) > 0;
}

std::optional<MerchantAccount> MerchantLedger::GetMerchant(const Address& merchant) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const MerchantAccount* account = FindLocked(merchant);
    if (!account) {
        return std::nullopt;
    }
    return *account;
}

std::vector<MerchantAccount> MerchantLedger::GetMerchants() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return merchants_;
}

size_t MerchantLedger::MerchantCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return merchants_.size();
}

Amount MerchantLedger::GetHeadroom(const Address& merchant) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const MerchantAccount* account = FindLocked(merchant);
    return account ? account->Headroom() : 0;
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<Byte> MerchantLedger::Serialize() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    DataStream s;
    s << LEDGER_STATE_VERSION << params_.owner << params_.vault << params_.registrationReward;

    WriteCompactSize(s, merchants_.size());
    for (const auto& m : merchants_) {
        s << m.address << m.name << m.printQuota << m.totalCashReceived
          << m.totalRecycled << m.rebate << m.frozen << m.guardian;
    }
    return s.Data();
}

bool MerchantLedger::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream s(data, len);
        uint8_t version = 0;
        LedgerParams params;
        s >> version;
        if (version != LEDGER_STATE_VERSION) {
            return false;
        }
        s >> params.owner >> params.vault >> params.registrationReward;

        std::vector<MerchantAccount> merchants;
        std::map<Address, size_t> index;
        uint64_t count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            MerchantAccount m;
            s >> m.address >> m.name >> m.printQuota >> m.totalCashReceived
              >> m.totalRecycled >> m.rebate >> m.frozen >> m.guardian;
            if (m.rebate > MAX_REBATE || !index.emplace(m.address, merchants.size()).second) {
                return false;
            }
            merchants.push_back(std::move(m));
        }
        if (!s.empty()) {
            return false;
        }

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        params_ = params;
        merchants_ = std::move(merchants);
        index_ = std::move(index);
        return true;
    } catch (const std::ios_base::failure& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "Corrupt ledger state: " << e.what();
        return false;
    }
}

} // namespace ledger
} // namespace quorum
