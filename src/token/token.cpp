// QUORUM - Fungible Token Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/token/token.h"
#include "quorum/core/serialize.h"
#include "quorum/util/logging.h"

namespace quorum {

namespace {
constexpr uint8_t TOKEN_STATE_VERSION = 1;
}

MemoryToken::MemoryToken(std::string symbol) : symbol_(std::move(symbol)) {}

Amount MemoryToken::BalanceOf(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryToken::TotalSupply() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalSupply_;
}

bool MemoryToken::MoveLocked(const Address& from, const Address& to, Amount amount) {
    if (to.IsNull()) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (from == to || amount == 0) {
        return true;
    }
    // Cannot overflow: the sum of all balances is totalSupply_
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    balances_[to] += amount;
    return true;
}

void MemoryToken::NotifyLocked(const Address& from, const Address& to, Amount amount) {
    if (hook_) {
        // Copy so the hook may replace itself
        TransferHook hook = hook_;
        hook(from, to, amount);
    }
}

bool MemoryToken::Transfer(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!MoveLocked(from, to, amount)) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << " transfer of " << amount
                                            << " from " << from.ToShortString() << " rejected";
        return false;
    }
    NotifyLocked(from, to, amount);
    return true;
}

bool MemoryToken::TransferFrom(const Address& spender, const Address& from,
                               const Address& to, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto key = std::make_pair(from, spender);
    auto allowed = allowances_.find(key);
    if (allowed == allowances_.end() || allowed->second < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << " transferFrom by "
                                            << spender.ToShortString()
                                            << " exceeds allowance";
        return false;
    }
    if (!MoveLocked(from, to, amount)) {
        return false;
    }
    allowed->second -= amount;
    if (allowed->second == 0) {
        allowances_.erase(allowed);
    }
    NotifyLocked(from, to, amount);
    return true;
}

bool MemoryToken::Approve(const Address& owner, const Address& spender, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (spender.IsNull()) {
        return false;
    }
    if (amount == 0) {
        allowances_.erase(std::make_pair(owner, spender));
    } else {
        allowances_[std::make_pair(owner, spender)] = amount;
    }
    return true;
}

Amount MemoryToken::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = allowances_.find(std::make_pair(owner, spender));
    return it == allowances_.end() ? 0 : it->second;
}

bool MemoryToken::Mint(const Address& to, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Amount newSupply = 0;
    if (to.IsNull() || amount == 0 || !CheckedAdd(totalSupply_, amount, newSupply)) {
        return false;
    }
    totalSupply_ = newSupply;
    balances_[to] += amount;
    NotifyLocked(NullAddress(), to, amount);
    return true;
}

bool MemoryToken::Burn(const Address& from, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (amount == 0) {
        return true;
    }
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    totalSupply_ -= amount;
    NotifyLocked(from, NullAddress(), amount);
    return true;
}

void MemoryToken::SetTransferHook(TransferHook hook) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<std::pair<Address, Amount>> MemoryToken::GetHolders() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return std::vector<std::pair<Address, Amount>>(balances_.begin(), balances_.end());
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<Byte> MemoryToken::Serialize() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    DataStream s;
    s << TOKEN_STATE_VERSION << symbol_ << totalSupply_ << balances_;

    WriteCompactSize(s, allowances_.size());
    for (const auto& [key, amount] : allowances_) {
        s << key.first << key.second << amount;
    }
    return s.Data();
}

bool MemoryToken::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream s(data, len);
        uint8_t version = 0;
        std::string symbol;
        Amount supply = 0;
        std::map<Address, Amount> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;

        s >> version;
        if (version != TOKEN_STATE_VERSION) {
            return false;
        }
        s >> symbol >> supply >> balances;

        uint64_t count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            Address owner, spender;
            Amount amount = 0;
            s >> owner >> spender >> amount;
            allowances[std::make_pair(owner, spender)] = amount;
        }

        // Balances must add up to the recorded supply
        Amount sum = 0;
        for (const auto& [account, balance] : balances) {
            if (!CheckedAdd(sum, balance, sum)) {
                return false;
            }
        }
        if (sum != supply || !s.empty()) {
            return false;
        }

        std::lock_guard<std::recursive_mutex> lock(mutex_);
        symbol_ = std::move(symbol);
        totalSupply_ = supply;
        balances_ = std::move(balances);
        allowances_ = std::move(allowances);
        return true;
    } catch (const std::ios_base::failure& e) {
        LOG_WARN(util::LogCategory::TOKEN) << "Corrupt token state: " << e.what();
        return false;
    }
}

} // namespace quorum
