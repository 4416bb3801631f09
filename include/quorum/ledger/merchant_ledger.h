// QUORUM - Merchant Ledger
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Quota-based merchant ledger. Registered merchants mint tokens to users up
// to a net-outstanding quota and accept payments that burn tokens back
// (recycling), optionally under-burning by a rebate percentage. Merchant
// registration, modification and vault withdrawals are privileged: only the
// ledger owner (the governance engine) or a merchant's guardian reach them.
//
// Key invariant, checked on every mint:
//   totalCashReceived - totalRecycled <= printQuota
// evaluated as cash + amount <= quota + recycled so nothing underflows.

#ifndef QUORUM_LEDGER_MERCHANT_LEDGER_H
#define QUORUM_LEDGER_MERCHANT_LEDGER_H

#include "quorum/core/errors.h"
#include "quorum/core/events.h"
#include "quorum/core/reentrancy.h"
#include "quorum/core/types.h"
#include "quorum/token/token.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quorum {

namespace util {
class ConfigManager;
}

namespace ledger {

/// Rebate ceiling in percent
constexpr uint32_t MAX_REBATE = 10;

/// Longest accepted merchant name
constexpr size_t MAX_MERCHANT_NAME_LENGTH = 64;

// ============================================================================
// Merchant Account
// ============================================================================

struct MerchantAccount {
    Address address;
    std::string name;

    /// Net-outstanding mint ceiling
    Amount printQuota{0};

    /// Cumulative amount minted by this merchant
    Amount totalCashReceived{0};

    /// Cumulative amount burned through this merchant's payments
    Amount totalRecycled{0};

    /// Percent of each payment left unburned, [0, MAX_REBATE]
    uint32_t rebate{0};

    bool frozen{false};

    /// May modify this merchant; null when only the owner can
    Address guardian;

    /// cash - recycled, or 0 when more has been recycled than minted
    Amount Outstanding() const {
        return totalCashReceived > totalRecycled ? totalCashReceived - totalRecycled : 0;
    }

    /// Largest amount the next mint may have
    Amount Headroom() const;

    bool HasActivity() const { return totalCashReceived != 0 || totalRecycled != 0; }

    std::string ToString() const;
};

// ============================================================================
// Ledger Parameters
// ============================================================================

struct LedgerParams {
    /// Account allowed to add, remove and modify merchants and to withdraw
    Address owner;

    /// Account holding deposits and withdrawable assets
    Address vault;

    /// Minted to the guardian of every newly added merchant (0 = none)
    Amount registrationReward{0};

    /// Reads owner, vault and registrationreward
    static LedgerParams FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Merchant Ledger
// ============================================================================

class MerchantLedger {
public:
    /**
     * @param token           Token minted by merchants and burned by payments
     * @param nativeCurrency  Asset withdrawn for the null asset address
     * @param events          Event sink for ledger effects
     */
    MerchantLedger(IFungibleToken& token, IFungibleToken& nativeCurrency,
                   EventLog& events, const LedgerParams& params);

    const Address& GetOwner() const { return params_.owner; }
    const Address& GetVault() const { return params_.vault; }
    const LedgerParams& GetParams() const { return params_; }

    /// Guard shared with the governance engine; see ReentrancyGuard
    ReentrancyGuard& GetGuard() { return guard_; }

    /// Taken before the engine's own mutex by every engine entry point
    std::recursive_mutex& GetMutex() const { return mutex_; }

    // ========================================================================
    // Vault Assets
    // ========================================================================

    /// Make an asset withdrawable. The null address is reserved for the
    /// native currency and cannot be re-registered.
    bool RegisterAsset(const Address& asset, IFungibleToken& token);

    bool IsAssetRegistered(const Address& asset) const;

    /// Vault balance of an asset, 0 if unknown
    Amount GetVaultBalance(const Address& asset) const;

    // ========================================================================
    // Merchant Management
    // ========================================================================

    /// Owner only. Registers a merchant with zeroed counters.
    ErrorCode AddMerchant(const Address& caller, const Address& merchant,
                          const std::string& name, Amount quota,
                          const Address& guardian);

    /// Owner path for a caller already holding GetGuard(). Returns
    /// Reentrancy when `held` is not a live scope on this ledger's guard.
    ErrorCode AddMerchant(const ReentrancyGuard::Scope& held, const Address& caller,
                          const Address& merchant, const std::string& name,
                          Amount quota, const Address& guardian);

    /// Owner only. Swap-and-pop removal from the merchant index.
    ErrorCode RemoveMerchant(const Address& caller, const Address& merchant);

    /// Owner or the merchant's guardian. A null newGuardian keeps the
    /// current guardian; changing it requires the owner.
    ErrorCode ModifyMerchant(const Address& caller, const Address& merchant,
                             const Address& newGuardian, bool freeze,
                             Amount quota, uint32_t rebate);

    ErrorCode ModifyMerchant(const ReentrancyGuard::Scope& held, const Address& caller,
                             const Address& merchant, const Address& newGuardian,
                             bool freeze, Amount quota, uint32_t rebate);

    /// Owner or guardian; toggles only the freeze flag
    ErrorCode SetFrozen(const Address& caller, const Address& merchant, bool frozen);

    // ========================================================================
    // Merchant Operations
    // ========================================================================

    ErrorCode Mint(const Address& callerMerchant, const Address& user, Amount amount);

    ErrorCode Pay(const Address& callerMerchant, const Address& user, Amount amount);

    /// Owner only. Moves the whole vault balance of `asset` to beneficiary.
    ErrorCode Withdraw(const Address& caller, const Address& asset,
                       const Address& beneficiary);

    ErrorCode Withdraw(const ReentrancyGuard::Scope& held, const Address& caller,
                       const Address& asset, const Address& beneficiary);

    // ========================================================================
    // Queries
    // ========================================================================

    bool IsMerchant(const Address& merchant) const;
    std::optional<MerchantAccount> GetMerchant(const Address& merchant) const;

    /// All merchants in index order
    std::vector<MerchantAccount> GetMerchants() const;

    size_t MerchantCount() const;

    /// Remaining mint headroom, 0 for unknown merchants
    Amount GetHeadroom(const Address& merchant) const;

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Merchant records and parameters; vault assets are runtime wiring
    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    MerchantAccount* FindLocked(const Address& merchant);
    const MerchantAccount* FindLocked(const Address& merchant) const;
    ErrorCode CheckMerchantLocked(const Address& merchant, MerchantAccount*& account);

    ErrorCode AddMerchantLocked(const Address& caller, const Address& merchant,
                                const std::string& name, Amount quota,
                                const Address& guardian);
    ErrorCode ModifyMerchantLocked(const Address& caller, const Address& merchant,
                                   const Address& newGuardian, bool freeze,
                                   Amount quota, uint32_t rebate);
    ErrorCode WithdrawLocked(const Address& caller, const Address& asset,
                             const Address& beneficiary);
    void Emit(EventType type, const Address& actor, const Address& subject,
              Amount amount = 0, Amount extra = 0, const std::string& detail = "");

    IFungibleToken& token_;
    EventLog& events_;
    LedgerParams params_;

    mutable std::recursive_mutex mutex_;
    ReentrancyGuard guard_;

    /// Arena of merchant records plus address -> position
    std::vector<MerchantAccount> merchants_;
    std::map<Address, size_t> index_;

    std::map<Address, IFungibleToken*> assets_;
};

} // namespace ledger
} // namespace quorum

#endif // QUORUM_LEDGER_MERCHANT_LEDGER_H
