// QUORUM - Fungible Token
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Interface of the fungible token that provides voting weight and that the
// merchant ledger mints to and burns from, plus an in-memory implementation.

#ifndef QUORUM_TOKEN_TOKEN_H
#define QUORUM_TOKEN_TOKEN_H

#include "quorum/core/types.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace quorum {

// ============================================================================
// Token Interface
// ============================================================================

/**
 * Fungible token surface used by the ledger and governance engine.
 *
 * Every mutating call either applies fully and returns true, or changes
 * nothing and returns false. Mint and Burn are privileged: only the
 * component that owns the token (the merchant ledger) calls them.
 */
class IFungibleToken {
public:
    virtual ~IFungibleToken() = default;

    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount TotalSupply() const = 0;

    /// Move amount from `from` to `to`
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Move amount from `from` to `to` on behalf of spender, consuming allowance
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, Amount amount) = 0;

    /// Set (not add to) spender's allowance over owner's balance
    virtual bool Approve(const Address& owner, const Address& spender, Amount amount) = 0;
    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    virtual bool Mint(const Address& to, Amount amount) = 0;
    virtual bool Burn(const Address& from, Amount amount) = 0;

    virtual std::string GetSymbol() const = 0;
};

// ============================================================================
// In-memory Token
// ============================================================================

/**
 * Map-backed token.
 *
 * An optional transfer hook runs after every successful balance movement
 * (mint: from is null, burn: to is null). The hook is called with the token
 * lock held; it may call back into the token from the same thread.
 */
class MemoryToken : public IFungibleToken {
public:
    using TransferHook = std::function<void(const Address& from, const Address& to, Amount amount)>;

    explicit MemoryToken(std::string symbol = "QRM");

    Amount BalanceOf(const Address& account) const override;
    Amount TotalSupply() const override;

    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;

    bool Approve(const Address& owner, const Address& spender, Amount amount) override;
    Amount Allowance(const Address& owner, const Address& spender) const override;

    bool Mint(const Address& to, Amount amount) override;
    bool Burn(const Address& from, Amount amount) override;

    std::string GetSymbol() const override { return symbol_; }

    void SetTransferHook(TransferHook hook);

    /// Accounts with a non-zero balance
    std::vector<std::pair<Address, Amount>> GetHolders() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    bool MoveLocked(const Address& from, const Address& to, Amount amount);
    void NotifyLocked(const Address& from, const Address& to, Amount amount);

    mutable std::recursive_mutex mutex_;
    std::string symbol_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    TransferHook hook_;
};

} // namespace quorum

#endif // QUORUM_TOKEN_TOKEN_H
