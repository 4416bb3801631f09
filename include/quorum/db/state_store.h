// QUORUM - State Store
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Persists the governance token, native currency, merchant ledger and
// governance engine as four blobs written in one atomic batch.

#ifndef QUORUM_DB_STATE_STORE_H
#define QUORUM_DB_STATE_STORE_H

#include "quorum/db/database.h"
#include "quorum/governance/governance.h"
#include "quorum/ledger/merchant_ledger.h"
#include "quorum/token/token.h"

#include <cstdint>

namespace quorum {
namespace db {

/// Layout version stored under the META "version" key
constexpr uint32_t STATE_STORE_VERSION = 1;

class StateStore {
public:
    explicit StateStore(Database& db) : db_(db) {}

    /// True once Save has succeeded against this database
    bool HasState();

    Status Save(const MemoryToken& token, const MemoryToken& nativeCurrency,
                const ledger::MerchantLedger& ledger,
                const governance::GovernanceEngine& engine);

    /**
     * Restore all four components.
     *
     * NotFound when nothing was saved yet, Corruption when a blob is missing
     * or does not decode. InvalidArgument when the engine's account is not
     * the owner of the saved ledger, since every proposal would then fail
     * to execute. On either failure every component is put back to the
     * state it had before the call.
     */
    Status Load(MemoryToken& token, MemoryToken& nativeCurrency,
                ledger::MerchantLedger& ledger,
                governance::GovernanceEngine& engine);

private:
    Database& db_;
};

} // namespace db
} // namespace quorum

#endif // QUORUM_DB_STATE_STORE_H
