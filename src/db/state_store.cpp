// QUORUM - State Store Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/db/state_store.h"
#include "quorum/util/logging.h"

#include <string>
#include <vector>

namespace quorum {
namespace db {

namespace {

const std::string VERSION_KEY = MakeKey(prefix::META, "version");

Slice AsSlice(const std::vector<Byte>& blob) {
    return Slice(blob);
}

bool Decode(const std::string& blob, MemoryToken& token) {
    return token.Deserialize(reinterpret_cast<const Byte*>(blob.data()), blob.size());
}

bool Decode(const std::string& blob, ledger::MerchantLedger& ledger) {
    return ledger.Deserialize(reinterpret_cast<const Byte*>(blob.data()), blob.size());
}

bool Decode(const std::string& blob, governance::GovernanceEngine& engine) {
    return engine.Deserialize(reinterpret_cast<const Byte*>(blob.data()), blob.size());
}

} // namespace

bool StateStore::HasState() {
    return db_.Exists(VERSION_KEY);
}

Status StateStore::Save(const MemoryToken& token, const MemoryToken& nativeCurrency,
                        const ledger::MerchantLedger& ledger,
                        const governance::GovernanceEngine& engine) {
    std::vector<Byte> tokenBlob = token.Serialize();
    std::vector<Byte> nativeBlob = nativeCurrency.Serialize();
    std::vector<Byte> ledgerBlob = ledger.Serialize();
    std::vector<Byte> engineBlob = engine.Serialize();

    WriteBatch batch;
    batch.Put(MakeKey(prefix::TOKEN), AsSlice(tokenBlob));
    batch.Put(MakeKey(prefix::NATIVE), AsSlice(nativeBlob));
    batch.Put(MakeKey(prefix::LEDGER), AsSlice(ledgerBlob));
    batch.Put(MakeKey(prefix::GOVERNANCE), AsSlice(engineBlob));
    batch.Put(VERSION_KEY, std::to_string(STATE_STORE_VERSION));

    WriteOptions options;
    options.sync = true;
    Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Saving state failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Saved state, " << batch.ApproximateSize() << " bytes";
    return Status::Ok();
}

Status StateStore::Load(MemoryToken& token, MemoryToken& nativeCurrency,
                        ledger::MerchantLedger& ledger,
                        governance::GovernanceEngine& engine) {
    std::string version;
    Status s = db_.Get(VERSION_KEY, &version);
    if (s.IsNotFound()) {
        return Status::NotFound("no saved state");
    }
    if (!s.ok()) {
        return s;
    }
    if (version != std::to_string(STATE_STORE_VERSION)) {
        return Status::Corruption("unsupported state version " + version);
    }

    std::string tokenBlob, nativeBlob, ledgerBlob, engineBlob;
    const std::pair<char, std::string*> reads[] = {
        {prefix::TOKEN, &tokenBlob},
        {prefix::NATIVE, &nativeBlob},
        {prefix::LEDGER, &ledgerBlob},
        {prefix::GOVERNANCE, &engineBlob},
    };
    for (const auto& [p, out] : reads) {
        s = db_.Get(MakeKey(p), out);
        if (s.IsNotFound()) {
            return Status::Corruption(std::string("missing state record '") + p + "'");
        }
        if (!s.ok()) {
            return s;
        }
    }

    // Kept to undo a partial restore
    std::vector<Byte> tokenBefore = token.Serialize();
    std::vector<Byte> nativeBefore = nativeCurrency.Serialize();
    std::vector<Byte> ledgerBefore = ledger.Serialize();
    std::vector<Byte> engineBefore = engine.Serialize();

    auto restore = [&]() {
        bool restored = token.Deserialize(tokenBefore.data(), tokenBefore.size()) &&
                        nativeCurrency.Deserialize(nativeBefore.data(), nativeBefore.size()) &&
                        ledger.Deserialize(ledgerBefore.data(), ledgerBefore.size()) &&
                        engine.Deserialize(engineBefore.data(), engineBefore.size());
        if (!restored) {
            LOG_ERROR(util::LogCategory::DB) << "Restoring in-memory state after a failed load failed";
        }
    };

    bool ok = Decode(tokenBlob, token) && Decode(nativeBlob, nativeCurrency) &&
              Decode(ledgerBlob, ledger) && Decode(engineBlob, engine);
    if (!ok) {
        restore();
        LOG_ERROR(util::LogCategory::DB) << "Saved state does not decode";
        return Status::Corruption("saved state does not decode");
    }

    // The ledger owner is persisted, the engine account is configured
    if (engine.GetAddress() != ledger.GetOwner()) {
        std::string detail = "engine account " + engine.GetAddress().ToString() +
                             " does not own the saved ledger (owner " +
                             ledger.GetOwner().ToString() + ")";
        restore();
        LOG_ERROR(util::LogCategory::DB) << "Saved state rejected: " << detail;
        return Status::InvalidArgument(detail);
    }

    LOG_DEBUG(util::LogCategory::DB) << "Loaded state: " << ledger.MerchantCount()
                                     << " merchants, supply " << token.TotalSupply();
    return Status::Ok();
}

} // namespace db
} // namespace quorum
