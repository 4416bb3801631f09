// QUORUM - SHA256 Hash Function
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// SHA-256 over OpenSSL's EVP interface, plus label-to-address derivation.

#ifndef QUORUM_CRYPTO_SHA256_H
#define QUORUM_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "quorum/core/types.h"

namespace quorum {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write OUTPUT_SIZE bytes to hash.
    /// The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// Deterministic account address for a human-readable label:
/// the first 20 bytes of SHA256(label).
Address AddressFromLabel(const std::string& label);

/// Parse "0x..." / 40-hex-digit addresses, otherwise derive from the label.
Address ParseAddress(const std::string& text);

} // namespace quorum

#endif // QUORUM_CRYPTO_SHA256_H
