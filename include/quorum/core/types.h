// QUORUM - Core Types Header
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Fundamental value types shared by the token, ledger and governance modules.

#ifndef QUORUM_CORE_TYPES_H
#define QUORUM_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in base units. Ledger counters are unsigned.
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// floor(value * percent / 100) without overflowing 64 bits.
inline Amount PercentOf(Amount value, uint32_t percent) {
    return (value / 100) * percent + ((value % 100) * percent) / 100;
}

/// a + b, or false when the sum would not fit in an Amount.
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a > MAX_AMOUNT - b) {
        return false;
    }
    out = a + b;
    return true;
}

// ============================================================================
// Fixed-width Byte Strings
// ============================================================================

/// Fixed-size byte string used for hashes and account addresses.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { data_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies min(len, SIZE) bytes; the remainder is zero.
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const BaseHash& other) const noexcept { return !(*this == other); }
    bool operator<(const BaseHash& other) const noexcept { return data_ < other.data_; }

    /// Lowercase hex, first byte first
    std::string ToHex() const;

    /// Parse exactly SIZE*2 hex characters, optional "0x" prefix.
    /// Throws std::invalid_argument on malformed input.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit account address (20 bytes).
/// The null address doubles as the native-currency marker for withdrawals.
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }

    /// "0x" + first 4 bytes + "..", for log lines
    std::string ToShortString() const;

    /// "0x" + full hex
    std::string ToString() const { return "0x" + ToHex(); }
};

/// Null address constant
inline const Address& NullAddress() {
    static const Address kNull;
    return kNull;
}

} // namespace quorum

#endif // QUORUM_CORE_TYPES_H
