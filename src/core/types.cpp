// QUORUM - Core Types Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/types.h"
#include "quorum/core/hex.h"

namespace quorum {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(BITS) + "-bit value");
    }

    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Address
// ============================================================================

std::string Address::ToShortString() const {
    return "0x" + BytesToHex(data_.data(), 4) + "..";
}

} // namespace quorum
