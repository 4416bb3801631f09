// QUORUM - Hex Encoding
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Lowercase hex on output; either case and an optional "0x" prefix
// (see StripHexPrefix) accepted on input.

#ifndef QUORUM_CORE_HEX_H
#define QUORUM_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quorum {

std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Decode hex digits, or nullopt on odd length or a non-hex character
std::optional<std::vector<uint8_t>> TryParseHex(const std::string& hex);

/// Throwing form of TryParseHex (std::invalid_argument)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True for a non-empty, even-length string of hex digits
bool IsValidHex(const std::string& str);

/// "0xabcd" -> "abcd"; anything else is returned unchanged
std::string StripHexPrefix(const std::string& str);

} // namespace quorum

#endif // QUORUM_CORE_HEX_H
