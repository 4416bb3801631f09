// QUORUM - Hex Encoding Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/hex.h"

#include <cctype>
#include <stdexcept>

namespace quorum {

namespace {

int NibbleOf(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isxdigit(u)) {
        return -1;
    }
    return std::isdigit(u) ? u - '0' : std::tolower(u) - 'a' + 10;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> TryParseHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = NibbleOf(hex[2 * i]);
        int lo = NibbleOf(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return out;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    auto bytes = TryParseHex(hex);
    if (!bytes) {
        throw std::invalid_argument("not a hex string: \"" + hex + "\"");
    }
    return std::move(*bytes);
}

bool IsValidHex(const std::string& str) {
    return !str.empty() && TryParseHex(str).has_value();
}

std::string StripHexPrefix(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return str.substr(2);
    }
    return str;
}

} // namespace quorum
