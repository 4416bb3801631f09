// QUORUM - Serialization Header
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Little-endian binary serialization used for persisted ledger, token and
// governance state. Readers throw std::ios_base::failure on truncated or
// malformed input; callers convert that into a boolean at their boundary.

#ifndef QUORUM_CORE_SERIALIZE_H
#define QUORUM_CORE_SERIALIZE_H

#include "quorum/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace quorum {

/// Upper bound on any length prefix read from a stream
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Integers (little-endian)
// ============================================================================

template<typename Stream, typename T>
inline void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE expects an unsigned type");
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename Stream, typename T>
inline T ReadLE(Stream& s) {
    static_assert(std::is_unsigned<T>::value, "ReadLE expects an unsigned type");
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(buf[i]) << (8 * i);
    }
    return value;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<Stream, uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFD);
        WriteLE<Stream, uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFE);
        WriteLE<Stream, uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<Stream, uint8_t>(s, 0xFF);
        WriteLE<Stream, uint64_t>(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<Stream, uint8_t>(s);
    uint64_t size = 0;
    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ReadLE<Stream, uint16_t>(s);
        if (size < 253) throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else if (marker == 254) {
        size = ReadLE<Stream, uint32_t>(s);
        if (size < 0x10000) throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else {
        size = ReadLE<Stream, uint64_t>(s);
        if (size < 0x100000000ULL) throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize Overloads
// ============================================================================

template<typename Stream> inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { WriteLE(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a) {
    WriteLE(s, static_cast<uint64_t>(a));
}
template<typename Stream> inline void Serialize(Stream& s, bool a) {
    WriteLE<Stream, uint8_t>(s, a ? 1 : 0);
}

template<typename Stream> inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<Stream, uint8_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<Stream, uint32_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<Stream, uint64_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& a) {
    a = static_cast<int64_t>(ReadLE<Stream, uint64_t>(s));
}
template<typename Stream> inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ReadLE<Stream, uint8_t>(s);
    if (v > 1) throw std::ios_base::failure("invalid boolean encoding");
    a = (v == 1);
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(reinterpret_cast<uint8_t*>(&str[0]), size);
    }
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Address& addr) {
    s.Write(addr.data(), Address::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Address& addr) {
    s.Read(addr.data(), Address::SIZE);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(static_cast<size_t>(std::min<uint64_t>(size, 4096)));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& m) {
    WriteCompactSize(s, m.size());
    for (const auto& kv : m) {
        Serialize(s, kv.first);
        Serialize(s, kv.second);
    }
}

template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& m) {
    uint64_t size = ReadCompactSize(s);
    m.clear();
    for (uint64_t i = 0; i < size; ++i) {
        K key;
        V value;
        Unserialize(s, key);
        Unserialize(s, value);
        m.emplace(std::move(key), std::move(value));
    }
}

/// Enumerations travel as one byte; the caller validates the range.
template<typename Stream, typename E>
void SerializeEnum(Stream& s, E value) {
    WriteLE<Stream, uint8_t>(s, static_cast<uint8_t>(value));
}

template<typename Stream>
uint8_t UnserializeEnum(Stream& s, uint8_t maxValue) {
    uint8_t raw = ReadLE<Stream, uint8_t>(s);
    if (raw > maxValue) {
        throw std::ios_base::failure("enumeration value out of range");
    }
    return raw;
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace quorum

#endif // QUORUM_CORE_SERIALIZE_H
