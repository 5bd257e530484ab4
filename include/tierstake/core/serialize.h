// TIERSTAKE - Serialization Header
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Little-endian serialization primitives for persisted ledger state.

#ifndef TIERSTAKE_CORE_SERIALIZE_H
#define TIERSTAKE_CORE_SERIALIZE_H

#include "tierstake/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace tierstake {

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint32_t HostToLE32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t HostToLE64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint32_t LE32ToHost(uint32_t little) { return HostToLE32(little); }
inline uint64_t LE64ToHost(uint64_t little) { return HostToLE64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    explicit DataStream(const std::string& bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Unread bytes as a string (for key-value storage)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
};

// ============================================================================
// Integer and Bool Serialization
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { s.Write(&a, 1); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { s.Read(&a, 1); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) {
    a = detail::HostToLE32(a);
    s.Write(reinterpret_cast<const uint8_t*>(&a), 4);
}

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) {
    s.Read(reinterpret_cast<uint8_t*>(&a), 4);
    a = detail::LE32ToHost(a);
}

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) {
    a = detail::HostToLE64(a);
    s.Write(reinterpret_cast<const uint8_t*>(&a), 8);
}

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) {
    s.Read(reinterpret_cast<uint8_t*>(&a), 8);
    a = detail::LE64ToHost(a);
}

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { Serialize(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) {
    uint64_t raw = 0;
    Unserialize(s, raw);
    a = static_cast<int64_t>(raw);
}

template<typename Stream>
inline void Serialize(Stream& s, bool a) { Serialize(s, static_cast<uint8_t>(a ? 1 : 0)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t raw = 0;
    Unserialize(s, raw);
    a = (raw != 0);
}

// ============================================================================
// Hash Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Hash160& hash) {
    s.Write(hash.data(), Hash160::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash160& hash) {
    s.Read(hash.data(), Hash160::SIZE);
}

// ============================================================================
// DataStream Stream Operators Implementation
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

} // namespace tierstake

#endif // TIERSTAKE_CORE_SERIALIZE_H
