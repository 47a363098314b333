// StakeLedger - Serialization Header
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Byte-level serialization used for persisted ledger records.
// Integers are little-endian; amounts are 32-byte big-endian so that
// encoded records compare and diff predictably.

#ifndef STAKELEDGER_CORE_SERIALIZE_H
#define STAKELEDGER_CORE_SERIALIZE_H

#include <stakeledger/core/types.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace stakeledger {

/// Maximum length accepted for a serialized string
static constexpr uint64_t MAX_STRING_SIZE = 0x10000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    explicit DataStream(const std::string& bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

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

    /// Unread bytes as a string (for database values)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Primitive Serialization
// ============================================================================

void WriteU8(DataStream& s, uint8_t v);
void WriteU64(DataStream& s, uint64_t v);
void WriteI64(DataStream& s, int64_t v);
void WriteCompactSize(DataStream& s, uint64_t v);
void WriteString(DataStream& s, const std::string& v);
void WriteAmount(DataStream& s, const Amount& v);
void WriteAddress(DataStream& s, const Address& v);

uint8_t ReadU8(DataStream& s);
uint64_t ReadU64(DataStream& s);
int64_t ReadI64(DataStream& s);
uint64_t ReadCompactSize(DataStream& s);
std::string ReadString(DataStream& s);
Amount ReadAmount(DataStream& s);
Address ReadAddress(DataStream& s);

} // namespace stakeledger

#endif // STAKELEDGER_CORE_SERIALIZE_H
