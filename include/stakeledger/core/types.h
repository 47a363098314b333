// StakeLedger - Core Types Header
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// This file defines fundamental types used throughout StakeLedger.

#ifndef STAKELEDGER_CORE_TYPES_H
#define STAKELEDGER_CORE_TYPES_H

#include <stakeledger/core/uint256.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace stakeledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Token quantity in 18-decimal fixed point
using Amount = Uint256;

/// Number of fractional decimal digits shared by both assets
constexpr int TOKEN_DECIMALS = 18;

/// One whole token (1e18 base units)
const Amount& OneToken();

/// Convenience: whole tokens to base units
Amount Tokens(uint64_t whole);

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse hex (optional 0x prefix); returns false on bad input
    static bool FromHex(const std::string& hex, BaseHash& out);

protected:
    std::array<Byte, SIZE> data_;
};

extern template class BaseHash<160>;

// ============================================================================
// Address
// ============================================================================

/// 160-bit account address
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const BaseHash<160>& h) : BaseHash<160>(h) {}

    /// Parse a 40-character hex address; returns a null address on failure
    static Address FromHex(const std::string& hex);

    /// Short display form ("0x1234...abcd")
    std::string ToShortString() const;
};

} // namespace stakeledger

#endif // STAKELEDGER_CORE_TYPES_H
