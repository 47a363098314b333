// StakeLedger - Core Types Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/core/types.h>

namespace stakeledger {

const Amount& OneToken() {
    static const Amount one = *ParseUnits("1", TOKEN_DECIMALS);
    return one;
}

Amount Tokens(uint64_t whole) {
    return Amount(whole) * OneToken();
}

// ============================================================================
// BaseHash
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(SIZE * 2);
    for (Byte b : data_) {
        result.push_back(hexChars[b >> 4]);
        result.push_back(hexChars[b & 0x0F]);
    }
    return result;
}

template<size_t BITS>
bool BaseHash<BITS>::FromHex(const std::string& hex, BaseHash& out) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.size() != SIZE * 2) {
        return false;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::array<Byte, SIZE> bytes;
    for (size_t i = 0; i < SIZE; ++i) {
        int hi = nibble(h[i * 2]);
        int lo = nibble(h[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes[i] = static_cast<Byte>((hi << 4) | lo);
    }
    out = BaseHash(bytes);
    return true;
}

template class BaseHash<160>;

// ============================================================================
// Address
// ============================================================================

Address Address::FromHex(const std::string& hex) {
    BaseHash<160> parsed;
    if (!BaseHash<160>::FromHex(hex, parsed)) {
        return Address();
    }
    return Address(parsed);
}

std::string Address::ToShortString() const {
    std::string hex = ToHex();
    return "0x" + hex.substr(0, 4) + "..." + hex.substr(hex.size() - 4);
}

} // namespace stakeledger
