// StakeLedger - 256-bit Unsigned Integer Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/core/uint256.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace stakeledger {

namespace {

int HexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// 10^n for n in [0, 77]
Uint256 PowerOfTen(int n) {
    Uint256 result(1);
    Uint256 ten(10);
    for (int i = 0; i < n; ++i) {
        Uint256 high;
        result = Uint256::Mul(result, ten, high);
    }
    return result;
}

} // namespace

// ============================================================================
// Parsing / Formatting
// ============================================================================

std::optional<Uint256> Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.empty() || h.size() > 64) {
        return std::nullopt;
    }

    Uint256 result;
    for (char c : h) {
        int nibble = HexNibble(c);
        if (nibble < 0) return std::nullopt;
        result = result << 4;
        result.limbs[0] |= static_cast<uint64_t>(nibble);
    }
    return result;
}

std::optional<Uint256> Uint256::FromDecimal(const std::string& dec) {
    if (dec.empty()) {
        return std::nullopt;
    }

    Uint256 result;
    const Uint256 ten(10);
    for (char c : dec) {
        if (c < '0' || c > '9') return std::nullopt;
        Uint256 scaled;
        if (!CheckedMul(result, ten, scaled)) return std::nullopt;
        if (!CheckedAdd(scaled, Uint256(static_cast<uint64_t>(c - '0')), result)) {
            return std::nullopt;
        }
    }
    return result;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);

    for (int i = 3; i >= 0; --i) {
        for (int j = 60; j >= 0; j -= 4) {
            result.push_back(hexChars[(limbs[i] >> j) & 0x0F]);
        }
    }
    return result;
}

std::string Uint256::ToString() const {
    if (IsZero()) {
        return "0";
    }

    // Peel off 19 digits at a time
    const Uint256 chunk(10000000000000000000ULL);
    std::string result;
    Uint256 value = *this;
    while (!value.IsZero()) {
        Uint256 q, r;
        DivMod(value, chunk, q, r);
        std::string digits = std::to_string(r.limbs[0]);
        if (!q.IsZero()) {
            digits.insert(0, 19 - digits.size(), '0');
        }
        result.insert(0, digits);
        value = q;
    }
    return result;
}

std::array<uint8_t, 32> Uint256::ToBigEndian() const {
    std::array<uint8_t, 32> out{};
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 8; ++j) {
            out[31 - (i * 8 + j)] = static_cast<uint8_t>(limbs[i] >> (j * 8));
        }
    }
    return out;
}

Uint256 Uint256::FromBigEndian(const uint8_t* data) {
    Uint256 result;
    for (int i = 0; i < 4; ++i) {
        uint64_t limb = 0;
        for (int j = 7; j >= 0; --j) {
            limb = (limb << 8) | data[31 - (i * 8 + j)];
        }
        result.limbs[i] = limb;
    }
    return result;
}

// ============================================================================
// Comparison
// ============================================================================

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

int Uint256::Bits() const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != 0) {
            return i * 64 + (64 - __builtin_clzll(limbs[i]));
        }
    }
    return 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

// ============================================================================
// Shifts
// ============================================================================

Uint256 Uint256::operator<<(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 0; i < 4 - limbShift; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

// ============================================================================
// Limb Arithmetic
// ============================================================================

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) +
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }

    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) -
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>(diff >> 127) & 1;
    }

    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 256 x 256 -> 512
    uint64_t result[8] = {0};

    for (int i = 0; i < 4; ++i) {
        uint64_t carry = 0;
        for (int j = 0; j < 4; ++j) {
            __uint128_t cur = static_cast<__uint128_t>(a.limbs[i]) * b.limbs[j] +
                              result[i + j] + carry;
            result[i + j] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
        result[i + 4] = carry;
    }

    high = Uint256(result[4], result[5], result[6], result[7]);
    return Uint256(result[0], result[1], result[2], result[3]);
}

bool Uint256::DivMod(const Uint256& a, const Uint256& b,
                     Uint256& quotient, Uint256& remainder) {
    if (b.IsZero()) {
        return false;
    }
    if (a < b) {
        quotient = Uint256();
        remainder = a;
        return true;
    }
    if (a.FitsUint64() && b.FitsUint64()) {
        quotient = Uint256(a.limbs[0] / b.limbs[0]);
        remainder = Uint256(a.limbs[0] % b.limbs[0]);
        return true;
    }

    // Shift-subtract, starting at the highest set bit of the dividend
    Uint256 q, r;
    for (int bit = a.Bits() - 1; bit >= 0; --bit) {
        bool top = (r.limbs[3] >> 63) != 0;
        r = r << 1;
        r.limbs[0] |= (a.limbs[bit / 64] >> (bit % 64)) & 1;
        if (top || r >= b) {
            bool borrow;
            r = Sub(r, b, borrow);
            q.limbs[bit / 64] |= (1ULL << (bit % 64));
        }
    }
    quotient = q;
    remainder = r;
    return true;
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

bool CheckedAdd(const Uint256& a, const Uint256& b, Uint256& out) {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);
    if (carry) return false;
    out = sum;
    return true;
}

bool CheckedSub(const Uint256& a, const Uint256& b, Uint256& out) {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);
    if (borrow) return false;
    out = diff;
    return true;
}

bool CheckedMul(const Uint256& a, const Uint256& b, Uint256& out) {
    Uint256 high;
    Uint256 low = Uint256::Mul(a, b, high);
    if (!high.IsZero()) return false;
    out = low;
    return true;
}

bool MulDiv(const Uint256& a, const Uint256& b, const Uint256& c, Uint256& out) {
    if (c.IsZero()) {
        return false;
    }

    Uint256 high;
    Uint256 low = Uint256::Mul(a, b, high);
    if (high.IsZero()) {
        Uint256 q, r;
        Uint256::DivMod(low, c, q, r);
        out = q;
        return true;
    }

    // Quotient fits in 256 bits only if high < c
    if (high >= c) {
        return false;
    }

    // 512-bit by 256-bit long division, remainder carried in (rem, overflow bit)
    Uint256 rem = high;
    Uint256 q;
    for (int bit = 255; bit >= 0; --bit) {
        bool top = (rem.limbs[3] >> 63) != 0;
        rem = rem << 1;
        rem.limbs[0] |= (low.limbs[bit / 64] >> (bit % 64)) & 1;
        if (top || rem >= c) {
            bool borrow;
            rem = Uint256::Sub(rem, c, borrow);
            q.limbs[bit / 64] |= (1ULL << (bit % 64));
        }
    }
    out = q;
    return true;
}

// ============================================================================
// Throwing Operators
// ============================================================================

Uint256 operator+(const Uint256& a, const Uint256& b) {
    Uint256 out;
    if (!CheckedAdd(a, b, out)) throw std::overflow_error("Uint256 addition overflow");
    return out;
}

Uint256 operator-(const Uint256& a, const Uint256& b) {
    Uint256 out;
    if (!CheckedSub(a, b, out)) throw std::overflow_error("Uint256 subtraction underflow");
    return out;
}

Uint256 operator*(const Uint256& a, const Uint256& b) {
    Uint256 out;
    if (!CheckedMul(a, b, out)) throw std::overflow_error("Uint256 multiplication overflow");
    return out;
}

Uint256 operator/(const Uint256& a, const Uint256& b) {
    Uint256 q, r;
    if (!Uint256::DivMod(a, b, q, r)) throw std::domain_error("Uint256 division by zero");
    return q;
}

Uint256 operator%(const Uint256& a, const Uint256& b) {
    Uint256 q, r;
    if (!Uint256::DivMod(a, b, q, r)) throw std::domain_error("Uint256 division by zero");
    return r;
}

Uint256& operator+=(Uint256& a, const Uint256& b) {
    a = a + b;
    return a;
}

Uint256& operator-=(Uint256& a, const Uint256& b) {
    a = a - b;
    return a;
}

// ============================================================================
// Decimal Token Notation
// ============================================================================

std::optional<Uint256> ParseUnits(const std::string& text, int decimals) {
    if (text.empty() || decimals < 0 || decimals > 77) {
        return std::nullopt;
    }

    size_t dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? "" : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) return std::nullopt;
    if (dot != std::string::npos && frac.empty()) return std::nullopt;
    if (frac.size() > static_cast<size_t>(decimals)) return std::nullopt;
    if (whole.empty()) whole = "0";

    auto wholeValue = Uint256::FromDecimal(whole);
    if (!wholeValue) return std::nullopt;

    frac.append(static_cast<size_t>(decimals) - frac.size(), '0');
    Uint256 fracValue;
    if (!frac.empty()) {
        auto parsed = Uint256::FromDecimal(frac);
        if (!parsed) return std::nullopt;
        fracValue = *parsed;
    }

    Uint256 scaled, result;
    if (!CheckedMul(*wholeValue, PowerOfTen(decimals), scaled)) return std::nullopt;
    if (!CheckedAdd(scaled, fracValue, result)) return std::nullopt;
    return result;
}

std::string FormatUnits(const Uint256& amount, int decimals) {
    std::string digits = amount.ToString();
    if (decimals <= 0) {
        return digits;
    }

    size_t d = static_cast<size_t>(decimals);
    if (digits.size() <= d) {
        digits.insert(0, d - digits.size() + 1, '0');
    }
    std::string whole = digits.substr(0, digits.size() - d);
    std::string frac = digits.substr(digits.size() - d);

    size_t last = frac.find_last_not_of('0');
    if (last == std::string::npos) {
        return whole;
    }
    return whole + "." + frac.substr(0, last + 1);
}

std::ostream& operator<<(std::ostream& os, const Uint256& value) {
    return os << value.ToString();
}

} // namespace stakeledger
