// StakeLedger - 256-bit Unsigned Integer
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Token amounts are unsigned 256-bit integers in 18-decimal fixed point.
// Arithmetic comes in two flavours:
// - Checked helpers (CheckedAdd, CheckedSub, CheckedMul, MulDiv) that report
//   overflow through their return value. Ledger code uses these.
// - Operators that throw std::overflow_error / std::domain_error, for call
//   sites whose preconditions are already established.

#ifndef STAKELEDGER_CORE_UINT256_H
#define STAKELEDGER_CORE_UINT256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace stakeledger {

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Implicit so that literals like `Amount(0)` and `x == 0` read naturally
    constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Largest representable value (2^256 - 1)
    static constexpr Uint256 Max() {
        return Uint256(~0ULL, ~0ULL, ~0ULL, ~0ULL);
    }

    /// Parse big-endian hex (optional 0x prefix)
    static std::optional<Uint256> FromHex(const std::string& hex);

    /// Parse an unsigned base-10 integer
    static std::optional<Uint256> FromDecimal(const std::string& dec);

    /// 64 hex characters, most significant first
    std::string ToHex() const;

    /// Base-10 representation
    std::string ToString() const;

    /// 32 bytes, big-endian (stable key/value encoding)
    std::array<uint8_t, 32> ToBigEndian() const;
    static Uint256 FromBigEndian(const uint8_t* data);

    bool IsZero() const;

    /// Number of significant bits (0 for zero)
    int Bits() const;

    /// Value fits in a uint64_t
    bool FitsUint64() const { return limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0; }
    uint64_t Low64() const { return limbs[0]; }

    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    /// Raw limb arithmetic
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Long division. Returns false on division by zero.
    static bool DivMod(const Uint256& a, const Uint256& b,
                       Uint256& quotient, Uint256& remainder);
};

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// out = a + b; false on overflow (out untouched)
bool CheckedAdd(const Uint256& a, const Uint256& b, Uint256& out);

/// out = a - b; false on underflow (out untouched)
bool CheckedSub(const Uint256& a, const Uint256& b, Uint256& out);

/// out = a * b; false on overflow (out untouched)
bool CheckedMul(const Uint256& a, const Uint256& b, Uint256& out);

/// out = floor(a * b / c) with a 512-bit intermediate product.
/// False if c is zero or the quotient does not fit in 256 bits.
bool MulDiv(const Uint256& a, const Uint256& b, const Uint256& c, Uint256& out);

// ============================================================================
// Throwing Operators
// ============================================================================

Uint256 operator+(const Uint256& a, const Uint256& b);
Uint256 operator-(const Uint256& a, const Uint256& b);
Uint256 operator*(const Uint256& a, const Uint256& b);
Uint256 operator/(const Uint256& a, const Uint256& b);
Uint256 operator%(const Uint256& a, const Uint256& b);

Uint256& operator+=(Uint256& a, const Uint256& b);
Uint256& operator-=(Uint256& a, const Uint256& b);

// ============================================================================
// Decimal Token Notation
// ============================================================================

/// Parse "12.345" into base units with the given number of decimals.
/// Rejects signs, exponents, empty input and excess fractional digits.
std::optional<Uint256> ParseUnits(const std::string& text, int decimals);

/// Render base units as a decimal string with trailing zeros trimmed
std::string FormatUnits(const Uint256& amount, int decimals);

/// Stream as base-10 (also used by test failure output)
std::ostream& operator<<(std::ostream& os, const Uint256& value);

} // namespace stakeledger

#endif // STAKELEDGER_CORE_UINT256_H
