//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/Scalar.hpp
// Purpose: Fixed-width integer operand value extracted from an instruction.
// Key invariants: The stored bits never exceed bitLength; bitLength <= 64.
// Ownership/Lifetime: Value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <ostream>

namespace eqtab::program
{

/// @brief Integer of a declared bit width and signedness.
/// @details Two scalars are equal only when width, signedness and masked bits
///          all agree, so a byte-sized 1 does not equal a word-sized 1.
class Scalar
{
  public:
    Scalar() = default;

    /// @brief Build a scalar, truncating @p value to @p bitLength bits.
    /// @param bitLength Width in bits; values above 64 are clamped to 64.
    Scalar(unsigned bitLength, uint64_t value, bool isSigned) noexcept;

    unsigned bitLength() const noexcept
    {
        return bitLength_;
    }

    bool isSigned() const noexcept
    {
        return signed_;
    }

    /// @brief Interpreted value: sign-extended when signed, zero-extended otherwise.
    int64_t value() const noexcept
    {
        return signed_ ? signedValue() : static_cast<int64_t>(bits_);
    }

    /// @brief Value sign-extended from bitLength().
    int64_t signedValue() const noexcept;

    /// @brief Value zero-extended from bitLength().
    uint64_t unsignedValue() const noexcept
    {
        return bits_;
    }

    friend bool operator==(const Scalar &a, const Scalar &b) noexcept
    {
        return a.bitLength_ == b.bitLength_ && a.signed_ == b.signed_ && a.bits_ == b.bits_;
    }

    friend bool operator!=(const Scalar &a, const Scalar &b) noexcept
    {
        return !(a == b);
    }

  private:
    unsigned bitLength_ = 0;
    uint64_t bits_ = 0;
    bool signed_ = false;
};

std::ostream &operator<<(std::ostream &os, const Scalar &s);

} // namespace eqtab::program
