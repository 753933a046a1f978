//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "program/Scalar.hpp"

#include <algorithm>

namespace eqtab::program
{
namespace
{
constexpr uint64_t maskFor(unsigned bits) noexcept
{
    if (bits == 0)
        return 0;
    if (bits >= 64)
        return ~uint64_t{0};
    return (uint64_t{1} << bits) - 1;
}
} // namespace

Scalar::Scalar(unsigned bitLength, uint64_t value, bool isSigned) noexcept
    : bitLength_(std::min(bitLength, 64u)), bits_(value & maskFor(bitLength_)), signed_(isSigned)
{
}

int64_t Scalar::signedValue() const noexcept
{
    if (bitLength_ == 0)
        return 0;
    if (bitLength_ >= 64)
        return static_cast<int64_t>(bits_);
    const uint64_t sign = uint64_t{1} << (bitLength_ - 1);
    if (bits_ & sign)
        return static_cast<int64_t>(bits_ | ~maskFor(bitLength_));
    return static_cast<int64_t>(bits_);
}

std::ostream &operator<<(std::ostream &os, const Scalar &s)
{
    return os << (s.isSigned() ? "s" : "u") << s.bitLength() << ':' << s.value();
}

} // namespace eqtab::program
