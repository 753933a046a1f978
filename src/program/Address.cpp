//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Address formatting, AddressSet normalisation and flat key encoding.
/// @details AddressSet keeps its ranges merged on insertion so membership tests
///          are a binary search and iteration yields ascending, disjoint ranges.
//
//===----------------------------------------------------------------------===//

#include "program/Address.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <sstream>

namespace eqtab::program
{

std::string toString(const Address &addr)
{
    std::ostringstream os;
    os << addr;
    return os.str();
}

std::ostream &operator<<(std::ostream &os, const Address &addr)
{
    const auto flags = os.flags();
    os << addr.space << ":0x" << std::hex << addr.offset;
    os.flags(flags);
    return os;
}

AddressSet::AddressSet(const Address &min, const Address &max)
{
    add(AddressRange{min, max});
}

/// @brief Insert @p range and coalesce it with overlapping or adjacent ranges.
void AddressSet::add(const AddressRange &range)
{
    if (range.min.space != range.max.space || range.max < range.min)
        return;

    AddressRange merged = range;
    std::vector<AddressRange> out;
    out.reserve(ranges_.size() + 1);
    bool placed = false;
    for (const AddressRange &r : ranges_)
    {
        const bool sameSpace = r.min.space == merged.min.space;
        const bool before =
            !sameSpace ? r.min.space < merged.min.space
                       : (r.max.offset != std::numeric_limits<uint64_t>::max() &&
                          r.max.offset + 1 < merged.min.offset);
        const bool after =
            !sameSpace ? r.min.space > merged.min.space
                       : (merged.max.offset != std::numeric_limits<uint64_t>::max() &&
                          merged.max.offset + 1 < r.min.offset);
        if (before)
        {
            out.push_back(r);
        }
        else if (after)
        {
            if (!placed)
            {
                out.push_back(merged);
                placed = true;
            }
            out.push_back(r);
        }
        else
        {
            merged.min = std::min(merged.min, r.min);
            merged.max = std::max(merged.max, r.max);
        }
    }
    if (!placed)
        out.push_back(merged);
    ranges_ = std::move(out);
}

void AddressSet::add(const Address &addr)
{
    add(AddressRange{addr, addr});
}

bool AddressSet::contains(const Address &addr) const
{
    auto it = std::upper_bound(ranges_.begin(),
                               ranges_.end(),
                               addr,
                               [](const Address &a, const AddressRange &r) { return a < r.min; });
    if (it == ranges_.begin())
        return false;
    return std::prev(it)->contains(addr);
}

uint64_t AddressSet::numAddresses() const
{
    uint64_t total = 0;
    for (const AddressRange &r : ranges_)
    {
        const uint64_t span = r.max.offset - r.min.offset;
        if (span == std::numeric_limits<uint64_t>::max() ||
            total > std::numeric_limits<uint64_t>::max() - span - 1)
            return std::numeric_limits<uint64_t>::max();
        total += span + 1;
    }
    return total;
}

int64_t FlatAddressMap::getKey(const Address &addr, bool /*create*/) const
{
    if (addr.space > kMaxSpace || addr.offset >= kOffsetLimit)
        return kInvalidAddressKey;
    return static_cast<int64_t>((static_cast<uint64_t>(addr.space) << kOffsetBits) | addr.offset);
}

std::optional<Address> FlatAddressMap::decodeAddress(int64_t key) const
{
    if (key < 0)
        return std::nullopt;
    const auto raw = static_cast<uint64_t>(key);
    const auto space = static_cast<uint64_t>(raw >> kOffsetBits);
    if (space > kMaxSpace)
        return std::nullopt;
    return Address{static_cast<uint16_t>(space), raw & (kOffsetLimit - 1)};
}

std::vector<AddressKeyRange> FlatAddressMap::getKeyRanges(const Address &first,
                                                          const Address &last) const
{
    if (last < first || first.space > kMaxSpace)
        return {};

    Address lo = first;
    if (lo.offset >= kOffsetLimit)
    {
        if (lo.space == kMaxSpace)
            return {};
        lo = Address{static_cast<uint16_t>(lo.space + 1), 0};
    }
    Address hi = last;
    if (hi.space > kMaxSpace)
        hi = Address{kMaxSpace, kOffsetLimit - 1};
    else if (hi.offset >= kOffsetLimit)
        hi.offset = kOffsetLimit - 1;

    const int64_t loKey = getKey(lo, false);
    const int64_t hiKey = getKey(hi, false);
    if (hiKey < loKey)
        return {};
    return {AddressKeyRange{loKey, hiKey}};
}

} // namespace eqtab::program
