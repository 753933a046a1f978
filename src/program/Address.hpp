//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: program/Address.hpp
// Purpose: Declare addresses, address ranges and sets, and the translation
//          between addresses and storage keys.
// Key invariants: AddressSet ranges are sorted, disjoint and non-adjacent.
//                 Storage keys are monotonic within one address space.
// Ownership/Lifetime: All types are values; AddressMap implementations are
//                     borrowed by the stores that use them.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace eqtab::program
{

/// @brief Location in a program's address space.
struct Address
{
    uint16_t space = 0;  ///< Address space identifier.
    uint64_t offset = 0; ///< Byte offset within the space.

    friend bool operator==(const Address &a, const Address &b) noexcept
    {
        return a.space == b.space && a.offset == b.offset;
    }

    friend bool operator!=(const Address &a, const Address &b) noexcept
    {
        return !(a == b);
    }

    friend bool operator<(const Address &a, const Address &b) noexcept
    {
        return a.space != b.space ? a.space < b.space : a.offset < b.offset;
    }

    friend bool operator<=(const Address &a, const Address &b) noexcept
    {
        return !(b < a);
    }
};

/// @brief Render as `space:0xoffset` for traces and test output.
std::string toString(const Address &addr);

std::ostream &operator<<(std::ostream &os, const Address &addr);

/// @brief Inclusive address range within a single space.
struct AddressRange
{
    Address min; ///< First address in the range.
    Address max; ///< Last address in the range; same space as @c min.

    bool contains(const Address &addr) const noexcept
    {
        return min <= addr && addr <= max;
    }
};

/// @brief Normalised set of addresses stored as merged ranges.
class AddressSet
{
  public:
    AddressSet() = default;

    /// @brief Construct from a single inclusive range.
    AddressSet(const Address &min, const Address &max);

    /// @brief Add an inclusive range; ranges spanning spaces are ignored.
    void add(const AddressRange &range);

    /// @brief Add a single address.
    void add(const Address &addr);

    bool contains(const Address &addr) const;

    bool empty() const noexcept
    {
        return ranges_.empty();
    }

    /// @brief Total count of addresses across all ranges, saturating at UINT64_MAX.
    uint64_t numAddresses() const;

    /// @brief Ranges in ascending order.
    const std::vector<AddressRange> &ranges() const noexcept
    {
        return ranges_;
    }

  private:
    std::vector<AddressRange> ranges_;
};

/// @brief Sentinel returned for addresses that have no storage key.
inline constexpr int64_t kInvalidAddressKey = -1;

/// @brief Inclusive window of address keys.
struct AddressKeyRange
{
    int64_t first = 0;
    int64_t last = 0;
};

/// @brief Translates addresses to storage-comparable keys and back.
class AddressMap
{
  public:
    virtual ~AddressMap() = default;

    /// @brief Encode @p addr as a storage key.
    /// @param create Whether the map may allocate new key space for @p addr.
    /// @return Storage key, or kInvalidAddressKey when @p addr cannot be encoded.
    virtual int64_t getKey(const Address &addr, bool create) const = 0;

    /// @brief Decode a key produced by getKey().
    virtual std::optional<Address> decodeAddress(int64_t key) const = 0;

    /// @brief Key windows covering every mappable address in [@p first, @p last].
    /// @details Endpoints outside the encodable region are clamped to the
    ///          nearest mappable address between them. An empty result means
    ///          no address in the range has a key.
    virtual std::vector<AddressKeyRange> getKeyRanges(const Address &first,
                                                      const Address &last) const = 0;
};

/// @brief AddressMap placing each space in its own 2^48-sized key window.
class FlatAddressMap final : public AddressMap
{
  public:
    static constexpr unsigned kOffsetBits = 48;
    static constexpr uint64_t kOffsetLimit = uint64_t{1} << kOffsetBits;
    static constexpr uint16_t kMaxSpace = 0x7FFE;

    int64_t getKey(const Address &addr, bool create) const override;
    std::optional<Address> decodeAddress(int64_t key) const override;
    std::vector<AddressKeyRange> getKeyRanges(const Address &first,
                                              const Address &last) const override;
};

} // namespace eqtab::program
