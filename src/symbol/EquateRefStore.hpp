//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EquateRefStore.hpp
// Purpose: CRUD over equate references with address-ordered iteration and
//          bulk address relocation.
// Key invariants: No slot-exclusivity checks happen here; the EquateManager
//                 owns that rule. Address iteration is ascending and visits
//                 each referenced address once.
// Ownership/Lifetime: Borrows the adapter and address map; owns its cache.
//                     Not synchronised: callers hold the table lock.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/EquateAdapters.hpp"
#include "db/ObjectCache.hpp"
#include "program/Address.hpp"
#include "program/TaskMonitor.hpp"
#include "symbol/Equate.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace eqtab::symbol
{

using support::Expected;

using program::AddressKeyRange;

class EquateRefStore;

/// @brief Lazy, forward-only walk over referenced addresses.
/// @details Each call to next() asks storage for the next referenced address
///          key after the previous one, so references added behind the cursor
///          are not revisited and the walk always terminates.
class RefAddressCursor
{
  public:
    RefAddressCursor(EquateRefStore &store, std::vector<AddressKeyRange> ranges);

    /// @return The next referenced address, empty at the end of the walk.
    Expected<std::optional<program::Address>> next();

  private:
    EquateRefStore *store_;
    std::vector<AddressKeyRange> ranges_;
    std::size_t rangeIndex_ = 0;
    std::optional<int64_t> resumeKey_;
};

class EquateRefStore
{
  public:
    EquateRefStore(db::EquateRefAdapter &adapter,
                   const program::AddressMap &addressMap,
                   std::size_t cacheCapacity);

    /// @brief Persist a reference; fails with InvalidArgument for unmappable addresses.
    Expected<EquateReference> create(const program::Address &address,
                                     int16_t opIndex,
                                     uint64_t dynamicHash,
                                     db::RecordKey equateId);

    Expected<void> remove(db::RecordKey refId);

    /// @brief Reference @p refId; empty when it does not exist.
    Expected<std::optional<EquateReference>> get(db::RecordKey refId);

    /// @brief Keys of the references at @p address; empty for unmappable addresses.
    Expected<std::vector<db::RecordKey>> listByAddress(const program::Address &address);

    Expected<std::vector<db::RecordKey>> listByEquate(db::RecordKey equateId);

    /// @brief Resolve the references at @p address.
    Expected<std::vector<EquateReference>> referencesAt(const program::Address &address);

    /// @brief Resolve the references pointing at @p equateId.
    Expected<std::vector<EquateReference>> referencesTo(db::RecordKey equateId);

    /// @brief Key windows covering [@p first, @p last], clamped to mappable addresses.
    std::vector<AddressKeyRange> keyRanges(const program::Address &first,
                                           const program::Address &last) const
    {
        return addressMap_.getKeyRanges(first, last);
    }

    /// @brief Key windows covering every range of @p set that maps to storage.
    std::vector<AddressKeyRange> keyRanges(const program::AddressSet &set) const;

    /// @brief Address-ordered cursor over @p ranges.
    RefAddressCursor addresses(std::vector<AddressKeyRange> ranges)
    {
        return RefAddressCursor(*this, std::move(ranges));
    }

    /// @brief Cursor from @p start (or the lowest address) to the end of the key space.
    RefAddressCursor addressesFrom(const std::optional<program::Address> &start);

    /// @brief Re-key references in [@p from, @p from + @p length) by `to - from`.
    /// @details The cache is invalidated first. The monitor is polled once per
    ///          collected address and once per moved record; cancellation keeps
    ///          the records already moved. The destination is expected to be
    ///          free of references, as the owning program guarantees for moves.
    ///          The source window is clamped like any other key range, so
    ///          references in its mappable part move even when its tail runs
    ///          past the encodable region.
    /// @return Completed or Cancelled; InvalidArgument when the destination
    ///         does not map to storage.
    Expected<program::TaskOutcome> moveRange(const program::Address &from,
                                             const program::Address &to,
                                             uint64_t length,
                                             program::TaskMonitor &monitor);

    void invalidate()
    {
        cache_.invalidate();
    }

    const db::ObjectCache<db::EquateRefRecord> &cache() const noexcept
    {
        return cache_;
    }

    const program::AddressMap &addressMap() const noexcept
    {
        return addressMap_;
    }

  private:
    friend class RefAddressCursor;

    Expected<std::optional<db::EquateRefRecord>> lookup(db::RecordKey refId);
    Expected<EquateReference> toReference(const db::EquateRefRecord &rec) const;
    Expected<std::vector<EquateReference>> resolve(const std::vector<db::RecordKey> &keys);

    db::EquateRefAdapter &adapter_;
    const program::AddressMap &addressMap_;
    db::ObjectCache<db::EquateRefRecord> cache_;
};

} // namespace eqtab::symbol
