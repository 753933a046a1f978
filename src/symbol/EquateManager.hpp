//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: symbol/EquateManager.hpp
// Purpose: Equate table facade coordinating the equate and reference stores.
// Key invariants:
//   - At most one reference occupies an operand slot (opIndex with hash 0, or a
//     non-zero dynamic hash) at an address; attaching replaces the occupant.
//   - No equate is left without references once a detaching operation returns.
//   - Every public method takes the table lock exactly once.
// Ownership/Lifetime: Borrows the adapters, address map, change sink, listing,
//                     type registry and lock; they must outlive the manager.
//                     Owns both stores and their caches.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/EquateAdapters.hpp"
#include "program/Address.hpp"
#include "program/ChangeEvents.hpp"
#include "program/DataTypes.hpp"
#include "program/Listing.hpp"
#include "program/TaskMonitor.hpp"
#include "symbol/Equate.hpp"
#include "symbol/EquateConfig.hpp"
#include "symbol/EquateRefStore.hpp"
#include "symbol/EquateStore.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eqtab::symbol
{

/// @brief Collaborators an EquateManager works against.
/// @details The listing and type registry are only needed by applyEnum and
///          displayName; leave them null when those are unused.
struct EquateServices
{
    db::EquateAdapter &equates;
    db::EquateRefAdapter &references;
    const program::AddressMap &addressMap;
    program::ChangeSink &changes;
    const program::Listing *listing = nullptr;
    program::TypeRegistry *types = nullptr;
};

class EquateManager;

/// @brief Forward-only walk over addresses holding at least one reference.
/// @details Each step takes the table lock, so mutations may run between
///          steps. A storage failure is reported to the manager's handler and
///          ends the walk.
class EquateAddressIterator
{
  public:
    /// @return Next referenced address in ascending order, empty at the end.
    std::optional<program::Address> next();

  private:
    friend class EquateManager;

    EquateAddressIterator(EquateManager &manager, RefAddressCursor cursor);

    EquateManager *manager_;
    RefAddressCursor cursor_;
    bool done_ = false;
};

class EquateManager
{
  public:
    /// @param lock Table lock shared with the owning program model.
    EquateManager(EquateServices services, std::mutex &lock, EquateTableConfig config = {});

    EquateManager(const EquateManager &) = delete;
    EquateManager &operator=(const EquateManager &) = delete;

    /// @brief Create equate @p name with @p value.
    /// @return The equate, or DuplicateName, InvalidName or StorageFailure.
    Expected<Equate> createEquate(std::string_view name, int64_t value);

    /// @brief Existing equate named @p name, otherwise a new one with @p value.
    /// @note An existing equate is returned as-is even when its value differs.
    Expected<Equate> getOrCreateEquate(std::string_view name, int64_t value);

    std::optional<Equate> getEquate(std::string_view name);
    std::optional<Equate> getEquateById(db::RecordKey id);

    /// @brief Equate referenced at operand @p opIndex of @p address whose value is @p scalarValue.
    std::optional<Equate> getEquate(const program::Address &address, int opIndex, int64_t scalarValue);

    /// @brief Equates referenced at operand @p opIndex of @p address.
    std::vector<Equate> getEquates(const program::Address &address, int opIndex);

    /// @brief Equates referenced anywhere at @p address.
    std::vector<Equate> getEquates(const program::Address &address);

    /// @brief Every equate, in storage order.
    std::vector<Equate> getEquates();

    std::vector<Equate> getEquatesByValue(int64_t value);

    std::vector<EquateReference> getReferences(const program::Address &address);
    std::vector<EquateReference> getReferences(db::RecordKey equateId);
    std::size_t getReferenceCount(db::RecordKey equateId);

    EquateAddressIterator getEquateAddresses();
    EquateAddressIterator getEquateAddresses(const program::Address &start);
    EquateAddressIterator getEquateAddresses(const program::AddressSet &set);

    /// @brief Attach equate @p equateId to a slot of @p address.
    /// @details The slot is @p opIndex when @p dynamicHash is zero, otherwise the
    ///          hash. The slot's previous occupant is detached first and its
    ///          equate pruned when nothing else references it.
    /// @return The new reference; InvalidArgument for an unknown equate, an
    ///         operand index outside [0, 32767] or an unmappable address.
    Expected<EquateReference> addReference(db::RecordKey equateId,
                                           const program::Address &address,
                                           int opIndex,
                                           uint64_t dynamicHash = 0);

    /// @brief Detach equate @p equateId from operand @p opIndex of @p address.
    /// @return True when a reference was removed.
    bool removeReference(db::RecordKey equateId, const program::Address &address, int opIndex);

    /// @brief Detach equate @p equateId from the sub-operand @p dynamicHash at @p address.
    bool removeReference(db::RecordKey equateId, uint64_t dynamicHash, const program::Address &address);

    /// @brief Detach every reference to equate @p name, then delete it.
    /// @return False when no equate has that name.
    bool removeEquate(std::string_view name);

    /// @brief Rename equate @p id and emit EquateRenamed.
    Expected<Equate> renameEquate(db::RecordKey id, std::string_view newName);

    /// @brief Remove every reference in [@p start, @p end] and prune orphaned equates.
    Expected<program::TaskOutcome> deleteAddressRange(const program::Address &start,
                                                      const program::Address &end,
                                                      program::TaskMonitor &monitor);

    /// @brief Relocate references in [@p from, @p from + @p length) to @p to.
    Expected<program::TaskOutcome> moveAddressRange(const program::Address &from,
                                                    const program::Address &to,
                                                    uint64_t length,
                                                    program::TaskMonitor &monitor);

    /// @brief Bind equates for every operand scalar in @p addresses declared by @p type.
    Expected<program::TaskOutcome> applyEnum(const program::AddressSet &addresses,
                                             const program::EnumType &type,
                                             program::TaskMonitor &monitor,
                                             bool includeSubOperands);

    /// @brief Drop every cached record; the next read goes to storage.
    void invalidateCache();

    /// @brief Name to show for @p equate; derived names resolve through the type registry.
    std::string displayName(const Equate &equate);

    db::CacheStats equateCacheStats() const;
    db::CacheStats referenceCacheStats() const;

  private:
    friend class EquateAddressIterator;

    static bool occupiesSlot(const EquateReference &ref, int opIndex, uint64_t dynamicHash);

    Expected<EquateReference> addReferenceLocked(db::RecordKey equateId,
                                                 const program::Address &address,
                                                 int opIndex,
                                                 uint64_t dynamicHash);
    Expected<Equate> getOrCreateLocked(std::string_view name, int64_t value);
    Expected<void> removeRefLocked(const EquateReference &ref);
    Expected<void> pruneIfOrphanLocked(db::RecordKey equateId);
    Expected<bool> removeMatchingLocked(db::RecordKey equateId,
                                        const program::Address &address,
                                        int opIndex,
                                        std::optional<uint64_t> dynamicHash);
    Expected<std::vector<Equate>> equatesAtLocked(const program::Address &address,
                                                  std::optional<int> opIndex);

    void reportStorageError(const support::Diag &diag);
    std::ostream &trace();

    EquateServices services_;
    std::mutex &lock_;
    EquateTableConfig config_;
    EquateStore equates_;
    EquateRefStore refs_;
};

} // namespace eqtab::symbol
