//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements the equate table coordinator.
/// @details Public methods lock once and delegate to `...Locked` helpers, which
///          never lock. Storage failures are routed through reportStorageError
///          before the method returns; lookups then yield empty results and
///          bulk operations yield TaskOutcome::StorageFailed. Validation errors
///          go back to the caller without touching the handler.
//
//===----------------------------------------------------------------------===//

#include "symbol/EquateManager.hpp"

#include "symbol/EnumApplier.hpp"
#include "symbol/EquateNames.hpp"

#include <iostream>
#include <limits>
#include <utility>

namespace eqtab::symbol
{

using program::TaskOutcome;
using support::ErrorCode;
using support::makeError;

namespace
{
bool isStorageFailure(const support::Diag &diag)
{
    return diag.code == ErrorCode::StorageFailure;
}

const char *toString(TaskOutcome outcome)
{
    switch (outcome)
    {
        case TaskOutcome::Completed:
            return "completed";
        case TaskOutcome::Cancelled:
            return "cancelled";
        case TaskOutcome::StorageFailed:
            return "storage-failed";
    }
    return "unknown";
}
} // namespace

//===----------------------------------------------------------------------===//
// EquateAddressIterator
//===----------------------------------------------------------------------===//

EquateAddressIterator::EquateAddressIterator(EquateManager &manager, RefAddressCursor cursor)
    : manager_(&manager), cursor_(std::move(cursor))
{
}

std::optional<program::Address> EquateAddressIterator::next()
{
    if (done_)
        return std::nullopt;
    std::lock_guard<std::mutex> guard(manager_->lock_);
    auto addr = cursor_.next();
    if (!addr)
    {
        done_ = true;
        manager_->reportStorageError(addr.error());
        return std::nullopt;
    }
    if (!addr.value())
        done_ = true;
    return addr.value();
}

//===----------------------------------------------------------------------===//
// EquateManager
//===----------------------------------------------------------------------===//

EquateManager::EquateManager(EquateServices services, std::mutex &lock, EquateTableConfig config)
    : services_(services),
      lock_(lock),
      config_(std::move(config)),
      equates_(services.equates, services.changes, config_.equateCacheCapacity),
      refs_(services.references, services.addressMap, config_.referenceCacheCapacity)
{
}

void EquateManager::reportStorageError(const support::Diag &diag)
{
    if (config_.trace)
        trace() << "storage failure: " << diag.message << "\n";
    if (config_.onStorageError)
        config_.onStorageError(diag);
    else
        support::printDiag(diag, std::cerr);
}

std::ostream &EquateManager::trace()
{
    std::ostream &os = config_.traceStream ? *config_.traceStream : std::cerr;
    os << "[equates] ";
    return os;
}

bool EquateManager::occupiesSlot(const EquateReference &ref, int opIndex, uint64_t dynamicHash)
{
    if (dynamicHash != 0)
        return ref.dynamicHash == dynamicHash;
    return ref.dynamicHash == 0 && ref.opIndex == opIndex;
}

Expected<Equate> EquateManager::createEquate(std::string_view name, int64_t value)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto eq = equates_.create(name, value);
    if (!eq)
    {
        if (isStorageFailure(eq.error()))
            reportStorageError(eq.error());
        return eq;
    }
    if (config_.trace)
        trace() << "create '" << eq.value().name << "' = " << value << "\n";
    return eq;
}

Expected<Equate> EquateManager::getOrCreateLocked(std::string_view name, int64_t value)
{
    auto existing = equates_.getByName(name);
    if (!existing)
        return existing.error();
    if (existing.value())
        return *existing.value();
    auto eq = equates_.create(name, value);
    if (eq && config_.trace)
        trace() << "create '" << eq.value().name << "' = " << value << "\n";
    return eq;
}

Expected<Equate> EquateManager::getOrCreateEquate(std::string_view name, int64_t value)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto eq = getOrCreateLocked(name, value);
    if (!eq && isStorageFailure(eq.error()))
        reportStorageError(eq.error());
    return eq;
}

std::optional<Equate> EquateManager::getEquate(std::string_view name)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto eq = equates_.getByName(name);
    if (!eq)
    {
        reportStorageError(eq.error());
        return std::nullopt;
    }
    return eq.value();
}

std::optional<Equate> EquateManager::getEquateById(db::RecordKey id)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto eq = equates_.getById(id);
    if (!eq)
    {
        reportStorageError(eq.error());
        return std::nullopt;
    }
    return eq.value();
}

Expected<std::vector<Equate>> EquateManager::equatesAtLocked(const program::Address &address,
                                                             std::optional<int> opIndex)
{
    auto refs = refs_.referencesAt(address);
    if (!refs)
        return refs.error();
    std::vector<Equate> out;
    for (const EquateReference &ref : refs.value())
    {
        if (opIndex && ref.opIndex != *opIndex)
            continue;
        auto eq = equates_.getById(ref.equateId);
        if (!eq)
            return eq.error();
        if (eq.value())
            out.push_back(std::move(*eq.value()));
    }
    return out;
}

std::optional<Equate> EquateManager::getEquate(const program::Address &address,
                                               int opIndex,
                                               int64_t scalarValue)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto found = equatesAtLocked(address, opIndex);
    if (!found)
    {
        reportStorageError(found.error());
        return std::nullopt;
    }
    for (Equate &eq : found.value())
    {
        if (eq.value == scalarValue)
            return std::move(eq);
    }
    return std::nullopt;
}

std::vector<Equate> EquateManager::getEquates(const program::Address &address, int opIndex)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto found = equatesAtLocked(address, opIndex);
    if (!found)
    {
        reportStorageError(found.error());
        return {};
    }
    return std::move(found.value());
}

std::vector<Equate> EquateManager::getEquates(const program::Address &address)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto found = equatesAtLocked(address, std::nullopt);
    if (!found)
    {
        reportStorageError(found.error());
        return {};
    }
    return std::move(found.value());
}

std::vector<Equate> EquateManager::getEquates()
{
    std::lock_guard<std::mutex> guard(lock_);
    auto all = equates_.all();
    if (!all)
    {
        reportStorageError(all.error());
        return {};
    }
    return std::move(all.value());
}

std::vector<Equate> EquateManager::getEquatesByValue(int64_t value)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto found = equates_.getByValue(value);
    if (!found)
    {
        reportStorageError(found.error());
        return {};
    }
    return std::move(found.value());
}

std::vector<EquateReference> EquateManager::getReferences(const program::Address &address)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto refs = refs_.referencesAt(address);
    if (!refs)
    {
        reportStorageError(refs.error());
        return {};
    }
    return std::move(refs.value());
}

std::vector<EquateReference> EquateManager::getReferences(db::RecordKey equateId)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto refs = refs_.referencesTo(equateId);
    if (!refs)
    {
        reportStorageError(refs.error());
        return {};
    }
    return std::move(refs.value());
}

std::size_t EquateManager::getReferenceCount(db::RecordKey equateId)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto keys = refs_.listByEquate(equateId);
    if (!keys)
    {
        reportStorageError(keys.error());
        return 0;
    }
    return keys.value().size();
}

EquateAddressIterator EquateManager::getEquateAddresses()
{
    std::lock_guard<std::mutex> guard(lock_);
    return EquateAddressIterator(*this, refs_.addressesFrom(std::nullopt));
}

EquateAddressIterator EquateManager::getEquateAddresses(const program::Address &start)
{
    std::lock_guard<std::mutex> guard(lock_);
    return EquateAddressIterator(*this, refs_.addressesFrom(start));
}

EquateAddressIterator EquateManager::getEquateAddresses(const program::AddressSet &set)
{
    std::lock_guard<std::mutex> guard(lock_);
    return EquateAddressIterator(*this, refs_.addresses(refs_.keyRanges(set)));
}

Expected<void> EquateManager::removeRefLocked(const EquateReference &ref)
{
    auto eq = equates_.getById(ref.equateId);
    if (!eq)
        return eq.error();
    if (auto removed = refs_.remove(ref.id); !removed)
        return removed;

    program::ChangeRecord change;
    change.kind = program::ChangeKind::ReferenceRemoved;
    if (eq.value())
    {
        change.info.name = eq.value()->name;
        change.info.value = eq.value()->value;
    }
    change.info.address = ref.address;
    change.info.opIndex = ref.opIndex;
    change.info.dynamicHash = ref.dynamicHash;
    services_.changes.notify(change);

    if (config_.trace)
        trace() << "detach '" << change.info.name << "' at " << ref.address << " op "
                << ref.opIndex << " hash 0x" << std::hex << ref.dynamicHash << std::dec
                << "\n";
    return {};
}

Expected<void> EquateManager::pruneIfOrphanLocked(db::RecordKey equateId)
{
    auto keys = refs_.listByEquate(equateId);
    if (!keys)
        return keys.error();
    if (!keys.value().empty())
        return {};
    auto eq = equates_.getById(equateId);
    if (!eq)
        return eq.error();
    if (!eq.value())
        return {};
    if (auto removed = equates_.remove(equateId); !removed)
        return removed;
    if (config_.trace)
        trace() << "prune '" << eq.value()->name << "'\n";
    return {};
}

Expected<EquateReference> EquateManager::addReferenceLocked(db::RecordKey equateId,
                                                            const program::Address &address,
                                                            int opIndex,
                                                            uint64_t dynamicHash)
{
    if (opIndex < 0 || opIndex > std::numeric_limits<int16_t>::max())
        return makeError(ErrorCode::InvalidArgument,
                         "operand index " + std::to_string(opIndex) + " is out of range");
    auto eq = equates_.getById(equateId);
    if (!eq)
        return eq.error();
    if (!eq.value())
        return makeError(ErrorCode::InvalidArgument,
                         "no equate with key " + std::to_string(equateId));
    if (services_.addressMap.getKey(address, true) == program::kInvalidAddressKey)
        return makeError(ErrorCode::InvalidArgument,
                         "address " + program::toString(address) + " has no storage key");

    auto existing = refs_.referencesAt(address);
    if (!existing)
        return existing.error();
    std::vector<db::RecordKey> displaced;
    for (const EquateReference &ref : existing.value())
    {
        if (!occupiesSlot(ref, opIndex, dynamicHash))
            continue;
        if (auto removed = removeRefLocked(ref); !removed)
            return removed.error();
        if (ref.equateId != equateId)
            displaced.push_back(ref.equateId);
    }

    auto ref = refs_.create(address, static_cast<int16_t>(opIndex), dynamicHash, equateId);
    if (!ref)
        return ref;

    program::ChangeRecord change;
    change.kind = program::ChangeKind::ReferenceAdded;
    change.info.name = eq.value()->name;
    change.info.value = eq.value()->value;
    change.info.address = address;
    change.info.opIndex = opIndex;
    change.info.dynamicHash = dynamicHash;
    services_.changes.notify(change);

    if (config_.trace)
        trace() << "attach '" << eq.value()->name << "' at " << address << " op " << opIndex
                << " hash 0x" << std::hex << dynamicHash << std::dec << "\n";

    for (db::RecordKey id : displaced)
    {
        if (auto pruned = pruneIfOrphanLocked(id); !pruned)
            return pruned.error();
    }
    return ref;
}

Expected<EquateReference> EquateManager::addReference(db::RecordKey equateId,
                                                      const program::Address &address,
                                                      int opIndex,
                                                      uint64_t dynamicHash)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto ref = addReferenceLocked(equateId, address, opIndex, dynamicHash);
    if (!ref && isStorageFailure(ref.error()))
        reportStorageError(ref.error());
    return ref;
}

Expected<bool> EquateManager::removeMatchingLocked(db::RecordKey equateId,
                                                   const program::Address &address,
                                                   int opIndex,
                                                   std::optional<uint64_t> dynamicHash)
{
    auto refs = refs_.referencesTo(equateId);
    if (!refs)
        return refs.error();
    for (const EquateReference &ref : refs.value())
    {
        if (ref.address != address)
            continue;
        const bool match = dynamicHash ? ref.dynamicHash == *dynamicHash : ref.opIndex == opIndex;
        if (!match)
            continue;
        if (auto removed = removeRefLocked(ref); !removed)
            return removed.error();
        if (auto pruned = pruneIfOrphanLocked(equateId); !pruned)
            return pruned.error();
        return true;
    }
    return false;
}

bool EquateManager::removeReference(db::RecordKey equateId,
                                    const program::Address &address,
                                    int opIndex)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto removed = removeMatchingLocked(equateId, address, opIndex, std::nullopt);
    if (!removed)
    {
        reportStorageError(removed.error());
        return false;
    }
    return removed.value();
}

bool EquateManager::removeReference(db::RecordKey equateId,
                                    uint64_t dynamicHash,
                                    const program::Address &address)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto removed = removeMatchingLocked(equateId, address, 0, dynamicHash);
    if (!removed)
    {
        reportStorageError(removed.error());
        return false;
    }
    return removed.value();
}

bool EquateManager::removeEquate(std::string_view name)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto eq = equates_.getByName(name);
    if (!eq)
    {
        reportStorageError(eq.error());
        return false;
    }
    if (!eq.value())
        return false;
    const db::RecordKey id = eq.value()->id;

    auto refs = refs_.referencesTo(id);
    if (!refs)
    {
        reportStorageError(refs.error());
        return false;
    }
    for (const EquateReference &ref : refs.value())
    {
        if (auto removed = removeRefLocked(ref); !removed)
        {
            reportStorageError(removed.error());
            return false;
        }
    }
    if (auto removed = equates_.remove(id); !removed)
    {
        reportStorageError(removed.error());
        return false;
    }
    if (config_.trace)
        trace() << "remove '" << eq.value()->name << "'\n";
    return true;
}

Expected<Equate> EquateManager::renameEquate(db::RecordKey id, std::string_view newName)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto old = equates_.getById(id);
    if (!old)
    {
        reportStorageError(old.error());
        return old.error();
    }
    auto eq = equates_.rename(id, newName);
    if (!eq)
    {
        if (isStorageFailure(eq.error()))
            reportStorageError(eq.error());
        return eq;
    }
    if (config_.trace && old.value() && old.value()->name != eq.value().name)
        trace() << "rename '" << old.value()->name << "' -> '" << eq.value().name << "'\n";
    return eq;
}

Expected<TaskOutcome> EquateManager::deleteAddressRange(const program::Address &start,
                                                        const program::Address &end,
                                                        program::TaskMonitor &monitor)
{
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<AddressKeyRange> window = refs_.keyRanges(start, end);
    if (window.empty())
        return TaskOutcome::Completed;

    std::size_t removedCount = 0;
    auto run = [&]() -> Expected<TaskOutcome> {
        monitor.setMessage("Deleting equate references");
        std::vector<EquateReference> doomed;
        RefAddressCursor cursor = refs_.addresses(window);
        for (;;)
        {
            if (monitor.isCancelled())
                return TaskOutcome::Cancelled;
            auto addr = cursor.next();
            if (!addr)
                return addr.error();
            if (!addr.value())
                break;
            auto refs = refs_.referencesAt(*addr.value());
            if (!refs)
                return refs.error();
            doomed.insert(doomed.end(), refs.value().begin(), refs.value().end());
        }

        for (std::size_t i = 0; i < doomed.size(); ++i)
        {
            if (monitor.isCancelled())
                return TaskOutcome::Cancelled;
            monitor.setProgress(i, doomed.size());
            if (auto removed = removeRefLocked(doomed[i]); !removed)
                return removed.error();
            ++removedCount;
            if (auto pruned = pruneIfOrphanLocked(doomed[i].equateId); !pruned)
                return pruned.error();
        }
        monitor.setProgress(doomed.size(), doomed.size());
        return TaskOutcome::Completed;
    };

    auto outcome = run();
    if (!outcome)
    {
        reportStorageError(outcome.error());
        outcome = TaskOutcome::StorageFailed;
    }
    if (config_.trace)
        trace() << "delete-range " << start << ".." << end << " removed=" << removedCount << " "
                << toString(outcome.value()) << "\n";
    return outcome;
}

Expected<TaskOutcome> EquateManager::moveAddressRange(const program::Address &from,
                                                      const program::Address &to,
                                                      uint64_t length,
                                                      program::TaskMonitor &monitor)
{
    std::lock_guard<std::mutex> guard(lock_);
    equates_.invalidate();
    auto outcome = refs_.moveRange(from, to, length, monitor);
    if (!outcome)
    {
        if (!isStorageFailure(outcome.error()))
            return outcome;
        reportStorageError(outcome.error());
        outcome = TaskOutcome::StorageFailed;
    }
    if (config_.trace)
        trace() << "move-range " << from << " -> " << to << " length=" << length << " "
                << toString(outcome.value()) << "\n";
    return outcome;
}

Expected<TaskOutcome> EquateManager::applyEnum(const program::AddressSet &addresses,
                                               const program::EnumType &type,
                                               program::TaskMonitor &monitor,
                                               bool includeSubOperands)
{
    if (!services_.listing || !services_.types)
        return makeError(ErrorCode::InvalidArgument,
                         "applying enum equates needs a listing and a type registry");
    if (type.length < 1 || type.length > 8)
        return makeError(ErrorCode::InvalidArgument,
                         "enum '" + type.name + "' has unsupported length " +
                             std::to_string(type.length));

    std::lock_guard<std::mutex> guard(lock_);
    EnumApplier applier(*services_.listing, *services_.types);
    auto result = applier.apply(
        addresses,
        type,
        monitor,
        includeSubOperands,
        [this](std::string_view name, int64_t value, const program::Address &address, int opIndex)
            -> Expected<void> {
            auto eq = getOrCreateLocked(name, value);
            if (!eq)
                return eq.error();
            auto ref = addReferenceLocked(eq.value().id, address, opIndex, 0);
            if (!ref)
                return ref.error();
            return {};
        });
    if (!result)
    {
        if (!isStorageFailure(result.error()))
            return result.error();
        reportStorageError(result.error());
        if (config_.trace)
            trace() << "apply-enum '" << type.name << "' " << toString(TaskOutcome::StorageFailed)
                    << "\n";
        return TaskOutcome::StorageFailed;
    }
    if (config_.trace)
        trace() << "apply-enum '" << type.name << "' visited=" << result.value().instructionsVisited
                << " bound=" << result.value().bindings << " "
                << toString(result.value().outcome) << "\n";
    return result.value().outcome;
}

void EquateManager::invalidateCache()
{
    std::lock_guard<std::mutex> guard(lock_);
    equates_.invalidate();
    refs_.invalidate();
}

std::string EquateManager::displayName(const Equate &equate)
{
    if (!isDerivedEquateName(equate.name))
        return equate.name;
    std::lock_guard<std::mutex> guard(lock_);
    auto typeId = typeIdFromEquateName(equate.name);
    if (typeId && services_.types)
    {
        if (auto type = services_.types->findById(*typeId))
        {
            if (auto member = type->nameOf(equate.value))
                return std::string(*member);
        }
    }
    return formatNameForEquateError(equate.value);
}

db::CacheStats EquateManager::equateCacheStats() const
{
    std::lock_guard<std::mutex> guard(lock_);
    return equates_.cache().stats();
}

db::CacheStats EquateManager::referenceCacheStats() const
{
    std::lock_guard<std::mutex> guard(lock_);
    return refs_.cache().stats();
}

} // namespace eqtab::symbol
