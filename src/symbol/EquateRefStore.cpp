//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements the equate reference store and its address cursor.
/// @details References are stored with an address key produced by the
///          AddressMap, so range queries become key-window queries. The record
///          cache is keyed by reference key; anything that re-keys addresses in
///          bulk must invalidate it because cached records carry the old
///          address key.
//
//===----------------------------------------------------------------------===//

#include "symbol/EquateRefStore.hpp"

#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace eqtab::symbol
{

using support::ErrorCode;
using support::makeError;
using support::makeStorageError;

RefAddressCursor::RefAddressCursor(EquateRefStore &store, std::vector<AddressKeyRange> ranges)
    : store_(&store), ranges_(std::move(ranges))
{
}

Expected<std::optional<program::Address>> RefAddressCursor::next()
{
    while (rangeIndex_ < ranges_.size())
    {
        const AddressKeyRange &range = ranges_[rangeIndex_];
        const int64_t from = resumeKey_ ? *resumeKey_ : range.first;
        if (from > range.last)
        {
            ++rangeIndex_;
            resumeKey_.reset();
            continue;
        }
        auto key = store_->adapter_.nextAddressKey(from, range.last);
        if (!key)
            return key.error();
        if (!key.value())
        {
            ++rangeIndex_;
            resumeKey_.reset();
            continue;
        }
        const int64_t found = *key.value();
        if (found == std::numeric_limits<int64_t>::max())
        {
            ++rangeIndex_;
            resumeKey_.reset();
        }
        else
        {
            resumeKey_ = found + 1;
        }
        auto addr = store_->addressMap_.decodeAddress(found);
        if (!addr)
            return makeStorageError("reference table holds undecodable address key " +
                                    std::to_string(found));
        return std::optional<program::Address>{*addr};
    }
    return std::optional<program::Address>{};
}

EquateRefStore::EquateRefStore(db::EquateRefAdapter &adapter,
                               const program::AddressMap &addressMap,
                               std::size_t cacheCapacity)
    : adapter_(adapter), addressMap_(addressMap), cache_(cacheCapacity)
{
}

Expected<EquateReference> EquateRefStore::toReference(const db::EquateRefRecord &rec) const
{
    auto addr = addressMap_.decodeAddress(rec.addressKey);
    if (!addr)
        return makeStorageError("reference " + std::to_string(rec.key) +
                                " holds undecodable address key " +
                                std::to_string(rec.addressKey));
    return EquateReference{rec.key, *addr, rec.opIndex, rec.dynamicHash, rec.equateKey};
}

Expected<EquateReference> EquateRefStore::create(const program::Address &address,
                                                 int16_t opIndex,
                                                 uint64_t dynamicHash,
                                                 db::RecordKey equateId)
{
    const int64_t addrKey = addressMap_.getKey(address, true);
    if (addrKey == program::kInvalidAddressKey)
        return makeError(ErrorCode::InvalidArgument,
                         "address " + program::toString(address) + " has no storage key");
    auto rec = adapter_.createReference(addrKey, opIndex, dynamicHash, equateId);
    if (!rec)
        return rec.error();
    cache_.put(rec.value().key, std::make_shared<const db::EquateRefRecord>(rec.value()));
    return EquateReference{rec.value().key, address, opIndex, dynamicHash, equateId};
}

Expected<void> EquateRefStore::remove(db::RecordKey refId)
{
    auto removed = adapter_.removeRecord(refId);
    if (!removed)
        return removed;
    cache_.remove(refId);
    return {};
}

Expected<std::optional<db::EquateRefRecord>> EquateRefStore::lookup(db::RecordKey refId)
{
    if (auto cached = cache_.get(refId))
        return std::optional<db::EquateRefRecord>{*cached};
    auto rec = adapter_.getRecord(refId);
    if (!rec)
        return rec.error();
    if (rec.value())
        cache_.put(refId, std::make_shared<const db::EquateRefRecord>(*rec.value()));
    return rec.value();
}

Expected<std::optional<EquateReference>> EquateRefStore::get(db::RecordKey refId)
{
    auto rec = lookup(refId);
    if (!rec)
        return rec.error();
    if (!rec.value())
        return std::optional<EquateReference>{};
    auto ref = toReference(*rec.value());
    if (!ref)
        return ref.error();
    return std::optional<EquateReference>{ref.value()};
}

Expected<std::vector<db::RecordKey>> EquateRefStore::listByAddress(const program::Address &address)
{
    const int64_t addrKey = addressMap_.getKey(address, false);
    if (addrKey == program::kInvalidAddressKey)
        return std::vector<db::RecordKey>{};
    return adapter_.getRecordKeysForAddr(addrKey);
}

Expected<std::vector<db::RecordKey>> EquateRefStore::listByEquate(db::RecordKey equateId)
{
    return adapter_.getRecordKeysForEquate(equateId);
}

Expected<std::vector<EquateReference>> EquateRefStore::resolve(
    const std::vector<db::RecordKey> &keys)
{
    std::vector<EquateReference> out;
    out.reserve(keys.size());
    for (db::RecordKey key : keys)
    {
        auto ref = get(key);
        if (!ref)
            return ref.error();
        if (ref.value())
            out.push_back(*ref.value());
    }
    return out;
}

Expected<std::vector<EquateReference>> EquateRefStore::referencesAt(
    const program::Address &address)
{
    auto keys = listByAddress(address);
    if (!keys)
        return keys.error();
    return resolve(keys.value());
}

Expected<std::vector<EquateReference>> EquateRefStore::referencesTo(db::RecordKey equateId)
{
    auto keys = listByEquate(equateId);
    if (!keys)
        return keys.error();
    return resolve(keys.value());
}

std::vector<AddressKeyRange> EquateRefStore::keyRanges(const program::AddressSet &set) const
{
    std::vector<AddressKeyRange> out;
    for (const program::AddressRange &r : set.ranges())
    {
        for (const AddressKeyRange &keys : keyRanges(r.min, r.max))
            out.push_back(keys);
    }
    return out;
}

RefAddressCursor EquateRefStore::addressesFrom(const std::optional<program::Address> &start)
{
    if (!start)
        return addresses({AddressKeyRange{0, std::numeric_limits<int64_t>::max()}});
    const program::Address top{std::numeric_limits<uint16_t>::max(),
                               std::numeric_limits<uint64_t>::max()};
    std::vector<AddressKeyRange> ranges = keyRanges(*start, top);
    if (ranges.empty())
        return addresses({});
    return addresses({AddressKeyRange{ranges.front().first, std::numeric_limits<int64_t>::max()}});
}

Expected<program::TaskOutcome> EquateRefStore::moveRange(const program::Address &from,
                                                         const program::Address &to,
                                                         uint64_t length,
                                                         program::TaskMonitor &monitor)
{
    if (length == 0)
        return program::TaskOutcome::Completed;

    const uint64_t span = length - 1;
    if (span > std::numeric_limits<uint64_t>::max() - to.offset)
        return makeError(ErrorCode::InvalidArgument, "move destination wraps the address space");
    const program::Address toLast{to.space, to.offset + span};
    if (addressMap_.getKey(to, true) == program::kInvalidAddressKey ||
        addressMap_.getKey(toLast, true) == program::kInvalidAddressKey)
        return makeError(ErrorCode::InvalidArgument,
                         "move destination " + program::toString(to) + " has no storage key");

    cache_.invalidate();

    const uint64_t fromLastOffset = span > std::numeric_limits<uint64_t>::max() - from.offset
                                        ? std::numeric_limits<uint64_t>::max()
                                        : from.offset + span;
    std::vector<AddressKeyRange> window =
        keyRanges(from, program::Address{from.space, fromLastOffset});
    if (window.empty())
        return program::TaskOutcome::Completed;

    monitor.setMessage("Moving equate references");
    std::vector<db::EquateRefRecord> moving;
    RefAddressCursor cursor = addresses(std::move(window));
    for (;;)
    {
        if (monitor.isCancelled())
            return program::TaskOutcome::Cancelled;
        auto addr = cursor.next();
        if (!addr)
            return addr.error();
        if (!addr.value())
            break;
        auto keys = listByAddress(*addr.value());
        if (!keys)
            return keys.error();
        for (db::RecordKey key : keys.value())
        {
            auto rec = lookup(key);
            if (!rec)
                return rec.error();
            if (rec.value())
                moving.push_back(*rec.value());
        }
    }

    for (size_t i = 0; i < moving.size(); ++i)
    {
        if (monitor.isCancelled())
            return program::TaskOutcome::Cancelled;
        monitor.setProgress(i, moving.size());
        db::EquateRefRecord rec = moving[i];
        auto addr = addressMap_.decodeAddress(rec.addressKey);
        if (!addr)
            return makeStorageError("reference " + std::to_string(rec.key) +
                                    " holds undecodable address key");
        const program::Address target{to.space, to.offset + (addr->offset - from.offset)};
        rec.addressKey = addressMap_.getKey(target, true);
        if (auto stored = adapter_.updateRecord(rec); !stored)
            return stored.error();
        cache_.remove(rec.key);
    }
    monitor.setProgress(moving.size(), moving.size());
    return program::TaskOutcome::Completed;
}

} // namespace eqtab::symbol
