//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Ordered-map backed equate and reference tables.
/// @details The maps give the same observable ordering a keyed record store
///          would: records iterate by key, and address keys iterate ascending.
///          Index violations (a duplicate name, an unknown key on update) are
///          reported as storage failures because a real table would reject them
///          at the storage layer.
//
//===----------------------------------------------------------------------===//

#include "db/MemoryAdapters.hpp"

#include <utility>

namespace eqtab::db
{

using support::makeStorageError;

Expected<EquateRecord> MemoryEquateAdapter::createRecord(std::string_view name, int64_t value)
{
    if (byName_.find(name) != byName_.end())
        return makeStorageError("equate name index already holds '" + std::string(name) + "'");
    EquateRecord rec{nextKey_++, std::string(name), value};
    byName_.emplace(rec.name, rec.key);
    records_.emplace(rec.key, rec);
    return rec;
}

Expected<bool> MemoryEquateAdapter::hasRecord(std::string_view name)
{
    return byName_.find(name) != byName_.end();
}

Expected<std::optional<EquateRecord>> MemoryEquateAdapter::getRecord(RecordKey key)
{
    auto it = records_.find(key);
    if (it == records_.end())
        return std::optional<EquateRecord>{};
    return std::optional<EquateRecord>{it->second};
}

Expected<std::optional<RecordKey>> MemoryEquateAdapter::getRecordKey(std::string_view name)
{
    auto it = byName_.find(name);
    if (it == byName_.end())
        return std::optional<RecordKey>{};
    return std::optional<RecordKey>{it->second};
}

Expected<void> MemoryEquateAdapter::updateRecord(const EquateRecord &record)
{
    auto it = records_.find(record.key);
    if (it == records_.end())
        return makeStorageError("no equate record " + std::to_string(record.key));
    if (it->second.name != record.name)
    {
        auto owner = byName_.find(record.name);
        if (owner != byName_.end() && owner->second != record.key)
            return makeStorageError("equate name index already holds '" + record.name + "'");
        byName_.erase(it->second.name);
        byName_.emplace(record.name, record.key);
    }
    it->second = record;
    return {};
}

Expected<void> MemoryEquateAdapter::removeRecord(RecordKey key)
{
    auto it = records_.find(key);
    if (it == records_.end())
        return {};
    byName_.erase(it->second.name);
    records_.erase(it);
    return {};
}

Expected<std::vector<EquateRecord>> MemoryEquateAdapter::records()
{
    std::vector<EquateRecord> out;
    out.reserve(records_.size());
    for (const auto &[key, rec] : records_)
        out.push_back(rec);
    return out;
}

// ---------------------------------------------------------------------------

void MemoryEquateRefAdapter::index(const EquateRefRecord &rec)
{
    byAddress_[rec.addressKey].insert(rec.key);
    byEquate_[rec.equateKey].insert(rec.key);
}

void MemoryEquateRefAdapter::unindex(const EquateRefRecord &rec)
{
    auto a = byAddress_.find(rec.addressKey);
    if (a != byAddress_.end())
    {
        a->second.erase(rec.key);
        if (a->second.empty())
            byAddress_.erase(a);
    }
    auto e = byEquate_.find(rec.equateKey);
    if (e != byEquate_.end())
    {
        e->second.erase(rec.key);
        if (e->second.empty())
            byEquate_.erase(e);
    }
}

Expected<EquateRefRecord> MemoryEquateRefAdapter::createReference(int64_t addressKey,
                                                                  int16_t opIndex,
                                                                  uint64_t dynamicHash,
                                                                  RecordKey equateKey)
{
    EquateRefRecord rec{nextKey_++, addressKey, opIndex, dynamicHash, equateKey};
    records_.emplace(rec.key, rec);
    index(rec);
    return rec;
}

Expected<std::optional<EquateRefRecord>> MemoryEquateRefAdapter::getRecord(RecordKey key)
{
    auto it = records_.find(key);
    if (it == records_.end())
        return std::optional<EquateRefRecord>{};
    return std::optional<EquateRefRecord>{it->second};
}

Expected<void> MemoryEquateRefAdapter::updateRecord(const EquateRefRecord &record)
{
    auto it = records_.find(record.key);
    if (it == records_.end())
        return makeStorageError("no equate reference record " + std::to_string(record.key));
    unindex(it->second);
    it->second = record;
    index(record);
    return {};
}

Expected<void> MemoryEquateRefAdapter::removeRecord(RecordKey key)
{
    auto it = records_.find(key);
    if (it == records_.end())
        return {};
    unindex(it->second);
    records_.erase(it);
    return {};
}

Expected<std::vector<RecordKey>> MemoryEquateRefAdapter::getRecordKeysForAddr(int64_t addressKey)
{
    auto it = byAddress_.find(addressKey);
    if (it == byAddress_.end())
        return std::vector<RecordKey>{};
    return std::vector<RecordKey>(it->second.begin(), it->second.end());
}

Expected<std::vector<RecordKey>> MemoryEquateRefAdapter::getRecordKeysForEquate(RecordKey equateKey)
{
    auto it = byEquate_.find(equateKey);
    if (it == byEquate_.end())
        return std::vector<RecordKey>{};
    return std::vector<RecordKey>(it->second.begin(), it->second.end());
}

Expected<std::optional<int64_t>> MemoryEquateRefAdapter::nextAddressKey(int64_t fromKey,
                                                                        int64_t toKey)
{
    auto it = byAddress_.lower_bound(fromKey);
    if (it == byAddress_.end() || it->first > toKey)
        return std::optional<int64_t>{};
    return std::optional<int64_t>{it->first};
}

} // namespace eqtab::db
