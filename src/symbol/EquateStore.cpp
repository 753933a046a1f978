//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements the equate store on top of an EquateAdapter.
/// @details Reads go through the record cache first and repopulate it on a
///          miss. Writes go to the adapter first and update or evict the cache
///          entry only once the adapter succeeded, so a storage failure never
///          leaves the cache ahead of storage.
//
//===----------------------------------------------------------------------===//

#include "symbol/EquateStore.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

namespace eqtab::symbol
{

using support::ErrorCode;
using support::makeError;

namespace
{
Equate toEquate(const db::EquateRecord &rec)
{
    return Equate{rec.key, rec.name, rec.value};
}
} // namespace

EquateStore::EquateStore(db::EquateAdapter &adapter,
                         program::ChangeSink &changes,
                         std::size_t cacheCapacity)
    : adapter_(adapter), changes_(changes), cache_(cacheCapacity)
{
}

Expected<void> EquateStore::validateName(std::string_view name)
{
    const bool blank = std::all_of(
        name.begin(), name.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (name.empty())
        return makeError(ErrorCode::InvalidName, "equate name is empty");
    if (blank)
        return makeError(ErrorCode::InvalidName, "equate name is blank");
    return {};
}

Expected<Equate> EquateStore::create(std::string_view name, int64_t value)
{
    auto exists = adapter_.hasRecord(name);
    if (!exists)
        return exists.error();
    if (exists.value())
        return makeError(ErrorCode::DuplicateName,
                         std::string(name) + " already exists for an equate");
    if (auto valid = validateName(name); !valid)
        return valid.error();

    auto rec = adapter_.createRecord(name, value);
    if (!rec)
        return rec.error();
    cache_.put(rec.value().key, std::make_shared<const db::EquateRecord>(rec.value()));

    program::ChangeRecord change;
    change.kind = program::ChangeKind::EquateAdded;
    change.info.name = rec.value().name;
    change.info.value = value;
    changes_.notify(change);
    return toEquate(rec.value());
}

Expected<std::optional<db::EquateRecord>> EquateStore::lookup(db::RecordKey id)
{
    if (auto cached = cache_.get(id))
        return std::optional<db::EquateRecord>{*cached};
    auto rec = adapter_.getRecord(id);
    if (!rec)
        return rec.error();
    if (rec.value())
        cache_.put(id, std::make_shared<const db::EquateRecord>(*rec.value()));
    return rec.value();
}

Expected<std::optional<Equate>> EquateStore::getById(db::RecordKey id)
{
    auto rec = lookup(id);
    if (!rec)
        return rec.error();
    if (!rec.value())
        return std::optional<Equate>{};
    return std::optional<Equate>{toEquate(*rec.value())};
}

Expected<std::optional<Equate>> EquateStore::getByName(std::string_view name)
{
    auto key = adapter_.getRecordKey(name);
    if (!key)
        return key.error();
    if (!key.value())
        return std::optional<Equate>{};
    return getById(*key.value());
}

Expected<std::vector<Equate>> EquateStore::all()
{
    auto recs = adapter_.records();
    if (!recs)
        return recs.error();
    std::vector<Equate> out;
    out.reserve(recs.value().size());
    for (const db::EquateRecord &rec : recs.value())
    {
        // Route through the cache so the returned snapshot matches later reads.
        auto eq = getById(rec.key);
        if (!eq)
            return eq.error();
        if (eq.value())
            out.push_back(std::move(*eq.value()));
    }
    return out;
}

Expected<std::vector<Equate>> EquateStore::getByValue(int64_t value)
{
    auto everything = all();
    if (!everything)
        return everything.error();
    std::vector<Equate> out;
    for (Equate &eq : everything.value())
    {
        if (eq.value == value)
            out.push_back(std::move(eq));
    }
    return out;
}

Expected<void> EquateStore::remove(db::RecordKey id)
{
    auto rec = lookup(id);
    if (!rec)
        return rec.error();
    if (!rec.value())
        return {};
    if (auto removed = adapter_.removeRecord(id); !removed)
        return removed;
    cache_.remove(id);

    program::ChangeRecord change;
    change.kind = program::ChangeKind::EquateRemoved;
    change.info.name = rec.value()->name;
    change.info.value = rec.value()->value;
    changes_.notify(change);
    return {};
}

Expected<Equate> EquateStore::rename(db::RecordKey id, std::string_view newName)
{
    auto rec = lookup(id);
    if (!rec)
        return rec.error();
    if (!rec.value())
        return makeError(ErrorCode::InvalidArgument,
                         "no equate with key " + std::to_string(id));
    db::EquateRecord updated = *rec.value();
    if (updated.name == newName)
        return toEquate(updated);
    if (auto valid = validateName(newName); !valid)
        return valid.error();
    auto exists = adapter_.hasRecord(newName);
    if (!exists)
        return exists.error();
    if (exists.value())
        return makeError(ErrorCode::DuplicateName,
                         std::string(newName) + " already exists for an equate");

    const std::string oldName = updated.name;
    updated.name = std::string(newName);
    if (auto stored = adapter_.updateRecord(updated); !stored)
        return stored.error();
    cache_.put(id, std::make_shared<const db::EquateRecord>(updated));
    nameChanged(oldName, updated.name);
    return toEquate(updated);
}

void EquateStore::nameChanged(std::string_view oldName, std::string_view newName)
{
    program::ChangeRecord change;
    change.kind = program::ChangeKind::EquateRenamed;
    change.info.name = std::string(oldName);
    change.newName = std::string(newName);
    changes_.notify(change);
}

} // namespace eqtab::symbol
