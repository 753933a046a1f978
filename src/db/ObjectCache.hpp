//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: db/ObjectCache.hpp
// Purpose: Fixed-capacity, least-recently-used cache of record objects.
//
// Key invariants:
//   - size() never exceeds capacity().
//   - After invalidate() no previously cached object is returned.
//   - The cache is not synchronised; owners guard it with their own lock.
//
// Ownership/Lifetime:
//   - Entries are shared_ptr<const T>; an evicted object stays alive for any
//     holder but is no longer reachable through the cache.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "db/Records.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <unordered_map>
#include <utility>

namespace eqtab::db
{

/// @brief Hit and miss counters of an ObjectCache, reset by resetStats().
struct CacheStats
{
    uint64_t hits = 0;
    uint64_t misses = 0;
};

/// @brief Read-through cache front for one record table.
/// @tparam T Cached record type.
template <typename T> class ObjectCache
{
  public:
    using Stats = CacheStats;

    /// @param capacity Maximum entries held; zero is clamped to one.
    explicit ObjectCache(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    ObjectCache(const ObjectCache &) = delete;
    ObjectCache &operator=(const ObjectCache &) = delete;

    /// @brief Look up @p key and mark it most recently used.
    /// @return Cached object, or nullptr on a miss.
    std::shared_ptr<const T> get(RecordKey key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
        {
            ++stats_.misses;
            return nullptr;
        }
        ++stats_.hits;
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->second;
    }

    /// @brief Insert or replace the entry for @p key, evicting the oldest entry when full.
    void put(RecordKey key, std::shared_ptr<const T> obj)
    {
        auto it = index_.find(key);
        if (it != index_.end())
        {
            it->second->second = std::move(obj);
            lru_.splice(lru_.begin(), lru_, it->second);
            return;
        }
        if (lru_.size() >= capacity_)
        {
            index_.erase(lru_.back().first);
            lru_.pop_back();
        }
        lru_.emplace_front(key, std::move(obj));
        index_.emplace(key, lru_.begin());
    }

    /// @brief Drop the entry for @p key if present.
    void remove(RecordKey key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return;
        lru_.erase(it->second);
        index_.erase(it);
    }

    /// @brief Drop every entry; required whenever storage changed behind the cache.
    void invalidate()
    {
        lru_.clear();
        index_.clear();
    }

    std::size_t size() const noexcept
    {
        return lru_.size();
    }

    std::size_t capacity() const noexcept
    {
        return capacity_;
    }

    const Stats &stats() const noexcept
    {
        return stats_;
    }

    void resetStats() noexcept
    {
        stats_ = {};
    }

  private:
    using Entry = std::pair<RecordKey, std::shared_ptr<const T>>;

    std::size_t capacity_;
    std::list<Entry> lru_; ///< Front is most recently used.
    std::unordered_map<RecordKey, typename std::list<Entry>::iterator> index_;
    Stats stats_;
};

} // namespace eqtab::db
