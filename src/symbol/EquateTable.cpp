//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements the in-memory EquateTable facade.
/// @details The Impl holds the storage ahead of the manager so the manager,
///          which borrows it, is destroyed first.
//
//===----------------------------------------------------------------------===//

#include "eqtab/EquateTable.hpp"

#include "db/MemoryAdapters.hpp"
#include "program/Address.hpp"

namespace eqtab
{

struct EquateTable::Impl
{
    explicit Impl(EquateTableOptions options)
        : changes(options.changes ? options.changes : &nullSink),
          manager(symbol::EquateServices{equates,
                                         references,
                                         addressMap,
                                         *changes,
                                         options.listing,
                                         options.types},
                  lock,
                  std::move(options.config))
    {
    }

    program::NullChangeSink nullSink;
    db::MemoryEquateAdapter equates;
    db::MemoryEquateRefAdapter references;
    program::FlatAddressMap addressMap;
    std::mutex lock;
    program::ChangeSink *changes;
    EquateManager manager;
};

EquateTable::EquateTable(EquateTableOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

EquateTable::~EquateTable() = default;

EquateManager &EquateTable::manager()
{
    return impl_->manager;
}

std::mutex &EquateTable::lock()
{
    return impl_->lock;
}

std::size_t EquateTable::equateCount() const
{
    std::lock_guard<std::mutex> guard(impl_->lock);
    return impl_->equates.size();
}

std::size_t EquateTable::referenceCount() const
{
    std::lock_guard<std::mutex> guard(impl_->lock);
    return impl_->references.size();
}

} // namespace eqtab
