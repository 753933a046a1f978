// File: tests/unit/test_equate_invariants.cpp
// Purpose: Drive random interleavings of coordinator operations and check the
//          table's structural invariants after every step.
// Key invariants:
//   - Every stored equate has at least one reference.
//   - Every reference points at a stored equate.
//   - No two references share an address and slot.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "EquateFakes.hpp"
#include "db/MemoryAdapters.hpp"
#include "symbol/EquateManager.hpp"

#include <mutex>
#include <random>
#include <set>
#include <string>
#include <tuple>

using namespace eqtab;
using eqtab::program::Address;

namespace
{
struct InvariantTest : ::testing::Test
{
    db::MemoryEquateAdapter equates;
    db::MemoryEquateRefAdapter refs;
    program::FlatAddressMap addressMap;
    test::RecordingChangeSink sink;
    std::mutex lock;
    // Small caches so eviction happens during the run.
    symbol::EquateManager manager{symbol::EquateServices{equates, refs, addressMap, sink},
                                  lock,
                                  symbol::EquateTableConfig{3, 3, false, nullptr, {}}};

    void checkInvariants(int step)
    {
        SCOPED_TRACE("step " + std::to_string(step));
        std::set<db::RecordKey> ids;
        for (const auto &eq : manager.getEquates())
        {
            ids.insert(eq.id);
            EXPECT_GT(manager.getReferenceCount(eq.id), 0u) << "orphaned equate " << eq.name;
        }

        std::set<std::tuple<uint16_t, uint64_t, int, uint64_t>> slots;
        auto it = manager.getEquateAddresses();
        while (auto addr = it.next())
        {
            for (const auto &ref : manager.getReferences(*addr))
            {
                EXPECT_TRUE(ids.count(ref.equateId)) << "dangling reference " << ref.id;
                const int slotIndex = ref.dynamicHash != 0 ? -1 : ref.opIndex;
                auto key = std::make_tuple(addr->space, addr->offset, slotIndex, ref.dynamicHash);
                EXPECT_TRUE(slots.insert(key).second) << "two references in one slot at " << *addr;
            }
        }
        EXPECT_EQ(slots.size(), refs.size());
    }
};
} // namespace

TEST_F(InvariantTest, RandomInterleavingsKeepTableConsistent)
{
    std::mt19937 rng(0xE0A7E5u);
    auto pick = [&](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };
    auto randomAddress = [&]() { return Address{0, static_cast<uint64_t>(0x100 + pick(0, 31))}; };

    for (int step = 0; step < 400; ++step)
    {
        const int op = pick(0, 9);
        const std::string name = "E" + std::to_string(pick(0, 11));
        if (op <= 4)
        {
            auto eq = manager.getOrCreateEquate(name, pick(-4, 4));
            ASSERT_TRUE(eq);
            const uint64_t hash = pick(0, 3) == 0 ? static_cast<uint64_t>(pick(1, 3)) : 0;
            ASSERT_TRUE(manager.addReference(eq.value().id, randomAddress(), pick(0, 2), hash));
        }
        else if (op <= 6)
        {
            if (auto eq = manager.getEquate(name))
            {
                auto all = manager.getReferences(eq->id);
                if (!all.empty())
                {
                    const auto &ref = all[static_cast<size_t>(pick(0, static_cast<int>(all.size()) - 1))];
                    if (ref.dynamicHash != 0)
                        EXPECT_TRUE(manager.removeReference(eq->id, ref.dynamicHash, ref.address));
                    else
                        EXPECT_TRUE(manager.removeReference(eq->id, ref.address, ref.opIndex));
                }
            }
        }
        else if (op == 7)
        {
            manager.removeEquate(name);
        }
        else if (op == 8)
        {
            const Address start = randomAddress();
            const Address end{0, start.offset + static_cast<uint64_t>(pick(0, 6))};
            auto outcome = manager.deleteAddressRange(start, end, program::TaskMonitor::dummy());
            ASSERT_TRUE(outcome);
        }
        else
        {
            manager.invalidateCache();
        }
        checkInvariants(step);
        if (HasFatalFailure() || HasNonfatalFailure())
            return;
    }
}
