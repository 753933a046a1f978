// File: tests/unit/test_address_set.cpp
// Purpose: Verify AddressSet normalisation and FlatAddressMap key encoding.
// Key invariants: Ranges stay sorted and merged; keys preserve address order
//                 within a space and reject unencodable addresses.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "program/Address.hpp"

#include <limits>

using namespace eqtab::program;

TEST(AddressSet, MergesOverlappingAndAdjacentRanges)
{
    AddressSet set;
    set.add(AddressRange{{0, 0x10}, {0, 0x1f}});
    set.add(AddressRange{{0, 0x20}, {0, 0x2f}});
    set.add(AddressRange{{0, 0x28}, {0, 0x40}});

    ASSERT_EQ(set.ranges().size(), 1u);
    EXPECT_EQ(set.ranges()[0].min, (Address{0, 0x10}));
    EXPECT_EQ(set.ranges()[0].max, (Address{0, 0x40}));
    EXPECT_EQ(set.numAddresses(), 0x31u);
}

TEST(AddressSet, KeepsDisjointRangesSorted)
{
    AddressSet set;
    set.add(Address{1, 0x10});
    set.add(AddressRange{{0, 0x100}, {0, 0x1ff}});
    set.add(Address{0, 0x10});

    ASSERT_EQ(set.ranges().size(), 3u);
    EXPECT_EQ(set.ranges()[0].min, (Address{0, 0x10}));
    EXPECT_EQ(set.ranges()[1].min, (Address{0, 0x100}));
    EXPECT_EQ(set.ranges()[2].min, (Address{1, 0x10}));

    EXPECT_TRUE(set.contains(Address{0, 0x180}));
    EXPECT_FALSE(set.contains(Address{0, 0x11}));
    EXPECT_FALSE(set.contains(Address{1, 0x11}));
}

TEST(AddressSet, IgnoresInvertedAndCrossSpaceRanges)
{
    AddressSet set;
    set.add(AddressRange{{0, 0x20}, {0, 0x10}});
    set.add(AddressRange{{0, 0x20}, {1, 0x10}});
    EXPECT_TRUE(set.empty());
}

TEST(FlatAddressMap, KeysFollowAddressOrderAndRoundTrip)
{
    FlatAddressMap map;
    const Address a{2, 0x1000};
    const Address b{2, 0x1001};
    const Address c{3, 0};

    const int64_t ka = map.getKey(a, false);
    const int64_t kb = map.getKey(b, false);
    const int64_t kc = map.getKey(c, false);
    EXPECT_LT(ka, kb);
    EXPECT_LT(kb, kc);

    auto decoded = map.decodeAddress(kb);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, b);
}

TEST(FlatAddressMap, RejectsOffsetsBeyondWindow)
{
    FlatAddressMap map;
    EXPECT_EQ(map.getKey(Address{0, FlatAddressMap::kOffsetLimit}, true), kInvalidAddressKey);
    EXPECT_EQ(map.getKey(Address{FlatAddressMap::kMaxSpace + 1, 0}, true), kInvalidAddressKey);
    EXPECT_FALSE(map.decodeAddress(kInvalidAddressKey).has_value());
}

TEST(FlatAddressMap, KeyRangesClampToMappableAddresses)
{
    FlatAddressMap map;
    const uint64_t top = std::numeric_limits<uint64_t>::max();

    auto whole = map.getKeyRanges(Address{0, 0}, Address{0, top});
    ASSERT_EQ(whole.size(), 1u);
    EXPECT_EQ(whole[0].first, map.getKey(Address{0, 0}, false));
    EXPECT_EQ(whole[0].last, map.getKey(Address{0, FlatAddressMap::kOffsetLimit - 1}, false));

    // A start past the window moves up to the next space.
    auto spill = map.getKeyRanges(Address{0, FlatAddressMap::kOffsetLimit}, Address{1, 0x10});
    ASSERT_EQ(spill.size(), 1u);
    EXPECT_EQ(spill[0].first, map.getKey(Address{1, 0}, false));
    EXPECT_EQ(spill[0].last, map.getKey(Address{1, 0x10}, false));

    auto lastSpace = map.getKeyRanges(Address{FlatAddressMap::kMaxSpace, 0}, Address{0xffff, top});
    ASSERT_EQ(lastSpace.size(), 1u);
    EXPECT_EQ(lastSpace[0].last,
              map.getKey(Address{FlatAddressMap::kMaxSpace, FlatAddressMap::kOffsetLimit - 1}, false));

    EXPECT_TRUE(map.getKeyRanges(Address{0, FlatAddressMap::kOffsetLimit}, Address{0, top}).empty());
    EXPECT_TRUE(map.getKeyRanges(Address{0, 0x20}, Address{0, 0x10}).empty());
    EXPECT_TRUE(map.getKeyRanges(Address{FlatAddressMap::kMaxSpace + 1, 0}, Address{0xffff, 0}).empty());
}
