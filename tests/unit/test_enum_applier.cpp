// File: tests/unit/test_enum_applier.cpp
// Purpose: Verify enum-driven equate binding over a scripted listing.
// Key invariants: Only scalars equal to a declared value at the type's width
//                 and the scalar's signedness are bound; rescans are idempotent;
//                 the type is registered once.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "EquateFakes.hpp"
#include "db/MemoryAdapters.hpp"
#include "symbol/EnumApplier.hpp"
#include "symbol/EquateManager.hpp"
#include "symbol/EquateNames.hpp"

#include <mutex>
#include <sstream>
#include <string>

using namespace eqtab;
using eqtab::program::Address;
using eqtab::program::Scalar;
using eqtab::program::TaskOutcome;
using eqtab::support::ErrorCode;

namespace
{
const program::EnumType kMode{0x51, "Mode", 1, {{"READ", 1}, {"WRITE", 2}, {"NONE", -1}}};

struct EnumApplierTest : ::testing::Test
{
    db::MemoryEquateAdapter equates;
    db::MemoryEquateRefAdapter refs;
    program::FlatAddressMap addressMap;
    test::RecordingChangeSink sink;
    test::FakeListing listing;
    test::FakeTypeRegistry types;
    std::mutex lock;
    symbol::EquateManager manager{
        symbol::EquateServices{equates, refs, addressMap, sink, &listing, &types}, lock};

    program::AddressSet everything{Address{0, 0}, Address{0, 0xffff}};

    TaskOutcome apply(bool subOperands = false)
    {
        auto outcome = manager.applyEnum(everything, kMode, program::TaskMonitor::dummy(), subOperands);
        EXPECT_TRUE(outcome);
        return outcome ? outcome.value() : TaskOutcome::StorageFailed;
    }
};
} // namespace

TEST(EnumApplierMatch, ComparesAtTypeWidthAndScalarSignedness)
{
    EXPECT_TRUE(symbol::EnumApplier::matches(kMode, Scalar(8, 2, false)));
    EXPECT_TRUE(symbol::EnumApplier::matches(kMode, Scalar(8, 0xff, true)));
    EXPECT_FALSE(symbol::EnumApplier::matches(kMode, Scalar(16, 2, false)));
    EXPECT_FALSE(symbol::EnumApplier::matches(kMode, Scalar(8, 3, false)));
}

TEST(EnumApplierMatch, ScalarsMaskToTheirWidth)
{
    const Scalar byte(8, 0x1ff, true);
    EXPECT_EQ(byte.unsignedValue(), 0xffu);
    EXPECT_EQ(byte.value(), -1);
    EXPECT_EQ(Scalar(8, 0xff, false).value(), 255);
    EXPECT_NE(Scalar(8, 1, false), Scalar(8, 1, true));

    std::ostringstream os;
    os << byte;
    EXPECT_EQ(os.str(), "s8:-1");
}

TEST_F(EnumApplierTest, BindsMatchingOperand)
{
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(32, 0x1000, false)).scalarOperand(Scalar(8, 2, false));

    EXPECT_EQ(apply(), TaskOutcome::Completed);

    const std::string name = symbol::formatNameForEquate(kMode.id, 2);
    auto eq = manager.getEquate(name);
    ASSERT_TRUE(eq.has_value());
    EXPECT_EQ(eq->value, 2);
    auto refsHere = manager.getReferences(Address{0, 0x10});
    ASSERT_EQ(refsHere.size(), 1u);
    EXPECT_EQ(refsHere[0].opIndex, 1);
    EXPECT_EQ(manager.displayName(*eq), "WRITE");
}

TEST_F(EnumApplierTest, RescanIsIdempotent)
{
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(8, 1, false));
    listing.add(Address{0, 0x20}).scalarOperand(Scalar(8, 1, false));

    EXPECT_EQ(apply(), TaskOutcome::Completed);
    EXPECT_EQ(apply(), TaskOutcome::Completed);

    EXPECT_EQ(equates.size(), 1u);
    EXPECT_EQ(refs.size(), 2u);
    EXPECT_EQ(types.addCount, 1u);
}

TEST_F(EnumApplierTest, WidthOrSignednessMismatchIsSkipped)
{
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(16, 1, false));
    listing.add(Address{0, 0x20}).scalarOperand(Scalar(8, 7, false));

    EXPECT_EQ(apply(), TaskOutcome::Completed);
    EXPECT_EQ(equates.size(), 0u);
    EXPECT_EQ(types.addCount, 0u);
}

TEST_F(EnumApplierTest, SignedScalarBindsNegativeValue)
{
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(8, 0xff, true));
    EXPECT_EQ(apply(), TaskOutcome::Completed);
    auto eq = manager.getEquate(symbol::formatNameForEquate(kMode.id, -1));
    ASSERT_TRUE(eq.has_value());
    EXPECT_EQ(eq->value, -1);
    EXPECT_EQ(manager.displayName(*eq), "NONE");
}

TEST_F(EnumApplierTest, SubOperandsOnlyWhenRequested)
{
    listing.add(Address{0, 0x10})
        .compoundOperand({std::string("["), std::string("rbp"), Scalar(8, 2, false), std::string("]")});

    EXPECT_EQ(apply(false), TaskOutcome::Completed);
    EXPECT_EQ(refs.size(), 0u);

    EXPECT_EQ(apply(true), TaskOutcome::Completed);
    auto here = manager.getReferences(Address{0, 0x10});
    ASSERT_EQ(here.size(), 1u);
    EXPECT_EQ(here[0].opIndex, 0);
}

TEST_F(EnumApplierTest, SupersedesUnrelatedEquateInSlot)
{
    auto manual = manager.createEquate("MANUAL", 2);
    ASSERT_TRUE(manual);
    ASSERT_TRUE(manager.addReference(manual.value().id, Address{0, 0x10}, 0));
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(8, 2, false));

    EXPECT_EQ(apply(), TaskOutcome::Completed);
    EXPECT_FALSE(manager.getEquate("MANUAL").has_value());
    auto here = manager.getEquates(Address{0, 0x10}, 0);
    ASSERT_EQ(here.size(), 1u);
    EXPECT_EQ(here[0].name, symbol::formatNameForEquate(kMode.id, 2));
}

TEST_F(EnumApplierTest, RespectsAddressSet)
{
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(8, 1, false));
    listing.add(Address{0, 0x90}).scalarOperand(Scalar(8, 1, false));

    auto outcome = manager.applyEnum(program::AddressSet(Address{0, 0x80}, Address{0, 0xff}), kMode,
                                     program::TaskMonitor::dummy(), false);
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(manager.getReferences(Address{0, 0x10}).empty());
    EXPECT_EQ(manager.getReferences(Address{0, 0x90}).size(), 1u);
}

TEST_F(EnumApplierTest, CancellationStopsPerInstruction)
{
    for (uint64_t off = 0; off < 5; ++off)
        listing.add(Address{0, 0x10 + off}).scalarOperand(Scalar(8, 1, false));

    test::CancelAfterMonitor monitor(2);
    auto outcome = manager.applyEnum(everything, kMode, monitor, false);
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value(), TaskOutcome::Cancelled);
    EXPECT_EQ(refs.size(), 2u);
}

TEST_F(EnumApplierTest, UsesAlreadyRegisteredType)
{
    types.preload(kMode);
    listing.add(Address{0, 0x10}).scalarOperand(Scalar(8, 1, false));
    EXPECT_EQ(apply(), TaskOutcome::Completed);
    EXPECT_EQ(types.addCount, 0u);
    EXPECT_EQ(refs.size(), 1u);
}

TEST_F(EnumApplierTest, RejectsUnsupportedLength)
{
    program::EnumType wide = kMode;
    wide.length = 9;
    auto outcome = manager.applyEnum(everything, wide, program::TaskMonitor::dummy(), false);
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidArgument);
}

TEST(EnumApplierSetup, NeedsListingAndRegistry)
{
    db::MemoryEquateAdapter equates;
    db::MemoryEquateRefAdapter refs;
    program::FlatAddressMap addressMap;
    program::NullChangeSink sink;
    std::mutex lock;
    symbol::EquateManager manager{symbol::EquateServices{equates, refs, addressMap, sink}, lock};

    auto outcome = manager.applyEnum(program::AddressSet(Address{0, 0}, Address{0, 0xff}), kMode,
                                     program::TaskMonitor::dummy(), false);
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidArgument);
}
