// File: tests/unit/test_storage_failures.cpp
// Purpose: Verify that storage failures reach the configured handler and that
//          every public operation degrades the documented way.
// Key invariants: Lookups return empty results, mutations return the
//                 diagnostic and bulk operations return StorageFailed.
//                 Validation errors never reach the handler.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "EquateFakes.hpp"
#include "support/diag_expected.hpp"
#include "symbol/EquateManager.hpp"

#include <mutex>
#include <sstream>

using namespace eqtab;
using eqtab::program::Address;
using eqtab::program::TaskOutcome;
using eqtab::support::ErrorCode;

namespace
{
struct StorageFailureTest : ::testing::Test
{
    test::FaultyEquateAdapter equates;
    test::FaultyEquateRefAdapter refs;
    program::FlatAddressMap addressMap;
    program::NullChangeSink sink;
    std::mutex lock;
    support::DiagnosticEngine diags;
    symbol::EquateManager manager{
        symbol::EquateServices{equates, refs, addressMap, sink},
        lock,
        symbol::EquateTableConfig{4, 4, false, nullptr, [this](const support::Diag &d) { diags.report(d); }}};

    void failAll(bool on)
    {
        equates.failing = on;
        refs.failing = on;
    }
};
} // namespace

TEST_F(StorageFailureTest, LookupsReturnEmptyAndReport)
{
    auto eq = manager.createEquate("PRESENT", 1);
    ASSERT_TRUE(eq);
    ASSERT_TRUE(manager.addReference(eq.value().id, Address{0, 0x10}, 0));
    manager.invalidateCache();
    failAll(true);

    EXPECT_FALSE(manager.getEquate("PRESENT").has_value());
    EXPECT_FALSE(manager.getEquateById(eq.value().id).has_value());
    EXPECT_TRUE(manager.getEquates().empty());
    EXPECT_TRUE(manager.getReferences(Address{0, 0x10}).empty());
    EXPECT_EQ(manager.getReferenceCount(eq.value().id), 0u);
    auto it = manager.getEquateAddresses();
    EXPECT_FALSE(it.next().has_value());

    EXPECT_EQ(diags.count(ErrorCode::StorageFailure), 6u);
    EXPECT_EQ(diags.errorCount(), 6u);
}

TEST_F(StorageFailureTest, MutationsReturnTheDiagnostic)
{
    failAll(true);
    auto eq = manager.createEquate("X", 1);
    ASSERT_FALSE(eq);
    EXPECT_EQ(eq.error().code, ErrorCode::StorageFailure);
    EXPECT_EQ(diags.count(ErrorCode::StorageFailure), 1u);
    EXPECT_FALSE(manager.removeEquate("X"));
    EXPECT_EQ(diags.count(ErrorCode::StorageFailure), 2u);
}

TEST_F(StorageFailureTest, ValidationErrorsBypassTheHandler)
{
    auto blank = manager.createEquate("   ", 1);
    ASSERT_FALSE(blank);
    EXPECT_EQ(blank.error().code, ErrorCode::InvalidName);

    auto unknown = manager.addReference(1234, Address{0, 0x10}, 0);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(diags.diagnostics().empty());
}

TEST_F(StorageFailureTest, BulkOperationsReportStorageFailed)
{
    auto eq = manager.createEquate("BULK", 1);
    ASSERT_TRUE(eq);
    ASSERT_TRUE(manager.addReference(eq.value().id, Address{0, 0x10}, 0));
    refs.failing = true;

    auto del = manager.deleteAddressRange(Address{0, 0}, Address{0, 0xff}, program::TaskMonitor::dummy());
    ASSERT_TRUE(del);
    EXPECT_EQ(del.value(), TaskOutcome::StorageFailed);

    auto move = manager.moveAddressRange(Address{0, 0}, Address{0, 0x1000}, 0x100,
                                         program::TaskMonitor::dummy());
    ASSERT_TRUE(move);
    EXPECT_EQ(move.value(), TaskOutcome::StorageFailed);

    EXPECT_EQ(diags.count(ErrorCode::StorageFailure), 2u);

    refs.failing = false;
    EXPECT_EQ(manager.getReferences(Address{0, 0x10}).size(), 1u);
}

TEST_F(StorageFailureTest, PrintedDiagnosticCarriesCode)
{
    std::ostringstream os;
    support::printDiag(support::makeStorageError("disk gone"), os);
    EXPECT_EQ(os.str(), "error[storage-failure]: disk gone\n");
}

TEST(StorageFailureDefaultHandler, PrintsToStandardError)
{
    test::FaultyEquateAdapter equates;
    test::FaultyEquateRefAdapter refs;
    program::FlatAddressMap addressMap;
    program::NullChangeSink sink;
    std::mutex lock;
    symbol::EquateManager manager{symbol::EquateServices{equates, refs, addressMap, sink}, lock};

    equates.failing = true;
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(manager.getEquate("ANY").has_value());
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("error[storage-failure]"), std::string::npos);
}
