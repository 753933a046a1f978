// File: tests/unit/test_equate_names.cpp
// Purpose: Verify the type-derived equate name format and its parser.
// Key invariants: Only `dtID:<u64>:<i64>` parses; everything else is a manual name.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "symbol/EquateNames.hpp"

#include <cstdint>
#include <limits>

using namespace eqtab::symbol;

TEST(EquateNames, FormatsDerivedName)
{
    EXPECT_EQ(formatNameForEquate(42, 7), "dtID:42:7");
    EXPECT_EQ(formatNameForEquate(std::numeric_limits<uint64_t>::max(), -3),
              "dtID:18446744073709551615:-3");
}

TEST(EquateNames, ParsesTypeIdAndValue)
{
    const std::string name = formatNameForEquate(0x1234, -129);
    EXPECT_TRUE(isDerivedEquateName(name));
    EXPECT_EQ(typeIdFromEquateName(name), std::optional<uint64_t>(0x1234));
    EXPECT_EQ(valueFromEquateName(name), std::optional<int64_t>(-129));
}

TEST(EquateNames, ManualNamesAreNotDerived)
{
    EXPECT_FALSE(isDerivedEquateName("MAX_PATH"));
    EXPECT_FALSE(isDerivedEquateName("dtID"));
    EXPECT_FALSE(typeIdFromEquateName("MAX_PATH").has_value());
    EXPECT_FALSE(valueFromEquateName("dtIDx:1:2").has_value());
}

TEST(EquateNames, MalformedDerivedNamesYieldNothing)
{
    for (const char *bad : {"dtID:", "dtID:1", "dtID:1:", "dtID::2", "dtID:a:2", "dtID:1:b",
                            "dtID:1:2:3", "dtID:-1:2", "dtID:1:99999999999999999999"})
    {
        EXPECT_FALSE(typeIdFromEquateName(bad).has_value()) << bad;
        EXPECT_FALSE(valueFromEquateName(bad).has_value()) << bad;
    }
}

TEST(EquateNames, ErrorNameRendersHexWithSign)
{
    EXPECT_EQ(formatNameForEquateError(255), "0xff <BAD EQUATE>");
    EXPECT_EQ(formatNameForEquateError(0), "0x0 <BAD EQUATE>");
    EXPECT_EQ(formatNameForEquateError(-255), "0x-ff <BAD EQUATE>");
    EXPECT_EQ(formatNameForEquateError(std::numeric_limits<int64_t>::min()),
              "0x-8000000000000000 <BAD EQUATE>");
}
