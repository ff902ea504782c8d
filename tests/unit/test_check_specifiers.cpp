// File: tests/unit/test_check_specifiers.cpp
// Purpose: Verify specifier iteration and the literal text around specifiers.
// Key invariants: before() and remainder() cover the format text between and
//                 after specifiers exactly.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "check/Specifiers.hpp"

using namespace fmtlint::check;
using fmtlint::lex::PrimitiveType;
using fmtlint::support::Span;

TEST(Specifiers, SplitsLiteralText)
{
    Specifiers specs("a %d b %5.2f c");

    auto first = specs.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->type, PrimitiveType::Integer);
    EXPECT_TRUE(first->options.empty());
    EXPECT_EQ(specs.before(), "a ");
    EXPECT_EQ(specs.remainder(), " b %5.2f c");
    EXPECT_EQ(specs.span(10), (Span{12, 14}));

    auto second = specs.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, (Specifier{"5.2", PrimitiveType::Float}));
    EXPECT_EQ(specs.before(), " b ");
    EXPECT_EQ(specs.remainder(), " c");
    EXPECT_EQ(specs.span(0), (Span{7, 12}));

    EXPECT_FALSE(specs.next());
    EXPECT_EQ(specs.remainder(), " c");
}

TEST(Specifiers, NoSpecifiersLeavesWholeRemainder)
{
    Specifiers specs("100%% done\\n");
    EXPECT_FALSE(specs.next());
    EXPECT_EQ(specs.remainder(), "100%% done\\n");
}

TEST(Specifiers, AdjacentSpecifiersHaveEmptyBefore)
{
    Specifiers specs("%d%s");
    ASSERT_TRUE(specs.next());
    ASSERT_TRUE(specs.next());
    EXPECT_TRUE(specs.before().empty());
    EXPECT_TRUE(specs.remainder().empty());
}

TEST(Specifiers, UnknownConversionFoldsIntoBefore)
{
    Specifiers specs("%x %d");
    auto spec = specs.next();
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec->type, PrimitiveType::Integer);
    EXPECT_EQ(specs.before(), "%x ");
}

TEST(Specifiers, CountDrainsTheRest)
{
    Specifiers specs("%d %s %f");
    ASSERT_TRUE(specs.next());
    EXPECT_EQ(specs.count(), 2u);
    EXPECT_FALSE(specs.next());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
