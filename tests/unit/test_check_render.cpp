// File: tests/unit/test_check_render.cpp
// Purpose: Verify the optimize and typecast renderings.
// Key invariants: Literal code is copied unchanged; the optimize rendering
//                 announces 3 * values + 1 trailing arguments.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "check/IR.hpp"

#include <sstream>
#include <string>
#include <string_view>

using namespace fmtlint::check;

namespace
{
std::string optimize(std::string_view src)
{
    auto parsed = IntermediateRepresentation::parse(src);
    EXPECT_TRUE(parsed.isOk()) << src;
    return parsed ? parsed.value().displayOptimize().str() : std::string{};
}

std::string typecast(std::string_view src)
{
    auto parsed = IntermediateRepresentation::parse(src);
    EXPECT_TRUE(parsed.isOk()) << src;
    return parsed ? parsed.value().displayTypecast().str() : std::string{};
}
} // namespace

TEST(Render, SnprintfStringNeedsNoAddressOf)
{
    EXPECT_EQ(optimize("snprintf(buf, n, \"%s\", str);"),
              "safe_snprintf((char* restrict) (buf), (size_t) (n), 4, \"\", (void*) (str), "
              "fmt_string, \"\");");
}

TEST(Render, OptimizePrintf)
{
    EXPECT_EQ(optimize("int x;\nprintf(\"x=%d\\n\", x);\n"),
              "int x;\nsafe_printf(4, \"x=\", (void*) &(x), fmt_int, \"\\n\");\n");
    EXPECT_EQ(optimize("printf(\"hello\\n\");"), "safe_printf(1, \"hello\\n\");");
}

TEST(Render, OptimizeSprintfWithCast)
{
    EXPECT_EQ(optimize("sprintf(out, \"%s: %5.1f\", name, (float) v);"),
              "safe_sprintf((char* restrict) (out), 7, \"\", (void*) (name), fmt_string, "
              "\": \", (void*) &((float) v), fmt_float, \"\");");
}

TEST(Render, TypecastAddsMissingCasts)
{
    EXPECT_EQ(typecast("sprintf(out, \"%s: %5.1f\", name, (float) v);"),
              "sprintf((char* restrict) (out), \"%s: %5.1f\", (char*) (name), (float) v);");
    EXPECT_EQ(typecast("snprintf(b, 8, \"%-3d|\", n + 1);"),
              "snprintf((char* restrict) (b), (size_t) (8), \"%-3d|\", (int) (n + 1));");
}

TEST(Render, TypecastKeepsCheckedArguments)
{
    constexpr std::string_view src = "printf(\"%d %f %s\", (int) a, (float) b, (char*) c);";
    EXPECT_EQ(typecast(src), src);
}

TEST(Render, TypecastNormalisesIntegerLetter)
{
    EXPECT_EQ(typecast("printf(\"%i\", n);"), "printf(\"%d\", (int) (n));");
}

TEST(Render, ConcatenatedFormatStaysValid)
{
    EXPECT_EQ(typecast("printf(\"a%d\" \"b\", x);"), "printf(\"a%d\" \"b\", (int) (x));");
}

TEST(Render, FileWithoutCallsIsUnchanged)
{
    constexpr std::string_view src = "#include <stdio.h>\n\nint main(void) {\n\treturn 0;\n}\n";
    EXPECT_EQ(optimize(src), src);
    EXPECT_EQ(typecast(src), src);
}

TEST(Render, StreamOutputMatchesStr)
{
    auto parsed = IntermediateRepresentation::parse("a(); printf(\"%d\", 1); b();");
    ASSERT_TRUE(parsed.isOk());
    const auto &ir = parsed.value();

    std::ostringstream opt;
    opt << ir.displayOptimize();
    EXPECT_EQ(opt.str(), ir.displayOptimize().str());

    std::ostringstream cast;
    cast << ir.displayTypecast();
    EXPECT_EQ(cast.str(), "a(); printf(\"%d\", (int) (1)); b();");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
