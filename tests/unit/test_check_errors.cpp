// File: tests/unit/test_check_errors.cpp
// Purpose: Verify error messages, labels, help text, codes and the
//          SourceErrors bundle.
// Key invariants: Each kind has a fixed code and headline; labels list the
//                 primary location first.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "check/Error.hpp"
#include "check/IR.hpp"
#include "support/diagnostics.hpp"

#include <sstream>
#include <string>

using namespace fmtlint::check;
using fmtlint::support::Severity;
using fmtlint::support::Span;

TEST(Error, CodesFollowTaxonomyOrder)
{
    EXPECT_EQ(errorCode(ErrorKind::MissingFunctionArgs), "F0001");
    EXPECT_EQ(errorCode(ErrorKind::NonliteralFormat), "F0002");
    EXPECT_EQ(errorCode(ErrorKind::SpecifierCastMismatch), "F0003");
    EXPECT_EQ(errorCode(ErrorKind::ExcessSpecifiers), "F0004");
    EXPECT_EQ(errorCode(ErrorKind::ExcessArgs), "F0005");
}

TEST(Error, MissingFunctionArgs)
{
    const Error e = Error::missingFunctionArgs(Span{8, 8});
    EXPECT_EQ(e.message(), "Missing function arguments.");
    ASSERT_EQ(e.labels().size(), 1u);
    EXPECT_EQ(e.labels()[0].span, (Span{8, 8}));
    EXPECT_EQ(e.labels()[0].text, "not enough arguments in function call");
    EXPECT_EQ(e.helpText(), "Supply enough arguments for the function call.");
}

TEST(Error, NonliteralFormat)
{
    auto parsed = IntermediateRepresentation::parse("printf(buf);");
    ASSERT_FALSE(parsed.isOk());
    const Error &e = parsed.error().at(0);
    EXPECT_EQ(e.message(),
              "Format string isn't a string literal, this is potentially an overflow "
              "vulnerability!");
    ASSERT_EQ(e.labels().size(), 1u);
    EXPECT_EQ(e.labels()[0].span, (Span{7, 10}));
    EXPECT_EQ(e.labels()[0].text, "not a string literal");
    EXPECT_EQ(e.helpText(), "To safely print a string, use `printf(\"%s\", buf)` instead.");
}

TEST(Error, SpecifierCastMismatch)
{
    const Error e = Error::specifierCastMismatch(
        Span{8, 10}, PrimitiveType::Integer, Span{13, 20}, PrimitiveType::Float);
    EXPECT_EQ(e.message(), "Incorrect specifier for type casted argument.");
    auto labels = e.labels();
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0].span, (Span{8, 10}));
    EXPECT_EQ(labels[0].text, "format string expects `int` value");
    EXPECT_EQ(labels[1].span, (Span{13, 20}));
    EXPECT_EQ(labels[1].text, "argument is casted as `float`");
    EXPECT_EQ(e.helpText(), "Change the specifier to `%f`, or change the cast to `(int)`.");

    const Error s = Error::specifierCastMismatch(
        Span{0, 2}, PrimitiveType::Float, Span{3, 10}, PrimitiveType::String);
    EXPECT_EQ(s.labels()[1].text, "argument is casted as `char*`");
    EXPECT_EQ(s.helpText(), "Change the specifier to `%s`, or change the cast to `(float)`.");
}

TEST(Error, ExcessSpecifiersPluralises)
{
    const Error one = Error::excessSpecifiers(Span{7, 14}, Span{7, 17}, 1);
    EXPECT_EQ(one.message(), "Excess specifiers, this will read arbitrary data off the stack!");
    auto labels = one.labels();
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0].text, "1 too many specifiers");
    EXPECT_EQ(labels[0].span, (Span{7, 14}));
    EXPECT_EQ(labels[1].text, "not enough arguments");
    EXPECT_EQ(labels[1].span, (Span{7, 17}));
    EXPECT_EQ(one.helpText(), "Add an argument or remove a specifier.");

    const Error three = Error::excessSpecifiers(Span{7, 14}, Span{7, 17}, 3);
    EXPECT_EQ(three.labels()[0].text, "3 too many specifiers");
    EXPECT_EQ(three.helpText(), "Add 3 arguments or remove 3 specifiers.");
}

TEST(Error, ExcessArgsPluralises)
{
    const Error one = Error::excessArgs(Span{7, 11}, Span{7, 17}, 1);
    EXPECT_EQ(one.message(), "Excess arguments.");
    auto labels = one.labels();
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0].text, "not enough specifiers");
    EXPECT_EQ(labels[1].text, "1 too many arguments");
    EXPECT_EQ(one.helpText(), "Add a specifier or remove an argument.");

    const Error two = Error::excessArgs(Span{7, 11}, Span{7, 17}, 2);
    EXPECT_EQ(two.labels()[1].text, "2 too many arguments");
    EXPECT_EQ(two.helpText(), "Add 2 specifiers or remove 2 arguments.");
}

TEST(Error, ToDiagnostic)
{
    const Error e = Error::excessArgs(Span{7, 11}, Span{7, 17}, 2);
    auto diag = e.toDiagnostic(4);
    EXPECT_EQ(diag.severity, Severity::Error);
    EXPECT_EQ(diag.fileId, 4u);
    EXPECT_EQ(diag.code, "F0005");
    EXPECT_EQ(diag.message, "Excess arguments.");
    EXPECT_EQ(diag.labels.size(), 2u);
    EXPECT_EQ(diag.help, "Add 2 specifiers or remove 2 arguments.");
}

TEST(SourceErrors, PrintsEveryErrorWithLocations)
{
    const std::string src = "int x;\nprintf(\"%d\", (float) x);\n";
    auto parsed = IntermediateRepresentation::parse(src);
    ASSERT_FALSE(parsed.isOk());

    const SourceErrors bundle("main.c", src, parsed.error());
    EXPECT_EQ(bundle.filename(), "main.c");
    EXPECT_EQ(bundle.source(), src);
    ASSERT_EQ(bundle.errors().size(), 1u);

    std::ostringstream os;
    bundle.print(os);
    EXPECT_EQ(os.str(),
              "Source code contains errors.\n"
              "main.c:2:9: error[F0003]: Incorrect specifier for type casted argument.\n"
              "  main.c:2:9: note: format string expects `int` value\n"
              "  main.c:2:14: note: argument is casted as `float`\n"
              "  help: Change the specifier to `%f`, or change the cast to `(int)`.\n");
}

TEST(SourceErrors, ReportsToEngine)
{
    auto parsed = IntermediateRepresentation::parse("printf(a); printf(\"%d\");");
    ASSERT_FALSE(parsed.isOk());
    const SourceErrors bundle("x.c", "printf(a); printf(\"%d\");", parsed.error());

    fmtlint::support::DiagnosticEngine engine;
    bundle.report(engine, 1);
    EXPECT_EQ(engine.errorCount(), 2u);
    EXPECT_EQ(engine.diagnostics()[0].code, "F0002");
    EXPECT_EQ(engine.diagnostics()[1].code, "F0004");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
