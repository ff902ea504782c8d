// File: tests/unit/test_lex_source.cpp
// Purpose: Verify the whole-file tokenizer used to locate call sites.
// Key invariants: Whitespace is skipped; comments, literals and unknown bytes
//                 become single tokens with exact spans.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "lex/SourceLexer.hpp"

#include <string_view>
#include <vector>

using namespace fmtlint::lex;
using fmtlint::support::Span;

namespace
{
std::vector<SourceToken> lexAll(std::string_view src)
{
    SourceLexer lexer(src);
    std::vector<SourceToken> tokens;
    while (auto tok = lexer.next())
        tokens.push_back(*tok);
    return tokens;
}

void expectToken(const SourceToken &tok, SourceTokenKind kind, Span span)
{
    EXPECT_EQ(tok.kind, kind);
    EXPECT_EQ(tok.span, span);
}
} // namespace

TEST(SourceLexer, TokenizesSimpleCall)
{
    auto toks = lexAll("printf(\"hi %d\", x);");
    ASSERT_EQ(toks.size(), 7u);
    expectToken(toks[0], SourceTokenKind::Printf, {0, 6});
    expectToken(toks[1], SourceTokenKind::LParen, {6, 7});
    expectToken(toks[2], SourceTokenKind::String, {7, 14});
    expectToken(toks[3], SourceTokenKind::Other, {14, 15});
    expectToken(toks[4], SourceTokenKind::Other, {16, 17});
    expectToken(toks[5], SourceTokenKind::RParen, {17, 18});
    expectToken(toks[6], SourceTokenKind::Other, {18, 19});
}

TEST(SourceLexer, EscapedQuoteDoesNotEndString)
{
    auto toks = lexAll("\"a\\\"b\" x");
    ASSERT_EQ(toks.size(), 2u);
    expectToken(toks[0], SourceTokenKind::String, {0, 6});
    expectToken(toks[1], SourceTokenKind::Other, {7, 8});
}

TEST(SourceLexer, AdjacentLiteralsMerge)
{
    auto toks = lexAll("\"a\" \"b\";");
    ASSERT_EQ(toks.size(), 2u);
    expectToken(toks[0], SourceTokenKind::String, {0, 7});

    auto prefixed = lexAll("L\"x\" u8\"y\"");
    ASSERT_EQ(prefixed.size(), 1u);
    expectToken(prefixed[0], SourceTokenKind::String, {0, 10});
}

TEST(SourceLexer, UnterminatedStringIsOther)
{
    auto toks = lexAll("\"abc");
    ASSERT_EQ(toks.size(), 2u);
    expectToken(toks[0], SourceTokenKind::Other, {0, 1});
    expectToken(toks[1], SourceTokenKind::Other, {1, 4});
}

TEST(SourceLexer, CommentsHideCalls)
{
    auto toks = lexAll("// printf(\n/* printf( */ snprintf");
    ASSERT_EQ(toks.size(), 3u);
    expectToken(toks[0], SourceTokenKind::Comment, {0, 10});
    expectToken(toks[1], SourceTokenKind::Comment, {11, 24});
    expectToken(toks[2], SourceTokenKind::Snprintf, {25, 33});
}

TEST(SourceLexer, UnterminatedBlockCommentIsOther)
{
    auto toks = lexAll("/* x");
    ASSERT_EQ(toks.size(), 2u);
    expectToken(toks[0], SourceTokenKind::Other, {0, 2});
    expectToken(toks[1], SourceTokenKind::Other, {3, 4});
}

TEST(SourceLexer, TrackedNamesAreWholeIdentifiers)
{
    auto toks = lexAll("printf_s xprintf sprintf snprintf printf");
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0].kind, SourceTokenKind::Other);
    EXPECT_EQ(toks[1].kind, SourceTokenKind::Other);
    EXPECT_EQ(toks[2].kind, SourceTokenKind::Sprintf);
    EXPECT_EQ(toks[3].kind, SourceTokenKind::Snprintf);
    EXPECT_EQ(toks[4].kind, SourceTokenKind::Printf);
}

TEST(SourceLexer, CharLiteralHidesParenthesis)
{
    auto toks = lexAll("'(' ')' )");
    ASSERT_EQ(toks.size(), 3u);
    expectToken(toks[0], SourceTokenKind::Other, {0, 3});
    expectToken(toks[1], SourceTokenKind::Other, {4, 7});
    expectToken(toks[2], SourceTokenKind::RParen, {8, 9});
}

TEST(SourceLexer, NumbersAreSingleTokens)
{
    auto toks = lexAll("1.5e3 0x1F");
    ASSERT_EQ(toks.size(), 2u);
    expectToken(toks[0], SourceTokenKind::Other, {0, 5});
    expectToken(toks[1], SourceTokenKind::Other, {6, 10});
}

TEST(SourceLexer, PeekDoesNotConsume)
{
    SourceLexer lexer("printf (x)");
    auto name = lexer.next();
    ASSERT_TRUE(name);
    EXPECT_EQ(lexer.offset(), 6u);

    const auto &peeked = lexer.peek();
    ASSERT_TRUE(peeked);
    EXPECT_EQ(peeked->kind, SourceTokenKind::LParen);
    EXPECT_EQ(lexer.offset(), 6u);
    EXPECT_EQ(lexer.span(), (Span{0, 6}));

    auto paren = lexer.next();
    ASSERT_TRUE(paren);
    EXPECT_EQ(paren->span, (Span{7, 8}));
    EXPECT_EQ(lexer.offset(), 8u);
}

TEST(SourceLexer, SeekResumesAndDropsLookahead)
{
    SourceLexer lexer("a ( b ) c");
    lexer.next();
    lexer.peek();
    lexer.seek(7);
    EXPECT_EQ(lexer.offset(), 7u);
    EXPECT_EQ(lexer.remainder(), " c");
    auto tok = lexer.next();
    ASSERT_TRUE(tok);
    EXPECT_EQ(tok->span, (Span{8, 9}));
    EXPECT_FALSE(lexer.next());
    EXPECT_EQ(lexer.offset(), 9u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
