/*
 * Lexer tests - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shellkit/lex/lexer.hpp>

using namespace shellkit;

static std::vector<TokenKind> kinds(const TokenStream& ts) {
    std::vector<TokenKind> out;
    for (auto& t : ts) out.push_back(t.kind);
    return out;
}

TEST(LexerBasic, WordsAndOperators) {
    auto ts = tokenize("print a | grep a ; date > out.txt &");
    std::vector<TokenKind> expected = {
        TokenKind::Word, TokenKind::Word, TokenKind::Pipe, TokenKind::Word, TokenKind::Word,
        TokenKind::Semi, TokenKind::Word, TokenKind::RedirOut, TokenKind::Word, TokenKind::Background,
        TokenKind::Eof};
    EXPECT_EQ(kinds(ts), expected);
    EXPECT_EQ(ts[0].lexeme, "print");
    EXPECT_EQ(ts[8].lexeme, "out.txt");
}

TEST(LexerBasic, AppendRedirect) {
    auto ts = tokenize("print x >> log");
    ASSERT_EQ(ts.size(), 5u);
    EXPECT_EQ(ts[2].kind, TokenKind::RedirOutAppend);
    EXPECT_EQ(ts[2].lexeme, ">>");
}

TEST(LexerBasic, OperatorsNeedNoSpaces) {
    auto ts = tokenize("a|b;c");
    std::vector<TokenKind> expected = {TokenKind::Word, TokenKind::Pipe, TokenKind::Word, TokenKind::Semi,
                                       TokenKind::Word, TokenKind::Eof};
    EXPECT_EQ(kinds(ts), expected);
}

TEST(LexerQuotes, OperatorsInsideQuotesStayInWord) {
    auto ts = tokenize("print \"a|b;c > d\" 'x & y'");
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[1].kind, TokenKind::Word);
    EXPECT_EQ(ts[1].lexeme, "a|b;c > d");
    EXPECT_EQ(ts[2].lexeme, "x & y");
}

TEST(LexerQuotes, AdjacentQuotedPartsJoin) {
    auto ts = tokenize("print ab\"c d\"'e'");
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[1].lexeme, "abc de");
}

TEST(LexerQuotes, EscapesInDoubleQuotes) {
    auto ts = tokenize(R"(print "say \"hi\" \\ \$x \n")");
    ASSERT_EQ(ts.size(), 3u);
    // \n is not a lexer escape; print interprets it later
    EXPECT_EQ(ts[1].lexeme, R"(say "hi" \ $x \n)");
}

TEST(LexerQuotes, SingleQuotesAreLiteral) {
    auto ts = tokenize(R"(print 'a\"b')");
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[1].lexeme, R"(a\"b)");
}

TEST(LexerQuotes, UnterminatedQuoteIsInvalid) {
    auto ts = tokenize("print \"oops");
    ASSERT_GE(ts.size(), 2u);
    EXPECT_EQ(ts[ts.size() - 2].kind, TokenKind::Invalid);
    EXPECT_NE(ts[ts.size() - 2].lexeme.find("unterminated double quote"), std::string::npos);
    EXPECT_EQ(ts.back().kind, TokenKind::Eof);
}

TEST(LexerEscapes, BackslashOutsideQuotes) {
    auto ts = tokenize(R"(print a\ b c\|d)");
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[1].lexeme, "a b");
    EXPECT_EQ(ts[2].lexeme, "c|d");
}

TEST(LexerEscapes, LineContinuation) {
    auto ts = tokenize("print one \\\n two");
    std::vector<TokenKind> expected = {TokenKind::Word, TokenKind::Word, TokenKind::Word, TokenKind::Eof};
    EXPECT_EQ(kinds(ts), expected);
    EXPECT_EQ(ts[2].lexeme, "two");
}

TEST(LexerEscapes, TrailingBackslashIsInvalid) {
    auto ts = tokenize("print a\\");
    ASSERT_GE(ts.size(), 2u);
    EXPECT_EQ(ts[ts.size() - 2].kind, TokenKind::Invalid);
}

TEST(LexerMisc, NewlinesAndComments) {
    auto ts = tokenize("print a # trailing comment\nprint b");
    std::vector<TokenKind> expected = {TokenKind::Word, TokenKind::Word, TokenKind::Newline, TokenKind::Word,
                                       TokenKind::Word, TokenKind::Eof};
    EXPECT_EQ(kinds(ts), expected);
}

TEST(LexerMisc, HashInsideWordIsNotComment) {
    auto ts = tokenize("print a#b");
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[1].lexeme, "a#b");
}

TEST(LexerMisc, LogicalOperatorsRejected) {
    auto ts = tokenize("a && b");
    ASSERT_GE(ts.size(), 2u);
    EXPECT_EQ(ts[1].kind, TokenKind::Invalid);
    ts = tokenize("a || b");
    EXPECT_EQ(ts[1].kind, TokenKind::Invalid);
}

TEST(LexerMisc, EmptyInput) {
    auto ts = tokenize("   ");
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0].kind, TokenKind::Eof);
}
