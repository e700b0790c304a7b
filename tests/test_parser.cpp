/*
 * Parser tests - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shellkit/lex/lexer.hpp>
#include <shellkit/parse/parser.hpp>
#include <shellkit/parse/ast.hpp>

using namespace shellkit;

static std::string error_of(const std::string& line) {
    auto res = parse_line(line);
    return res.error ? res.error->message : std::string();
}

TEST(ParserPipeline, StageCount) {
    auto res = parse_line("print a | grep a | grep -v b");
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.chains.size(), 1u);
    EXPECT_EQ(res.chains[0].stage_count(), 3u);
    EXPECT_EQ(res.chains[0].head->name, "print");
    EXPECT_EQ(res.chains[0].head->next->name, "grep");
    EXPECT_EQ(res.chains[0].head->next->next->args, (std::vector<std::string>{"-v", "b"}));
}

TEST(ParserList, SemicolonsAndNewlines) {
    auto res = parse_line("print a; print b\nprint c;");
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.chains.size(), 3u);
    EXPECT_EQ(res.chains[2].head->argv(), (std::vector<std::string>{"print", "c"}));
}

TEST(ParserList, EmptyLine) {
    auto res = parse_line("");
    EXPECT_TRUE(res.ok());
    EXPECT_TRUE(res.chains.empty());
    res = parse_line("# only a comment");
    EXPECT_TRUE(res.ok());
    EXPECT_TRUE(res.chains.empty());
}

TEST(ParserQuotes, PipeInsideQuotesIsArgument) {
    auto res = parse_line("print \"a|b\"");
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.chains.size(), 1u);
    EXPECT_EQ(res.chains[0].stage_count(), 1u);
    EXPECT_EQ(res.chains[0].head->args, (std::vector<std::string>{"a|b"}));
}

TEST(ParserRedirect, OutputAndAppend) {
    auto res = parse_line("print hi | grep h > out.txt");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.chains[0].redirect, "out.txt");
    EXPECT_FALSE(res.chains[0].append);
    EXPECT_EQ(res.redirect_target(), "out.txt");

    res = parse_line("print hi >> log.txt");
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.chains[0].append);
}

TEST(ParserRedirect, Errors) {
    EXPECT_EQ(error_of("print hi >"), "syntax error: missing redirect target");
    EXPECT_EQ(error_of("print a > f1 > f2"), "syntax error: multiple output redirections are not allowed");
    EXPECT_EQ(error_of("print a > f1; print b > f2"), "syntax error: multiple output redirections are not allowed");
    EXPECT_EQ(error_of("print a > f1 extra"), "syntax error: unexpected 'extra' after redirect target");
    EXPECT_EQ(error_of("print a > f1 | grep a"), "syntax error: cannot pipe the output of a redirect");
}

TEST(ParserErrors, MissingCommands) {
    EXPECT_EQ(error_of("| grep a"), "syntax error: missing command before '|'");
    EXPECT_EQ(error_of("print a |"), "syntax error: missing command after '|'");
    EXPECT_EQ(error_of("print a | | grep"), "syntax error: missing command after '|'");
    EXPECT_EQ(error_of("; print a"), "syntax error: missing command before ';'");
    EXPECT_EQ(error_of("print a;; print b"), "syntax error: missing command before ';'");
}

TEST(ParserErrors, LexerErrorsSurface) {
    auto res = parse_line("print \"unterminated");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error->kind, ErrorKind::Syntax);
    EXPECT_NE(res.error->message.find("unterminated"), std::string::npos);
    EXPECT_TRUE(res.chains.empty());

    EXPECT_FALSE(parse_line("a && b").ok());
}

TEST(ParserBackground, TrailingAmpersand) {
    auto res = parse_line("sleep 1 &; print done");
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.chains.size(), 2u);
    EXPECT_TRUE(res.chains[0].background);
    EXPECT_FALSE(res.chains[1].background);
}

TEST(ParserRoundTrip, ToStringReparsesToEqualChain) {
    const char* lines[] = {
        "print \"a|b\" 'c d' | grep -v x > \"out file.txt\"",
        "print \"it's\" \"say \\\"hi\\\"\" back\\\\slash",
        "sleep 2 &",
        "print '' | cat >> log",
    };
    for (auto line : lines) {
        auto first = parse_line(line);
        ASSERT_TRUE(first.ok()) << line;
        ASSERT_EQ(first.chains.size(), 1u);
        std::string text = first.chains[0].to_string();
        auto second = parse_line(text);
        ASSERT_TRUE(second.ok()) << text;
        ASSERT_EQ(second.chains.size(), 1u);
        EXPECT_TRUE(first.chains[0] == second.chains[0]) << line << " -> " << text;
    }
}

TEST(ParserClone, DeepCopy) {
    auto res = parse_line("print a | grep a > f");
    ASSERT_TRUE(res.ok());
    Chain copy = res.chains[0].clone();
    EXPECT_TRUE(copy == res.chains[0]);
    copy.head->next->args[0] = "b";
    EXPECT_FALSE(copy == res.chains[0]);
}
