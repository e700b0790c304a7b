/*
 * Built-in command tests - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/builtins.hpp>
#include <cstdlib>
#include <map>
#include <mutex>
#include <regex>

using namespace shellkit;

namespace {

class MemoryFiles : public FileHandler {
public:
    explicit MemoryFiles(std::map<std::string, std::string>& files) : m_files(files) {}
    Status write_file(const std::string& path, const std::string& content, RedirType type) override {
        std::lock_guard<std::mutex> lock(m_mu);
        if (type == RedirType::OutAppend) m_files[path] += content;
        else m_files[path] = content;
        return std::nullopt;
    }
    Status read_file(const std::string& path, std::string& content) override {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_files.find(path);
        if (it == m_files.end()) return make_error(ErrorKind::Io, "failed to read file " + path + ": not found");
        content = it->second;
        return std::nullopt;
    }
private:
    std::mutex m_mu;
    std::map<std::string, std::string>& m_files;
};

class BuiltinsTest : public ::testing::Test {
protected:
    BuiltinsTest() {
        register_builtins(engine);
        engine.set_file_handler(std::make_unique<MemoryFiles>(files));
    }

    std::string run(const std::string& line) {
        auto r = engine.execute(line);
        EXPECT_TRUE(r.ok()) << line << ": " << (r.error ? r.error->message : "");
        return r.output;
    }

    std::map<std::string, std::string> files;
    Engine engine;
};

} // namespace

TEST(BuiltinHelpers, InterpretEscapes) {
    EXPECT_EQ(interpret_escapes("a\\nb\\tc\\\\d\\q"), "a\nb\tc\\d\\q");
}

TEST(BuiltinHelpers, ParseInteger) {
    EXPECT_EQ(parse_integer("42"), 42);
    EXPECT_EQ(parse_integer("-7"), -7);
    EXPECT_EQ(parse_integer("+3"), 3);
    EXPECT_FALSE(parse_integer("").has_value());
    EXPECT_FALSE(parse_integer("4x").has_value());
    EXPECT_FALSE(parse_integer("+").has_value());
}

TEST(BuiltinHelpers, SplitLines) {
    EXPECT_EQ(split_lines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\r\n\nc"), (std::vector<std::string>{"a", "", "c"}));
    EXPECT_TRUE(split_lines("").empty());
}

TEST_F(BuiltinsTest, PrintAndEcho) {
    EXPECT_EQ(run("print hello   world"), "hello world\n");
    EXPECT_EQ(run("echo \"a\\tb\""), "a\tb\n");
    EXPECT_EQ(run("print"), "\n");
}

TEST_F(BuiltinsTest, GrepFlags) {
    const std::string src = "print \"Alpha\\nbeta\\nALPHA beta\\ngamma\"";
    EXPECT_EQ(run(src + " | grep Alpha"), "Alpha\n");
    EXPECT_EQ(run(src + " | grep -i alpha"), "Alpha\nALPHA beta\n");
    EXPECT_EQ(run(src + " | grep -v beta"), "Alpha\ngamma\n");
    EXPECT_EQ(run(src + " | grep -E \"^[a-z]+$\""), "beta\ngamma\n");
    EXPECT_EQ(run("grep anything"), "");
}

TEST_F(BuiltinsTest, GrepErrors) {
    auto r = engine.execute("print x | grep -E \"(\"");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error->message.find("invalid pattern"), std::string::npos);
    r = engine.execute("print x | grep");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error->message.find("usage"), std::string::npos);
}

TEST_F(BuiltinsTest, CatAndTee) {
    files["notes.txt"] = "one\ntwo\n";
    EXPECT_EQ(run("cat notes.txt"), "one\ntwo\n");
    EXPECT_EQ(run("cat notes.txt | grep two"), "two\n");
    EXPECT_EQ(run("print piped | cat"), "piped\n");
    EXPECT_EQ(run("print copy | tee a.txt"), "copy\n");
    EXPECT_EQ(run("print more | tee -a a.txt"), "more\n");
    EXPECT_EQ(files["a.txt"], "copy\nmore\n");
    auto r = engine.execute("cat missing.txt");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::Io);
}

TEST_F(BuiltinsTest, DateEnvHelp) {
    EXPECT_TRUE(std::regex_match(run("date"), std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}[+-]\d{4}\n)")));
    setenv("SHELLKIT_BUILTIN_ENV", "present", 1);
    EXPECT_EQ(run("env SHELLKIT_BUILTIN_ENV"), "present\n");
    EXPECT_NE(run("env").find("SHELLKIT_BUILTIN_ENV=present"), std::string::npos);
    std::string help = run("help");
    EXPECT_NE(help.find("print"), std::string::npos);
    EXPECT_NE(help.find("aliases: echo"), std::string::npos);
    EXPECT_EQ(run("help grep").rfind("grep - ", 0), 0u);
    EXPECT_NE(run("help alias").find("delete"), std::string::npos);
}

TEST_F(BuiltinsTest, SleepValidatesArgument) {
    EXPECT_EQ(run("sleep 0.01"), "");
    EXPECT_FALSE(engine.execute("sleep soon").ok());
    EXPECT_FALSE(engine.execute("sleep -1").ok());
}

TEST_F(BuiltinsTest, LetExpandsValues) {
    EXPECT_EQ(run("let x=5"), "x = 5\n");
    EXPECT_EQ(run("let y=$((x * 2 + 1))"), "y = 11\n");
    EXPECT_EQ(run("let msg=$(print hi there)"), "msg = hi there\n");
    EXPECT_EQ(run("let a=1 b=\"two words\""), "a = 1\nb = two words\n");
    EXPECT_EQ(engine.get_variable("b"), "two words");
}

TEST_F(BuiltinsTest, LetRejectsInvalidNames) {
    auto r = engine.execute("let 1abc=3");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.output, "Invalid assignment: 1abc=3 (expected name=value)\n");
    EXPECT_FALSE(engine.execute("let novalue").ok());
    EXPECT_FALSE(engine.execute("let").ok());
}

TEST_F(BuiltinsTest, UnsetReportsMissing) {
    run("let gone=1");
    EXPECT_EQ(run("unset gone"), "Removed variable: gone\n");
    EXPECT_EQ(run("unset gone"), "Variable not found: gone\n");
}

TEST_F(BuiltinsTest, IncDec) {
    EXPECT_EQ(run("inc counter"), "counter = 1\n");
    EXPECT_EQ(run("inc counter 5"), "counter = 6\n");
    EXPECT_EQ(run("dec counter 2"), "counter = 4\n");
    EXPECT_EQ(run("dec counter"), "counter = 3\n");
    run("let word=abc");
    auto r = engine.execute("inc word");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error->message.find("not numeric: abc"), std::string::npos);
    EXPECT_EQ(engine.get_variable("word"), "abc");
    r = engine.execute("inc counter x");
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error->message.find("invalid amount: x"), std::string::npos);
}

TEST_F(BuiltinsTest, IncDecRejectOverflow) {
    run("let big=9223372036854775806");
    EXPECT_EQ(run("inc big"), "big = 9223372036854775807\n");
    auto r = engine.execute("inc big");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::Dispatch);
    EXPECT_EQ(r.error->message, "inc: result out of range for big");
    EXPECT_EQ(engine.get_variable("big"), "9223372036854775807");

    run("let small=1");
    r = engine.execute("inc small 9223372036854775807");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "inc: result out of range for small");
    EXPECT_EQ(engine.get_variable("small"), "1");
    r = engine.execute("dec small -9223372036854775807");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "dec: result out of range for small");
}

TEST_F(BuiltinsTest, VarsFormats) {
    EXPECT_EQ(run("vars"), "No variables set\n");
    run("let b=two");
    run("let a=1");
    std::string table = run("vars");
    EXPECT_EQ(table.rfind("Variables:\n", 0), 0u);
    EXPECT_NE(table.find("a                    = 1\n"), std::string::npos);
    EXPECT_LT(table.find("a   "), table.find("b   "));
    EXPECT_EQ(run("vars --json"), "{\n  \"a\": \"1\",\n  \"b\": \"two\"\n}\n");
    EXPECT_EQ(run("vars --export"), "# Variable export\nexport A=\"1\"\nexport B=\"two\"\n");
    EXPECT_FALSE(engine.execute("vars --bogus").ok());
}

TEST_F(BuiltinsTest, VarsTruncatesLongValues) {
    engine.set_variable("long", std::string(60, 'x'));
    std::string table = run("vars");
    EXPECT_NE(table.find(std::string(47, 'x') + "...\n"), std::string::npos);
}

TEST_F(BuiltinsTest, AliasLifecycle) {
    EXPECT_EQ(run("alias add hw print hello world"), "Setting alias, `hw` command: `print hello world`\n");
    EXPECT_EQ(run("hw"), "hello world\n");
    EXPECT_EQ(run("hw | grep hello"), "hello world\n");
    EXPECT_NE(run("alias print").find("hw=print hello world\n"), std::string::npos);
    EXPECT_EQ(run("alias print hw"), "hw=print hello world\n");
    EXPECT_EQ(run("alias delete hw"), "removing alias `hw`\n");
    EXPECT_FALSE(engine.execute("alias delete hw").ok());
    EXPECT_EQ(run("alias list"), "No aliases defined\n");
}

TEST_F(BuiltinsTest, AliasSaveLoad) {
    run("alias add ll print long listing");
    EXPECT_EQ(run("alias save saved.aliases"), "Saved 1 alias(es) to saved.aliases\n");
    EXPECT_EQ(files["saved.aliases"], "ll=print long listing\n");
    run("alias delete ll");
    EXPECT_EQ(run("alias load saved.aliases"), "Loaded aliases from saved.aliases\n");
    EXPECT_EQ(run("ll"), "long listing\n");
}

TEST_F(BuiltinsTest, RunBindsArguments) {
    files["script.sk"] =
        "# sums two numbers\n"
        "print start @arg1\n"
        "\n"
        "let -s total=$((@arg1 + @arg2))\n"
        "print total=@total of @argc \\\n"
        "  args\n";
    EXPECT_EQ(run("run script.sk 3 4"), "start 3\ntotal = 7\ntotal=7 of 2 args\n");
    EXPECT_FALSE(engine.get_variable("total").has_value());
}

TEST_F(BuiltinsTest, RunStopsAtFirstError) {
    files["bad.sk"] = "print a\nnosuch\nprint b\n";
    auto r = engine.execute("run bad.sk");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.output, "a\n");
    EXPECT_EQ(r.error->message, "bad.sk:2: unknown command: nosuch");
    r = engine.execute("run missing.sk");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::Io);
}
