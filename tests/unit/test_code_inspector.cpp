/**
 * @file test_code_inspector.cpp
 * @brief Unit tests for the user code inspector.
 */

#include "provisioning/code_inspector.hpp"

#include <gtest/gtest.h>

using namespace game_factory;

// ─── Brackets / encoding ─────────────────────

TEST(CheckBracketsTest, Balanced) {
    EXPECT_TRUE(check_brackets("function f(a) { return [a, (a)]; }").empty());
}

TEST(CheckBracketsTest, Unclosed) {
    auto errors = check_brackets("function f() {\n  return 1;\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "line 1: unclosed '{'");
}

TEST(CheckBracketsTest, Mismatched) {
    auto errors = check_brackets("let a = [1, 2);");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "line 1: expected ']' but found ')'");
}

TEST(CheckBracketsTest, StrayCloser) {
    auto errors = check_brackets("x\n}");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "line 2: unmatched '}'");
}

TEST(Utf8Test, Validity) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));
    EXPECT_FALSE(is_valid_utf8("\xFF\xFE"));
}

// ─── Inspection ──────────────────────────────

TEST(CodeInspectorTest, CleanGame) {
    CodeInspector inspector;
    auto report = inspector.inspect(
        "function initGame() { return { clickCount: 0 }; }\n"
        "function handleConnection(socket) {}\n"
        "module.exports = { initGame, handleConnection };\n");

    EXPECT_TRUE(report.is_valid());
    EXPECT_TRUE(report.issues.empty());
    EXPECT_TRUE(report.warnings.empty());
}

TEST(CodeInspectorTest, HighSeverityInvalidates) {
    CodeInspector inspector;
    auto report = inspector.inspect(
        "const cp = require('child_process');\n"
        "cp.exec('rm -rf /');\n");

    EXPECT_FALSE(report.is_valid());
    ASSERT_EQ(report.count(Severity::High), 1u);
    EXPECT_EQ(report.issues[0].line, 1u);
    EXPECT_EQ(report.issues[0].snippet, "const cp = require('child_process');");
    EXPECT_NE(report.summary().find("1 high"), std::string::npos);
}

TEST(CodeInspectorTest, EvalAndFunctionConstructor) {
    CodeInspector inspector;
    auto report = inspector.inspect("eval('1+1');\nconst f = new Function('return 1');\n");
    EXPECT_EQ(report.count(Severity::High), 2u);
}

TEST(CodeInspectorTest, LowercaseFunctionKeywordIsFine) {
    CodeInspector inspector;
    auto report = inspector.inspect("function initGame() {}\nmodule.exports = {};\n");
    EXPECT_EQ(report.count(Severity::High), 0u);
}

TEST(CodeInspectorTest, MediumAndLowDoNotInvalidate) {
    CodeInspector inspector;
    auto report = inspector.inspect(
        "const port = process.env.PORT;\n"
        "setTimeout(\"tick()\", 100);\n"
        "module.exports = {};\n");

    EXPECT_TRUE(report.is_valid());
    EXPECT_EQ(report.count(Severity::Medium), 1u);
    EXPECT_EQ(report.count(Severity::Low), 1u);
    // Sorted by line
    EXPECT_EQ(report.issues[0].line, 1u);
    EXPECT_EQ(report.issues[1].line, 2u);
}

TEST(CodeInspectorTest, SyntaxErrorInvalidates) {
    CodeInspector inspector;
    auto report = inspector.inspect("function broken( {\n");
    EXPECT_FALSE(report.is_valid());
    EXPECT_FALSE(report.syntax_errors.empty());
    EXPECT_NE(report.summary().find("first: line 1"), std::string::npos);
}

TEST(CodeInspectorTest, InvalidUtf8) {
    CodeInspector inspector;
    auto report = inspector.inspect("let s = '\xC0';");
    ASSERT_EQ(report.syntax_errors.size(), 1u);
    EXPECT_EQ(report.syntax_errors[0], "code is not valid UTF-8");
}

TEST(CodeInspectorTest, Warnings) {
    CodeInspector inspector;
    auto report = inspector.inspect("let x = 1;\n");
    EXPECT_TRUE(report.is_valid());
    EXPECT_EQ(report.warnings.size(), 2u);
}

TEST(CodeInspectorTest, VeryLongLineIsScannedInLinearTime) {
    CodeInspector inspector;
    const std::string padding(150'000, ' ');

    auto flagged = inspector.inspect("let x = 1; eval" + padding + "(1);\nmodule.exports = {};\n");
    EXPECT_FALSE(flagged.is_valid());
    ASSERT_EQ(flagged.count(Severity::High), 1u);
    EXPECT_EQ(flagged.issues[0].line, 1u);

    auto clean = inspector.inspect("// see require" + padding + "\nmodule.exports = {};\n");
    EXPECT_TRUE(clean.is_valid());
    EXPECT_TRUE(clean.issues.empty());
}

TEST(CodeInspectorTest, QuotedModuleNameAcrossWhitespace) {
    CodeInspector inspector;
    auto report = inspector.inspect("const f = require (\t\"fs\" );\n");
    ASSERT_EQ(report.count(Severity::High), 1u);
    EXPECT_EQ(report.issues[0].message, "filesystem module access");

    // Partial matches do not count
    EXPECT_TRUE(inspector.inspect("require('fsx');\nrequire(fs);\n").issues.empty());
}
