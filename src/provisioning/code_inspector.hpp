/**
 * @file code_inspector.hpp
 * @brief Static screening of uploaded game code before it is built.
 *
 * A line-oriented pattern scan, not a parser. It flags constructs that
 * reach outside the game sandbox and reports unbalanced brackets.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace game_factory {

enum class Severity : uint8_t {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:    return "low";
        case Severity::Medium: return "medium";
        case Severity::High:   return "high";
    }
    return "unknown";
}

struct SecurityIssue {
    Severity severity{Severity::Low};
    std::string message;
    uint32_t line{0};                   ///< 1-based
    std::string snippet;
};

struct InspectionReport {
    std::vector<std::string> syntax_errors;
    std::vector<SecurityIssue> issues;
    std::vector<std::string> warnings;

    [[nodiscard]] size_t count(Severity severity) const noexcept;

    /// No syntax errors and no high-severity issue.
    [[nodiscard]] bool is_valid() const noexcept;

    /// One-line summary used in error messages and logs.
    [[nodiscard]] std::string summary() const;
};

class CodeInspector {
public:
    CodeInspector();

    [[nodiscard]] InspectionReport inspect(std::string_view code) const;

private:
    /**
     * A rule is a compact token pattern matched without backtracking:
     * ' ' matches any run of whitespace (possibly empty), '\'' matches
     * either quote character, every other byte matches itself.
     */
    struct Rule {
        std::string pattern;
        bool ignore_case;
        bool word_start;                ///< previous char must not be [A-Za-z0-9_]
        Severity severity;
        std::string message;
    };

    [[nodiscard]] static bool matches(const Rule& rule, std::string_view line) noexcept;

    std::vector<Rule> rules_;
};

/// Bracket matching over (), [] and {}. Returns one message per defect.
[[nodiscard]] std::vector<std::string> check_brackets(std::string_view code);

/// Whether @p text is well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace game_factory
