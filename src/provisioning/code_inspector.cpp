/**
 * @file code_inspector.cpp
 * @brief CodeInspector implementation.
 */

#include "provisioning/code_inspector.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace game_factory {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_word(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

char fold(char c, bool ignore_case) noexcept {
    return ignore_case ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : c;
}

std::string strip(std::string_view line) {
    auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) return {};
    auto end = line.find_last_not_of(" \t\r");
    return std::string{line.substr(begin, end - begin + 1)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// InspectionReport
// ─────────────────────────────────────────────

size_t InspectionReport::count(Severity severity) const noexcept {
    return static_cast<size_t>(std::count_if(
        issues.begin(), issues.end(),
        [severity](const SecurityIssue& i) { return i.severity == severity; }));
}

bool InspectionReport::is_valid() const noexcept {
    return syntax_errors.empty() && count(Severity::High) == 0;
}

std::string InspectionReport::summary() const {
    std::ostringstream oss;
    oss << syntax_errors.size() << " syntax error(s), "
        << count(Severity::High) << " high / "
        << count(Severity::Medium) << " medium / "
        << count(Severity::Low) << " low severity issue(s)";

    if (!syntax_errors.empty()) {
        oss << "; first: " << syntax_errors.front();
    } else if (auto it = std::find_if(issues.begin(), issues.end(),
                                      [](const SecurityIssue& i) {
                                          return i.severity == Severity::High;
                                      });
               it != issues.end()) {
        oss << "; first: line " << it->line << ": " << it->message;
    }
    return oss.str();
}

// ─────────────────────────────────────────────
// CodeInspector
// ─────────────────────────────────────────────

CodeInspector::CodeInspector() {
    auto add = [this](const char* pattern, bool ignore_case, Severity severity,
                      const char* message, bool word_start = false) {
        rules_.push_back(Rule{pattern, ignore_case, word_start, severity, message});
    };

    // Filesystem and process access
    add("require ( 'fs'", true, Severity::High, "filesystem module access");
    add("require ( 'child_process'", true, Severity::High, "child process execution");
    add("require ( 'path'", true, Severity::Medium, "path manipulation");

    // Raw networking
    add("require ( 'http'", true, Severity::Medium, "http module use");
    add("require ( 'https'", true, Severity::Medium, "https module use");
    add("require ( 'net'", true, Severity::Medium, "net module use");

    // Dynamic evaluation
    add("eval (", true, Severity::High, "eval call");
    add("Function (", false, Severity::High, "Function constructor", true);
    add("setTimeout ( '", true, Severity::Medium, "setTimeout with a string body");
    add("setInterval ( '", true, Severity::Medium, "setInterval with a string body");

    // Process and host environment
    add("process.exit", true, Severity::Medium, "process exit");
    add("process.env", true, Severity::Low, "environment variable access");
    add("__dirname", true, Severity::Low, "directory path access");
    add("__filename", true, Severity::Low, "file path access");

    add("global .", true, Severity::Medium, "global object mutation");
    add("Buffer .", true, Severity::Medium, "Buffer use");
}

bool CodeInspector::matches(const Rule& rule, std::string_view line) noexcept {
    const std::string_view pattern = rule.pattern;

    // Leading literal run; candidates are the positions where it occurs.
    size_t lead = 0;
    while (lead < pattern.size() && pattern[lead] != ' ' && pattern[lead] != '\'') ++lead;

    auto literal_at = [&](size_t pos) {
        if (pos + lead > line.size()) return false;
        for (size_t k = 0; k < lead; ++k) {
            if (fold(line[pos + k], rule.ignore_case) != fold(pattern[k], rule.ignore_case)) {
                return false;
            }
        }
        return true;
    };

    for (size_t start = 0; start + lead <= line.size(); ++start) {
        if (!literal_at(start)) continue;
        if (rule.word_start && start > 0 && is_word(line[start - 1])) continue;

        size_t pos = start + lead;
        bool ok = true;
        for (size_t p = lead; p < pattern.size() && ok; ++p) {
            const char want = pattern[p];
            if (want == ' ') {
                while (pos < line.size() && is_space(line[pos])) ++pos;
            } else if (want == '\'') {
                ok = pos < line.size() && (line[pos] == '\'' || line[pos] == '"');
                ++pos;
            } else {
                ok = pos < line.size()
                     && fold(line[pos], rule.ignore_case) == fold(want, rule.ignore_case);
                ++pos;
            }
        }
        if (ok) return true;
    }
    return false;
}

InspectionReport CodeInspector::inspect(std::string_view code) const {
    InspectionReport report;

    if (!is_valid_utf8(code)) {
        report.syntax_errors.emplace_back("code is not valid UTF-8");
        return report;
    }

    report.syntax_errors = check_brackets(code);

    std::vector<std::string> lines;
    {
        std::istringstream iss{std::string(code)};
        std::string line;
        while (std::getline(iss, line)) lines.push_back(std::move(line));
    }

    for (const auto& rule : rules_) {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (matches(rule, lines[i])) {
                report.issues.push_back(SecurityIssue{
                    .severity = rule.severity,
                    .message = rule.message,
                    .line = static_cast<uint32_t>(i + 1),
                    .snippet = strip(lines[i]),
                });
            }
        }
    }

    std::sort(report.issues.begin(), report.issues.end(),
              [](const SecurityIssue& a, const SecurityIssue& b) { return a.line < b.line; });

    if (code.find("module.exports") == std::string_view::npos
        && code.find("export") == std::string_view::npos) {
        report.warnings.emplace_back("no module export; a default export will be added");
    }
    if (code.find("handleConnection") == std::string_view::npos
        && code.find("onConnection") == std::string_view::npos) {
        report.warnings.emplace_back("no connection handler defined");
    }
    if (lines.size() > 1000) {
        report.warnings.emplace_back("more than 1000 lines; consider splitting the module");
    }

    return report;
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::vector<std::string> check_brackets(std::string_view code) {
    std::vector<std::string> errors;
    std::vector<std::pair<char, uint32_t>> stack;
    uint32_t line = 1;

    auto closing_for = [](char open) {
        switch (open) {
            case '(': return ')';
            case '[': return ']';
            default:  return '}';
        }
    };

    for (char c : code) {
        if (c == '\n') {
            ++line;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            stack.emplace_back(c, line);
        } else if (c == ')' || c == ']' || c == '}') {
            if (stack.empty()) {
                errors.push_back("line " + std::to_string(line) + ": unmatched '"
                                 + std::string(1, c) + "'");
                continue;
            }
            auto [open, open_line] = stack.back();
            stack.pop_back();
            if (closing_for(open) != c) {
                errors.push_back("line " + std::to_string(line) + ": expected '"
                                 + std::string(1, closing_for(open)) + "' but found '"
                                 + std::string(1, c) + "'");
            }
        }
    }

    for (const auto& [open, open_line] : stack) {
        errors.push_back("line " + std::to_string(open_line) + ": unclosed '"
                         + std::string(1, open) + "'");
    }
    return errors;
}

bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        if (c < 0x80)                extra = 0;
        else if ((c >> 5) == 0x06)   extra = 1;
        else if ((c >> 4) == 0x0E)   extra = 2;
        else if ((c >> 3) == 0x1E)   extra = 3;
        else return false;

        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= text.size()) return false;
            if ((static_cast<unsigned char>(text[i + k]) >> 6) != 0x02) return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace game_factory
