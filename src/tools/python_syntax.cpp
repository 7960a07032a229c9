/**
 * @file python_syntax.cpp
 * @brief Lexical Python checker
 *
 * Single pass over the source, tracking:
 * - the bracket stack (with the line each bracket was opened on)
 * - string literals, including triple-quoted and prefixed forms
 * - per logical line: the leading keyword and whether a ':' appears
 *   outside brackets
 *
 * @date 2025
 */

#include "codebox/tools/python_syntax.hpp"
#include "codebox/utils/string_utils.hpp"

#include <cctype>
#include <set>
#include <utility>
#include <vector>

namespace codebox {
namespace tools {

namespace {

const std::set<std::string> kCompoundKeywords = {
    "def", "class", "if", "elif", "else", "for", "while",
    "try", "except", "finally", "with"
};

const std::set<std::string> kStringPrefixes = {
    "r", "u", "b", "f", "br", "rb", "fr", "rf"
};

bool IsIdentStart(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsIdentChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

char MatchingOpen(char close) {
    switch (close) {
        case ')': return '(';
        case ']': return '[';
        default:  return '{';
    }
}

class Scanner {
public:
    explicit Scanner(const std::string& source) : src_(source) {}

    std::optional<SyntaxIssue> Run() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];

            if (c == '\\' && Peek(1) == '\n') {
                pos_ += 2;
                ++line_;
                continue;
            }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (c == '\n') {
                ++pos_;
                ++line_;
                if (brackets_.empty()) {
                    if (auto issue = EndLogicalLine()) return issue;
                }
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
                continue;
            }

            if (c == '"' || c == '\'') {
                MarkToken("");
                if (auto issue = ScanString()) return issue;
                continue;
            }

            if (IsIdentStart(c)) {
                std::size_t start = pos_;
                while (pos_ < src_.size() && IsIdentChar(src_[pos_])) ++pos_;
                std::string ident = src_.substr(start, pos_ - start);

                if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
                    kStringPrefixes.count(utils::StringUtils::ToLower(ident))) {
                    MarkToken("");
                    if (auto issue = ScanString()) return issue;
                    continue;
                }

                // "async def" / "async for" / "async with"
                if (!(ident == "async" && !has_first_)) {
                    MarkToken(ident);
                } else {
                    BeginLine();
                }
                continue;
            }

            MarkToken("");

            if (c == '(' || c == '[' || c == '{') {
                brackets_.emplace_back(c, line_);
            } else if (c == ')' || c == ']' || c == '}') {
                if (brackets_.empty()) {
                    return SyntaxIssue{std::string("unmatched '") + c + "'", line_};
                }
                auto [open, open_line] = brackets_.back();
                if (open != MatchingOpen(c)) {
                    std::string message = std::string("closing parenthesis '") + c +
                                          "' does not match opening parenthesis '" + open + "'";
                    if (open_line != line_) {
                        message += " on line " + std::to_string(open_line);
                    }
                    return SyntaxIssue{message, line_};
                }
                brackets_.pop_back();
            } else if (c == ':' && brackets_.empty() && Peek(1) != '=') {
                has_colon_ = true;
            }
            ++pos_;
        }

        if (!brackets_.empty()) {
            auto [open, open_line] = brackets_.back();
            return SyntaxIssue{std::string("'") + open + "' was never closed", open_line};
        }
        return EndLogicalLine();
    }

private:
    char Peek(std::size_t offset) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    void BeginLine() {
        if (!in_line_) {
            in_line_ = true;
            line_start_ = line_;
        }
    }

    void MarkToken(const std::string& ident) {
        BeginLine();
        if (!has_first_) {
            has_first_ = true;
            first_token_ = ident;
        }
    }

    std::optional<SyntaxIssue> EndLogicalLine() {
        std::optional<SyntaxIssue> issue;
        if (in_line_ && kCompoundKeywords.count(first_token_) && !has_colon_) {
            issue = SyntaxIssue{"expected ':'", line_start_};
        }
        in_line_ = false;
        has_first_ = false;
        has_colon_ = false;
        first_token_.clear();
        return issue;
    }

    std::optional<SyntaxIssue> ScanString() {
        char quote = src_[pos_];
        int start_line = line_;

        bool triple = Peek(1) == quote && Peek(2) == quote;
        pos_ += triple ? 3 : 1;

        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\') {
                if (Peek(1) == '\n') ++line_;
                pos_ += 2;
                continue;
            }
            if (c == '\n') {
                if (!triple) {
                    return SyntaxIssue{"unterminated string literal (detected at line " +
                                       std::to_string(start_line) + ")", start_line};
                }
                ++line_;
                ++pos_;
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    ++pos_;
                    return std::nullopt;
                }
                if (Peek(1) == quote && Peek(2) == quote) {
                    pos_ += 3;
                    return std::nullopt;
                }
            }
            ++pos_;
        }

        if (triple) {
            return SyntaxIssue{"unterminated triple-quoted string literal (detected at line " +
                               std::to_string(line_) + ")", start_line};
        }
        return SyntaxIssue{"unterminated string literal (detected at line " +
                           std::to_string(start_line) + ")", start_line};
    }

    const std::string& src_;
    std::size_t pos_{0};
    int line_{1};

    std::vector<std::pair<char, int>> brackets_;

    bool in_line_{false};
    bool has_first_{false};
    bool has_colon_{false};
    int line_start_{1};
    std::string first_token_;
};

} // anonymous namespace

std::optional<SyntaxIssue> CheckPythonSyntax(const std::string& source) {
    return Scanner(source).Run();
}

} // namespace tools
} // namespace codebox
