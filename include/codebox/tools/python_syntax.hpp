/**
 * @file python_syntax.hpp
 * @brief Lexical pre-check of Python source
 *
 * Catches the common structural mistakes in generated code before a
 * container is started: unbalanced brackets, unterminated string literals,
 * and compound statements missing their ':'. It is not a full parser;
 * anything it lets through is still checked by the interpreter itself.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

namespace codebox {
namespace tools {

/**
 * @struct SyntaxIssue
 * @brief First problem found in the source
 */
struct SyntaxIssue {
    std::string message;   ///< Interpreter-style message, e.g. "'(' was never closed"
    int line{0};           ///< 1-based line number
};

/**
 * @brief Scan Python source for structural errors
 *
 * @param source Python code
 * @return The first issue, or nullopt if none was found
 *
 * **Example**:
 * @code
 * auto issue = CheckPythonSyntax("def f(:\n    pass\n");
 * // issue->message == "'(' was never closed", issue->line == 1
 * @endcode
 */
std::optional<SyntaxIssue> CheckPythonSyntax(const std::string& source);

} // namespace tools
} // namespace codebox
