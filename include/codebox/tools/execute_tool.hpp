/**
 * @file execute_tool.hpp
 * @brief Tool-style front door to sandboxed Python execution
 *
 * Validates the request, pre-checks the syntax, runs the code through a
 * LanguageRuntime and renders the ExecutionResult as a human-readable
 * report. Invalid requests never reach a container.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/execution_result.hpp"
#include "codebox/runtimes/language_runtime.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace codebox {
namespace tools {

/**
 * @class ExecuteTool
 * @brief `execute_code` tool
 *
 * **Input Schema**:
 * ```json
 * {
 *   "type": "object",
 *   "properties": {
 *     "code":    {"type": "string",  "description": "Python code to execute"},
 *     "timeout": {"type": "integer", "description": "Timeout in seconds (default: 30)", "default": 30}
 *   },
 *   "required": ["code"]
 * }
 * ```
 */
class ExecuteTool {
public:
    static constexpr std::size_t kMaxCodeLength = 50000;
    static constexpr int kDefaultTimeout = 30;
    static constexpr int kMinTimeout = 1;
    static constexpr int kMaxTimeout = 300;

    explicit ExecuteTool(runtimes::LanguageRuntime& runtime);

    static std::string Name() { return "execute_code"; }
    static std::string Description();
    static nlohmann::json InputSchema();

    /// {name, description, input_schema}
    static nlohmann::json ToJson();

    /**
     * @brief Execute code and describe the outcome
     *
     * @param code Python source
     * @param timeout Timeout in seconds
     * @return Report text; errors are reported in the text, never thrown
     */
    std::string Execute(const std::string& code, int timeout = kDefaultTimeout);

    /**
     * @brief Execute from a JSON tool call ({"code": ..., "timeout": ...})
     */
    std::string ExecuteJson(const nlohmann::json& input);

    /// Render a result as returned by Execute()
    static std::string FormatResult(const core::ExecutionResult& result, int timeout);

private:
    runtimes::LanguageRuntime& runtime_;
};

} // namespace tools
} // namespace codebox
