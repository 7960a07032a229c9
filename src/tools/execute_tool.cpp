/**
 * @file execute_tool.cpp
 * @brief ExecuteTool implementation
 *
 * @date 2025
 */

#include "codebox/tools/execute_tool.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/tools/python_syntax.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace codebox {
namespace tools {

using utils::StringUtils;

ExecuteTool::ExecuteTool(runtimes::LanguageRuntime& runtime)
    : runtime_(runtime) {}

// ============================================================================
// TOOL DESCRIPTION
// ============================================================================

std::string ExecuteTool::Description() {
    return "Run Python code in a secure, isolated sandbox and return the output. "
           "The sandbox has no network access, a read-only filesystem and limited "
           "memory and CPU.";
}

json ExecuteTool::InputSchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"code", {
                {"type", "string"},
                {"description", "Python code to execute"}
            }},
            {"timeout", {
                {"type", "integer"},
                {"description", "Timeout in seconds (default: 30)"},
                {"default", kDefaultTimeout}
            }}
        }},
        {"required", json::array({"code"})}
    };
}

json ExecuteTool::ToJson() {
    return {
        {"name", Name()},
        {"description", Description()},
        {"input_schema", InputSchema()}
    };
}

// ============================================================================
// EXECUTION
// ============================================================================

std::string ExecuteTool::Execute(const std::string& code, int timeout) {
    if (StringUtils::Trim(code).empty()) {
        return "Error: No code provided to execute.";
    }

    std::size_t length = StringUtils::Utf8Length(code);
    if (length > kMaxCodeLength) {
        return "Error: Code too long. Maximum: 50,000 characters (got " +
               std::to_string(length) + ")";
    }

    if (timeout < kMinTimeout || timeout > kMaxTimeout) {
        return "Error: Timeout must be between 1 and 300 seconds";
    }

    if (auto issue = CheckPythonSyntax(code)) {
        spdlog::debug("Rejected code with syntax error at line {}", issue->line);
        return "Syntax error: " + issue->message + " at line " + std::to_string(issue->line);
    }

    try {
        auto result = runtime_.Run(code, timeout);
        return FormatResult(result, timeout);
    } catch (const core::DaemonError& e) {
        spdlog::error("Execution failed: {}", e.what());
        return std::string("Runtime error: ") + e.what();
    } catch (const core::ConfigurationError& e) {
        spdlog::error("Execution failed: {}", e.what());
        return std::string("Runtime error: ") + e.what();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error during execution: {}", e.what());
        return std::string("Unexpected error: ") + e.what();
    }
}

std::string ExecuteTool::ExecuteJson(const json& input) {
    if (!input.is_object() || !input.contains("code") || !input["code"].is_string()) {
        return "Error: No code provided to execute.";
    }

    int timeout = kDefaultTimeout;
    if (input.contains("timeout")) {
        if (!input["timeout"].is_number_integer()) {
            return "Error: Timeout must be between 1 and 300 seconds";
        }
        auto requested = input["timeout"].get<std::int64_t>();
        if (requested < kMinTimeout || requested > kMaxTimeout) {
            return "Error: Timeout must be between 1 and 300 seconds";
        }
        timeout = static_cast<int>(requested);
    }

    return Execute(input["code"].get<std::string>(), timeout);
}

// ============================================================================
// REPORT FORMATTING
// ============================================================================

std::string ExecuteTool::FormatResult(const core::ExecutionResult& result, int timeout) {
    std::ostringstream oss;

    if (result.timed_out) {
        oss << "Execution timed out after " << timeout << "s (exit code: " << result.exit_code << ")";
        if (!StringUtils::Trim(result.stdout_output).empty()) {
            oss << "\n\nPartial output:\n" << result.stdout_output;
        }
        return oss.str();
    }

    if (result.success) {
        oss << "Execution successful (" << result.execution_time_ms << "ms";
        if (result.memory_used_mb > 0.0) {
            oss << ", " << std::fixed << std::setprecision(2) << result.memory_used_mb << " MB";
        }
        oss << ")\n\n";

        if (StringUtils::Trim(result.stdout_output).empty()) {
            oss << "No output produced";
        } else {
            oss << "Output:\n" << result.stdout_output;
        }
        if (!StringUtils::Trim(result.stderr_output).empty()) {
            oss << "\n\nWarnings:\n" << result.stderr_output;
        }
        return oss.str();
    }

    oss << "Execution failed (exit code: " << result.exit_code << ", "
        << result.execution_time_ms << "ms)";

    if (!StringUtils::Trim(result.stderr_output).empty()) {
        oss << "\n\nError:\n" << result.stderr_output;
    } else if (result.error_message) {
        oss << "\n\nError:\n" << *result.error_message;
    }
    if (!StringUtils::Trim(result.stdout_output).empty()) {
        oss << "\n\nOutput:\n" << result.stdout_output;
    }
    return oss.str();
}

} // namespace tools
} // namespace codebox
