/**
 * @file language_runtime.hpp
 * @brief Abstract per-language execution runtime
 *
 * A runtime knows how to turn source code of one language into a sandboxed
 * execution: which image to use, which interpreter command to run, and how
 * to drive that language's test framework.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/execution_result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace runtimes {

/**
 * @struct RuntimeConfig
 * @brief Static description of one language runtime
 */
struct RuntimeConfig {
    std::string language;                ///< Language identifier ("python")
    std::string image;                   ///< Image tag
    std::vector<std::string> command;    ///< Interpreter argv; the code is appended
    std::string file_extension;          ///< Source file extension (".py")
    int timeout_seconds{30};             ///< Default timeout
    std::string memory_limit{"256m"};    ///< Default memory limit
    int cpu_quota{50000};                ///< Default CPU quota (0.5 core)
    std::vector<std::string> packages;   ///< Packages pre-installed in the image
};

/**
 * @class LanguageRuntime
 * @brief Interface implemented by every language runtime
 */
class LanguageRuntime {
public:
    virtual ~LanguageRuntime() = default;

    /// Language identifier
    virtual const std::string& Language() const = 0;

    virtual const RuntimeConfig& Config() const = 0;

    /**
     * @brief Execute code
     * @param code Source code
     * @param timeout_seconds Override of the default timeout
     */
    virtual core::ExecutionResult Run(const std::string& code,
                                      std::optional<int> timeout_seconds = std::nullopt) = 0;

    /**
     * @brief Execute code together with its tests
     * @param code Code under test
     * @param test_code Tests exercising `code`
     */
    virtual core::ExecutionResult RunTests(const std::string& code, const std::string& test_code) = 0;

    virtual bool IsAvailable() { return true; }
};

} // namespace runtimes
} // namespace codebox
