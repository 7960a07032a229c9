/**
 * @file python_runtime.hpp
 * @brief Python runtime with pytest support
 *
 * @date 2025
 */

#pragma once

#include "codebox/runtimes/docker_runtime.hpp"

namespace codebox {
namespace runtimes {

/**
 * @class PythonRuntime
 * @brief Python 3 in the `codebox-python` image
 *
 * Code runs as `python -c <code>`. Tests run under pytest: the code and the
 * tests are Base64-encoded into a fixed wrapper script, which decodes them
 * into a temporary file under /tmp, runs pytest on it and removes it again.
 * No user text is ever spliced into the wrapper's Python source.
 *
 * **Usage Example**:
 * @code
 * PythonRuntime python(manager);
 * auto result = python.RunTests("def add(a, b): return a + b",
 *                               "def test_add(): assert add(1, 2) == 3");
 * @endcode
 */
class PythonRuntime : public DockerRuntime {
public:
    explicit PythonRuntime(core::SandboxManager& manager, RuntimeConfig config = DefaultConfig());

    /// image codebox-python:latest, `python -c`, 30s, 256m, 0.5 CPU
    static RuntimeConfig DefaultConfig();

    core::ExecutionResult RunTests(const std::string& code, const std::string& test_code) override;

    /**
     * @brief Generate the pytest wrapper script
     *
     * @param code Code under test
     * @param test_code pytest tests
     * @return Python source that runs the tests and exits with pytest's status
     */
    static std::string BuildTestWrapper(const std::string& code, const std::string& test_code);
};

} // namespace runtimes
} // namespace codebox
