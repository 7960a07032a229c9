/**
 * @file python_runtime.cpp
 * @brief PythonRuntime implementation
 *
 * @date 2025
 */

#include "codebox/runtimes/python_runtime.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace codebox {
namespace runtimes {

namespace {

constexpr const char* kPayloadMarker = "@PAYLOAD@";

// The marker is replaced with Base64 text, which never contains quotes
constexpr const char* kPytestWrapper = R"PY(import base64
import os
import sys
import tempfile

source = base64.b64decode("@PAYLOAD@").decode("utf-8")
fd, test_file = tempfile.mkstemp(prefix="test_codebox_", suffix=".py", dir="/tmp")
exit_code = 1
try:
    with os.fdopen(fd, "w", encoding="utf-8") as f:
        f.write(source)
    import pytest
    exit_code = pytest.main([test_file, "-v", "--tb=short", "-p", "no:cacheprovider"])
finally:
    if os.path.exists(test_file):
        os.remove(test_file)
sys.exit(int(exit_code))
)PY";

} // anonymous namespace

PythonRuntime::PythonRuntime(core::SandboxManager& manager, RuntimeConfig config)
    : DockerRuntime(std::move(config), manager) {}

RuntimeConfig PythonRuntime::DefaultConfig() {
    RuntimeConfig config;
    config.language = "python";
    config.image = "codebox-python:latest";
    config.command = {"python", "-c"};
    config.file_extension = ".py";
    config.timeout_seconds = 30;
    config.memory_limit = "256m";
    config.cpu_quota = 50000;
    config.packages = {"pytest", "numpy", "pandas", "requests"};
    return config;
}

std::string PythonRuntime::BuildTestWrapper(const std::string& code, const std::string& test_code) {
    std::string encoded = utils::StringUtils::ToBase64(code + "\n\n" + test_code);

    std::string wrapper(kPytestWrapper);
    auto pos = wrapper.find(kPayloadMarker);
    wrapper.replace(pos, std::char_traits<char>::length(kPayloadMarker), encoded);
    return wrapper;
}

core::ExecutionResult PythonRuntime::RunTests(const std::string& code, const std::string& test_code) {
    spdlog::debug("Running pytest ({} bytes of code, {} bytes of tests)", code.size(), test_code.size());
    return Run(BuildTestWrapper(code, test_code));
}

} // namespace runtimes
} // namespace codebox
