/**
 * @file docker_runtime.cpp
 * @brief DockerRuntime implementation
 *
 * @date 2025
 */

#include "codebox/runtimes/docker_runtime.hpp"
#include "codebox/core/container_config.hpp"
#include "codebox/core/sandbox_manager.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace codebox {
namespace runtimes {

DockerRuntime::DockerRuntime(RuntimeConfig config, core::SandboxManager& manager)
    : config_(std::move(config))
    , manager_(manager) {

    std::string dockerfile = "Dockerfile." + config_.language;
    bool ready = manager_.EnsureImage(config_.image, dockerfile, manager_.Settings().build_context);
    if (!ready) {
        spdlog::warn("Failed to ensure image {} for runtime {}", config_.image, config_.language);
    }
}

core::ExecutionResult DockerRuntime::Run(const std::string& code, std::optional<int> timeout_seconds) {
    auto container_config = core::ContainerConfigBuilder()
        .WithImage(config_.image)
        .WithCommand(config_.command)
        .WithTimeout(timeout_seconds.value_or(config_.timeout_seconds))
        .WithMemoryLimit(config_.memory_limit)
        .WithCpuQuota(config_.cpu_quota)
        .WithNetwork(false)
        .WithReadOnlyRootfs(true)
        .WithPidsLimit(kPidsLimit)
        .Build();

    return manager_.RunContainer(container_config, code);
}

core::ExecutionResult DockerRuntime::RunTests(const std::string& code, const std::string& test_code) {
    return Run(code + "\n\n" + test_code);
}

bool DockerRuntime::IsAvailable() {
    return manager_.IsAvailable();
}

} // namespace runtimes
} // namespace codebox
