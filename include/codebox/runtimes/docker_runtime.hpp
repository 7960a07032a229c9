/**
 * @file docker_runtime.hpp
 * @brief LanguageRuntime running code through the SandboxManager
 *
 * @date 2025
 */

#pragma once

#include "codebox/runtimes/language_runtime.hpp"

namespace codebox {
namespace core {
class SandboxManager;
} // namespace core

namespace runtimes {

/**
 * @class DockerRuntime
 * @brief Base for container-backed runtimes
 *
 * On construction the runtime makes sure its image exists, building it from
 * `Dockerfile.<language>` in the manager's build context when needed. A
 * failed build is logged; Run() then reports the missing image as a
 * container error.
 *
 * Every run uses network disabled, a read-only root filesystem and a pids
 * limit of 50.
 */
class DockerRuntime : public LanguageRuntime {
public:
    static constexpr int kPidsLimit = 50;

    DockerRuntime(RuntimeConfig config, core::SandboxManager& manager);

    const std::string& Language() const override { return config_.language; }
    const RuntimeConfig& Config() const override { return config_; }

    core::ExecutionResult Run(const std::string& code,
                              std::optional<int> timeout_seconds = std::nullopt) override;

    /**
     * @brief Run code followed by tests as one program
     *
     * Code and tests are joined with a blank line. Runtimes with a test
     * framework override this.
     */
    core::ExecutionResult RunTests(const std::string& code, const std::string& test_code) override;

    bool IsAvailable() override;

protected:
    core::SandboxManager& Manager() { return manager_; }

private:
    RuntimeConfig config_;
    core::SandboxManager& manager_;
};

} // namespace runtimes
} // namespace codebox
