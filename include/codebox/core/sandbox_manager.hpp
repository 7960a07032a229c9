/**
 * @file sandbox_manager.hpp
 * @brief Sandboxed execution of untrusted code in Docker containers
 *
 * The SandboxManager owns the image cache and the loaded seccomp profile
 * and runs one container per execution:
 *
 * ```
 * EnsureImage -> create (limits, seccomp, cap-drop) -> start
 *             -> wait (timeout) -> logs + stats -> [kill] -> rm --force
 * ```
 *
 * **Security Layers** (applied to every container):
 * - Memory, CPU quota and pids limits
 * - Network disabled unless requested
 * - Read-only root filesystem with a small writable /tmp
 * - All capabilities dropped, no-new-privileges
 * - Seccomp syscall filter
 * - Images are never pulled from a registry
 *
 * The manager keeps no per-run state, so one instance may serve several
 * threads at once.
 *
 * @date 2025
 */

#pragma once

#include "codebox/config/engine_config.hpp"
#include "codebox/core/container_config.hpp"
#include "codebox/core/execution_result.hpp"
#include "codebox/core/image_cache.hpp"
#include "codebox/security/seccomp_profile.hpp"
#include "codebox/utils/container_client.hpp"

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @brief Classify how a run ended
 *
 * @param failure Exception raised while waiting for the container, or
 *        nullptr if the wait completed
 * @return kSuccess for a completed wait, kTimeout / kDaemonError for the
 *         matching ClientError kinds, kContainerError for everything else
 */
RunOutcome ClassifyRunOutcome(std::exception_ptr failure);

/**
 * @class SandboxManager
 * @brief Image lifecycle, container execution and cleanup
 *
 * **Usage Example**:
 * @code
 * auto client = std::make_shared<utils::DockerCliClient>();
 * SandboxManager manager(client, settings);
 *
 * manager.EnsureImage("codebox-python:latest", "Dockerfile.python", "docker");
 *
 * ContainerConfig config("codebox-python:latest", {"python", "-c"}, 10);
 * auto result = manager.RunContainer(config, "print('hello')");
 * if (result.success) {
 *     std::cout << result.stdout_output;
 * }
 * @endcode
 */
class SandboxManager {
public:
    /**
     * @brief Load the seccomp profile and connect to the runtime
     *
     * A missing profile at the default path only produces a warning; a
     * missing profile at an explicitly configured path is an error.
     *
     * @param client Container runtime client
     * @param settings Sandbox settings
     *
     * @throws SeccompError if the profile cannot be loaded
     * @throws DaemonError if the runtime cannot be reached
     */
    SandboxManager(std::shared_ptr<utils::ContainerClient> client,
                   const config::SandboxSettings& settings);

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Make sure an image is available locally
     *
     * Checks the cache, then the runtime, then builds from the Dockerfile.
     * Concurrent calls for the same image perform at most one build.
     *
     * @param image_name Image tag
     * @param dockerfile_path Dockerfile relative to the build context
     * @param build_context Build context directory
     * @param force_rebuild Skip the cache fast path
     * @return true if the image is ready
     */
    bool EnsureImage(const std::string& image_name,
                     const std::optional<std::string>& dockerfile_path = std::nullopt,
                     const std::string& build_context = ".",
                     bool force_rebuild = false);

    /**
     * @brief Execute a payload in a fresh container
     *
     * The payload is appended to the configured command as one argv
     * element. The container is always removed before returning.
     *
     * @param config Validated container configuration
     * @param payload Code to pass to the command
     * @return Execution outcome (non-zero exits and timeouts are not errors)
     *
     * @throws DaemonError if the runtime is unreachable
     */
    ExecutionResult RunContainer(const ContainerConfig& config, const std::string& payload);

    /**
     * @brief Remove exited containers
     * @param image_filter Only containers started from this image
     * @return Number of containers removed
     */
    int CleanupStoppedContainers(const std::optional<std::string>& image_filter = std::nullopt);

    /**
     * @brief Remove an image and forget it in the cache
     * @return false if the image does not exist or removal failed
     */
    bool RemoveImage(const std::string& image_name, bool force = false);

    /**
     * @brief Tagged local images, optionally filtered by substring
     */
    std::vector<std::string> ListImages(const std::optional<std::string>& name_filter = std::nullopt);

    /**
     * @brief Daemon statistics
     *
     * Keys: containers_running, containers_stopped, images, memory_total,
     * cpus. Empty if the daemon cannot be queried.
     */
    std::map<std::string, std::int64_t> GetStats();

    /// Ping the runtime
    bool IsAvailable();

    /// Loaded profile, if any
    const std::optional<security::SeccompProfile>& Seccomp() const { return seccomp_profile_; }

    const config::SandboxSettings& Settings() const { return settings_; }

private:
    void LoadSeccompProfile();
    utils::ContainerSpec BuildSpec(const ContainerConfig& config, const std::string& payload) const;
    void CleanupContainer(const std::string& container_id, bool kill_first);

    std::shared_ptr<utils::ContainerClient> client_;
    config::SandboxSettings settings_;
    std::optional<security::SeccompProfile> seccomp_profile_;
    ImageCache image_cache_;
};

} // namespace core
} // namespace codebox
