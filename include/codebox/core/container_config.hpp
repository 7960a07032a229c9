/**
 * @file container_config.hpp
 * @brief Validated per-run container configuration
 *
 * A ContainerConfig cannot exist in an invalid state: every field is
 * checked in the constructor and the object is immutable afterwards.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @class ContainerConfig
 * @brief Image, command and resource limits for one sandboxed run
 *
 * **Limits**:
 * - timeout: 1-300 seconds
 * - memory: digits followed by k, m or g ("256m", "1g")
 * - CPU quota: 1000-1000000 (100000 = one core)
 * - pids: 1-1000
 */
class ContainerConfig {
public:
    static constexpr int kDefaultTimeoutSeconds = 30;
    static constexpr const char* kDefaultMemoryLimit = "256m";
    static constexpr int kDefaultCpuQuota = 50000;
    static constexpr int kDefaultPidsLimit = 50;

    /**
     * @brief Construct and validate
     *
     * @throws ConfigurationError if any field is out of range
     */
    ContainerConfig(std::string image,
                    std::vector<std::string> command,
                    int timeout_seconds = kDefaultTimeoutSeconds,
                    std::string memory_limit = kDefaultMemoryLimit,
                    int cpu_quota = kDefaultCpuQuota,
                    bool network_enabled = false,
                    bool read_only = true,
                    int pids_limit = kDefaultPidsLimit);

    const std::string& Image() const { return image_; }
    const std::vector<std::string>& Command() const { return command_; }
    int TimeoutSeconds() const { return timeout_seconds_; }
    const std::string& MemoryLimit() const { return memory_limit_; }
    int CpuQuota() const { return cpu_quota_; }
    bool NetworkEnabled() const { return network_enabled_; }
    bool ReadOnly() const { return read_only_; }
    int PidsLimit() const { return pids_limit_; }

private:
    void Validate() const;

    std::string image_;
    std::vector<std::string> command_;
    int timeout_seconds_;
    std::string memory_limit_;
    int cpu_quota_;
    bool network_enabled_;
    bool read_only_;
    int pids_limit_;
};

/**
 * @class ContainerConfigBuilder
 * @brief Fluent construction of ContainerConfig
 *
 * **Usage Example**:
 * @code
 * auto config = ContainerConfigBuilder()
 *     .WithImage("codebox-python:latest")
 *     .WithCommand({"python", "-c"})
 *     .WithTimeout(10)
 *     .WithMemoryLimit("128m")
 *     .Build();
 * @endcode
 */
class ContainerConfigBuilder {
public:
    ContainerConfigBuilder& WithImage(const std::string& image);
    ContainerConfigBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerConfigBuilder& WithTimeout(int seconds);
    ContainerConfigBuilder& WithMemoryLimit(const std::string& limit);
    ContainerConfigBuilder& WithCpuQuota(int quota);
    ContainerConfigBuilder& WithNetwork(bool enabled);
    ContainerConfigBuilder& WithReadOnlyRootfs(bool read_only);
    ContainerConfigBuilder& WithPidsLimit(int limit);

    /**
     * @brief Build the configuration
     * @throws ConfigurationError if any field is out of range
     */
    ContainerConfig Build() const;

private:
    std::string image_;
    std::vector<std::string> command_;
    int timeout_seconds_{ContainerConfig::kDefaultTimeoutSeconds};
    std::string memory_limit_{ContainerConfig::kDefaultMemoryLimit};
    int cpu_quota_{ContainerConfig::kDefaultCpuQuota};
    bool network_enabled_{false};
    bool read_only_{true};
    int pids_limit_{ContainerConfig::kDefaultPidsLimit};
};

} // namespace core
} // namespace codebox
