/**
 * @file container_config.cpp
 * @brief ContainerConfig validation and builder
 *
 * @date 2025
 */

#include "codebox/core/container_config.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/security/path_validator.hpp"

#include <utility>

namespace codebox {
namespace core {

using security::PathValidator;

// ============================================================================
// CONSTRUCTION AND VALIDATION
// ============================================================================

ContainerConfig::ContainerConfig(std::string image,
                                 std::vector<std::string> command,
                                 int timeout_seconds,
                                 std::string memory_limit,
                                 int cpu_quota,
                                 bool network_enabled,
                                 bool read_only,
                                 int pids_limit)
    : image_(std::move(image)),
      command_(std::move(command)),
      timeout_seconds_(timeout_seconds),
      memory_limit_(std::move(memory_limit)),
      cpu_quota_(cpu_quota),
      network_enabled_(network_enabled),
      read_only_(read_only),
      pids_limit_(pids_limit) {
    Validate();
}

void ContainerConfig::Validate() const {
    if (!PathValidator::IsValidImageName(image_)) {
        throw ConfigurationError("Invalid image name: '" + image_ + "'");
    }
    if (!PathValidator::IsValidMemoryLimit(memory_limit_)) {
        throw ConfigurationError("Invalid memory limit: '" + memory_limit_ +
                                 "' (expected digits followed by k, m or g)");
    }
    if (timeout_seconds_ < 1 || timeout_seconds_ > 300) {
        throw ConfigurationError("Timeout must be between 1 and 300 seconds, got " +
                                 std::to_string(timeout_seconds_));
    }
    if (cpu_quota_ < 1000 || cpu_quota_ > 1000000) {
        throw ConfigurationError("CPU quota must be between 1000 and 1000000, got " +
                                 std::to_string(cpu_quota_));
    }
    if (pids_limit_ < 1 || pids_limit_ > 1000) {
        throw ConfigurationError("Pids limit must be between 1 and 1000, got " +
                                 std::to_string(pids_limit_));
    }
    if (command_.empty()) {
        throw ConfigurationError("Container command must not be empty");
    }
}

// ============================================================================
// CONTAINER CONFIG BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerConfigBuilder& ContainerConfigBuilder::WithImage(const std::string& image) {
    image_ = image;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithCommand(const std::vector<std::string>& command) {
    command_ = command;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithTimeout(int seconds) {
    timeout_seconds_ = seconds;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithMemoryLimit(const std::string& limit) {
    memory_limit_ = limit;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithCpuQuota(int quota) {
    cpu_quota_ = quota;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithNetwork(bool enabled) {
    network_enabled_ = enabled;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithReadOnlyRootfs(bool read_only) {
    read_only_ = read_only;
    return *this;
}

ContainerConfigBuilder& ContainerConfigBuilder::WithPidsLimit(int limit) {
    pids_limit_ = limit;
    return *this;
}

ContainerConfig ContainerConfigBuilder::Build() const {
    return ContainerConfig(image_, command_, timeout_seconds_, memory_limit_,
                           cpu_quota_, network_enabled_, read_only_, pids_limit_);
}

} // namespace core
} // namespace codebox
