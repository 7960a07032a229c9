/**
 * @file sandbox_manager.cpp
 * @brief Implementation of the sandboxed execution engine
 *
 * **Execution Pipeline**:
 * 1. Build a ContainerSpec from the validated ContainerConfig
 * 2. Create and start the container (payload is one argv element)
 * 3. Wait with the configured timeout
 * 4. Classify the outcome (success / container error / timeout / daemon)
 * 5. Collect stdout, stderr and memory usage on completion
 * 6. Kill on timeout, then force-remove (scope guard, runs on every path)
 *
 * @date 2025
 */

#include "codebox/core/sandbox_manager.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/security/path_validator.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <utility>

namespace fs = std::filesystem;

namespace codebox {
namespace core {

using security::PathValidator;
using utils::ClientError;
using utils::ClientErrorKind;

namespace {

/// Runs a callable when leaving scope
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopeExit() {
        if (fn_) {
            fn_();
        }
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> fn_;
};

constexpr double kBytesPerMb = 1024.0 * 1024.0;

} // anonymous namespace

// ============================================================================
// OUTCOME CLASSIFICATION
// ============================================================================

RunOutcome ClassifyRunOutcome(std::exception_ptr failure) {
    if (!failure) {
        return RunOutcome::kSuccess;
    }

    try {
        std::rethrow_exception(failure);
    } catch (const ClientError& e) {
        switch (e.Kind()) {
            case ClientErrorKind::kTimeout:
                return RunOutcome::kTimeout;
            case ClientErrorKind::kDaemonUnavailable:
                return RunOutcome::kDaemonError;
            default:
                return RunOutcome::kContainerError;
        }
    } catch (const DaemonError&) {
        return RunOutcome::kDaemonError;
    } catch (const std::exception&) {
        return RunOutcome::kContainerError;
    }
    return RunOutcome::kContainerError;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

SandboxManager::SandboxManager(std::shared_ptr<utils::ContainerClient> client,
                               const config::SandboxSettings& settings)
    : client_(std::move(client))
    , settings_(settings) {

    if (!client_) {
        throw ConfigurationError("SandboxManager requires a container client");
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING SANDBOX MANAGER");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    settings_.Validate();

    // Profile first: a bad profile must fail before any daemon traffic
    LoadSeccompProfile();

    try {
        client_->Ping();
    } catch (const ClientError& e) {
        spdlog::error("Docker daemon is not reachable: {}", e.what());
        throw DaemonError(std::string("Failed to connect to Docker daemon: ") + e.what());
    }

    spdlog::info("✓ Docker daemon is available");
    spdlog::debug("Default limits: timeout={}s memory={} cpu_quota={}",
                  settings_.timeout_seconds, settings_.memory_limit, settings_.cpu_quota);
}

void SandboxManager::LoadSeccompProfile() {
    const std::string& path = settings_.seccomp_profile_path;

    if (path.empty()) {
        spdlog::warn("Seccomp profile disabled, containers use the runtime default filter");
        return;
    }

    std::error_code ec;
    if (path == config::kDefaultSeccompProfilePath && !fs::exists(path, ec)) {
        spdlog::warn("Default seccomp profile {} not found, containers use the runtime default filter",
                     path);
        return;
    }

    seccomp_profile_ = security::SeccompProfile::Load(path);
    spdlog::info("✓ Using seccomp profile: {}", path);
}

// ============================================================================
// IMAGE LIFECYCLE
// ============================================================================

bool SandboxManager::EnsureImage(const std::string& image_name,
                                 const std::optional<std::string>& dockerfile_path,
                                 const std::string& build_context,
                                 bool force_rebuild) {
    if (!PathValidator::IsValidImageName(image_name)) {
        spdlog::error("Invalid image name: '{}'", image_name);
        return false;
    }

    if (!force_rebuild && image_cache_.Contains(image_name)) {
        return true;
    }

    auto key_lock = image_cache_.LockKey(image_name);

    // A concurrent caller may have finished the build while we waited
    if (!force_rebuild && image_cache_.Contains(image_name)) {
        return true;
    }

    try {
        if (client_->ImageExists(image_name)) {
            image_cache_.MarkReady(image_name);
            spdlog::info("Image {} found locally", image_name);
            return true;
        }

        if (!dockerfile_path) {
            spdlog::error("Image {} not found and no Dockerfile provided", image_name);
            return false;
        }

        security::ResolvedBuild build;
        try {
            build = PathValidator::ResolveDockerfile(*dockerfile_path, build_context);
        } catch (const ConfigurationError& e) {
            spdlog::error("Refusing to build {}: {}", image_name, e.what());
            return false;
        }

        spdlog::info("Building image {} from {}...", image_name, *dockerfile_path);

        utils::BuildRequest request;
        request.tag = image_name;
        request.context_dir = build.context.string();
        request.dockerfile = build.dockerfile.string();
        request.remove_intermediate = true;
        client_->BuildImage(request);

        image_cache_.MarkReady(image_name);
        spdlog::info("✓ Successfully built image {}", image_name);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to ensure image {}: {}", image_name, e.what());
        return false;
    }
}

bool SandboxManager::RemoveImage(const std::string& image_name, bool force) {
    if (!PathValidator::IsValidImageName(image_name)) {
        spdlog::error("Refusing to remove invalid image name: {}", image_name);
        return false;
    }

    try {
        client_->RemoveImage(image_name, force);
        image_cache_.Erase(image_name);
        spdlog::info("Removed image {}", image_name);
        return true;
    } catch (const ClientError& e) {
        if (e.Kind() == ClientErrorKind::kNotFound) {
            spdlog::warn("Image {} not found", image_name);
        } else {
            spdlog::error("Failed to remove image {}: {}", image_name, e.what());
        }
        return false;
    }
}

std::vector<std::string> SandboxManager::ListImages(const std::optional<std::string>& name_filter) {
    std::vector<std::string> images;
    try {
        for (const auto& tag : client_->ListImageTags()) {
            if (utils::StringUtils::Contains(tag, "<none>")) {
                continue;
            }
            if (!name_filter || utils::StringUtils::Contains(tag, *name_filter)) {
                images.push_back(tag);
            }
        }
    } catch (const ClientError& e) {
        spdlog::error("Failed to list images: {}", e.what());
        return {};
    }
    return images;
}

// ============================================================================
// CONTAINER EXECUTION
// ============================================================================

utils::ContainerSpec SandboxManager::BuildSpec(const ContainerConfig& config,
                                               const std::string& payload) const {
    utils::ContainerSpec spec;
    spec.image = config.Image();
    spec.command = config.Command();
    spec.command.push_back(payload);
    spec.memory_limit = config.MemoryLimit();
    spec.cpu_quota = config.CpuQuota();
    spec.pids_limit = config.PidsLimit();
    spec.network_enabled = config.NetworkEnabled();
    spec.read_only_rootfs = config.ReadOnly();

    if (seccomp_profile_) {
        std::error_code ec;
        const auto& path = seccomp_profile_->SourcePath();
        if (fs::exists(path, ec)) {
            spec.seccomp_profile = fs::absolute(path, ec).string();
        } else {
            spdlog::warn("Seccomp profile {} disappeared, running without it", path.string());
        }
    }

    return spec;
}

ExecutionResult SandboxManager::RunContainer(const ContainerConfig& config,
                                             const std::string& payload) {
    auto spec = BuildSpec(config, payload);

    spdlog::info("Starting sandboxed execution (image={}, timeout={}s, memory={}, network={})",
                 config.Image(), config.TimeoutSeconds(), config.MemoryLimit(),
                 config.NetworkEnabled() ? "bridge" : "none");
    spdlog::debug("Payload size: {} bytes", payload.size());

    ExecutionResult result;
    std::string container_id;
    bool kill_before_remove = false;
    std::exception_ptr failure;
    int exit_code = -1;

    auto start_time = std::chrono::steady_clock::now();

    // Declared before the container exists so it also covers a failed start
    ScopeExit cleanup([&] {
        if (!container_id.empty()) {
            CleanupContainer(container_id, kill_before_remove);
        }
    });

    try {
        container_id = client_->RunDetached(spec);
        spdlog::debug("Container started: {}", container_id);
        exit_code = client_->Wait(container_id, std::chrono::seconds(config.TimeoutSeconds()));
    } catch (const std::exception&) {
        failure = std::current_exception();
    }

    result.execution_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    switch (ClassifyRunOutcome(failure)) {
        case RunOutcome::kSuccess: {
            result.exit_code = exit_code;
            result.timed_out = false;
            try {
                result.stdout_output = client_->Logs(container_id, utils::LogStream::kStdout);
                result.stderr_output = client_->Logs(container_id, utils::LogStream::kStderr);
                result.success = (exit_code == 0);
            } catch (const ClientError& e) {
                if (e.Kind() == ClientErrorKind::kDaemonUnavailable) {
                    throw DaemonError(std::string("Docker daemon unavailable: ") + e.what());
                }
                spdlog::error("Failed to read logs of {}: {}", container_id, e.what());
                result.success = false;
                result.error_message = std::string("Failed to read container output: ") + e.what();
                break;
            }

            try {
                auto memory = client_->MemoryUsageBytes(container_id);
                result.memory_used_mb = memory ? static_cast<double>(*memory) / kBytesPerMb : 0.0;
            } catch (const ClientError& e) {
                spdlog::debug("Memory stats unavailable for {}: {}", container_id, e.what());
                result.memory_used_mb = 0.0;
            }

            spdlog::info("Execution finished: exit code {} in {}ms", result.exit_code,
                         result.execution_time_ms);
            break;
        }

        case RunOutcome::kTimeout:
            kill_before_remove = true;
            result.success = false;
            result.timed_out = true;
            result.exit_code = -1;
            result.error_message = "Execution timed out";
            spdlog::warn("Execution timed out after {}s", config.TimeoutSeconds());
            break;

        case RunOutcome::kContainerError:
            result.success = false;
            result.timed_out = false;
            try {
                std::rethrow_exception(failure);
            } catch (const ClientError& e) {
                spdlog::debug("Container {} failed ({})", container_id, utils::ToString(e.Kind()));
                result.exit_code = e.ExitCode().value_or(-1);
                result.stdout_output = e.PartialStdout();
                result.stderr_output = e.PartialStderr().empty() ? e.what() : e.PartialStderr();
                result.error_message = e.what();
            } catch (const std::exception& e) {
                result.exit_code = -1;
                result.stderr_output = e.what();
                result.error_message = e.what();
            }
            spdlog::error("Container error: {}", result.error_message.value_or(""));
            break;

        case RunOutcome::kDaemonError:
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                spdlog::error("Docker daemon unavailable during execution: {}", e.what());
                throw DaemonError(std::string("Docker daemon unavailable: ") + e.what());
            }
    }

    return result;
}

void SandboxManager::CleanupContainer(const std::string& container_id, bool kill_first) {
    if (kill_first) {
        try {
            client_->Kill(container_id);
            spdlog::debug("Killed container {}", container_id);
        } catch (const ClientError& e) {
            if (e.Kind() != ClientErrorKind::kNotFound) {
                spdlog::warn("Failed to kill container {} ({}): {}", container_id,
                             utils::ToString(e.Kind()), e.what());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Failed to kill container {}: {}", container_id, e.what());
        }
    }

    try {
        client_->Remove(container_id, true);
        spdlog::debug("Removed container {}", container_id);
    } catch (const ClientError& e) {
        if (e.Kind() == ClientErrorKind::kNotFound) {
            spdlog::debug("Container {} already removed", container_id);
        } else {
            spdlog::warn("Failed to remove container {}: {}", container_id, e.what());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to remove container {}: {}", container_id, e.what());
    }
}

// ============================================================================
// MAINTENANCE
// ============================================================================

int SandboxManager::CleanupStoppedContainers(const std::optional<std::string>& image_filter) {
    int removed_count = 0;

    try {
        utils::ContainerFilter filter;
        filter.status = "exited";
        filter.ancestor = image_filter;

        for (const auto& id : client_->ListContainers(filter)) {
            try {
                client_->Remove(id, false);
                ++removed_count;
            } catch (const ClientError& e) {
                spdlog::warn("Failed to remove container {}: {}", id, e.what());
            }
        }

        if (removed_count > 0) {
            spdlog::info("Cleaned up {} stopped containers", removed_count);
        }
    } catch (const ClientError& e) {
        spdlog::error("Failed to cleanup containers: {}", e.what());
    }

    return removed_count;
}

std::map<std::string, std::int64_t> SandboxManager::GetStats() {
    try {
        auto info = client_->Info();
        return {
            {"containers_running", info.containers_running},
            {"containers_stopped", info.containers_stopped},
            {"images", info.images},
            {"memory_total", info.memory_total},
            {"cpus", info.cpus},
        };
    } catch (const ClientError& e) {
        spdlog::error("Failed to get Docker stats: {}", e.what());
        return {};
    }
}

bool SandboxManager::IsAvailable() {
    try {
        client_->Ping();
        return true;
    } catch (const ClientError& e) {
        spdlog::debug("Docker ping failed: {}", e.what());
        return false;
    }
}

} // namespace core
} // namespace codebox
