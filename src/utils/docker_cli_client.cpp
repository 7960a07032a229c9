/**
 * @file docker_cli_client.cpp
 * @brief Implementation of the docker CLI container client
 *
 * Container lifecycle used by the sandbox:
 * ```
 * create -> start -> wait (bounded) -> logs / stats -> [kill] -> rm --force
 * ```
 *
 * `docker create` + `docker start` is used instead of `docker run -d` so
 * the container ID is known even when the start fails, and the container
 * can be removed before the error is reported.
 *
 * @date 2025
 */

#include "codebox/utils/docker_cli_client.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace codebox {
namespace utils {

namespace {

constexpr std::chrono::seconds kPingTimeout{10};
constexpr std::chrono::seconds kQueryTimeout{30};

[[noreturn]] void ThrowFromResult(const std::string& what, const ProcessResult& result) {
    std::string message = StringUtils::Trim(result.stderr_output);
    if (message.empty()) {
        message = what + " failed with exit code " + std::to_string(result.exit_code);
    }
    throw ClientError(docker_cli::ClassifyCliError(result.stderr_output), message);
}

} // anonymous namespace

// ============================================================================
// ARGUMENT BUILDERS AND PARSERS
// ============================================================================

namespace docker_cli {

std::vector<std::string> BuildCreateArguments(const ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("create");

    // Resource limits
    args.push_back("--memory");
    args.push_back(spec.memory_limit);
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(spec.cpu_quota));
    args.push_back("--pids-limit");
    args.push_back(std::to_string(spec.pids_limit));

    // Network mode
    args.push_back("--network");
    args.push_back(spec.network_enabled ? "bridge" : "none");

    // Read-only root filesystem with a bounded scratch area
    if (spec.read_only_rootfs) {
        args.push_back("--read-only");
    }
    if (!spec.tmpfs_mount.empty()) {
        args.push_back("--tmpfs");
        args.push_back(spec.tmpfs_mount);
    }

    // Security: Drop capabilities
    for (const auto& cap : spec.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (spec.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (spec.seccomp_profile) {
        args.push_back("--security-opt");
        args.push_back("seccomp=" + *spec.seccomp_profile);
    }

    // Never fetch images from a registry
    args.push_back("--pull");
    args.push_back("never");

    // Image (must be last before command); "--" ends option parsing
    args.push_back("--");
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::vector<std::string> BuildImageArguments(const BuildRequest& request) {
    std::vector<std::string> args = {"build"};
    if (request.remove_intermediate) {
        args.push_back("--rm");
        args.push_back("--force-rm");
    }
    args.push_back("-t");
    args.push_back(request.tag);
    args.push_back("-f");
    args.push_back(request.dockerfile);
    args.push_back(request.context_dir);
    return args;
}

ClientErrorKind ClassifyCliError(const std::string& stderr_output) {
    if (StringUtils::Contains(stderr_output, "Cannot connect to the Docker daemon") ||
        StringUtils::Contains(stderr_output, "error during connect") ||
        StringUtils::Contains(stderr_output, "Is the docker daemon running")) {
        return ClientErrorKind::kDaemonUnavailable;
    }
    if (StringUtils::ContainsIgnoreCase(stderr_output, "No such container") ||
        StringUtils::ContainsIgnoreCase(stderr_output, "No such image") ||
        StringUtils::ContainsIgnoreCase(stderr_output, "No such object")) {
        return ClientErrorKind::kNotFound;
    }
    if (StringUtils::Contains(stderr_output, "OCI runtime") ||
        StringUtils::Contains(stderr_output, "executable file not found") ||
        StringUtils::Contains(stderr_output, "exec format error")) {
        return ClientErrorKind::kContainerError;
    }
    return ClientErrorKind::kApi;
}

std::optional<std::uint64_t> ParseMemoryUsage(const std::string& mem_usage) {
    // Format: "123MiB / 2GiB"
    auto slash_pos = mem_usage.find('/');
    std::string usage = slash_pos == std::string::npos ? mem_usage : mem_usage.substr(0, slash_pos);
    return StringUtils::ParseByteSize(usage);
}

SystemInfo ParseSystemInfo(const std::string& json_text) {
    json j = json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ClientError(ClientErrorKind::kApi, "Unexpected docker info output");
    }

    SystemInfo info;
    info.containers_running = j.value("ContainersRunning", std::int64_t{0});
    info.containers_stopped = j.value("ContainersStopped", std::int64_t{0});
    info.images = j.value("Images", std::int64_t{0});
    info.memory_total = j.value("MemTotal", std::int64_t{0});
    info.cpus = j.value("NCPU", std::int64_t{0});
    return info;
}

} // namespace docker_cli

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCliClient::DockerCliClient(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::debug("Docker CLI client using binary: {}", docker_binary_);
}

// ============================================================================
// DAEMON
// ============================================================================

void DockerCliClient::Ping() {
    auto result = Execute({"version", "--format", "{{.Server.Version}}"}, kPingTimeout);
    if (result.timed_out) {
        throw ClientError(ClientErrorKind::kDaemonUnavailable, "docker version timed out");
    }
    if (result.exit_code != 0) {
        // Any failure to reach the server counts as unavailable here
        std::string message = StringUtils::Trim(result.stderr_output);
        throw ClientError(ClientErrorKind::kDaemonUnavailable,
                          message.empty() ? "docker version failed" : message);
    }
    spdlog::debug("Docker server version: {}", StringUtils::Trim(result.stdout_output));
}

SystemInfo DockerCliClient::Info() {
    auto result = ExecuteChecked({"info", "--format", "{{json .}}"}, kQueryTimeout);
    return docker_cli::ParseSystemInfo(result.stdout_output);
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerCliClient::ImageExists(const std::string& image) {
    auto result = Execute({"image", "inspect", "--format", "{{.Id}}", "--", image},
                          kQueryTimeout);
    if (result.exit_code == 0) {
        return true;
    }
    if (docker_cli::ClassifyCliError(result.stderr_output) == ClientErrorKind::kNotFound) {
        return false;
    }
    ThrowFromResult("docker image inspect", result);
}

void DockerCliClient::BuildImage(const BuildRequest& request) {
    spdlog::info("Building image {} from {}", request.tag, request.dockerfile);
    auto result = Execute(docker_cli::BuildImageArguments(request));
    if (result.exit_code != 0) {
        spdlog::debug("docker build output:\n{}", StringUtils::Truncate(result.stdout_output, 4096));
        ThrowFromResult("docker build", result);
    }
}

void DockerCliClient::RemoveImage(const std::string& image, bool force) {
    std::vector<std::string> args = {"rmi"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back("--");
    args.push_back(image);
    ExecuteChecked(args, kQueryTimeout);
}

std::vector<std::string> DockerCliClient::ListImageTags() {
    auto result = ExecuteChecked({"images", "--format", "{{.Repository}}:{{.Tag}}"}, kQueryTimeout);
    std::vector<std::string> tags;
    for (const auto& line : StringUtils::Split(result.stdout_output, '\n')) {
        std::string tag = StringUtils::Trim(line);
        if (!tag.empty()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerCliClient::RunDetached(const ContainerSpec& spec) {
    auto created = ExecuteChecked(docker_cli::BuildCreateArguments(spec), kQueryTimeout);
    std::string container_id = StringUtils::Trim(created.stdout_output);
    if (container_id.empty()) {
        throw ClientError(ClientErrorKind::kApi, "docker create returned no container ID");
    }

    spdlog::debug("Container created: {}", container_id);

    auto started = Execute({"start", container_id}, kQueryTimeout);
    if (started.exit_code == 0 && !started.timed_out) {
        return container_id;
    }

    std::string message = StringUtils::Trim(started.stderr_output);
    if (message.empty()) {
        message = "docker start failed";
    }

    auto removed = Execute({"rm", "--force", container_id}, kQueryTimeout);
    if (removed.exit_code != 0) {
        spdlog::warn("Failed to remove unstartable container {}: {}",
                     container_id, StringUtils::Trim(removed.stderr_output));
    }

    auto kind = docker_cli::ClassifyCliError(started.stderr_output);
    if (kind == ClientErrorKind::kApi) {
        kind = ClientErrorKind::kContainerError;
    }
    throw ClientError(kind, message, started.exit_code);
}

int DockerCliClient::Wait(const std::string& container_id, std::chrono::seconds timeout) {
    auto result = Execute({"wait", container_id}, timeout);
    if (result.timed_out) {
        throw ClientError(ClientErrorKind::kTimeout,
                          "Container did not exit within " + std::to_string(timeout.count()) + "s");
    }
    if (result.exit_code != 0) {
        ThrowFromResult("docker wait", result);
    }

    int exit_code = -1;
    try {
        exit_code = std::stoi(StringUtils::Trim(result.stdout_output));
    } catch (const std::exception&) {
        throw ClientError(ClientErrorKind::kApi,
                          "Unexpected docker wait output: " + result.stdout_output);
    }

    auto state = Execute({"inspect", "--format", "{{.State.Error}}", container_id}, kQueryTimeout);
    std::string state_error = state.exit_code == 0 ? StringUtils::Trim(state.stdout_output) : "";
    if (!state_error.empty()) {
        std::string out, err;
        try {
            out = Logs(container_id, LogStream::kStdout);
            err = Logs(container_id, LogStream::kStderr);
        } catch (const ClientError& e) {
            spdlog::debug("Could not read logs of failed container: {}", e.what());
        }
        throw ClientError(ClientErrorKind::kContainerError, state_error, exit_code, out, err);
    }

    return exit_code;
}

std::string DockerCliClient::Logs(const std::string& container_id, LogStream stream) {
    auto result = ExecuteChecked({"logs", container_id}, kQueryTimeout);
    return stream == LogStream::kStdout ? result.stdout_output : result.stderr_output;
}

std::optional<std::uint64_t> DockerCliClient::MemoryUsageBytes(const std::string& container_id) {
    auto result = ExecuteChecked({"stats", "--no-stream", "--format", "{{json .}}", container_id},
                                 kQueryTimeout);

    json j = json::parse(StringUtils::Trim(result.stdout_output), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("MemUsage") || !j["MemUsage"].is_string()) {
        return std::nullopt;
    }
    return docker_cli::ParseMemoryUsage(j["MemUsage"].get<std::string>());
}

void DockerCliClient::Kill(const std::string& container_id) {
    spdlog::debug("Killing container: {}", container_id);
    ExecuteChecked({"kill", container_id}, kQueryTimeout);
}

void DockerCliClient::Remove(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);
    ExecuteChecked(args, kQueryTimeout);
}

std::vector<std::string> DockerCliClient::ListContainers(const ContainerFilter& filter) {
    std::vector<std::string> args = {"ps", "--all", "--quiet", "--no-trunc"};
    if (filter.status) {
        args.push_back("--filter");
        args.push_back("status=" + *filter.status);
    }
    if (filter.ancestor) {
        args.push_back("--filter");
        args.push_back("ancestor=" + *filter.ancestor);
    }

    auto result = ExecuteChecked(args, kQueryTimeout);
    std::vector<std::string> ids;
    for (const auto& line : StringUtils::Split(result.stdout_output, '\n')) {
        std::string id = StringUtils::Trim(line);
        if (!id.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ProcessResult DockerCliClient::Execute(const std::vector<std::string>& args,
                                       std::optional<std::chrono::milliseconds> timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {} {} ({} args)", docker_binary_, args.empty() ? "" : args[0], args.size());

    ProcessOptions options;
    options.timeout = timeout;

    try {
        return RunProcess(argv, options);
    } catch (const std::system_error& e) {
        const auto& code = e.code();
        if (code == std::errc::argument_list_too_long) {
            throw ClientError(ClientErrorKind::kContainerError,
                              "Payload too large for the docker command line: " +
                                  std::string(e.what()));
        }
        // Only a missing or unusable binary means docker itself is unreachable
        if (code == std::errc::no_such_file_or_directory ||
            code == std::errc::permission_denied ||
            code == std::errc::not_a_directory ||
            code == std::errc::executable_format_error ||
            code == std::errc::too_many_symbolic_link_levels) {
            throw ClientError(ClientErrorKind::kDaemonUnavailable,
                              "Failed to run " + docker_binary_ + ": " + e.what());
        }
        throw ClientError(ClientErrorKind::kApi,
                          "Failed to run " + docker_binary_ + ": " + e.what());
    }
}

ProcessResult DockerCliClient::ExecuteChecked(const std::vector<std::string>& args,
                                              std::optional<std::chrono::milliseconds> timeout) const {
    auto result = Execute(args, timeout);
    if (result.timed_out) {
        throw ClientError(ClientErrorKind::kTimeout,
                          "docker " + (args.empty() ? std::string() : args[0]) + " timed out");
    }
    if (result.exit_code != 0) {
        ThrowFromResult("docker " + (args.empty() ? std::string() : args[0]), result);
    }
    return result;
}

} // namespace utils
} // namespace codebox
