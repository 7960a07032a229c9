/**
 * @file container_client.hpp
 * @brief Abstract interface to a container runtime
 *
 * SandboxManager talks to the container runtime only through this
 * interface. DockerCliClient drives the `docker` binary; tests substitute
 * a GoogleMock implementation.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @enum ClientErrorKind
 * @brief Category of a container runtime failure
 */
enum class ClientErrorKind {
    kNotFound,           ///< Container or image does not exist
    kContainerError,     ///< Runtime reported a structured failure for the container
    kTimeout,            ///< Operation did not finish within its bound
    kApi,                ///< Runtime rejected the request
    kDaemonUnavailable   ///< Runtime could not be reached at all
};

/**
 * @brief Human-readable name of an error kind
 */
const char* ToString(ClientErrorKind kind);

/**
 * @class ClientError
 * @brief Failure raised by ContainerClient implementations
 *
 * Container errors carry whatever output the container produced before
 * failing, and its exit code when the runtime reported one.
 */
class ClientError : public std::runtime_error {
public:
    ClientError(ClientErrorKind kind, const std::string& message,
                std::optional<int> exit_code = std::nullopt,
                std::string partial_stdout = "",
                std::string partial_stderr = "")
        : std::runtime_error(message),
          kind_(kind),
          exit_code_(exit_code),
          partial_stdout_(std::move(partial_stdout)),
          partial_stderr_(std::move(partial_stderr)) {}

    ClientErrorKind Kind() const { return kind_; }
    std::optional<int> ExitCode() const { return exit_code_; }
    const std::string& PartialStdout() const { return partial_stdout_; }
    const std::string& PartialStderr() const { return partial_stderr_; }

private:
    ClientErrorKind kind_;
    std::optional<int> exit_code_;
    std::string partial_stdout_;
    std::string partial_stderr_;
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to start one sandboxed container
 */
struct ContainerSpec {
    std::string image;                          ///< Image reference
    std::vector<std::string> command;           ///< argv executed inside the container
    std::string memory_limit{"256m"};           ///< `--memory`
    int cpu_quota{50000};                       ///< `--cpu-quota` (per 100000us period)
    int pids_limit{50};                         ///< `--pids-limit`
    bool network_enabled{false};                ///< bridge when true, none otherwise
    bool read_only_rootfs{true};                ///< `--read-only`
    std::optional<std::string> seccomp_profile; ///< Path of a seccomp JSON profile
    std::string tmpfs_mount{"/tmp:rw,nosuid,nodev,size=10m,mode=1777"};  ///< Writable scratch space
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    bool no_new_privileges{true};               ///< `--security-opt no-new-privileges`
};

/**
 * @struct BuildRequest
 * @brief Image build parameters
 */
struct BuildRequest {
    std::string tag;            ///< Resulting image tag
    std::string context_dir;    ///< Absolute build context
    std::string dockerfile;     ///< Absolute Dockerfile path inside the context
    bool remove_intermediate{true};  ///< `--rm --force-rm`
};

/**
 * @enum LogStream
 * @brief Which output stream to fetch
 */
enum class LogStream {
    kStdout,
    kStderr
};

/**
 * @struct ContainerFilter
 * @brief Selection criteria for ListContainers()
 */
struct ContainerFilter {
    std::optional<std::string> status;     ///< e.g. "exited", "running"
    std::optional<std::string> ancestor;   ///< Image the container was started from
};

/**
 * @struct SystemInfo
 * @brief Daemon-wide counters
 */
struct SystemInfo {
    std::int64_t containers_running{0};
    std::int64_t containers_stopped{0};
    std::int64_t images{0};
    std::int64_t memory_total{0};   ///< Bytes
    std::int64_t cpus{0};
};

/**
 * @class ContainerClient
 * @brief Operations the sandbox needs from a container runtime
 *
 * All methods throw ClientError on failure.
 */
class ContainerClient {
public:
    virtual ~ContainerClient() = default;

    /// Verify the runtime is reachable
    virtual void Ping() = 0;

    virtual bool ImageExists(const std::string& image) = 0;
    virtual void BuildImage(const BuildRequest& request) = 0;
    virtual void RemoveImage(const std::string& image, bool force) = 0;

    /// Repository:tag names of all local images
    virtual std::vector<std::string> ListImageTags() = 0;

    /**
     * @brief Start a container in the background
     * @return Container ID
     */
    virtual std::string RunDetached(const ContainerSpec& spec) = 0;

    /**
     * @brief Block until the container exits
     *
     * @param container_id Container to wait on
     * @param timeout Upper bound on the wait
     * @return Container exit code
     *
     * @throws ClientError kTimeout when the bound elapses,
     *         kContainerError when the runtime reports a container failure
     */
    virtual int Wait(const std::string& container_id, std::chrono::seconds timeout) = 0;

    virtual std::string Logs(const std::string& container_id, LogStream stream) = 0;

    /// Current memory usage, or nullopt when the runtime does not report it
    virtual std::optional<std::uint64_t> MemoryUsageBytes(const std::string& container_id) = 0;

    virtual void Kill(const std::string& container_id) = 0;
    virtual void Remove(const std::string& container_id, bool force) = 0;

    /// IDs of containers matching the filter
    virtual std::vector<std::string> ListContainers(const ContainerFilter& filter) = 0;

    virtual SystemInfo Info() = 0;
};

} // namespace utils
} // namespace codebox
