/**
 * @file docker_cli_client.hpp
 * @brief ContainerClient backed by the `docker` command-line tool
 *
 * Each operation spawns the docker binary with an explicit argv (never a
 * shell string) and maps its exit status and stderr onto ClientError kinds.
 * The argument builders and output parsers are free functions in
 * `docker_cli` so they can be tested without a daemon.
 *
 * @date 2025
 */

#pragma once

#include "codebox/utils/container_client.hpp"
#include "codebox/utils/process_utils.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace utils {

namespace docker_cli {

/**
 * @brief Build `docker create` arguments for a sandboxed container
 *
 * The result starts with "create" and ends with the image followed by the
 * container command. Security options always include `--cap-drop`,
 * `no-new-privileges` and `--pull never`.
 *
 * @param spec Container specification
 * @return Arguments to pass after the docker binary
 */
std::vector<std::string> BuildCreateArguments(const ContainerSpec& spec);

/**
 * @brief Build `docker build` arguments
 */
std::vector<std::string> BuildImageArguments(const BuildRequest& request);

/**
 * @brief Map a failed docker invocation onto an error kind
 *
 * @param stderr_output What docker printed on stderr
 * @return Error category
 */
ClientErrorKind ClassifyCliError(const std::string& stderr_output);

/**
 * @brief Extract the used-memory part of a `docker stats` MemUsage field
 *
 * @param mem_usage Field such as "1.5MiB / 256MiB"
 * @return Bytes in use, or nullopt if the field cannot be parsed
 */
std::optional<std::uint64_t> ParseMemoryUsage(const std::string& mem_usage);

/**
 * @brief Parse `docker info --format '{{json .}}'` output
 *
 * @throws ClientError (kApi) if the text is not a JSON object
 */
SystemInfo ParseSystemInfo(const std::string& json_text);

} // namespace docker_cli

/**
 * @class DockerCliClient
 * @brief Drives a local Docker daemon through its CLI
 *
 * **Usage Example**:
 * @code
 * auto client = std::make_shared<DockerCliClient>();
 * client->Ping();
 * auto id = client->RunDetached(spec);
 * int exit_code = client->Wait(id, std::chrono::seconds(30));
 * @endcode
 */
class DockerCliClient : public ContainerClient {
public:
    /**
     * @brief Construct client
     * @param docker_binary Name or path of the docker executable
     */
    explicit DockerCliClient(std::string docker_binary = "docker");

    void Ping() override;

    bool ImageExists(const std::string& image) override;
    void BuildImage(const BuildRequest& request) override;
    void RemoveImage(const std::string& image, bool force) override;
    std::vector<std::string> ListImageTags() override;

    /**
     * @brief Create and start a container
     *
     * If the container is created but cannot be started (for example the
     * entrypoint is missing), it is removed again before the
     * kContainerError is thrown.
     */
    std::string RunDetached(const ContainerSpec& spec) override;

    int Wait(const std::string& container_id, std::chrono::seconds timeout) override;
    std::string Logs(const std::string& container_id, LogStream stream) override;
    std::optional<std::uint64_t> MemoryUsageBytes(const std::string& container_id) override;

    void Kill(const std::string& container_id) override;
    void Remove(const std::string& container_id, bool force) override;
    std::vector<std::string> ListContainers(const ContainerFilter& filter) override;

    SystemInfo Info() override;

private:
    /**
     * @brief Run docker with the given arguments
     *
     * @throws ClientError kDaemonUnavailable if the binary cannot be executed,
     *         kContainerError if the arguments exceed the kernel's size limit
     */
    ProcessResult Execute(const std::vector<std::string>& args,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /// Execute and throw a classified ClientError on non-zero exit
    ProcessResult ExecuteChecked(const std::vector<std::string>& args,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    std::string docker_binary_;
};

} // namespace utils
} // namespace codebox
