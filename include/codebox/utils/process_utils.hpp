/**
 * @file process_utils.hpp
 * @brief Shell-free child process execution with output capture
 *
 * Every container runtime call goes through RunProcess(). Arguments are
 * passed as an argv vector straight to posix_spawnp, so no argument is
 * ever interpreted by a shell.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Limits applied to a spawned child
 */
struct ProcessOptions {
    std::optional<std::chrono::milliseconds> timeout;   ///< Kill the child after this long
    std::size_t max_output_bytes{10 * 1024 * 1024};     ///< Per-stream capture cap (10MB)
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished child
 */
struct ProcessResult {
    int exit_code{0};           ///< Exit status, or 128 + signal if killed by a signal
    std::string stdout_output;  ///< Captured stdout (capped)
    std::string stderr_output;  ///< Captured stderr (capped)
    bool timed_out{false};      ///< Child was killed because the timeout elapsed
};

/**
 * @brief Run a program and wait for it
 *
 * The program is located through PATH. stdin is `/dev/null`; stdout and
 * stderr are read concurrently through separate pipes. When
 * `options.timeout` elapses the child receives SIGKILL, is reaped, and
 * `timed_out` is set.
 *
 * @param argv Program name followed by its arguments (must not be empty)
 * @param options Timeout and capture limits
 * @return Exit status and captured output
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes cannot be created or the spawn fails
 *
 * **Example**:
 * @code
 * ProcessOptions opts;
 * opts.timeout = std::chrono::seconds(5);
 * auto result = RunProcess({"docker", "version"}, opts);
 * @endcode
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

} // namespace utils
} // namespace codebox
