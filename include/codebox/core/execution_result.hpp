/**
 * @file execution_result.hpp
 * @brief Outcome of one sandboxed execution
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace codebox {
namespace core {

/**
 * @struct ExecutionResult
 * @brief Everything a caller learns about a run
 *
 * Built once per run and returned by value.
 */
struct ExecutionResult {
    bool success{false};                      ///< Exit code 0 and no timeout
    std::string stdout_output;                ///< Container stdout
    std::string stderr_output;                ///< Container stderr
    int exit_code{-1};                        ///< Process exit code, -1 on timeout or unknown
    bool timed_out{false};                    ///< Killed because the timeout elapsed
    std::int64_t execution_time_ms{0};        ///< Wall-clock duration
    double memory_used_mb{0.0};               ///< Best-effort memory usage, 0 if unknown
    std::optional<std::string> error_message; ///< Set on timeout or container error
};

/**
 * @enum RunOutcome
 * @brief Classification of how a run ended
 */
enum class RunOutcome {
    kSuccess,         ///< Container ran to completion (any exit code)
    kContainerError,  ///< Runtime reported a failure for the container
    kTimeout,         ///< Timeout elapsed
    kDaemonError      ///< Runtime unreachable
};

} // namespace core
} // namespace codebox
