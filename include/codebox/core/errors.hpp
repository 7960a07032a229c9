/**
 * @file errors.hpp
 * @brief Exception hierarchy of the sandbox engine
 *
 * Exceptions signal environment and configuration faults. Outcomes of the
 * sandboxed code itself (non-zero exit, timeout) are reported as
 * ExecutionResult values instead.
 *
 * ```
 * std::runtime_error
 *   SandboxError
 *     ConfigurationError
 *       SeccompError
 *         SeccompNotFoundError
 *         SeccompParseError
 *         SeccompSchemaError
 *     DaemonError
 * ```
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace codebox {
namespace core {

/**
 * @class SandboxError
 * @brief Root of all engine errors
 */
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ConfigurationError
 * @brief Invalid settings, container configuration or paths
 *
 * Raised before any container is created.
 */
class ConfigurationError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class DaemonError
 * @brief Container runtime unreachable
 */
class DaemonError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class SeccompError
 * @brief Base for seccomp profile loading failures
 */
class SeccompError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class SeccompNotFoundError : public SeccompError {
public:
    explicit SeccompNotFoundError(const std::string& path)
        : SeccompError("Seccomp profile not found: " + path), path_(path) {}

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

class SeccompParseError : public SeccompError {
public:
    using SeccompError::SeccompError;
};

/**
 * @class SeccompSchemaError
 * @brief Profile is valid JSON but violates the profile schema
 *
 * Carries the offending field and, for list items, the item index.
 */
class SeccompSchemaError : public SeccompError {
public:
    SeccompSchemaError(const std::string& field, const std::string& reason,
                       std::optional<std::size_t> index = std::nullopt)
        : SeccompError(Describe(field, reason, index)), field_(field), index_(index) {}

    const std::string& Field() const { return field_; }
    std::optional<std::size_t> Index() const { return index_; }

private:
    static std::string Describe(const std::string& field, const std::string& reason,
                                std::optional<std::size_t> index) {
        std::string location = field;
        if (index) {
            location += "[" + std::to_string(*index) + "]";
        }
        return "Invalid seccomp profile field '" + location + "': " + reason;
    }

    std::string field_;
    std::optional<std::size_t> index_;
};

} // namespace core
} // namespace codebox
