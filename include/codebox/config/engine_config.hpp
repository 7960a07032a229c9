/**
 * @file engine_config.hpp
 * @brief Engine-wide settings loaded from JSON
 *
 * **File Format**:
 * ```json
 * {
 *   "sandbox": {
 *     "enabled": true,
 *     "timeout_seconds": 30,
 *     "memory_limit": "256m",
 *     "cpu_quota": 50000,
 *     "seccomp_profile_path": "docker/seccomp-profile.json",
 *     "build_context": "docker",
 *     "docker_binary": "docker"
 *   },
 *   "logging": {
 *     "level": "info",
 *     "pattern": "[%H:%M:%S] [%^%l%$] %v"
 *   }
 * }
 * ```
 * Absent keys keep their defaults.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace codebox {
namespace config {

constexpr const char* kDefaultSeccompProfilePath = "docker/seccomp-profile.json";

/**
 * @struct SandboxSettings
 * @brief Defaults applied to every sandboxed run
 */
struct SandboxSettings {
    bool enabled{true};                                           ///< Master switch
    int timeout_seconds{30};                                      ///< Default timeout (1-300)
    std::string memory_limit{"256m"};                             ///< Default memory limit
    int cpu_quota{50000};                                         ///< Default CPU quota (0.5 core)
    std::string seccomp_profile_path{kDefaultSeccompProfilePath}; ///< Empty disables the profile
    std::string build_context{"docker"};                          ///< Directory holding Dockerfile.<language>
    std::string docker_binary{"docker"};                          ///< Docker CLI executable

    /**
     * @brief Check ranges and formats
     * @throws core::ConfigurationError on the first invalid field
     */
    void Validate() const;
};

/**
 * @struct LoggingSettings
 * @brief spdlog level and pattern
 */
struct LoggingSettings {
    std::string level{"info"};                        ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%H:%M:%S] [%^%l%$] %v"};   ///< spdlog pattern

    void Validate() const;
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    SandboxSettings sandbox;
    LoggingSettings logging;

    /**
     * @brief Load configuration from a JSON file
     *
     * @param path Configuration file
     * @return Validated configuration
     *
     * @throws core::ConfigurationError if the file is missing, is not valid
     *         JSON, has wrongly typed fields or out-of-range values
     */
    static EngineConfig LoadFromFile(const std::filesystem::path& path);

    /// Same as LoadFromFile() for an in-memory document
    static EngineConfig LoadFromString(const std::string& text);

    void Validate() const;
};

/**
 * @brief Apply logging settings to the default spdlog logger
 */
void ConfigureLogging(const LoggingSettings& settings);

} // namespace config
} // namespace codebox
