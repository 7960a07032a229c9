/**
 * @file engine_config.cpp
 * @brief Engine configuration loading and validation
 *
 * @date 2025
 */

#include "codebox/config/engine_config.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/security/path_validator.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace codebox {
namespace config {

using core::ConfigurationError;

namespace {

const char* const kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

} // anonymous namespace

// ============================================================================
// VALIDATION
// ============================================================================

void SandboxSettings::Validate() const {
    if (timeout_seconds < 1 || timeout_seconds > 300) {
        throw ConfigurationError("sandbox.timeout_seconds must be between 1 and 300");
    }
    if (!security::PathValidator::IsValidMemoryLimit(memory_limit)) {
        throw ConfigurationError("sandbox.memory_limit is invalid: '" + memory_limit + "'");
    }
    if (cpu_quota < 1000 || cpu_quota > 1000000) {
        throw ConfigurationError("sandbox.cpu_quota must be between 1000 and 1000000");
    }
    if (build_context.empty()) {
        throw ConfigurationError("sandbox.build_context must not be empty");
    }
    if (docker_binary.empty()) {
        throw ConfigurationError("sandbox.docker_binary must not be empty");
    }
}

void LoggingSettings::Validate() const {
    std::string lower = utils::StringUtils::ToLower(level);
    for (const char* known : kLogLevels) {
        if (lower == known) {
            return;
        }
    }
    throw ConfigurationError("logging.level is invalid: '" + level + "'");
}

void EngineConfig::Validate() const {
    sandbox.Validate();
    logging.Validate();
}

// ============================================================================
// LOADING
// ============================================================================

EngineConfig EngineConfig::LoadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ConfigurationError("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading configuration from {}", path.string());
    return LoadFromString(buffer.str());
}

EngineConfig EngineConfig::LoadFromString(const std::string& text) {
    EngineConfig config;

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigurationError("Configuration must be a JSON object");
        }

        if (j.contains("sandbox")) {
            const auto& s = j.at("sandbox");
            auto& sandbox = config.sandbox;
            sandbox.enabled = s.value("enabled", sandbox.enabled);
            sandbox.timeout_seconds = s.value("timeout_seconds", sandbox.timeout_seconds);
            sandbox.memory_limit = s.value("memory_limit", sandbox.memory_limit);
            sandbox.cpu_quota = s.value("cpu_quota", sandbox.cpu_quota);
            sandbox.seccomp_profile_path = s.value("seccomp_profile_path", sandbox.seccomp_profile_path);
            sandbox.build_context = s.value("build_context", sandbox.build_context);
            sandbox.docker_binary = s.value("docker_binary", sandbox.docker_binary);
        }

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            config.logging.level = l.value("level", config.logging.level);
            config.logging.pattern = l.value("pattern", config.logging.pattern);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }

    config.Validate();
    return config;
}

// ============================================================================
// LOGGING
// ============================================================================

void ConfigureLogging(const LoggingSettings& settings) {
    spdlog::set_level(spdlog::level::from_str(utils::StringUtils::ToLower(settings.level)));
    spdlog::set_pattern(settings.pattern);
}

} // namespace config
} // namespace codebox
