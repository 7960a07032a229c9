/**
 * @file seccomp_profile.cpp
 * @brief Implementation of the seccomp profile loader
 *
 * Validation walks the document top-down and reports the first violation
 * with the field name and, for list entries, the entry index.
 *
 * @date 2025
 */

#include "codebox/security/seccomp_profile.hpp"
#include "codebox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <array>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace codebox {
namespace security {

using core::SeccompNotFoundError;
using core::SeccompParseError;
using core::SeccompSchemaError;

namespace {

const std::array<std::pair<SeccompAction, const char*>, 9> kActionNames = {{
    {SeccompAction::kKill, "SCMP_ACT_KILL"},
    {SeccompAction::kKillProcess, "SCMP_ACT_KILL_PROCESS"},
    {SeccompAction::kKillThread, "SCMP_ACT_KILL_THREAD"},
    {SeccompAction::kTrap, "SCMP_ACT_TRAP"},
    {SeccompAction::kErrno, "SCMP_ACT_ERRNO"},
    {SeccompAction::kTrace, "SCMP_ACT_TRACE"},
    {SeccompAction::kAllow, "SCMP_ACT_ALLOW"},
    {SeccompAction::kLog, "SCMP_ACT_LOG"},
    {SeccompAction::kNotify, "SCMP_ACT_NOTIFY"},
}};

SeccompAction RequireAction(const json& value, const std::string& field,
                            std::optional<std::size_t> index = std::nullopt) {
    if (!value.is_string()) {
        throw SeccompSchemaError(field, "action must be a string", index);
    }
    auto action = ParseSeccompAction(value.get<std::string>());
    if (!action) {
        throw SeccompSchemaError(field, "unknown action '" + value.get<std::string>() + "'", index);
    }
    return *action;
}

} // anonymous namespace

// ============================================================================
// ACTION NAMES
// ============================================================================

std::optional<SeccompAction> ParseSeccompAction(const std::string& name) {
    for (const auto& [action, action_name] : kActionNames) {
        if (name == action_name) {
            return action;
        }
    }
    return std::nullopt;
}

std::string ToString(SeccompAction action) {
    for (const auto& [candidate, action_name] : kActionNames) {
        if (candidate == action) {
            return action_name;
        }
    }
    return "UNKNOWN";
}

// ============================================================================
// LOADING
// ============================================================================

SeccompProfile SeccompProfile::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw SeccompNotFoundError(path.string());
    }

    std::ifstream file(path);
    if (!file) {
        throw SeccompNotFoundError(path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    SeccompProfile profile = Parse(buffer.str());
    profile.source_path_ = path;

    spdlog::info("Loaded seccomp profile {} (default action {}, {} rules)",
                 path.string(), ToString(profile.default_action_), profile.rules_.size());
    return profile;
}

SeccompProfile SeccompProfile::Parse(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw SeccompParseError("Seccomp profile is not valid JSON");
    }
    if (!j.is_object()) {
        throw SeccompParseError("Seccomp profile must be a JSON object");
    }

    SeccompProfile profile;

    // defaultAction (required)
    if (!j.contains("defaultAction")) {
        throw SeccompSchemaError("defaultAction", "missing required field");
    }
    profile.default_action_ = RequireAction(j["defaultAction"], "defaultAction");

    // architectures (optional list of strings)
    if (j.contains("architectures")) {
        const auto& archs = j["architectures"];
        if (!archs.is_array()) {
            throw SeccompSchemaError("architectures", "must be a list");
        }
        for (std::size_t i = 0; i < archs.size(); ++i) {
            if (!archs[i].is_string()) {
                throw SeccompSchemaError("architectures", "entry must be a string", i);
            }
            profile.architectures_.push_back(archs[i].get<std::string>());
        }
    }

    // syscalls (optional list of rule objects)
    if (j.contains("syscalls")) {
        const auto& syscalls = j["syscalls"];
        if (!syscalls.is_array()) {
            throw SeccompSchemaError("syscalls", "must be a list");
        }

        for (std::size_t i = 0; i < syscalls.size(); ++i) {
            const auto& entry = syscalls[i];
            if (!entry.is_object()) {
                throw SeccompSchemaError("syscalls", "entry must be an object", i);
            }

            // names and action are both required
            if (!entry.contains("names")) {
                throw SeccompSchemaError("syscalls.names", "missing required field", i);
            }
            if (!entry.contains("action")) {
                throw SeccompSchemaError("syscalls.action", "missing required field", i);
            }

            SeccompRule rule;
            const auto& names = entry["names"];
            if (!names.is_array()) {
                throw SeccompSchemaError("syscalls.names", "must be a list of strings", i);
            }
            for (const auto& name : names) {
                if (!name.is_string()) {
                    throw SeccompSchemaError("syscalls.names", "must be a list of strings", i);
                }
                rule.names.push_back(name.get<std::string>());
            }
            rule.action = RequireAction(entry["action"], "syscalls.action", i);
            profile.rules_.push_back(std::move(rule));
        }
    }

    return profile;
}

} // namespace security
} // namespace codebox
