/**
 * @file seccomp_profile.hpp
 * @brief Loader and validator for Docker seccomp profiles
 *
 * The profile is handed to the container runtime as a file path; this
 * loader only makes sure the document is well formed before any container
 * is started, so a broken profile fails at startup rather than on the first
 * execution.
 *
 * **Profile Format**:
 * ```json
 * {
 *   "defaultAction": "SCMP_ACT_ERRNO",
 *   "architectures": ["SCMP_ARCH_X86_64"],
 *   "syscalls": [
 *     {"names": ["read", "write"], "action": "SCMP_ACT_ALLOW"}
 *   ]
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace security {

/**
 * @enum SeccompAction
 * @brief Actions a seccomp rule may take
 */
enum class SeccompAction {
    kKill,          ///< SCMP_ACT_KILL
    kKillProcess,   ///< SCMP_ACT_KILL_PROCESS
    kKillThread,    ///< SCMP_ACT_KILL_THREAD
    kTrap,          ///< SCMP_ACT_TRAP
    kErrno,         ///< SCMP_ACT_ERRNO
    kTrace,         ///< SCMP_ACT_TRACE
    kAllow,         ///< SCMP_ACT_ALLOW
    kLog,           ///< SCMP_ACT_LOG
    kNotify         ///< SCMP_ACT_NOTIFY
};

/// Parse an action name; nullopt if it is not one of the SCMP_ACT_* names
std::optional<SeccompAction> ParseSeccompAction(const std::string& name);

/// Canonical SCMP_ACT_* name
std::string ToString(SeccompAction action);

/**
 * @struct SeccompRule
 * @brief One entry of the `syscalls` list
 */
struct SeccompRule {
    std::vector<std::string> names;   ///< Syscall names
    SeccompAction action{};           ///< Action applied to those syscalls
};

/**
 * @class SeccompProfile
 * @brief Validated seccomp profile
 *
 * **Usage Example**:
 * @code
 * auto profile = SeccompProfile::Load("docker/seccomp-profile.json");
 * spdlog::info("Seccomp default action: {}", ToString(profile.DefaultAction()));
 * @endcode
 */
class SeccompProfile {
public:
    /**
     * @brief Load and validate a profile file
     *
     * @param path Profile location
     * @return Parsed profile remembering its source path
     *
     * @throws core::SeccompNotFoundError if the file is missing or not a regular file
     * @throws core::SeccompParseError if the content is not a JSON object
     * @throws core::SeccompSchemaError if a field violates the profile schema
     */
    static SeccompProfile Load(const std::filesystem::path& path);

    /**
     * @brief Validate an in-memory profile document
     *
     * Same rules as Load(), without a source path.
     */
    static SeccompProfile Parse(const std::string& text);

    SeccompAction DefaultAction() const { return default_action_; }
    const std::vector<std::string>& Architectures() const { return architectures_; }
    const std::vector<SeccompRule>& Rules() const { return rules_; }

    /// File the profile was loaded from (empty for Parse())
    const std::filesystem::path& SourcePath() const { return source_path_; }

private:
    SeccompProfile() = default;

    SeccompAction default_action_{SeccompAction::kErrno};
    std::vector<std::string> architectures_;
    std::vector<SeccompRule> rules_;
    std::filesystem::path source_path_;
};

} // namespace security
} // namespace codebox
