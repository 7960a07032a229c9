/**
 * @file path_validator.hpp
 * @brief Validation of image names, memory limits and build paths
 *
 * Dockerfile paths are untrusted input. A path is accepted only when it is
 * relative, contains no `..` segment, and resolves (symlinks collapsed) to
 * a strict descendant of the build context.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace codebox {
namespace security {

/**
 * @struct ResolvedBuild
 * @brief Canonical build context and Dockerfile
 */
struct ResolvedBuild {
    std::filesystem::path context;      ///< Absolute, existing directory
    std::filesystem::path dockerfile;   ///< Absolute path strictly inside context
};

/**
 * @class PathValidator
 * @brief Stateless validation helpers
 */
class PathValidator {
public:
    /**
     * @brief Check an image reference
     *
     * Accepts `[A-Za-z0-9:/_.-]+` without `..`. The first character must be
     * alphanumeric so the name can never be read as a docker flag.
     */
    static bool IsValidImageName(const std::string& name);

    /**
     * @brief Check a docker memory limit such as "256m" or "1g"
     *
     * Digits followed by exactly one of k, m, g (either case).
     */
    static bool IsValidMemoryLimit(const std::string& limit);

    /**
     * @brief Component-wise ancestor test
     *
     * Both paths should already be absolute and normalized. `/a/b` is not an
     * ancestor of `/a/bc`, and a path is not its own strict ancestor.
     *
     * @param ancestor Candidate parent directory
     * @param path Candidate descendant
     * @return true if `path` lies strictly below `ancestor`
     */
    static bool IsStrictDescendant(const std::filesystem::path& ancestor,
                                   const std::filesystem::path& path);

    /**
     * @brief Validate and resolve a Dockerfile inside a build context
     *
     * @param dockerfile_path Path relative to the build context
     * @param build_context Build context directory (relative or absolute)
     * @return Resolved context and Dockerfile
     *
     * @throws core::ConfigurationError describing the first violated rule
     */
    static ResolvedBuild ResolveDockerfile(const std::string& dockerfile_path,
                                           const std::string& build_context);
};

} // namespace security
} // namespace codebox
