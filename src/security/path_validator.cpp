/**
 * @file path_validator.cpp
 * @brief Implementation of name, limit and path validation
 *
 * @date 2025
 */

#include "codebox/security/path_validator.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/utils/string_utils.hpp"

#include <iterator>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace codebox {
namespace security {

using core::ConfigurationError;
using utils::StringUtils;

// ============================================================================
// NAME AND LIMIT VALIDATION
// ============================================================================

bool PathValidator::IsValidImageName(const std::string& name) {
    static const std::regex image_regex(R"([A-Za-z0-9][A-Za-z0-9:/_.\-]*)");

    if (StringUtils::Trim(name).empty()) {
        return false;
    }
    if (StringUtils::Contains(name, "..")) {
        return false;
    }
    return std::regex_match(name, image_regex);
}

bool PathValidator::IsValidMemoryLimit(const std::string& limit) {
    static const std::regex memory_regex(R"(^\d+[kmg]$)", std::regex::icase);
    return std::regex_match(limit, memory_regex);
}

// ============================================================================
// PATH CONTAINMENT
// ============================================================================

bool PathValidator::IsStrictDescendant(const fs::path& ancestor, const fs::path& path) {
    auto a = ancestor.begin();
    auto p = path.begin();

    for (; a != ancestor.end(); ++a, ++p) {
        // Trailing separator yields an empty final element
        if (a->empty() && std::next(a) == ancestor.end()) {
            break;
        }
        if (p == path.end() || *a != *p) {
            return false;
        }
    }

    for (; p != path.end(); ++p) {
        if (!p->empty()) {
            return true;
        }
    }
    return false;
}

ResolvedBuild PathValidator::ResolveDockerfile(const std::string& dockerfile_path,
                                               const std::string& build_context) {
    if (dockerfile_path.empty()) {
        throw ConfigurationError("Dockerfile path is empty");
    }

    fs::path relative(dockerfile_path);
    if (relative.is_absolute() || relative.has_root_path()) {
        throw ConfigurationError("Dockerfile path must be relative: " + dockerfile_path);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw ConfigurationError("Dockerfile path contains '..': " + dockerfile_path);
        }
    }

    if (build_context.empty()) {
        throw ConfigurationError("Build context is empty");
    }

    std::error_code ec;
    fs::path context = fs::canonical(fs::path(build_context), ec);
    if (ec) {
        throw ConfigurationError("Build context does not exist: " + build_context);
    }
    if (!fs::is_directory(context, ec)) {
        throw ConfigurationError("Build context is not a directory: " + build_context);
    }

    fs::path dockerfile = fs::weakly_canonical(context / relative, ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve Dockerfile path: " + dockerfile_path);
    }
    if (!IsStrictDescendant(context, dockerfile)) {
        throw ConfigurationError("Dockerfile escapes the build context: " + dockerfile_path);
    }

    return ResolvedBuild{context, dockerfile};
}

} // namespace security
} // namespace codebox
