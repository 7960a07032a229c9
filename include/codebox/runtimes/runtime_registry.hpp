/**
 * @file runtime_registry.hpp
 * @brief Lookup of language runtimes by name
 *
 * @date 2025
 */

#pragma once

#include "codebox/runtimes/language_runtime.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codebox {
namespace runtimes {

/**
 * @class RuntimeRegistry
 * @brief Owns the runtimes available to a caller
 *
 * Registering a runtime for a language that is already present replaces it.
 */
class RuntimeRegistry {
public:
    void Register(std::unique_ptr<LanguageRuntime> runtime);

    /**
     * @brief Find a runtime
     * @throws core::ConfigurationError naming the available runtimes
     */
    LanguageRuntime& Get(const std::string& language) const;

    bool Contains(const std::string& language) const;

    /// Registered language identifiers, sorted
    std::vector<std::string> List() const;

private:
    std::map<std::string, std::unique_ptr<LanguageRuntime>> runtimes_;
};

} // namespace runtimes
} // namespace codebox
