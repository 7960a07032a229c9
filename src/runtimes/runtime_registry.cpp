/**
 * @file runtime_registry.cpp
 * @brief RuntimeRegistry implementation
 *
 * @date 2025
 */

#include "codebox/runtimes/runtime_registry.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace codebox {
namespace runtimes {

void RuntimeRegistry::Register(std::unique_ptr<LanguageRuntime> runtime) {
    if (!runtime) {
        throw std::invalid_argument("Cannot register a null runtime");
    }
    std::string language = runtime->Language();
    if (runtimes_.count(language)) {
        spdlog::warn("Replacing runtime for {}", language);
    }
    runtimes_[language] = std::move(runtime);
    spdlog::debug("Registered runtime: {}", language);
}

LanguageRuntime& RuntimeRegistry::Get(const std::string& language) const {
    auto it = runtimes_.find(language);
    if (it == runtimes_.end()) {
        throw core::ConfigurationError("Unknown runtime: " + language + ". Available: [" +
                                       utils::StringUtils::Join(List(), ", ") + "]");
    }
    return *it->second;
}

bool RuntimeRegistry::Contains(const std::string& language) const {
    return runtimes_.count(language) > 0;
}

std::vector<std::string> RuntimeRegistry::List() const {
    std::vector<std::string> languages;
    languages.reserve(runtimes_.size());
    for (const auto& [language, runtime] : runtimes_) {
        languages.push_back(language);
    }
    return languages;
}

} // namespace runtimes
} // namespace codebox
