/**
 * @file main.cpp
 * @brief codebox - Sandboxed code execution command-line interface
 *
 * Drives the sandbox engine from the shell: run a Python file, run code
 * against pytest tests, and inspect or clean up the Docker host.
 *
 * **Usage**:
 * ```
 * codebox run script.py --timeout 10
 * codebox test solution.py test_solution.py
 * codebox stats
 * codebox cleanup --image codebox-python:latest
 * codebox images --filter codebox
 * codebox schema
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "codebox/config/engine_config.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/core/sandbox_manager.hpp"
#include "codebox/runtimes/python_runtime.hpp"
#include "codebox/runtimes/runtime_registry.hpp"
#include "codebox/tools/execute_tool.hpp"
#include "codebox/utils/docker_cli_client.hpp"
#include "codebox/utils/string_utils.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

using json = nlohmann::json;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw codebox::core::ConfigurationError("Cannot read file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::unique_ptr<codebox::core::SandboxManager> CreateManager(const codebox::config::SandboxSettings& settings) {
    auto client = std::make_shared<codebox::utils::DockerCliClient>(settings.docker_binary);
    return std::make_unique<codebox::core::SandboxManager>(client, settings);
}

codebox::runtimes::RuntimeConfig PythonConfigFrom(const codebox::config::SandboxSettings& settings) {
    auto config = codebox::runtimes::PythonRuntime::DefaultConfig();
    config.timeout_seconds = settings.timeout_seconds;
    config.memory_limit = settings.memory_limit;
    config.cpu_quota = settings.cpu_quota;
    return config;
}

void RequireEnabled(const codebox::config::SandboxSettings& settings) {
    if (!settings.enabled) {
        throw codebox::core::ConfigurationError("Sandbox execution is disabled in the configuration");
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"codebox - run untrusted code in resource-limited Docker sandboxes"};
    app.require_subcommand(1);

    std::string config_path;
    std::string seccomp_path;
    std::string docker_binary;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--seccomp", seccomp_path, "Seccomp profile (overrides configuration)");
    app.add_option("--docker", docker_binary, "Docker CLI executable (overrides configuration)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute a Python file in the sandbox");
    std::string run_file;
    int run_timeout = 0;
    run_cmd->add_option("file", run_file, "Python source file")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-t,--timeout", run_timeout, "Timeout in seconds (default from configuration)");

    // test
    auto* test_cmd = app.add_subcommand("test", "Run Python code against pytest tests");
    std::string code_file;
    std::string test_file;
    test_cmd->add_option("code", code_file, "Code under test")
        ->required()
        ->check(CLI::ExistingFile);
    test_cmd->add_option("tests", test_file, "pytest test file")
        ->required()
        ->check(CLI::ExistingFile);

    // stats
    auto* stats_cmd = app.add_subcommand("stats", "Show Docker host statistics");

    // cleanup
    auto* cleanup_cmd = app.add_subcommand("cleanup", "Remove exited containers");
    std::string cleanup_image;
    cleanup_cmd->add_option("-i,--image", cleanup_image, "Only containers started from this image");

    // images
    auto* images_cmd = app.add_subcommand("images", "List local images");
    std::string image_filter;
    images_cmd->add_option("-f,--filter", image_filter, "Substring the image name must contain");

    // schema
    auto* schema_cmd = app.add_subcommand("schema", "Print the execute_code tool definition");

    CLI11_PARSE(app, argc, argv);

    try {
        codebox::config::EngineConfig config;
        if (!config_path.empty()) {
            config = codebox::config::EngineConfig::LoadFromFile(config_path);
        }
        if (!seccomp_path.empty()) {
            config.sandbox.seccomp_profile_path = seccomp_path;
        }
        if (!docker_binary.empty()) {
            config.sandbox.docker_binary = docker_binary;
        }
        if (verbose) {
            config.logging.level = "debug";
        }

        codebox::config::ConfigureLogging(config.logging);
        spdlog::debug("Verbose logging enabled");

        if (schema_cmd->parsed()) {
            std::cout << codebox::tools::ExecuteTool::ToJson().dump(2) << std::endl;
            return 0;
        }

        auto manager = CreateManager(config.sandbox);

        if (run_cmd->parsed() || test_cmd->parsed()) {
            RequireEnabled(config.sandbox);

            codebox::runtimes::RuntimeRegistry registry;
            registry.Register(std::make_unique<codebox::runtimes::PythonRuntime>(
                *manager, PythonConfigFrom(config.sandbox)));
            auto& python = registry.Get("python");

            if (run_cmd->parsed()) {
                if (!codebox::utils::StringUtils::EndsWith(run_file, python.Config().file_extension)) {
                    spdlog::warn("{} does not look like a Python file", run_file);
                }
                int timeout = run_timeout > 0 ? run_timeout : config.sandbox.timeout_seconds;
                codebox::tools::ExecuteTool tool(python);

                spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
                spdlog::info("[RUN] {}", run_file);

                std::string report = tool.Execute(ReadFile(run_file), timeout);
                std::cout << report << std::endl;
                return codebox::utils::StringUtils::StartsWith(report, "Execution successful") ? 0 : 1;
            }

            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            spdlog::info("[TEST] {} against {}", code_file, test_file);

            auto result = python.RunTests(ReadFile(code_file), ReadFile(test_file));
            std::cout << codebox::tools::ExecuteTool::FormatResult(result, python.Config().timeout_seconds)
                      << std::endl;
            return result.success ? 0 : 1;
        }

        if (stats_cmd->parsed()) {
            auto stats = manager->GetStats();
            if (stats.empty()) {
                spdlog::error("[ERROR] Could not retrieve Docker statistics");
                return 1;
            }
            json out(stats);
            std::cout << out.dump(2) << std::endl;
            std::cout << "Host memory: "
                      << codebox::utils::StringUtils::FormatSize(static_cast<std::uint64_t>(stats["memory_total"]))
                      << std::endl;
            return 0;
        }

        if (cleanup_cmd->parsed()) {
            std::optional<std::string> filter;
            if (!cleanup_image.empty()) {
                filter = cleanup_image;
            }
            int removed = manager->CleanupStoppedContainers(filter);
            std::cout << "Removed " << removed << " stopped container(s)" << std::endl;
            return 0;
        }

        if (images_cmd->parsed()) {
            std::optional<std::string> filter;
            if (!image_filter.empty()) {
                filter = image_filter;
            }
            for (const auto& image : manager->ListImages(filter)) {
                std::cout << image << std::endl;
            }
            return 0;
        }

        return 0;

    } catch (const codebox::core::SeccompError& e) {
        spdlog::error("[ERROR] Seccomp profile: {}", e.what());
        return 2;
    } catch (const codebox::core::ConfigurationError& e) {
        spdlog::error("[ERROR] Configuration: {}", e.what());
        return 2;
    } catch (const codebox::core::DaemonError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
