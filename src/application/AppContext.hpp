/**
 * @file AppContext.hpp
 * @brief Per-invocation values threaded through the services.
 */

#pragma once

#include <filesystem>
#include "infrastructure/PathUtils.hpp"

namespace shotgate::application {

/**
 * @struct AppContext
 * @brief Config location and working directory for one command.
 *
 * Built once per command and passed by value; tests build their own with
 * sandbox paths.
 */
struct AppContext {
    std::filesystem::path configPath;
    std::filesystem::path workingDirectory;

    static AppContext FromEnvironment() {
        AppContext ctx;
        ctx.configPath = infrastructure::PathUtils::GetConfigPath();
        ctx.workingDirectory = std::filesystem::current_path();
        return ctx;
    }
};

} // namespace shotgate::application
