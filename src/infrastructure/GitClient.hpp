/**
 * @file GitClient.hpp
 * @brief Minimal git CLI adapter: repository detection and staging.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shotgate::infrastructure {

/**
 * @class GitClient
 * @brief Runs the git executable from a fixed working directory.
 */
class GitClient {
public:
    explicit GitClient(const std::filesystem::path& workingDirectory);

    bool isInsideWorkTree() const;

    /**
     * @brief Top level of the enclosing work tree, if any.
     */
    std::optional<std::filesystem::path> getRoot() const;

    /**
     * @brief Runs "git add" from @p root for @p files (relative to @p root).
     * @return False when git reported a failure.
     */
    bool stage(const std::vector<std::filesystem::path>& files, const std::filesystem::path& root) const;

    /**
     * @brief Single-quotes @p value for /bin/sh.
     */
    static std::string ShellQuote(const std::string& value);

private:
    struct CommandResult {
        int exitCode = -1;
        std::string output;
    };

    static CommandResult RunCommand(const std::string& cmd);

    std::filesystem::path m_workingDirectory;
};

} // namespace shotgate::infrastructure
