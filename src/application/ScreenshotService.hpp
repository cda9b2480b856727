/**
 * @file ScreenshotService.hpp
 * @brief Fetch workflow: select, validate, copy, convert, stage, format.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "application/AppContext.hpp"
#include "domain/ConfigDocument.hpp"
#include "domain/ScreenshotCandidate.hpp"
#include "domain/SizeLimitPolicy.hpp"

namespace shotgate::application {

/**
 * @struct FetchRequest
 * @brief Options of one fetch command. Unset values fall back to the config.
 */
struct FetchRequest {
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<std::string> imagePath;   ///< Copy this single file instead of the newest ones.
    int count = 1;
    std::optional<std::string> outputStyle;
    std::optional<std::string> convertTo;
    bool noTransfer = false;                ///< Print source paths only; create nothing.
    bool allowSymlinks = false;             ///< Trusted-path opt-out for source and destination.
};

struct FetchResult {
    std::vector<std::filesystem::path> files;
    std::vector<std::string> lines;
    bool staged = false;
};

/**
 * @class ScreenshotService
 * @brief Orchestrates the path resolver, materializer and validator for a fetch.
 *
 * Invalid files found while picking the newest N are skipped with a warning;
 * an invalid file named explicitly is a hard error.
 */
class ScreenshotService {
public:
    ScreenshotService(AppContext context, domain::ConfigDocument config);

    /**
     * @brief Runs the whole fetch and returns the lines to print.
     * @throws domain::ShotgateError subclasses with sanitized messages.
     */
    FetchResult fetch(const FetchRequest& request) const;

    /**
     * @brief The @p count newest valid images in @p sourceDir, newest first.
     * @throws domain::NotFoundError when fewer than @p count valid images exist.
     */
    std::vector<domain::ScreenshotCandidate> selectRecent(const std::filesystem::path& sourceDir,
                                                          int count,
                                                          bool allowSymlinks,
                                                          const domain::SizeLimitPolicy& policy) const;

    /**
     * @brief Resolves and validates a single user-named image.
     * @throws domain::ValidationError if the file is not an acceptable image.
     */
    std::filesystem::path validateExplicit(const std::string& imagePath,
                                           bool allowSymlinks,
                                           const domain::SizeLimitPolicy& policy) const;

    /**
     * @brief Copies @p files into @p destination under fresh random names.
     *
     * Each file is read and validated once more and the copy is written from
     * exactly those bytes. Stops, with a warning, before the file that would
     * push the running total over the policy's aggregate ceiling.
     * @throws domain::SecurityError if a file no longer passes validation.
     */
    std::vector<std::filesystem::path> copyScreenshots(const std::vector<std::filesystem::path>& files,
                                                       const std::filesystem::path& destination,
                                                       const domain::SizeLimitPolicy& policy,
                                                       bool allowSymlinks = false) const;

    /**
     * @brief Converts copied files; each replaced copy is removed.
     */
    std::vector<std::filesystem::path> convertAll(const std::vector<std::filesystem::path>& files,
                                                  const std::string& target) const;

    /**
     * @brief Destination directory: explicit, else git heuristics, else config, else cwd.
     */
    std::filesystem::path resolveDestination(const std::optional<std::string>& requested,
                                             bool allowSymlinks) const;

    /**
     * @brief "screenshot_<32 hex>.<ext>" ("animated_" for GIFs), extension lowercased.
     */
    static std::string GenerateCopyName(const std::filesystem::path& source);

private:
    std::filesystem::path resolveSource(const std::optional<std::string>& requested, bool allowSymlinks) const;
    std::filesystem::path resolveExistingDirectory(const std::string& value, bool allowSymlinks) const;

    AppContext m_context;
    domain::ConfigDocument m_config;
};

} // namespace shotgate::application
