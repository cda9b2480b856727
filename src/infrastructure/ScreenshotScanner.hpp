/**
 * @file ScreenshotScanner.hpp
 * @brief Scanner for image files in the screenshot source directory.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "domain/ScreenshotCandidate.hpp"

namespace shotgate::infrastructure {

/**
 * @class ScreenshotScanner
 * @brief Lists .png/.jpg/.jpeg/.gif files, newest first.
 *
 * The extension only decides what is worth looking at; ImageValidator decides
 * what is an image. Symlinked entries are skipped with a warning unless
 * allowSymlinks is set.
 */
class ScreenshotScanner {
public:
    ScreenshotScanner(const std::filesystem::path& sourceDir, bool allowSymlinks);

    /**
     * @brief Scans the source directory.
     * @return Candidates sorted by modification time, newest first.
     * @throws domain::NotFoundError if the directory cannot be listed.
     */
    std::vector<domain::ScreenshotCandidate> scan() const;

    static bool HasImageExtension(const std::filesystem::path& path);

private:
    std::filesystem::path m_sourceDir;
    bool m_allowSymlinks;
};

} // namespace shotgate::infrastructure
