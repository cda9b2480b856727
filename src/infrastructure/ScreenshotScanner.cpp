/**
 * @file ScreenshotScanner.cpp
 * @brief Implementation of the ScreenshotScanner.
 */

#include "infrastructure/ScreenshotScanner.hpp"
#include "domain/ConfigDocument.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ErrorSanitizer.hpp"

#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace shotgate::infrastructure {

ScreenshotScanner::ScreenshotScanner(const fs::path& sourceDir, bool allowSymlinks)
    : m_sourceDir(sourceDir), m_allowSymlinks(allowSymlinks) {}

bool ScreenshotScanner::HasImageExtension(const fs::path& path) {
    const std::string ext = domain::ToLower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".gif";
}

std::vector<domain::ScreenshotCandidate> ScreenshotScanner::scan() const {
    std::vector<domain::ScreenshotCandidate> candidates;

    std::error_code ec;
    fs::directory_iterator it(m_sourceDir, ec);
    if (ec) {
        throw domain::NotFoundError("Cannot read source directory: " + ErrorSanitizer::FormatPathError(ec, m_sourceDir));
    }

    // One reference point so every entry is converted with the same offset.
    const auto fileNow = fs::file_time_type::clock::now();
    const auto systemNow = std::chrono::system_clock::now();

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw domain::NotFoundError("Cannot read source directory: " + ErrorSanitizer::FormatPathError(ec, m_sourceDir));
        }
        const fs::directory_entry& entry = *it;
        if (!HasImageExtension(entry.path())) {
            continue;
        }

        std::error_code statEc;
        if (entry.is_symlink(statEc)) {
            if (!m_allowSymlinks) {
                std::cerr << "[ScreenshotScanner] Skipping symlinked file: "
                          << ErrorSanitizer::SanitizePath(entry.path().string()) << std::endl;
                continue;
            }
        }
        if (!entry.is_regular_file(statEc)) {
            continue;
        }

        domain::ScreenshotCandidate candidate;
        candidate.path = entry.path();
        candidate.filename = entry.path().filename().string();

        auto ftime = entry.last_write_time(statEc);
        if (statEc) continue;
        candidate.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            ftime - fileNow + systemNow
        );

        candidate.sizeBytes = entry.file_size(statEc);
        if (statEc) continue;

        candidates.push_back(candidate);
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a.lastModified != b.lastModified) {
            return a.lastModified > b.lastModified;
        }
        return a.filename < b.filename;
    });
    return candidates;
}

} // namespace shotgate::infrastructure
