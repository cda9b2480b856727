/**
 * @file ScreenshotCandidate.hpp
 * @brief A file found in the source directory that may be copied.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace shotgate::domain {

struct ScreenshotCandidate {
    std::filesystem::path path;
    std::string filename;                                 ///< Basename of the file.
    std::chrono::system_clock::time_point lastModified;
    std::uintmax_t sizeBytes = 0;
};

} // namespace shotgate::domain
