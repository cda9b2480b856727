/**
 * @file ImageValidator.hpp
 * @brief Content-based validation of screenshot files.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "domain/ImageArtifact.hpp"

namespace shotgate::infrastructure {

/**
 * @class ImageValidator
 * @brief Proves a file is a genuine PNG, JPEG or GIF of acceptable size.
 *
 * Checks run cheapest first: byte size against the ceiling, magic bytes and
 * header, pixel count, full decode, then the format trailer. The extension is
 * never consulted. Messages mention the basename only.
 */
class ImageValidator {
public:
    /**
     * @brief Validates one file.
     * @param path File to inspect.
     * @param fileSize Size already known from a directory scan, to skip a stat.
     * @param maxSizeBytes Per-file ceiling; always clamped to the hard maximum.
     * @param followSymlinks Open through a final symlink instead of rejecting it.
     * @return ImageArtifact whose outcome is Valid or the first failed check.
     */
    static domain::ImageArtifact Validate(const std::filesystem::path& path,
                                          std::optional<std::uintmax_t> fileSize = std::nullopt,
                                          std::optional<std::uintmax_t> maxSizeBytes = std::nullopt,
                                          bool followSymlinks = false);

    /**
     * @brief Same checks as Validate(), keeping the bytes that were checked.
     *
     * The file is opened and read once; @p bytes holds exactly what was
     * decoded, so a caller that writes @p bytes never copies content that
     * replaced the file after validation.
     */
    static domain::ImageArtifact ReadValidated(const std::filesystem::path& path,
                                               std::string& bytes,
                                               std::optional<std::uintmax_t> fileSize = std::nullopt,
                                               std::optional<std::uintmax_t> maxSizeBytes = std::nullopt,
                                               bool followSymlinks = false);

    /**
     * @brief Identifies an allowed format from leading bytes.
     */
    static domain::ImageFormat DetectFormat(const std::string& bytes);

    /**
     * @brief Names recognizable formats that are not on the allow-list (BMP, WEBP...).
     * @return Empty when the bytes match nothing known.
     */
    static std::string DetectUnsupportedFormat(const std::string& bytes);

    /**
     * @brief True when @p bytes end with the logical end marker of @p format.
     */
    static bool HasExpectedTrailer(const std::string& bytes, domain::ImageFormat format);
};

} // namespace shotgate::infrastructure
