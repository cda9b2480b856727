/**
 * @file ImageArtifact.hpp
 * @brief Transient description of a validated (or rejected) image file.
 */

#pragma once
#include <cstdint>
#include <string>

namespace shotgate::domain {

/**
 * @enum ImageFormat
 * @brief Formats on the allow-list, detected from content.
 */
enum class ImageFormat {
    Unknown,
    Png,
    Jpeg,
    Gif
};

/**
 * @enum ValidationOutcome
 * @brief Result of running a file through the image validator.
 */
enum class ValidationOutcome {
    Valid,
    Unreadable,
    TooLarge,
    InvalidImage,
    UnsupportedFormat,
    DecompressionBomb,
    TrailingData
};

inline const char* ToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Gif: return "GIF";
        case ImageFormat::Unknown: break;
    }
    return "UNKNOWN";
}

/**
 * @class ImageArtifact
 * @brief What the validator learned about one file. Never persisted.
 */
class ImageArtifact {
public:
    std::string filename;               ///< Basename only.
    ImageFormat format;                 ///< Detected from magic bytes, not the extension.
    std::uintmax_t sizeBytes;
    int width;
    int height;
    ValidationOutcome outcome;
    std::string message;                ///< Failure reason; mentions the basename only.

    ImageArtifact()
        : format(ImageFormat::Unknown), sizeBytes(0), width(0), height(0),
          outcome(ValidationOutcome::Unreadable) {}

    bool isValid() const { return outcome == ValidationOutcome::Valid; }
};

} // namespace shotgate::domain
