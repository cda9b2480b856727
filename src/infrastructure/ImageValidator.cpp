/**
 * @file ImageValidator.cpp
 * @brief Implementation of ImageValidator.
 */

#include "infrastructure/ImageValidator.hpp"
#include "domain/SizeLimitPolicy.hpp"
#include "infrastructure/PosixFile.hpp"

#include "stb_image.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace shotgate::infrastructure {

using domain::ImageArtifact;
using domain::ImageFormat;
using domain::ValidationOutcome;

namespace {

const std::string kPngSignature("\x89PNG\r\n\x1a\n", 8);
const std::string kPngTrailer("\x00\x00\x00\x00IEND\xae\x42\x60\x82", 12);
const std::string kJpegTrailer("\xff\xd9", 2);
const std::string kGifTrailer("\x3b", 1);

bool StartsWith(const std::string& bytes, const std::string& prefix) {
    return bytes.size() >= prefix.size() && bytes.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& bytes, const std::string& suffix) {
    return bytes.size() >= suffix.size()
        && bytes.compare(bytes.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FormatMegabytes(std::uintmax_t bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2fMB", static_cast<double>(bytes) / domain::kBytesPerMegabyte);
    return buffer;
}

std::string WithThousands(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(*it);
        ++count;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

ImageArtifact Reject(ImageArtifact artifact, ValidationOutcome outcome, const std::string& message) {
    artifact.outcome = outcome;
    artifact.message = message;
    return artifact;
}

std::string BombMessage(const std::string& name, int width, int height) {
    const std::uint64_t pixels = static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    return "Image dimensions too large: " + name + " (" + std::to_string(width) + "x" + std::to_string(height)
        + " = " + WithThousands(pixels) + " pixels exceeds limit of " + WithThousands(domain::kMaxImagePixels)
        + " pixels)";
}

} // namespace

ImageFormat ImageValidator::DetectFormat(const std::string& bytes) {
    if (StartsWith(bytes, kPngSignature)) return ImageFormat::Png;
    if (StartsWith(bytes, std::string("\xff\xd8\xff", 3))) return ImageFormat::Jpeg;
    if (StartsWith(bytes, "GIF87a") || StartsWith(bytes, "GIF89a")) return ImageFormat::Gif;
    return ImageFormat::Unknown;
}

std::string ImageValidator::DetectUnsupportedFormat(const std::string& bytes) {
    if (StartsWith(bytes, "BM")) return "BMP";
    if (bytes.size() >= 12 && StartsWith(bytes, "RIFF") && bytes.compare(8, 4, "WEBP") == 0) return "WEBP";
    if (StartsWith(bytes, std::string("II*\0", 4)) || StartsWith(bytes, std::string("MM\0*", 4))) return "TIFF";
    if (StartsWith(bytes, std::string("\0\0\1\0", 4))) return "ICO";
    if (StartsWith(bytes, "8BPS")) return "PSD";
    return "";
}

bool ImageValidator::HasExpectedTrailer(const std::string& bytes, ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return EndsWith(bytes, kPngTrailer);
        case ImageFormat::Jpeg: return EndsWith(bytes, kJpegTrailer);
        case ImageFormat::Gif: return EndsWith(bytes, kGifTrailer);
        case ImageFormat::Unknown: break;
    }
    return false;
}

ImageArtifact ImageValidator::Validate(const fs::path& path,
                                       std::optional<std::uintmax_t> fileSize,
                                       std::optional<std::uintmax_t> maxSizeBytes,
                                       bool followSymlinks) {
    std::string bytes;
    return ReadValidated(path, bytes, fileSize, maxSizeBytes, followSymlinks);
}

ImageArtifact ImageValidator::ReadValidated(const fs::path& path,
                                            std::string& bytes,
                                            std::optional<std::uintmax_t> fileSize,
                                            std::optional<std::uintmax_t> maxSizeBytes,
                                            bool followSymlinks) {
    bytes.clear();
    ImageArtifact artifact;
    artifact.filename = path.filename().string();
    const std::string& name = artifact.filename;

    // O_NONBLOCK so a FIFO planted under an image name cannot stall the open.
    int flags = O_RDONLY | O_CLOEXEC | O_NONBLOCK;
    if (!followSymlinks) {
        flags |= O_NOFOLLOW;
    }
    UniqueFd fd(::open(path.c_str(), flags));
    if (!fd.valid()) {
        return Reject(artifact, ValidationOutcome::Unreadable,
                      "Cannot read file: " + name + " (" + std::error_code(errno, std::generic_category()).message() + ")");
    }

    // 1. Size, before any decoding work.
    if (fileSize) {
        artifact.sizeBytes = *fileSize;
    } else {
        struct stat st {};
        if (::fstat(fd.get(), &st) != 0) {
            return Reject(artifact, ValidationOutcome::Unreadable,
                          "Cannot read file: " + name + " (" + std::error_code(errno, std::generic_category()).message() + ")");
        }
        if (!S_ISREG(st.st_mode)) {
            return Reject(artifact, ValidationOutcome::Unreadable, "Cannot read file: " + name + " (not a regular file)");
        }
        artifact.sizeBytes = static_cast<std::uintmax_t>(st.st_size);
    }

    const std::uintmax_t ceiling = std::min<std::uintmax_t>(maxSizeBytes.value_or(domain::kHardMaxFileSizeBytes),
                                                            domain::kHardMaxFileSizeBytes);
    if (artifact.sizeBytes > ceiling) {
        return Reject(artifact, ValidationOutcome::TooLarge,
                      "File too large: " + name + " (" + FormatMegabytes(artifact.sizeBytes)
                      + ", maximum: " + FormatMegabytes(ceiling) + ")");
    }

    const int readError = ReadAll(fd.get(), bytes, static_cast<std::size_t>(ceiling));
    if (readError != 0) {
        return Reject(artifact, ValidationOutcome::Unreadable,
                      "Cannot read file: " + name + " (" + std::error_code(readError, std::generic_category()).message() + ")");
    }
    if (bytes.size() > ceiling) {
        // Grew after the size check.
        return Reject(artifact, ValidationOutcome::TooLarge,
                      "File too large: " + name + " (more than " + FormatMegabytes(ceiling) + ")");
    }
    artifact.sizeBytes = bytes.size();

    // 2. Format from content.
    artifact.format = DetectFormat(bytes);
    if (artifact.format == ImageFormat::Unknown) {
        const std::string unsupported = DetectUnsupportedFormat(bytes);
        if (!unsupported.empty()) {
            return Reject(artifact, ValidationOutcome::UnsupportedFormat,
                          "Unsupported image format: " + unsupported + " (" + name + ")");
        }
        return Reject(artifact, ValidationOutcome::InvalidImage, "File is not a valid image: " + name);
    }

    const auto* data = reinterpret_cast<const stbi_uc*>(bytes.data());
    const int length = static_cast<int>(bytes.size());
    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(data, length, &width, &height, &channels) || width <= 0 || height <= 0) {
        return Reject(artifact, ValidationOutcome::InvalidImage, "File is not a valid image: " + name);
    }
    artifact.width = width;
    artifact.height = height;

    // 3. Pixel ceiling from the header, then a full decode.
    if (static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height) > domain::kMaxImagePixels) {
        return Reject(artifact, ValidationOutcome::DecompressionBomb, BombMessage(name, width, height));
    }

    stbi_uc* pixels = stbi_load_from_memory(data, length, &width, &height, &channels, 0);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        if (reason && std::string(reason).find("too large") != std::string::npos) {
            return Reject(artifact, ValidationOutcome::DecompressionBomb, BombMessage(name, artifact.width, artifact.height));
        }
        return Reject(artifact, ValidationOutcome::InvalidImage, "File is not a valid image: " + name);
    }
    stbi_image_free(pixels);

    // 4. Nothing may follow the logical end of the image.
    if (!HasExpectedTrailer(bytes, artifact.format)) {
        return Reject(artifact, ValidationOutcome::TrailingData, "File contains trailing data after image end: " + name);
    }

    artifact.outcome = ValidationOutcome::Valid;
    return artifact;
}

} // namespace shotgate::infrastructure
