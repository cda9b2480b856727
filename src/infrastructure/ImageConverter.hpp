/**
 * @file ImageConverter.hpp
 * @brief Re-encodes a copied screenshot as PNG or JPEG.
 */

#pragma once

#include <filesystem>
#include <string>

namespace shotgate::infrastructure {

class ImageConverter {
public:
    static constexpr int kJpegQuality = 95;

    /**
     * @brief Writes a converted copy of @p source next to it and returns its path.
     *
     * The target is "png" or "jpg" ("jpeg" accepted). Converting to the
     * format the file already has returns @p source unchanged. JPEG output
     * drops alpha; GIF input keeps only its first frame. The source file is
     * left in place.
     * @throws domain::InvalidInputError for an unsupported target.
     * @throws domain::ValidationError if the source cannot be decoded.
     * @throws domain::PersistenceError if the output cannot be written.
     */
    static std::filesystem::path Convert(const std::filesystem::path& source, const std::string& targetFormat);
};

} // namespace shotgate::infrastructure
