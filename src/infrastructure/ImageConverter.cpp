#include "infrastructure/ImageConverter.hpp"
#include "domain/ConfigDocument.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/PosixFile.hpp"

#include "stb_image.h"
#include "stb_image_write.h"

#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

namespace shotgate::infrastructure {

namespace {

void AppendToString(void* context, void* data, int size) {
    static_cast<std::string*>(context)->append(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

struct StbiDeleter {
    void operator()(stbi_uc* pixels) const { stbi_image_free(pixels); }
};

} // namespace

fs::path ImageConverter::Convert(const fs::path& source, const std::string& targetFormat) {
    auto target = domain::NormalizeConvertTarget(targetFormat);
    if (!target) {
        throw domain::InvalidInputError("Invalid conversion format: " + targetFormat + " (expected png or jpg)");
    }

    const std::string currentExt = domain::ToLower(source.extension().string());
    const bool alreadyJpeg = currentExt == ".jpg" || currentExt == ".jpeg";
    if ((*target == "png" && currentExt == ".png") || (*target == "jpg" && alreadyJpeg)) {
        return source;
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw domain::NotFoundError("Cannot read image for conversion: " + ErrorSanitizer::SanitizePath(source.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string bytes = buffer.str();

    const int wantChannels = (*target == "jpg") ? 3 : 0;
    int width = 0;
    int height = 0;
    int channels = 0;
    std::unique_ptr<stbi_uc, StbiDeleter> pixels(stbi_load_from_memory(
        reinterpret_cast<const stbi_uc*>(bytes.data()), static_cast<int>(bytes.size()),
        &width, &height, &channels, wantChannels));
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw domain::ValidationError("Failed to convert image " + ErrorSanitizer::SanitizePath(source.string())
                                      + ": " + (reason ? reason : "decode failed"));
    }
    const int outChannels = wantChannels ? wantChannels : channels;

    std::string encoded;
    int ok = 0;
    if (*target == "png") {
        ok = stbi_write_png_to_func(AppendToString, &encoded, width, height, outChannels,
                                    pixels.get(), width * outChannels);
    } else {
        ok = stbi_write_jpg_to_func(AppendToString, &encoded, width, height, outChannels,
                                    pixels.get(), kJpegQuality);
    }
    if (!ok) {
        throw domain::PersistenceError("Failed to encode image " + ErrorSanitizer::SanitizePath(source.string()));
    }

    fs::path output = source;
    output.replace_extension("." + *target);
    WriteFileExclusive(output, encoded);
    return output;
}

} // namespace shotgate::infrastructure
