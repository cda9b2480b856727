/**
 * @file ConfigDocument.hpp
 * @brief Typed view of the user's config.json.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace shotgate::domain {

/**
 * @enum OutputStyle
 * @brief How copied files are reported on stdout.
 */
enum class OutputStyle {
    Markdown,
    Html,
    Text
};

inline const char* ToString(OutputStyle style) {
    switch (style) {
        case OutputStyle::Markdown: return "markdown";
        case OutputStyle::Html: return "html";
        case OutputStyle::Text: return "text";
    }
    return "markdown";
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

/**
 * @brief Case-insensitive parse; nullopt for anything outside the fixed set.
 */
inline std::optional<OutputStyle> ParseOutputStyle(const std::string& text) {
    const std::string lower = ToLower(text);
    if (lower == "markdown") return OutputStyle::Markdown;
    if (lower == "html") return OutputStyle::Html;
    if (lower == "text") return OutputStyle::Text;
    return std::nullopt;
}

/**
 * @brief Normalizes a conversion target ("png", "jpg"; "jpeg" maps to "jpg").
 * @return nullopt when the target is not supported.
 */
inline std::optional<std::string> NormalizeConvertTarget(const std::string& text) {
    const std::string lower = ToLower(text);
    if (lower == "png") return std::string("png");
    if (lower == "jpg" || lower == "jpeg") return std::string("jpg");
    return std::nullopt;
}

/**
 * @struct ConfigDocument
 * @brief Fixed schema with a default for every key.
 *
 * Size values are kept as read; SizeLimitResolver clamps them.
 */
struct ConfigDocument {
    std::string defaultSource;
    std::string defaultDestination;
    bool autoStageEnabled = false;
    OutputStyle defaultOutputFormat = OutputStyle::Markdown;
    std::optional<std::string> defaultConvertTo;
    double maxFileSizeMb = 50;
    double maxTotalSizeMb = 200;

    bool operator==(const ConfigDocument& other) const {
        return defaultSource == other.defaultSource
            && defaultDestination == other.defaultDestination
            && autoStageEnabled == other.autoStageEnabled
            && defaultOutputFormat == other.defaultOutputFormat
            && defaultConvertTo == other.defaultConvertTo
            && maxFileSizeMb == other.maxFileSizeMb
            && maxTotalSizeMb == other.maxTotalSizeMb;
    }
    bool operator!=(const ConfigDocument& other) const { return !(*this == other); }
};

namespace config_keys {
constexpr const char* kDefaultSource = "default_source";
constexpr const char* kDefaultDestination = "default_destination";
constexpr const char* kAutoStageEnabled = "auto_stage_enabled";
constexpr const char* kDefaultOutputFormat = "default_output_format";
constexpr const char* kDefaultConvertTo = "default_convert_to";
constexpr const char* kMaxFileSizeMb = "max_file_size_mb";
constexpr const char* kMaxTotalSizeMb = "max_total_size_mb";
} // namespace config_keys

} // namespace shotgate::domain
