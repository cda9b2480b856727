/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ErrorSanitizer.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace shotgate::infrastructure {

namespace fs = std::filesystem;
namespace keys = domain::config_keys;

using domain::ConfigDocument;

namespace {

const char* const kKnownKeys[] = {
    keys::kDefaultSource,
    keys::kDefaultDestination,
    keys::kAutoStageEnabled,
    keys::kDefaultOutputFormat,
    keys::kDefaultConvertTo,
    keys::kMaxFileSizeMb,
    keys::kMaxTotalSizeMb,
};

bool IsKnownKey(const std::string& key) {
    for (const char* known : kKnownKeys) {
        if (key == known) return true;
    }
    return false;
}

// Whole numbers are written as integers so the file reads "50", not "50.0".
nlohmann::json MegabytesToJson(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return static_cast<long long>(value);
    }
    return value;
}

[[noreturn]] void WrongType(const char* key, const char* expected) {
    throw domain::ValidationError(std::string("Config key '") + key + "' must be " + expected);
}

void CheckSymlink(const fs::path& configPath) {
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(configPath, ec))) {
        throw domain::SecurityError("Config file is a symlink: " + ErrorSanitizer::SanitizePath(configPath.string()));
    }
}

fs::path MoveAside(const fs::path& configPath) {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path backup = configPath;
    backup += ".corrupt-" + std::to_string(now);
    for (int attempt = 1; fs::exists(fs::symlink_status(backup)); ++attempt) {
        backup = configPath;
        backup += ".corrupt-" + std::to_string(now) + "-" + std::to_string(attempt);
    }

    std::error_code ec;
    fs::rename(configPath, backup, ec);
    if (ec) {
        throw domain::PersistenceError("Cannot move invalid config aside: " + ErrorSanitizer::FormatPathError(ec, configPath));
    }
    return backup;
}

} // namespace

nlohmann::json ConfigLoader::ToJson(const ConfigDocument& document) {
    nlohmann::json j;
    j[keys::kDefaultSource] = document.defaultSource;
    j[keys::kDefaultDestination] = document.defaultDestination;
    j[keys::kAutoStageEnabled] = document.autoStageEnabled;
    j[keys::kDefaultOutputFormat] = domain::ToString(document.defaultOutputFormat);
    if (document.defaultConvertTo) {
        j[keys::kDefaultConvertTo] = *document.defaultConvertTo;
    } else {
        j[keys::kDefaultConvertTo] = nullptr;
    }
    j[keys::kMaxFileSizeMb] = MegabytesToJson(document.maxFileSizeMb);
    j[keys::kMaxTotalSizeMb] = MegabytesToJson(document.maxTotalSizeMb);
    return j;
}

ConfigDocument ConfigLoader::FromJson(const nlohmann::json& json, std::vector<std::string>& warnings) {
    if (!json.is_object()) {
        throw domain::ValidationError("Config document must be a JSON object");
    }

    ConfigDocument doc;
    for (const auto& [key, value] : json.items()) {
        if (!IsKnownKey(key)) {
            warnings.push_back("Ignoring unknown config key: " + key);
            continue;
        }

        if (key == keys::kDefaultSource || key == keys::kDefaultDestination) {
            if (!value.is_string()) WrongType(key.c_str(), "a string");
            (key == keys::kDefaultSource ? doc.defaultSource : doc.defaultDestination) = value.get<std::string>();
        } else if (key == keys::kAutoStageEnabled) {
            if (!value.is_boolean()) WrongType(key.c_str(), "true or false");
            doc.autoStageEnabled = value.get<bool>();
        } else if (key == keys::kDefaultOutputFormat) {
            if (!value.is_string()) WrongType(key.c_str(), "a string");
            const std::string text = value.get<std::string>();
            if (domain::ToLower(text) == "plain_text") {
                warnings.push_back("Config uses legacy output format 'plain_text'; run 'shotgate migrate-config'");
                doc.defaultOutputFormat = domain::OutputStyle::Text;
            } else if (auto style = domain::ParseOutputStyle(text)) {
                doc.defaultOutputFormat = *style;
            } else {
                WrongType(key.c_str(), "one of markdown, html, text");
            }
        } else if (key == keys::kDefaultConvertTo) {
            if (value.is_null()) {
                doc.defaultConvertTo.reset();
            } else if (!value.is_string()) {
                WrongType(key.c_str(), "a string or null");
            } else if (value.get<std::string>().empty()) {
                doc.defaultConvertTo.reset();
            } else if (auto target = domain::NormalizeConvertTarget(value.get<std::string>())) {
                doc.defaultConvertTo = *target;
            } else {
                WrongType(key.c_str(), "one of png, jpg or null");
            }
        } else {
            if (!value.is_number() || !std::isfinite(value.get<double>())) WrongType(key.c_str(), "a finite number");
            (key == keys::kMaxFileSizeMb ? doc.maxFileSizeMb : doc.maxTotalSizeMb) = value.get<double>();
        }
    }
    return doc;
}

nlohmann::json ConfigLoader::ReadRaw(const fs::path& configPath) {
    CheckSymlink(configPath);

    std::ifstream f(configPath, std::ios::binary);
    if (!f.is_open()) {
        throw domain::NotFoundError("Cannot read config: " + ErrorSanitizer::SanitizePath(configPath.string()));
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    try {
        return nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::ValidationError("Cannot read config " + ErrorSanitizer::SanitizePath(configPath.string())
                                      + ": invalid JSON at byte " + std::to_string(e.byte));
    }
}

ConfigLoadResult ConfigLoader::Load(const fs::path& configPath, bool createIfMissing) {
    ConfigLoadResult result;
    CheckSymlink(configPath);

    struct stat st {};
    if (::lstat(configPath.c_str(), &st) != 0) {
        if (createIfMissing) {
            DurabilityReport report = Save(configPath, result.document);
            result.warnings.insert(result.warnings.end(), report.warnings.begin(), report.warnings.end());
            result.created = true;
        }
        return result;
    }

    if ((st.st_mode & 077) != 0) {
        char mode[8];
        std::snprintf(mode, sizeof(mode), "%04o", static_cast<unsigned>(st.st_mode & 07777));
        result.warnings.push_back(std::string("Config file has insecure permissions (") + mode
                                  + "); it will be reset to 0600 on the next write");
    }

    try {
        result.document = FromJson(ReadRaw(configPath), result.warnings);
        return result;
    } catch (const domain::ValidationError& e) {
        result.backupPath = MoveAside(configPath);
        result.recovered = true;
        result.warnings.push_back(std::string("Config file was invalid (") + e.what() + "); moved aside to "
                                  + ErrorSanitizer::SanitizePath(result.backupPath.string()) + " and replaced with defaults");
    }

    result.document = ConfigDocument{};
    DurabilityReport report = Save(configPath, result.document);
    result.warnings.insert(result.warnings.end(), report.warnings.begin(), report.warnings.end());
    return result;
}

DurabilityReport ConfigLoader::Save(const fs::path& configPath, const ConfigDocument& document) {
    // JSON has no NaN or infinity; nlohmann would write null and the next Load would reject the file.
    if (!std::isfinite(document.maxFileSizeMb)) WrongType(keys::kMaxFileSizeMb, "a finite number");
    if (!std::isfinite(document.maxTotalSizeMb)) WrongType(keys::kMaxTotalSizeMb, "a finite number");
    return AtomicFileWriter::WriteJson(configPath, ToJson(document), 0600);
}

} // namespace shotgate::infrastructure
