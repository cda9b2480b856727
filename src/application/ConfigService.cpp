/**
 * @file ConfigService.cpp
 * @brief Implementation of ConfigService.
 */

#include "application/ConfigService.hpp"
#include "application/OutputFormatter.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/PathResolver.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <istream>
#include <ostream>
#include <utility>

namespace shotgate::application {

namespace fs = std::filesystem;
namespace keys = domain::config_keys;

using infrastructure::ConfigLoader;
using infrastructure::ErrorSanitizer;

namespace {

void PrintWarnings(const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        std::cerr << "[ConfigService] Warning: " << warning << std::endl;
    }
}

} // namespace

ConfigService::ConfigService(AppContext context)
    : m_context(std::move(context)) {}

domain::ConfigDocument ConfigService::load(bool createIfMissing) const {
    infrastructure::ConfigLoadResult result = ConfigLoader::Load(m_context.configPath, createIfMissing);
    PrintWarnings(result.warnings);
    return result.document;
}

std::string ConfigService::ResolveDirectory(const std::string& field, const std::string& value) {
    if (value.empty()) {
        return value;
    }
    auto resolved = infrastructure::PathResolver::Resolve(value);
    const fs::path& path = resolved.value().path;
    if (!fs::is_directory(path)) {
        throw domain::InvalidInputError("Value for " + field + " is not a directory: "
                                        + ErrorSanitizer::SanitizePath(path.string()));
    }
    return path.string();
}

domain::ConfigDocument ConfigService::updateField(const std::string& field, const nlohmann::json& value) const {
    domain::ConfigDocument doc = load();

    if (field == keys::kDefaultSource || field == keys::kDefaultDestination) {
        if (!value.is_string()) {
            throw domain::InvalidInputError("Value for " + field + " must be a directory path");
        }
        std::string resolved = ResolveDirectory(field, value.get<std::string>());
        (field == keys::kDefaultSource ? doc.defaultSource : doc.defaultDestination) = resolved;
    } else if (field == keys::kAutoStageEnabled) {
        if (!value.is_boolean()) {
            throw domain::InvalidInputError("Value for " + field + " must be true or false");
        }
        doc.autoStageEnabled = value.get<bool>();
    } else if (field == keys::kDefaultOutputFormat) {
        if (!value.is_string()) {
            throw domain::InvalidInputError("Value for " + field + " must be a string");
        }
        doc.defaultOutputFormat = OutputFormatter::ParseStyle(value.get<std::string>());
    } else if (field == keys::kDefaultConvertTo) {
        if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
            doc.defaultConvertTo.reset();
        } else if (!value.is_string()) {
            throw domain::InvalidInputError("Value for " + field + " must be a string or null");
        } else if (auto target = domain::NormalizeConvertTarget(value.get<std::string>())) {
            doc.defaultConvertTo = *target;
        } else {
            throw domain::InvalidInputError("Invalid conversion format: " + value.get<std::string>()
                                            + ". Valid options: png, jpg.");
        }
    } else if (field == keys::kMaxFileSizeMb || field == keys::kMaxTotalSizeMb) {
        if (!value.is_number() || !std::isfinite(value.get<double>())) {
            throw domain::InvalidInputError("Value for " + field + " must be a finite number");
        }
        (field == keys::kMaxFileSizeMb ? doc.maxFileSizeMb : doc.maxTotalSizeMb) = value.get<double>();
    } else {
        throw domain::InvalidInputError("Unknown config field: " + field);
    }

    PrintWarnings(ConfigLoader::Save(m_context.configPath, doc).warnings);
    return doc;
}

void ConfigService::setDefaultSource(const std::string& directory) const {
    updateField(keys::kDefaultSource, directory);
}

void ConfigService::setDefaultDestination(const std::string& directory) const {
    updateField(keys::kDefaultDestination, directory);
}

void ConfigService::setAutoStage(bool enabled) const {
    updateField(keys::kAutoStageEnabled, enabled);
}

void ConfigService::setDefaultOutputFormat(const std::string& style) const {
    updateField(keys::kDefaultOutputFormat, style);
}

void ConfigService::setDefaultConvertTo(const std::string& format) const {
    updateField(keys::kDefaultConvertTo, format);
}

void ConfigService::setSizeLimits(double maxFileSizeMb, double maxTotalSizeMb) const {
    updateField(keys::kMaxFileSizeMb, maxFileSizeMb);
    updateField(keys::kMaxTotalSizeMb, maxTotalSizeMb);
}

std::string ConfigService::Prompt(std::istream& in, std::ostream& out,
                                  const std::string& message, const std::string& current) {
    out << message << " [" << current << "]: " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << std::endl;
        throw domain::InvalidInputError("Configuration aborted: no more input");
    }
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return current;
    }
    const auto last = line.find_last_not_of(" \t\r");
    return line.substr(first, last - first + 1);
}

domain::ConfigDocument ConfigService::configureInteractive(std::istream& in, std::ostream& out) const {
    std::error_code ec;
    const bool existed = fs::exists(fs::symlink_status(m_context.configPath, ec));
    domain::ConfigDocument doc = load(false);

    out << (existed ? "Updating the configuration file..." : "Creating the configuration file...") << "\n" << std::endl;

    const std::pair<const char*, const char*> directoryFields[] = {
        {keys::kDefaultSource, "Enter the path for the default source directory"},
        {keys::kDefaultDestination, "Enter the path for the default destination directory"},
    };
    for (const auto& [field, message] : directoryFields) {
        std::string& slot = (std::string(field) == keys::kDefaultSource) ? doc.defaultSource : doc.defaultDestination;
        while (true) {
            const std::string answer = Prompt(in, out, message, slot);
            if (answer == slot) {
                break;
            }
            try {
                slot = ResolveDirectory(field, answer);
                break;
            } catch (const domain::ShotgateError& e) {
                out << "Invalid " << field << ": " << e.what() << std::endl;
            }
        }
    }

    while (true) {
        const std::string answer = domain::ToLower(Prompt(in, out,
            "Automatically stage screenshots when copying to a git repository? (y/n)",
            doc.autoStageEnabled ? "y" : "n"));
        if (answer == "y" || answer == "yes" || answer == "true") {
            doc.autoStageEnabled = true;
            break;
        }
        if (answer == "n" || answer == "no" || answer == "false") {
            doc.autoStageEnabled = false;
            break;
        }
        out << "Please answer y or n." << std::endl;
    }

    while (true) {
        const std::string answer = Prompt(in, out, "Enter the default output format (markdown, html, text)",
                                          domain::ToString(doc.defaultOutputFormat));
        try {
            doc.defaultOutputFormat = OutputFormatter::ParseStyle(answer);
            break;
        } catch (const domain::InvalidInputError& e) {
            out << e.what() << std::endl;
        }
    }

    PrintWarnings(ConfigLoader::Save(m_context.configPath, doc).warnings);
    out << (existed ? "Configuration file updated" : "Configuration file created") << std::endl;
    return doc;
}

MigrationResult ConfigService::migrate(bool dryRun) const {
    MigrationResult result;
    try {
        result.config = ConfigLoader::ReadRaw(m_context.configPath);
    } catch (const domain::SecurityError&) {
        throw;
    } catch (const domain::ShotgateError& e) {
        result.error = e.what();
        return result;
    }
    if (!result.config.is_object()) {
        result.error = "Cannot read config " + ErrorSanitizer::SanitizePath(m_context.configPath.string())
                     + ": not a JSON object";
        return result;
    }

    auto it = result.config.find(keys::kDefaultOutputFormat);
    if (it != result.config.end() && it->is_string()) {
        const std::string current = it->get<std::string>();
        if (domain::ToLower(current) == "plain_text") {
            *it = "text";
            result.changes.push_back(std::string(keys::kDefaultOutputFormat) + ": '" + current + "' -> 'text'");
        }
    }

    result.migrated = !result.changes.empty();
    if (result.migrated && !dryRun) {
        PrintWarnings(infrastructure::AtomicFileWriter::WriteJson(m_context.configPath, result.config).warnings);
    }
    return result;
}

} // namespace shotgate::application
