/**
 * @file ConfigService.hpp
 * @brief Read-modify-write access to the user configuration.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/AppContext.hpp"
#include "domain/ConfigDocument.hpp"

namespace shotgate::application {

/**
 * @struct MigrationResult
 * @brief Outcome of migrate-config; error is set (sanitized) when the file could not be read.
 */
struct MigrationResult {
    bool migrated = false;
    std::vector<std::string> changes;
    nlohmann::json config;
    std::string error;
};

/**
 * @class ConfigService
 * @brief Setters validate a single field, then rewrite the whole document atomically.
 */
class ConfigService {
public:
    explicit ConfigService(AppContext context);

    /**
     * @brief Loads the document, printing loader warnings to stderr.
     */
    domain::ConfigDocument load(bool createIfMissing = true) const;

    /**
     * @brief Validates and stores one field by its on-disk name.
     * @throws domain::InvalidInputError for unknown fields or bad values.
     * @throws domain::NotFoundError / domain::SecurityError for bad directories.
     */
    domain::ConfigDocument updateField(const std::string& field, const nlohmann::json& value) const;

    void setDefaultSource(const std::string& directory) const;
    void setDefaultDestination(const std::string& directory) const;
    void setAutoStage(bool enabled) const;
    void setDefaultOutputFormat(const std::string& style) const;
    void setDefaultConvertTo(const std::string& format) const;
    void setSizeLimits(double maxFileSizeMb, double maxTotalSizeMb) const;

    /**
     * @brief Prompts for source, destination, auto-staging and output format.
     *
     * Each prompt shows the current value; an empty answer keeps it. Invalid
     * answers are reported and asked again. The document is written once, at
     * the end.
     * @throws domain::InvalidInputError if @p in ends before every question is answered.
     */
    domain::ConfigDocument configureInteractive(std::istream& in, std::ostream& out) const;

    /**
     * @brief Rewrites legacy values ("plain_text" output format) in place.
     * @param dryRun Report what would change without writing.
     */
    MigrationResult migrate(bool dryRun) const;

private:
    static std::string ResolveDirectory(const std::string& field, const std::string& value);
    static std::string Prompt(std::istream& in, std::ostream& out, const std::string& message, const std::string& current);

    AppContext m_context;
};

} // namespace shotgate::application
