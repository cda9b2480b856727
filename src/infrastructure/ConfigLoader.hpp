/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the user configuration (config.json).
 *
 * The document is validated once at load time against a fixed schema and
 * handed out as a typed ConfigDocument. A document that fails validation is
 * renamed aside and replaced with defaults; it is never deleted.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/ConfigDocument.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace shotgate::infrastructure {

/**
 * @struct ConfigLoadResult
 * @brief Loaded document plus anything the caller should tell the user.
 */
struct ConfigLoadResult {
    domain::ConfigDocument document;
    std::vector<std::string> warnings;
    bool created = false;    ///< No file existed; defaults were written.
    bool recovered = false;  ///< The file was invalid and moved aside.
    std::filesystem::path backupPath;
};

class ConfigLoader {
public:
    /**
     * @brief Loads and validates the document at @p configPath.
     * @param createIfMissing Write a defaults file when none exists.
     * @throws domain::SecurityError if the config path is a symlink.
     * @throws domain::PersistenceError if an invalid file cannot be moved aside.
     */
    static ConfigLoadResult Load(const std::filesystem::path& configPath, bool createIfMissing = true);

    /**
     * @brief Persists @p document through AtomicFileWriter with mode 0600.
     * @throws domain::ValidationError if a size limit is not finite; nothing is written.
     */
    static DurabilityReport Save(const std::filesystem::path& configPath, const domain::ConfigDocument& document);

    static nlohmann::json ToJson(const domain::ConfigDocument& document);

    /**
     * @brief Schema validation.
     * @param warnings Receives one entry per ignored unknown key and per legacy value.
     * @throws domain::ValidationError naming the first offending key.
     */
    static domain::ConfigDocument FromJson(const nlohmann::json& json, std::vector<std::string>& warnings);

    /**
     * @brief Reads and parses the file without schema validation.
     * @throws domain::SecurityError if the path is a symlink.
     * @throws domain::NotFoundError / domain::ValidationError with sanitized text.
     */
    static nlohmann::json ReadRaw(const std::filesystem::path& configPath);
};

} // namespace shotgate::infrastructure
