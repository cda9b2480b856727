/**
 * @file OutputFormatter.hpp
 * @brief Renders copied file paths as markdown, HTML or plain text.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/ConfigDocument.hpp"

namespace shotgate::application {

class OutputFormatter {
public:
    /**
     * @brief Case-insensitive parse of a user-supplied style.
     *
     * The legacy name "plain_text" is still accepted as text, with a
     * deprecation warning on stderr.
     * @throws domain::InvalidInputError with a "Did you mean" hint when one is close.
     */
    static domain::OutputStyle ParseStyle(const std::string& text);

    /**
     * @brief Closest valid style name, or empty when nothing is close.
     */
    static std::string SuggestFormat(const std::string& text);

    /**
     * @brief One output line for @p path.
     * @param repoRelative The path is relative to the git root and gets a leading "/".
     */
    static std::string FormatPath(domain::OutputStyle style, const std::filesystem::path& path, bool repoRelative);
};

} // namespace shotgate::application
