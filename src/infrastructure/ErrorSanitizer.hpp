/**
 * @file ErrorSanitizer.hpp
 * @brief Strips directory structure out of text headed for the console.
 *
 * Every function is pure. A path is reduced to "<...>/basename" (or the opaque
 * "<path>" when the basename is hidden or empty) so the user can still
 * recognize their file without learning usernames or layout.
 */

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace shotgate::infrastructure {

class ErrorSanitizer {
public:
    static constexpr const char* kOpaquePlaceholder = "<path>";
    static constexpr const char* kBasenamePrefix = "<...>/";

    /**
     * @brief Replaces a path with a placeholder, optionally keeping its last segment.
     * Accepts both '/' and '\\' separators. Trailing separators are ignored.
     */
    static std::string SanitizePath(const std::string& path, bool showBasename = true);

    /**
     * @brief Renders a filesystem_error as "<reason>: <sanitized path1>[, <sanitized path2>]".
     */
    static std::string FormatPathError(const std::filesystem::filesystem_error& error, bool showBasename = true);

    /**
     * @brief Renders an errno-style failure on @p path, keeping the reason text.
     */
    static std::string FormatPathError(const std::error_code& code, const std::filesystem::path& path, bool showBasename = true);
    static std::string FormatPathError(int errnum, const std::filesystem::path& path, bool showBasename = true);

    /**
     * @brief Sanitizes free text of the form "Reason: ...: /some/path".
     *
     * When the text after the last ": " looks like a path, the result is the
     * text before the first ": " followed by the sanitized tail. Any other
     * word that starts like a path ("Cannot open /a/b.png: denied") is
     * sanitized in place. Words such as "Input/output" are left alone.
     */
    static std::string FormatPathError(const std::string& message, bool showBasename = true);

    /**
     * @brief Sanitizes each whitespace-delimited word that starts like a path:
     * "/", "~/", "./", "../", a drive letter, or any word with a backslash.
     */
    static std::string SanitizeTokens(const std::string& text, bool showBasename = true);

    /**
     * @brief Replaces every literal occurrence of each sensitive path, in both
     * separator styles, with its sanitized form. Longest paths win.
     */
    static std::string SanitizeErrorMessage(const std::string& message,
                                            const std::vector<std::string>& sensitivePaths,
                                            bool showBasename = true);
};

} // namespace shotgate::infrastructure
