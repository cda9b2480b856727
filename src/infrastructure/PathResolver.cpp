/**
 * @file PathResolver.cpp
 * @brief Implementation of PathResolver.
 */

#include "infrastructure/PathResolver.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/PathUtils.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace shotgate::infrastructure {

using domain::ErrorKind;
using domain::ResolvedPath;
using domain::Result;

namespace {

bool IsMissing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

Result<ResolvedPath> PathResolver::Resolve(const std::string& candidate, bool enforceSymlinkSafety) {
    if (candidate.empty()) {
        return {ErrorKind::NotFound, "No such file or directory: " + ErrorSanitizer::SanitizePath(candidate)};
    }

    fs::path absolute;
    try {
        absolute = PathUtils::MakeAbsolute(PathUtils::ExpandHome(candidate));
    } catch (const fs::filesystem_error& e) {
        return {ErrorKind::NotFound, ErrorSanitizer::FormatPathError(e)};
    }
    // "link/" would make lstat follow the link.
    while (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    const std::string display = ErrorSanitizer::SanitizePath(absolute.string());

    if (enforceSymlinkSafety) {
        std::error_code ec;

        // Leaf first: the common attack and the cheapest check.
        fs::file_status leaf = fs::symlink_status(absolute, ec);
        if (!ec && fs::is_symlink(leaf)) {
            return {ErrorKind::SecurityViolation, "Symlinks are not allowed: " + display};
        }
        if (ec && !IsMissing(ec)) {
            return {ErrorKind::SecurityViolation, "Cannot verify path: " + ErrorSanitizer::FormatPathError(ec, absolute)};
        }

        // Walk the path as written, "." and ".." included, so a ".." after a
        // link is never normalized away before the link is seen.
        std::vector<fs::path> ancestors;
        fs::path prefix;
        for (const auto& part : absolute) {
            if (part.empty()) {
                continue;
            }
            prefix = prefix.empty() ? part : prefix / part;
            ancestors.push_back(prefix);
        }
        if (!ancestors.empty()) {
            ancestors.pop_back(); // the leaf, already checked
        }

        for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
            const fs::path& component = *it;
            const std::string name = component.filename().string();
            if (name == "." || name == "..") {
                continue;
            }
            fs::file_status status = fs::symlink_status(component, ec);
            if (ec) {
                if (IsMissing(ec)) {
                    continue; // reported by the existence check below
                }
                return {ErrorKind::SecurityViolation, "Cannot verify path: " + ErrorSanitizer::FormatPathError(ec, component)};
            }
            if (fs::is_symlink(status)) {
                return {ErrorKind::SecurityViolation,
                        "Path contains symlink: " + ErrorSanitizer::SanitizePath(component.string())};
            }
        }
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(absolute, ec);
    if (ec) {
        if (IsMissing(ec)) {
            return {ErrorKind::NotFound, "No such file or directory: " + display};
        }
        return {ErrorKind::NotFound, ErrorSanitizer::FormatPathError(ec, absolute)};
    }

    return ResolvedPath{canonical};
}

} // namespace shotgate::infrastructure
