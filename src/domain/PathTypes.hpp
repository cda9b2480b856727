/**
 * @file PathTypes.hpp
 * @brief Value types produced by the path resolver and the directory materializer.
 */

#pragma once
#include <filesystem>
#include <vector>

namespace shotgate::domain {

/**
 * @struct ResolvedPath
 * @brief Absolute canonical path that had no symlink component and existed when
 * it was checked.
 *
 * This is a point-in-time claim. Nothing re-validates it later; callers that
 * need a fresh guarantee must resolve again.
 */
struct ResolvedPath {
    std::filesystem::path path;
};

/**
 * @struct SecureDirectory
 * @brief Directory verified to be a real directory owned by the current user,
 * without group/other write bits when hardening was requested.
 *
 * Returned by value and never cached.
 */
struct SecureDirectory {
    std::filesystem::path path;
    std::vector<std::filesystem::path> createdComponents; ///< Components created by this call.
    bool permissionsHardened = false;                     ///< True if group/other write bits were cleared.
};

} // namespace shotgate::domain
