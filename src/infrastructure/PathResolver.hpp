/**
 * @file PathResolver.hpp
 * @brief Turns an untrusted path string into a verified, symlink-free absolute path.
 */

#pragma once

#include <string>
#include "domain/Errors.hpp"
#include "domain/PathTypes.hpp"

namespace shotgate::infrastructure {

/**
 * @class PathResolver
 * @brief Read-only resolution of user or config supplied paths.
 *
 * With enforcement on, the leaf is checked first, then every ancestor up to
 * the root, all without following links. Canonicalization only happens after
 * every component passed, so it can never traverse a symlink.
 *
 * Passing enforceSymlinkSafety = false is the trusted-path opt-out: symlinks
 * anywhere in the path are then followed silently. Only use it for paths the
 * user explicitly vouched for (the --allow-symlinks flag).
 */
class PathResolver {
public:
    /**
     * @brief Resolves @p candidate ("~" is expanded, relative paths are taken from the cwd).
     * @return The resolved path, or SecurityViolation / NotFound with a sanitized message.
     */
    static domain::Result<domain::ResolvedPath> Resolve(const std::string& candidate,
                                                        bool enforceSymlinkSafety = true);
};

} // namespace shotgate::infrastructure
