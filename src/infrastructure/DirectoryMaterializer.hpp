/**
 * @file DirectoryMaterializer.hpp
 * @brief Race-aware creation of directories that must not be redirected by symlinks.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <sys/types.h>
#include "domain/PathTypes.hpp"

namespace shotgate::infrastructure {

/**
 * @struct MaterializerHooks
 * @brief Test seam. afterAccept runs once a component has passed its checks,
 * before the next component is looked at.
 */
struct MaterializerHooks {
    std::function<void(const std::filesystem::path& accepted)> afterAccept;
};

/**
 * @class DirectoryMaterializer
 * @brief Creates a directory and its missing ancestors, verifying each step.
 *
 * For every component, root to leaf: lstat, mkdir if absent (EEXIST from a
 * concurrent creator is fine), lstat again and reject symlinks, non
 * directories and, for newly created components and the target, foreign
 * owners. Every previously accepted ancestor is re-checked on the same pass
 * (same device and inode, still a real directory) so a swap behind our back
 * is caught. Group/other write bits on the target are cleared through an
 * O_NOFOLLOW descriptor only after re-checking its identity.
 *
 * Ownership is compared against geteuid(). This code targets POSIX systems;
 * there is no fallback for filesystems without an owning user.
 */
class DirectoryMaterializer {
public:
    /**
     * @brief Ensures @p target exists as a secure directory.
     * @param target Absolute directory path.
     * @param mode Permission bits for directories created by this call.
     * @param hardenPermissions Clear group/other write bits on the target.
     * @throws domain::SecurityError on any violation; the message is sanitized.
     */
    static domain::SecureDirectory Ensure(const std::filesystem::path& target,
                                          mode_t mode = 0700,
                                          bool hardenPermissions = true,
                                          const MaterializerHooks& hooks = {});
};

} // namespace shotgate::infrastructure
