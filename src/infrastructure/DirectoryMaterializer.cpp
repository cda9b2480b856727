/**
 * @file DirectoryMaterializer.cpp
 * @brief Implementation of DirectoryMaterializer.
 */

#include "infrastructure/DirectoryMaterializer.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/PosixFile.hpp"

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace shotgate::infrastructure {

using domain::SecurityError;

namespace {

struct AcceptedComponent {
    fs::path path;
    dev_t device;
    ino_t inode;
};

std::string Describe(const fs::path& path) {
    return ErrorSanitizer::SanitizePath(path.string());
}

void RevalidateAncestors(const std::vector<AcceptedComponent>& accepted) {
    for (const auto& ancestor : accepted) {
        struct stat st {};
        if (::lstat(ancestor.path.c_str(), &st) != 0) {
            throw SecurityError("Directory disappeared during creation: " + Describe(ancestor.path));
        }
        if (S_ISLNK(st.st_mode)) {
            throw SecurityError("Directory was replaced by a symlink: " + Describe(ancestor.path));
        }
        if (!S_ISDIR(st.st_mode) || st.st_dev != ancestor.device || st.st_ino != ancestor.inode) {
            throw SecurityError("Directory was replaced during creation: " + Describe(ancestor.path));
        }
    }
}

bool MeansSymlink(int err) {
    // ELOOP from O_NOFOLLOW; EOPNOTSUPP is what chmod on a link reports on Linux.
    return err == ELOOP || err == EOPNOTSUPP || err == ENOTDIR;
}

void HardenTarget(const AcceptedComponent& target, domain::SecureDirectory& result) {
    struct stat st {};
    if (::lstat(target.path.c_str(), &st) != 0) {
        throw SecurityError("Directory disappeared during creation: " + Describe(target.path));
    }
    if (S_ISLNK(st.st_mode)) {
        throw SecurityError("Directory was replaced by a symlink before permission change: " + Describe(target.path));
    }
    if ((st.st_mode & (S_IWGRP | S_IWOTH)) == 0) {
        return;
    }

    UniqueFd fd(::open(target.path.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.valid()) {
        const int err = errno;
        if (MeansSymlink(err)) {
            throw SecurityError("Directory was replaced by a symlink before permission change: " + Describe(target.path));
        }
        throw SecurityError("Cannot open directory to fix permissions: " + ErrorSanitizer::FormatPathError(err, target.path));
    }

    struct stat opened {};
    if (::fstat(fd.get(), &opened) != 0) {
        throw SecurityError("Cannot inspect directory: " + ErrorSanitizer::FormatPathError(errno, target.path));
    }
    if (opened.st_dev != target.device || opened.st_ino != target.inode) {
        throw SecurityError("Directory was replaced during creation: " + Describe(target.path));
    }

    const mode_t hardened = (opened.st_mode & 07777) & ~static_cast<mode_t>(S_IWGRP | S_IWOTH);
    if (::fchmod(fd.get(), hardened) != 0) {
        const int err = errno;
        if (MeansSymlink(err)) {
            throw SecurityError("Directory was replaced by a symlink before permission change: " + Describe(target.path));
        }
        throw SecurityError("Cannot fix directory permissions: " + ErrorSanitizer::FormatPathError(err, target.path));
    }
    result.permissionsHardened = true;
}

} // namespace

domain::SecureDirectory DirectoryMaterializer::Ensure(const fs::path& target,
                                                     mode_t mode,
                                                     bool hardenPermissions,
                                                     const MaterializerHooks& hooks) {
    if (!target.is_absolute()) {
        throw SecurityError("Directory path must be absolute: " + Describe(target));
    }
    fs::path normalized = target.lexically_normal();
    while (!normalized.has_filename() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }

    std::vector<fs::path> components;
    fs::path prefix;
    for (const auto& part : normalized) {
        if (part.empty()) {
            continue;
        }
        prefix = prefix.empty() ? part : prefix / part;
        components.push_back(prefix);
    }

    domain::SecureDirectory result;
    std::vector<AcceptedComponent> accepted;

    for (std::size_t i = 0; i < components.size(); ++i) {
        const fs::path& current = components[i];
        const bool isTarget = (i + 1 == components.size());
        bool created = false;

        struct stat st {};
        if (::lstat(current.c_str(), &st) != 0) {
            if (errno != ENOENT) {
                throw SecurityError("Cannot inspect directory: " + ErrorSanitizer::FormatPathError(errno, current));
            }
            if (::mkdir(current.c_str(), mode) == 0) {
                created = true;
            } else if (errno != EEXIST) {
                throw SecurityError("Cannot create directory: " + ErrorSanitizer::FormatPathError(errno, current));
            }
        }

        if (::lstat(current.c_str(), &st) != 0) {
            throw SecurityError("Directory disappeared during creation: " + Describe(current));
        }
        if (S_ISLNK(st.st_mode)) {
            throw SecurityError("Symlink detected in directory path: " + Describe(current));
        }
        if (!S_ISDIR(st.st_mode)) {
            throw SecurityError("Path component is not a directory: " + Describe(current));
        }
        if ((created || isTarget) && st.st_uid != ::geteuid()) {
            throw SecurityError("Directory is not owned by the current user: " + Describe(current));
        }

        RevalidateAncestors(accepted);

        accepted.push_back({current, st.st_dev, st.st_ino});
        if (created) {
            result.createdComponents.push_back(current);
        }
        if (hooks.afterAccept) {
            hooks.afterAccept(current);
        }
    }

    if (hardenPermissions && !accepted.empty()) {
        HardenTarget(accepted.back(), result);
    }

    result.path = normalized;
    return result;
}

} // namespace shotgate::infrastructure
