/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DirectoryMaterializer.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/PosixFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shotgate::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string OctalMode(mode_t mode) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%04o", static_cast<unsigned>(mode & 07777));
    return buffer;
}

void RemoveTemp(const fs::path& tempPath) {
    if (tempPath.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(tempPath, ec); // best effort
}

} // namespace

DurabilityReport AtomicFileWriter::WriteJson(const fs::path& target,
                                             const nlohmann::json& document,
                                             mode_t mode,
                                             const AtomicWriteHooks& hooks) {
    return WriteText(target, document.dump(4) + "\n", mode, hooks);
}

DurabilityReport AtomicFileWriter::WriteText(const fs::path& target,
                                             const std::string& content,
                                             mode_t mode,
                                             const AtomicWriteHooks& hooks) {
    DurabilityReport report;
    const std::string display = ErrorSanitizer::SanitizePath(target.string());

    // 1. Refuse a planted link before touching anything.
    struct stat existing {};
    bool targetExists = false;
    if (::lstat(target.c_str(), &existing) == 0) {
        if (S_ISLNK(existing.st_mode)) {
            throw domain::SecurityError("Config file is a symlink: " + display);
        }
        targetExists = true;
    } else if (errno != ENOENT) {
        throw domain::PersistenceError("Cannot inspect config file: " + ErrorSanitizer::FormatPathError(errno, target));
    }

    if (targetExists && (existing.st_mode & 077) != 0) {
        report.warnings.push_back("Config file had insecure permissions (" + OctalMode(existing.st_mode)
                                  + "); resetting to " + OctalMode(mode));
    }

    // 2. Parent must be safe; the temp file lives there so rename stays on one filesystem.
    fs::path parent = target.parent_path();
    if (parent.empty()) {
        parent = fs::current_path();
    }
    DirectoryMaterializer::Ensure(fs::absolute(parent), 0700, true);

    std::string pattern = (parent / ("." + target.filename().string() + "_XXXXXX.tmp")).string();
    fs::path tempPath;

    try {
        UniqueFd fd(::mkstemps(pattern.data(), 4));
        if (!fd.valid()) {
            throw domain::PersistenceError("Cannot create temporary file: " + ErrorSanitizer::FormatPathError(errno, parent));
        }
        tempPath = pattern;

        int err = WriteAll(fd.get(), content.data(), content.size());
        if (err != 0) {
            throw domain::PersistenceError("Cannot write temporary file: " + ErrorSanitizer::FormatPathError(err, tempPath));
        }
        if (::fsync(fd.get()) != 0) {
            throw domain::PersistenceError("Cannot sync temporary file: " + ErrorSanitizer::FormatPathError(errno, tempPath));
        }
        if (::fchmod(fd.get(), mode) != 0) {
            throw domain::PersistenceError("Cannot set permissions: " + ErrorSanitizer::FormatPathError(errno, tempPath));
        }
        err = fd.close();
        if (err != 0) {
            throw domain::PersistenceError("Cannot close temporary file: " + ErrorSanitizer::FormatPathError(err, tempPath));
        }

        if (hooks.beforeRename) {
            hooks.beforeRename(tempPath);
        }

        // 3. The only moment a reader can observe.
        if (::rename(tempPath.c_str(), target.c_str()) != 0) {
            throw domain::PersistenceError("Cannot replace config file: " + ErrorSanitizer::FormatPathError(errno, target));
        }
    } catch (const domain::ShotgateError&) {
        RemoveTemp(tempPath);
        throw;
    } catch (const std::exception& e) {
        RemoveTemp(tempPath);
        throw domain::PersistenceError("Failed to write config file " + display + ": "
                                       + ErrorSanitizer::FormatPathError(std::string(e.what())));
    }

    // 4. Best effort: persist the directory entry too.
    UniqueFd dirFd(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    int syncError = dirFd.valid() ? 0 : errno;
    if (syncError == 0) {
        if (hooks.directorySync) {
            syncError = hooks.directorySync(dirFd.get());
        } else if (::fsync(dirFd.get()) != 0) {
            syncError = errno;
        }
    }
    if (syncError != 0) {
        report.directorySynced = false;
        report.warnings.push_back("Could not sync config directory: " + ErrorSanitizer::FormatPathError(syncError, parent));
    }

    return report;
}

} // namespace shotgate::infrastructure
