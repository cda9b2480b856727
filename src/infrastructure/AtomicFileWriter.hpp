/**
 * @file AtomicFileWriter.hpp
 * @brief All-or-nothing replacement of small documents such as config.json.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

#include <nlohmann/json.hpp>

namespace shotgate::infrastructure {

/**
 * @struct DurabilityReport
 * @brief Non-fatal findings of a successful write.
 */
struct DurabilityReport {
    bool directorySynced = true;
    std::vector<std::string> warnings;
};

/**
 * @struct AtomicWriteHooks
 * @brief Test seam. beforeRename runs after the temp file is complete; if it
 * throws, the write is abandoned exactly as a crash before rename would be.
 * directorySync replaces fsync() of the parent directory and returns 0 or an
 * errno value.
 */
struct AtomicWriteHooks {
    std::function<void(const std::filesystem::path& tempPath)> beforeRename;
    std::function<int(int directoryFd)> directorySync;
};

/**
 * @class AtomicFileWriter
 * @brief Writes temp-in-same-directory, fsync, chmod, rename, then syncs the directory.
 *
 * A reader sees either the previous file or the new one, never a mix. The
 * parent directory is materialized first (0700, hardened). A target that is a
 * symlink, dangling or not, is refused before anything is touched.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Serializes @p document with 4-space indentation and writes it atomically.
     * @throws domain::SecurityError if the target is a symlink or the parent is unsafe.
     * @throws domain::PersistenceError if the document could not be put in place.
     */
    static DurabilityReport WriteJson(const std::filesystem::path& target,
                                      const nlohmann::json& document,
                                      mode_t mode = 0600,
                                      const AtomicWriteHooks& hooks = {});

    static DurabilityReport WriteText(const std::filesystem::path& target,
                                      const std::string& content,
                                      mode_t mode = 0600,
                                      const AtomicWriteHooks& hooks = {});
};

} // namespace shotgate::infrastructure
