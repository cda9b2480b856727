// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace shotgate::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetConfigPath();

    /**
     * @brief Expands a leading "~" or "~/" using $HOME. Other forms ("~user") are
     * returned untouched.
     */
    static std::filesystem::path ExpandHome(const std::string& path);

    /**
     * @brief Makes @p path absolute against the working directory without
     * touching the filesystem (no symlink is followed).
     */
    static std::filesystem::path MakeAbsolute(const std::filesystem::path& path);
};

} // namespace shotgate::infrastructure
