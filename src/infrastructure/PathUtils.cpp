#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace shotgate::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetConfigPath() {
    return GetConfigHome() / "shotgate" / "config.json";
}

fs::path PathUtils::ExpandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fs::path(path);
    }
    if (path.size() <= 2) {
        return fs::path(home);
    }
    return fs::path(home) / path.substr(2);
}

fs::path PathUtils::MakeAbsolute(const fs::path& path) {
    if (path.is_absolute()) {
        return path;
    }
    return fs::current_path() / path;
}

} // namespace shotgate::infrastructure
