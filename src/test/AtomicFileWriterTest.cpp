#include <cassert>
#include <cerrno>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "test/TestSupport.hpp"

using namespace shotgate;
using infrastructure::AtomicFileWriter;
using infrastructure::AtomicWriteHooks;
namespace fs = std::filesystem;

namespace {

mode_t ModeOf(const fs::path& path) {
    struct stat st {};
    int rc = ::stat(path.c_str(), &st);
    assert(rc == 0);
    (void)rc;
    return st.st_mode & 07777;
}

std::size_t CountTempFiles(const fs::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") ++count;
    }
    return count;
}

void TestRoundTrip(const fs::path& root) {
    std::cout << "[Test] Written document reads back identically..." << std::endl;
    const fs::path target = root / "cfg" / "config.json";
    const nlohmann::json doc = {
        {"default_source", "/mnt/c/Users/someone/Pictures"},
        {"auto_stage_enabled", true},
        {"default_convert_to", nullptr},
        {"max_file_size_mb", 25.5},
    };

    infrastructure::DurabilityReport report = AtomicFileWriter::WriteJson(target, doc);
    assert(report.directorySynced);

    const std::string text = test::ReadFile(target);
    assert(nlohmann::json::parse(text) == doc);
    assert(text == doc.dump(4) + "\n");
    assert(ModeOf(target) == 0600);
    assert((ModeOf(target.parent_path()) & 077) == 0);
    assert(CountTempFiles(target.parent_path()) == 0);
}

void TestInterruptedWriteKeepsPreviousGeneration(const fs::path& root) {
    std::cout << "[Test] Failure before rename leaves the previous file intact..." << std::endl;
    const fs::path target = root / "gen" / "config.json";
    const nlohmann::json first = {{"generation", 1}};
    AtomicFileWriter::WriteJson(target, first);

    AtomicWriteHooks hooks;
    fs::path seenTemp;
    hooks.beforeRename = [&](const fs::path& tempPath) {
        seenTemp = tempPath;
        assert(tempPath.parent_path() == target.parent_path());
        assert(tempPath.filename().string().rfind(".config.json_", 0) == 0);
        assert(fs::exists(tempPath));
        throw std::runtime_error("simulated crash at /private/var/tmp");
    };

    bool threw = false;
    try {
        AtomicFileWriter::WriteJson(target, {{"generation", 2}}, 0600, hooks);
    } catch (const domain::PersistenceError& e) {
        threw = true;
        assert(std::string(e.what()).find("/private") == std::string::npos);
    }
    assert(threw);
    assert(!seenTemp.empty());
    assert(!fs::exists(seenTemp));
    assert(nlohmann::json::parse(test::ReadFile(target)) == first);
    assert(CountTempFiles(target.parent_path()) == 0);
}

void TestDirectorySyncFailureIsAWarning(const fs::path& root) {
    std::cout << "[Test] Directory fsync failure is reported, the write still lands..." << std::endl;
    const fs::path target = root / "nosync" / "config.json";
    const nlohmann::json doc = {{"generation", 7}};

    AtomicWriteHooks hooks;
    int syncedFd = -1;
    hooks.directorySync = [&](int directoryFd) {
        syncedFd = directoryFd;
        return EIO;
    };

    infrastructure::DurabilityReport report = AtomicFileWriter::WriteJson(target, doc, 0600, hooks);
    assert(syncedFd >= 0);
    assert(!report.directorySynced);
    assert(report.warnings.size() == 1);
    assert(report.warnings[0] == "Could not sync config directory: Input/output error: <...>/nosync");
    assert(report.warnings[0].find(root.string()) == std::string::npos);
    assert(nlohmann::json::parse(test::ReadFile(target)) == doc);
    assert(CountTempFiles(target.parent_path()) == 0);
}

void TestSymlinkTargetRefused(const fs::path& root) {
    std::cout << "[Test] Symlinked target is refused before anything is written..." << std::endl;
    const fs::path dir = root / "links";
    fs::create_directories(dir);
    const fs::path victim = dir / "victim.txt";
    test::WriteFile(victim, "original");
    const fs::path target = dir / "config.json";
    fs::create_symlink(victim, target);

    bool threw = false;
    try {
        AtomicFileWriter::WriteJson(target, {{"a", 1}});
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(std::string(e.what()).find("Config file is a symlink") != std::string::npos);
    }
    assert(threw);
    assert(test::ReadFile(victim) == "original");
    assert(fs::is_symlink(target));

    const fs::path dangling = dir / "dangling.json";
    fs::create_symlink(dir / "does_not_exist.json", dangling);
    threw = false;
    try {
        AtomicFileWriter::WriteJson(dangling, {{"a", 1}});
    } catch (const domain::SecurityError&) {
        threw = true;
    }
    assert(threw);
    assert(!fs::exists(dir / "does_not_exist.json"));
    assert(CountTempFiles(dir) == 0);
}

void TestInsecurePermissionsRepaired(const fs::path& root) {
    std::cout << "[Test] Insecure existing mode is reported and reset..." << std::endl;
    const fs::path target = root / "perm" / "config.json";
    AtomicFileWriter::WriteJson(target, {{"a", 1}});
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write
                                | fs::perms::group_read | fs::perms::group_write
                                | fs::perms::others_read | fs::perms::others_write);
    assert(ModeOf(target) == 0666);

    infrastructure::DurabilityReport report = AtomicFileWriter::WriteJson(target, {{"a", 2}});
    assert(!report.warnings.empty());
    assert(report.warnings.front().find("insecure permissions (0666)") != std::string::npos);
    assert(ModeOf(target) == 0600);
}

} // namespace

int main() {
    std::cout << "[Test] Starting AtomicFileWriter Test..." << std::endl;
    test::TempDir sandbox("atomic");

    TestRoundTrip(sandbox.path());
    TestInterruptedWriteKeepsPreviousGeneration(sandbox.path());
    TestDirectorySyncFailureIsAWarning(sandbox.path());
    TestSymlinkTargetRefused(sandbox.path());
    TestInsecurePermissionsRepaired(sandbox.path());

    std::cout << "[PASS] AtomicFileWriter Test." << std::endl;
    return 0;
}
