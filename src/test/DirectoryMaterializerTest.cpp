#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "domain/Errors.hpp"
#include "infrastructure/DirectoryMaterializer.hpp"
#include "test/TestSupport.hpp"

using namespace shotgate;
using infrastructure::DirectoryMaterializer;
namespace fs = std::filesystem;

namespace {

struct stat Lstat(const fs::path& path) {
    struct stat st {};
    int rc = ::lstat(path.c_str(), &st);
    assert(rc == 0);
    (void)rc;
    return st;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestCreatesNestedDirectories(const fs::path& root) {
    std::cout << "[Test] Creates missing components owned by the caller..." << std::endl;
    const fs::path target = root / "a" / "b" / "c";

    domain::SecureDirectory dir = DirectoryMaterializer::Ensure(target);
    assert(dir.path == target);
    assert(dir.createdComponents.size() == 3);
    assert(dir.createdComponents.back() == target);

    for (const auto& created : dir.createdComponents) {
        struct stat st = Lstat(created);
        assert(S_ISDIR(st.st_mode));
        assert(st.st_uid == ::geteuid());
        assert((st.st_mode & (S_IWGRP | S_IWOTH)) == 0);
    }
}

void TestIdempotent(const fs::path& root) {
    std::cout << "[Test] Second call on a correct directory changes nothing..." << std::endl;
    const fs::path target = root / "idem";
    fs::create_directories(target);
    fs::permissions(target, fs::perms::all); // 0777

    domain::SecureDirectory first = DirectoryMaterializer::Ensure(target, 0700, true);
    assert(first.permissionsHardened);
    struct stat afterFirst = Lstat(target);
    assert((afterFirst.st_mode & (S_IWGRP | S_IWOTH)) == 0);
    assert((afterFirst.st_mode & 07777) == 0755);

    domain::SecureDirectory second = DirectoryMaterializer::Ensure(target, 0700, true);
    assert(!second.permissionsHardened);
    assert(second.createdComponents.empty());
    assert(second.path == first.path);
    struct stat afterSecond = Lstat(target);
    assert(afterSecond.st_mode == afterFirst.st_mode);
    assert(afterSecond.st_ino == afterFirst.st_ino);
}

void TestNoHardeningLeavesModes(const fs::path& root) {
    std::cout << "[Test] Hardening off leaves existing modes alone..." << std::endl;
    const fs::path target = root / "shared";
    fs::create_directories(target);
    fs::permissions(target, fs::perms::all);

    domain::SecureDirectory dir = DirectoryMaterializer::Ensure(target, 0700, false);
    assert(!dir.permissionsHardened);
    assert((Lstat(target).st_mode & 07777) == 0777);
}

void TestSymlinkComponentRejected(const fs::path& root) {
    std::cout << "[Test] Symlinked component is rejected..." << std::endl;
    const fs::path elsewhere = root / "elsewhere";
    fs::create_directories(elsewhere);
    const fs::path link = root / "planted";
    fs::create_symlink(elsewhere, link);

    bool threw = false;
    try {
        DirectoryMaterializer::Ensure(link / "images");
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(Contains(e.what(), "<...>/planted"));
        assert(!Contains(e.what(), root.string()));
    }
    assert(threw);
    assert(!fs::exists(elsewhere / "images"));

    threw = false;
    try {
        DirectoryMaterializer::Ensure(link);
    } catch (const domain::SecurityError&) {
        threw = true;
    }
    assert(threw);
}

void TestFileComponentRejected(const fs::path& root) {
    std::cout << "[Test] Regular file in the path is rejected..." << std::endl;
    const fs::path file = root / "not_a_dir";
    test::WriteFile(file, "x");

    bool threw = false;
    try {
        DirectoryMaterializer::Ensure(file / "child");
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(Contains(e.what(), "not a directory"));
    }
    assert(threw);
}

void TestRelativeRejected() {
    std::cout << "[Test] Relative target is rejected..." << std::endl;
    bool threw = false;
    try {
        DirectoryMaterializer::Ensure("relative/dir");
    } catch (const domain::SecurityError&) {
        threw = true;
    }
    assert(threw);
}

void TestAncestorSwappedForSymlinkMidWalk(const fs::path& root) {
    std::cout << "[Test] An accepted ancestor swapped for a symlink mid-walk is caught..." << std::endl;
    const fs::path swapped = root / "swap";
    const fs::path moved = root / "swap_moved";
    const fs::path target = swapped / "outer" / "inner";

    infrastructure::MaterializerHooks hooks;
    hooks.afterAccept = [&](const fs::path& accepted) {
        if (accepted == swapped / "outer") {
            fs::rename(swapped, moved);
            fs::create_directory_symlink(moved, swapped);
        }
    };

    bool threw = false;
    try {
        DirectoryMaterializer::Ensure(target, 0700, true, hooks);
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(Contains(e.what(), "Directory was replaced by a symlink: <...>/swap"));
        assert(!Contains(e.what(), root.string()));
    }
    assert(threw);
    assert(fs::is_symlink(swapped));
}

void TestAncestorReplacedMidWalk(const fs::path& root) {
    std::cout << "[Test] An accepted ancestor replaced by another directory is caught..." << std::endl;
    const fs::path replaced = root / "replaced";
    const fs::path target = replaced / "child";

    infrastructure::MaterializerHooks hooks;
    hooks.afterAccept = [&](const fs::path& accepted) {
        if (accepted == replaced) {
            fs::rename(replaced, root / "replaced_old");
            fs::create_directory(replaced);
        }
    };

    bool threw = false;
    try {
        DirectoryMaterializer::Ensure(target, 0700, true, hooks);
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(Contains(e.what(), "Directory was replaced during creation: <...>/replaced"));
    }
    assert(threw);
}

void TestForeignOwnerRejected(const fs::path& root) {
    // Ownership means st_uid == geteuid(). Platforms or filesystems with no
    // owning user are not supported; the check is never skipped there.
    std::cout << "[Test] Ownership is compared with the effective uid (POSIX owners only)." << std::endl;

    // Needs privileges to hand a directory to another user.
    if (::geteuid() != 0) {
        std::cout << "[Test] Foreign owner check skipped (not root); owned directories above still "
                     "assert st_uid == geteuid()." << std::endl;
        return;
    }
    std::cout << "[Test] Target owned by someone else is rejected..." << std::endl;
    const fs::path target = root / "foreign";
    fs::create_directories(target);
    int rc = ::chown(target.c_str(), 65534, 65534);
    assert(rc == 0);
    (void)rc;

    bool threw = false;
    try {
        DirectoryMaterializer::Ensure(target);
    } catch (const domain::SecurityError& e) {
        threw = true;
        assert(Contains(e.what(), "not owned"));
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting DirectoryMaterializer Test..." << std::endl;
    ::umask(022);
    test::TempDir sandbox("materializer");

    TestCreatesNestedDirectories(sandbox.path());
    TestIdempotent(sandbox.path());
    TestNoHardeningLeavesModes(sandbox.path());
    TestSymlinkComponentRejected(sandbox.path());
    TestFileComponentRejected(sandbox.path());
    TestRelativeRejected();
    TestAncestorSwappedForSymlinkMidWalk(sandbox.path());
    TestAncestorReplacedMidWalk(sandbox.path());
    TestForeignOwnerRejected(sandbox.path());

    std::cout << "[PASS] DirectoryMaterializer Test." << std::endl;
    return 0;
}
