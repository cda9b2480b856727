#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "infrastructure/PathResolver.hpp"
#include "test/TestSupport.hpp"

using namespace shotgate;
using infrastructure::PathResolver;
namespace fs = std::filesystem;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestPlainFileResolves(const fs::path& root) {
    std::cout << "[Test] Regular file resolves to its canonical path..." << std::endl;
    const fs::path file = root / "plain.png";
    test::WriteFile(file, "x");

    auto result = PathResolver::Resolve(file.string());
    assert(result.isSuccess());
    assert(result.value().path == fs::canonical(file));
    assert(result.value().path.is_absolute());
}

void TestLeafSymlinkRejected(const fs::path& root) {
    std::cout << "[Test] Symlinked leaf is rejected..." << std::endl;
    const fs::path target = root / "target.txt";
    test::WriteFile(target, "secret");
    const fs::path link = root / "link.png";
    fs::create_symlink(target, link);

    auto result = PathResolver::Resolve(link.string());
    assert(result.isError());
    assert(result.error() == domain::ErrorKind::SecurityViolation);
    assert(result.message() == "Symlinks are not allowed: <...>/link.png");
    assert(!Contains(result.message(), root.string()));

    bool threw = false;
    try {
        (void)result.value();
    } catch (const domain::SecurityError&) {
        threw = true;
    }
    assert(threw);

    // Dangling links are still links.
    const fs::path dangling = root / "dangling.png";
    fs::create_symlink(root / "nowhere", dangling);
    auto danglingResult = PathResolver::Resolve(dangling.string());
    assert(danglingResult.error() == domain::ErrorKind::SecurityViolation);
}

void TestAncestorSymlinkRejected(const fs::path& root) {
    std::cout << "[Test] Symlinked ancestor is rejected before the leaf is read..." << std::endl;
    const fs::path sshDir = root / "home" / "user" / ".ssh";
    fs::create_directories(sshDir);
    test::WriteFile(sshDir / "id_rsa", "PRIVATE KEY");

    const fs::path link = root / "link";
    fs::create_symlink(sshDir, link);

    auto result = PathResolver::Resolve((link / "id_rsa").string());
    assert(result.isError());
    assert(result.error() == domain::ErrorKind::SecurityViolation);
    assert(Contains(result.message(), "Path contains symlink"));
    assert(Contains(result.message(), "<...>/link"));
    assert(!Contains(result.message(), ".ssh"));

    // "link/../x" must not be normalized past the link.
    test::WriteFile(root / "sibling.png", "x");
    auto dotted = PathResolver::Resolve((link / ".." / "sibling.png").string());
    assert(dotted.error() == domain::ErrorKind::SecurityViolation);

    // Trailing separator on a symlinked directory.
    auto trailing = PathResolver::Resolve(link.string() + "/");
    assert(trailing.error() == domain::ErrorKind::SecurityViolation);
}

void TestBypass(const fs::path& root) {
    std::cout << "[Test] Explicit bypass follows symlinks..." << std::endl;
    const fs::path realDir = root / "real";
    fs::create_directories(realDir);
    test::WriteFile(realDir / "shot.png", "x");
    const fs::path link = root / "trusted";
    fs::create_symlink(realDir, link);

    auto result = PathResolver::Resolve((link / "shot.png").string(), false);
    assert(result.isSuccess());
    assert(result.value().path == fs::canonical(realDir / "shot.png"));
}

void TestMissing(const fs::path& root) {
    std::cout << "[Test] Missing path reports NotFound..." << std::endl;
    auto result = PathResolver::Resolve((root / "absent" / "file.png").string());
    assert(result.error() == domain::ErrorKind::NotFound);
    assert(result.message() == "No such file or directory: <...>/file.png");

    bool threw = false;
    try {
        (void)result.value();
    } catch (const domain::NotFoundError&) {
        threw = true;
    }
    assert(threw);

    assert(PathResolver::Resolve("").error() == domain::ErrorKind::NotFound);
}

void TestRelativeAndHome(const fs::path& root) {
    std::cout << "[Test] Relative and home-relative paths..." << std::endl;
    test::WriteFile(root / "rel.png", "x");

    const fs::path previous = fs::current_path();
    fs::current_path(root);
    auto relative = PathResolver::Resolve("rel.png");
    fs::current_path(previous);
    assert(relative.isSuccess());
    assert(relative.value().path == fs::canonical(root / "rel.png"));

    const char* oldHome = std::getenv("HOME");
    const std::string savedHome = oldHome ? oldHome : "";
    ::setenv("HOME", root.c_str(), 1);
    auto home = PathResolver::Resolve("~/rel.png");
    auto bareHome = PathResolver::Resolve("~");
    if (oldHome) {
        ::setenv("HOME", savedHome.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }
    assert(home.isSuccess());
    assert(home.value().path == fs::canonical(root / "rel.png"));
    assert(bareHome.isSuccess());
    assert(bareHome.value().path == fs::canonical(root));
}

} // namespace

int main() {
    std::cout << "[Test] Starting PathResolver Test..." << std::endl;
    test::TempDir sandbox("resolver");

    TestPlainFileResolves(sandbox.path());
    TestLeafSymlinkRejected(sandbox.path());
    TestAncestorSymlinkRejected(sandbox.path());
    TestBypass(sandbox.path());
    TestMissing(sandbox.path());
    TestRelativeAndHome(sandbox.path());

    std::cout << "[PASS] PathResolver Test." << std::endl;
    return 0;
}
