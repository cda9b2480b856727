#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "infrastructure/ErrorSanitizer.hpp"

using shotgate::infrastructure::ErrorSanitizer;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestSanitizePath() {
    std::cout << "[Test] SanitizePath..." << std::endl;
    assert(ErrorSanitizer::SanitizePath("/home/alice/Pictures/latest.png") == "<...>/latest.png");
    assert(ErrorSanitizer::SanitizePath("/home/alice/Pictures/latest.png", false) == "<path>");
    assert(ErrorSanitizer::SanitizePath("relative/file.txt") == "<...>/file.txt");
    assert(ErrorSanitizer::SanitizePath("/") == "<path>");
    assert(ErrorSanitizer::SanitizePath("") == "<path>");
    assert(ErrorSanitizer::SanitizePath(".") == "<path>");
    assert(ErrorSanitizer::SanitizePath("..") == "<...>/..");
    assert(ErrorSanitizer::SanitizePath("/mnt/c/Users/alice/screenshots/") == "<...>/screenshots");
    assert(ErrorSanitizer::SanitizePath("C:\\Users\\Alice\\Documents\\secret.txt") == "<...>/secret.txt");
    assert(ErrorSanitizer::SanitizePath("C:\\") == "<path>");
}

void TestFormatFilesystemError() {
    std::cout << "[Test] FormatPathError(filesystem_error)..." << std::endl;
    const std::filesystem::path missing = "/home/alice/secret/latest.png";
    std::filesystem::filesystem_error error("stat", missing,
                                            std::make_error_code(std::errc::no_such_file_or_directory));

    const std::string shown = ErrorSanitizer::FormatPathError(error);
    assert(shown == "No such file or directory: <...>/latest.png");
    assert(!Contains(shown, "alice"));

    assert(ErrorSanitizer::FormatPathError(error, false) == "No such file or directory: <path>");

    std::filesystem::filesystem_error twoPaths("copy", "/a/b/src.png", "/c/d/dst.png",
                                               std::make_error_code(std::errc::permission_denied));
    assert(ErrorSanitizer::FormatPathError(twoPaths) == "Permission denied: <...>/src.png, <...>/dst.png");
}

void TestFormatErrno() {
    std::cout << "[Test] FormatPathError(errno)..." << std::endl;
    const std::string shown = ErrorSanitizer::FormatPathError(ENOENT, "/root/.ssh/id_rsa");
    assert(shown == "No such file or directory: <...>/id_rsa");
}

void TestFormatMessage() {
    std::cout << "[Test] FormatPathError(message)..." << std::endl;
    assert(ErrorSanitizer::FormatPathError(std::string("Symlinks are not allowed: /home/alice/.ssh/id_rsa"))
           == "Symlinks are not allowed: <...>/id_rsa");
    assert(ErrorSanitizer::FormatPathError(std::string("Wrapper: inner: /var/secret/data.txt"))
           == "Wrapper: <...>/data.txt");
    assert(ErrorSanitizer::FormatPathError(std::string("Plain failure: nothing to hide"))
           == "Plain failure: nothing to hide");
    assert(ErrorSanitizer::FormatPathError(std::string("no separators at all")) == "no separators at all");
}

void TestFormatMessageWithEmbeddedPaths() {
    std::cout << "[Test] FormatPathError(message) with paths mid-sentence..." << std::endl;
    assert(ErrorSanitizer::FormatPathError(std::string("Cannot open /home/alice/x.png: Permission denied"))
           == "Cannot open <...>/x.png: Permission denied");
    assert(ErrorSanitizer::FormatPathError(std::string("Copy of '/home/alice/a.png' (from /home/alice) failed"))
           == "Copy of '<...>/a.png' (from <...>/alice) failed");
    assert(ErrorSanitizer::FormatPathError(std::string("Cannot open /home/alice/x.png: /home/alice/y.png"))
           == "Cannot open <...>/x.png: <...>/y.png");

    const std::string windows = ErrorSanitizer::FormatPathError(std::string("Open C:\\Users\\Alice\\a.png, then retry"));
    assert(windows == "Open <...>/a.png, then retry");
    assert(!Contains(windows, "Alice"));

    assert(ErrorSanitizer::FormatPathError(std::string("Read failed: Input/output error"))
           == "Read failed: Input/output error");
    assert(ErrorSanitizer::FormatPathError(std::string("Cannot open ~/secret/x.png and/or ./local/y.png"))
           == "Cannot open <...>/x.png and/or <...>/y.png");

    // Already sanitized text passes through unchanged.
    assert(ErrorSanitizer::FormatPathError(std::string("Failed to copy <...>/a.png to <...>/b.png: denied"))
           == "Failed to copy <...>/a.png to <...>/b.png: denied");
}

void TestSanitizeErrorMessage() {
    std::cout << "[Test] SanitizeErrorMessage..." << std::endl;
    const std::string source = "/home/alice/Pictures/Screenshots";
    const std::string file = source + "/shot 1.png";
    const std::string message = "Failed to copy " + file + " from " + source + " (again: " + file + ")";

    const std::string clean = ErrorSanitizer::SanitizeErrorMessage(message, {source, file});
    assert(!Contains(clean, "/home"));
    assert(!Contains(clean, "alice"));
    assert(!Contains(clean, "Pictures"));
    assert(Contains(clean, "<...>/shot 1.png"));
    assert(Contains(clean, "<...>/Screenshots"));

    const std::string windows = "Cannot open C:\\Users\\Alice\\Desktop\\shot.png: denied";
    const std::string cleanWindows = ErrorSanitizer::SanitizeErrorMessage(windows, {"C:\\Users\\Alice\\Desktop\\shot.png"});
    assert(cleanWindows == "Cannot open <...>/shot.png: denied");

    // The same path may appear with the other platform's separators.
    const std::string mixed = "copy failed for \\home\\alice\\a.png";
    assert(ErrorSanitizer::SanitizeErrorMessage(mixed, {"/home/alice/a.png"}) == "copy failed for <...>/a.png");

    assert(ErrorSanitizer::SanitizeErrorMessage("untouched", {"", "/"}) == "untouched");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ErrorSanitizer Test..." << std::endl;

    TestSanitizePath();
    TestFormatFilesystemError();
    TestFormatErrno();
    TestFormatMessage();
    TestFormatMessageWithEmbeddedPaths();
    TestSanitizeErrorMessage();

    std::cout << "[PASS] ErrorSanitizer Test." << std::endl;
    return 0;
}
