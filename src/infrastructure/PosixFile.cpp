/**
 * @file PosixFile.cpp
 * @brief Implementation of the descriptor helpers.
 */

#include "infrastructure/PosixFile.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ErrorSanitizer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shotgate::infrastructure {

namespace fs = std::filesystem;

UniqueFd::~UniqueFd() {
    close();
}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

int UniqueFd::close() {
    if (m_fd < 0) {
        return 0;
    }
    int result = ::close(m_fd);
    m_fd = -1;
    return result == 0 ? 0 : errno;
}

int WriteAll(int fd, const char* data, std::size_t size) {
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        written += static_cast<std::size_t>(n);
    }
    return 0;
}

int ReadAll(int fd, std::string& out, std::size_t maxBytes) {
    out.clear();
    char buffer[64 * 1024];
    while (out.size() <= maxBytes) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) break;
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return 0;
}

namespace {

UniqueFd CreateExclusive(const fs::path& destination) {
    return UniqueFd(::open(destination.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644));
}

} // namespace

void WriteFileExclusive(const fs::path& destination, const std::string& content) {
    UniqueFd out = CreateExclusive(destination);
    if (!out.valid()) {
        throw domain::PersistenceError("Cannot create file: " + ErrorSanitizer::FormatPathError(errno, destination));
    }
    int err = WriteAll(out.get(), content.data(), content.size());
    if (err == 0) {
        err = out.close();
    }
    if (err != 0) {
        out.close();
        ::unlink(destination.c_str());
        throw domain::PersistenceError("Cannot write file: " + ErrorSanitizer::FormatPathError(err, destination));
    }
}

} // namespace shotgate::infrastructure
