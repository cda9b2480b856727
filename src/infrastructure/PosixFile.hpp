/**
 * @file PosixFile.hpp
 * @brief Thin RAII and I/O helpers over POSIX file descriptors.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace shotgate::infrastructure {

/**
 * @class UniqueFd
 * @brief Owns a file descriptor and closes it on destruction.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd();

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    /**
     * @brief Closes now so the caller can observe the result.
     * @return 0 on success, otherwise the errno of close().
     */
    int close();

private:
    int m_fd = -1;
};

/**
 * @brief Writes all of @p size bytes, retrying short writes and EINTR.
 * @return 0 on success, otherwise errno.
 */
int WriteAll(int fd, const char* data, std::size_t size);

/**
 * @brief Reads the whole descriptor into @p out, stopping after @p maxBytes + 1
 * bytes so callers can detect files that grew past a limit.
 * @return 0 on success, otherwise errno.
 */
int ReadAll(int fd, std::string& out, std::size_t maxBytes);

/**
 * @brief Writes @p content to a new file, failing if anything exists at @p destination.
 * @throws domain::PersistenceError
 */
void WriteFileExclusive(const std::filesystem::path& destination, const std::string& content);

} // namespace shotgate::infrastructure
