/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Target handles, the checkpoint log and the verifier all hold raw
 * descriptors through this wrapper so that every early return closes them.
 */

#pragma once

#include <unistd.h>

#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief RAII wrapper for POSIX file descriptors
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Construct from raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and take ownership of another
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Close explicitly and report the result
     * @return 0 on success, -1 with errno set on failure
     */
    auto close() noexcept -> int {
        if (!is_valid()) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }

private:
    int fd_ = -1;
};

}  // namespace util
