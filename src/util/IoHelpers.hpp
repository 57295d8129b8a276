/**
 * @file IoHelpers.hpp
 * @brief Whole-buffer read and write loops over file descriptors
 */

#pragma once

#include "util/Error.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <unistd.h>

namespace util {

/**
 * @brief Positional write of the whole buffer, retrying EINTR
 *
 * A short write that makes no progress is reported as TransientIO so the
 * caller's retry policy decides what happens next.
 */
inline auto pwrite_all(int fd, const void* buffer, size_t size, uint64_t offset)
    -> std::expected<void, Error> {
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::pwrite(fd, bytes + done, size - done,
                                     static_cast<off_t>(offset + done));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(io_error(std::format("pwrite at {}", offset + done), errno));
        }
        if (result == 0) {
            return std::unexpected(Error{ErrorKind::TransientIO,
                                         std::format("short write at {}", offset + done)});
        }
        done += static_cast<size_t>(result);
    }
    return {};
}

/**
 * @brief Positional read of exactly @p size bytes, retrying EINTR
 */
inline auto pread_all(int fd, void* buffer, size_t size, uint64_t offset)
    -> std::expected<void, Error> {
    auto* bytes = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::pread(fd, bytes + done, size - done,
                                    static_cast<off_t>(offset + done));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(io_error(std::format("pread at {}", offset + done), errno));
        }
        if (result == 0) {
            return std::unexpected(Error{ErrorKind::PermanentIO,
                                         std::format("unexpected end of target at {}",
                                                     offset + done)});
        }
        done += static_cast<size_t>(result);
    }
    return {};
}

/**
 * @brief Append the whole buffer to an O_APPEND descriptor, retrying EINTR
 */
inline auto write_all(int fd, const void* buffer, size_t size) -> std::expected<void, Error> {
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::write(fd, bytes + done, size - done);
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return std::unexpected(io_error("write", errno));
        }
        done += static_cast<size_t>(result);
    }
    return {};
}

}  // namespace util
