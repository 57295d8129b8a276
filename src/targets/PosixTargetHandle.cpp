/**
 * @file PosixTargetHandle.cpp
 * @brief Target handle over one or more POSIX file descriptors
 */

#include "targets/PosixTargetHandle.hpp"

#include "util/IoHelpers.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <format>

PosixTargetHandle::PosixTargetHandle(std::vector<Segment> segments)
    : segments_(std::move(segments)) {
    uint64_t start = 0;
    for (auto& segment : segments_) {
        segment.start = start;
        start += segment.length;
    }
    size_ = start;
}

template <typename Fn>
auto PosixTargetHandle::for_each_piece(uint64_t offset, size_t length, Fn&& fn)
    -> std::expected<void, util::Error> {
    if (offset > size_ || length > size_ - offset) {
        return std::unexpected(util::Error{
            util::ErrorKind::PermanentIO,
            std::format("range [{}, {}) beyond end of target ({} bytes)", offset,
                        offset + length, size_)});
    }

    // First segment whose end lies past offset
    auto it = std::upper_bound(segments_.begin(), segments_.end(), offset,
                               [](uint64_t value, const Segment& segment) {
                                   return value < segment.start + segment.length;
                               });

    size_t consumed = 0;
    while (consumed < length && it != segments_.end()) {
        const uint64_t position = offset + consumed;
        const uint64_t local = position - it->start;
        const auto piece =
            static_cast<size_t>(std::min<uint64_t>(it->length - local, length - consumed));
        if (piece > 0) {
            if (auto result = fn(*it, local, consumed, piece); !result) {
                return result;
            }
            consumed += piece;
        }
        ++it;
    }
    return {};
}

auto PosixTargetHandle::write_at(uint64_t offset, std::span<const uint8_t> data)
    -> std::expected<void, util::Error> {
    return for_each_piece(
        offset, data.size(),
        [&data](Segment& segment, uint64_t local, size_t consumed,
                size_t piece) -> std::expected<void, util::Error> {
            auto written = util::pwrite_all(segment.fd.get(), data.data() + consumed, piece, local);
            if (!written) {
                return std::unexpected(util::Error{
                    written.error().kind,
                    std::format("{}: {}", segment.path, written.error().message),
                    written.error().code});
            }
            segment.dirty = true;
            return {};
        });
}

auto PosixTargetHandle::read_at(uint64_t offset, std::span<uint8_t> out)
    -> std::expected<void, util::Error> {
    return for_each_piece(
        offset, out.size(),
        [&out](Segment& segment, uint64_t local, size_t consumed,
               size_t piece) -> std::expected<void, util::Error> {
            auto read = util::pread_all(segment.fd.get(), out.data() + consumed, piece, local);
            if (!read) {
                return std::unexpected(
                    util::Error{read.error().kind,
                                std::format("{}: {}", segment.path, read.error().message),
                                read.error().code});
            }
            return {};
        });
}

auto PosixTargetHandle::sync() -> std::expected<void, util::Error> {
    for (auto& segment : segments_) {
        if (!segment.dirty) {
            continue;
        }
        while (::fdatasync(segment.fd.get()) != 0) {
            if (errno != EINTR) {
                return std::unexpected(
                    util::io_error(std::format("fdatasync {}", segment.path), errno));
            }
        }
        segment.dirty = false;
    }
    return {};
}

auto PosixTargetHandle::size() const -> uint64_t {
    return size_;
}

auto PosixTargetHandle::close() -> std::expected<void, util::Error> {
    std::expected<void, util::Error> result;
    for (auto& segment : segments_) {
        if (segment.fd.close() != 0 && result) {
            result = std::unexpected(util::io_error(std::format("close {}", segment.path), errno));
        }
    }
    return result;
}
