/**
 * @file PosixTargetHandle.hpp
 * @brief Target handle over one or more POSIX file descriptors
 */

#pragma once

#include "targets/ITargetHandle.hpp"
#include "util/FileDescriptor.hpp"

#include <string>
#include <vector>

/**
 * @class PosixTargetHandle
 * @brief Concatenates segments (files or a device) into one byte range
 *
 * A file, free-space placeholder or drive is a single segment; a directory
 * contributes one segment per regular file. Writes that cross a segment
 * boundary are split. sync() flushes every segment written since the
 * previous barrier.
 */
class PosixTargetHandle : public ITargetHandle {
public:
    struct Segment {
        std::string path;
        util::FileDescriptor fd;
        uint64_t start = 0;
        uint64_t length = 0;
        bool dirty = false;
    };

    explicit PosixTargetHandle(std::vector<Segment> segments);
    ~PosixTargetHandle() override = default;

    PosixTargetHandle(const PosixTargetHandle&) = delete;
    PosixTargetHandle& operator=(const PosixTargetHandle&) = delete;

    auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> override;
    auto read_at(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> override;
    auto sync() -> std::expected<void, util::Error> override;
    [[nodiscard]] auto size() const -> uint64_t override;
    auto close() -> std::expected<void, util::Error> override;

private:
    template <typename Fn>
    auto for_each_piece(uint64_t offset, size_t length, Fn&& fn)
        -> std::expected<void, util::Error>;

    std::vector<Segment> segments_;
    uint64_t size_ = 0;
};
