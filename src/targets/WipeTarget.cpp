/**
 * @file WipeTarget.cpp
 * @brief Per-variant target capabilities
 */

#include "targets/WipeTarget.hpp"

#include "targets/PosixTargetHandle.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <linux/fs.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <random>
#include <type_traits>

namespace targets {

namespace {

constexpr uint64_t PLACEHOLDER_ALIGNMENT = 4096;

auto target_changed(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::TargetChanged, std::move(message)});
}

auto stat_path(const std::string& path, struct stat& st) -> std::expected<void, util::Error> {
    if (::stat(path.c_str(), &st) != 0) {
        return std::unexpected(util::io_error(std::format("stat {}", path), errno));
    }
    return {};
}

auto block_device_size(int fd, const std::string& path) -> std::expected<uint64_t, util::Error> {
    uint64_t size = 0;
    if (::ioctl(fd, BLKGETSIZE64, &size) == -1) {
        return std::unexpected(util::io_error(std::format("BLKGETSIZE64 {}", path), errno));
    }
    return size;
}

auto open_fd(const std::string& path, int flags, mode_t mode = 0)
    -> std::expected<util::FileDescriptor, util::Error> {
    util::FileDescriptor fd(::open(path.c_str(), flags | O_CLOEXEC, mode));
    if (!fd) {
        return std::unexpected(util::io_error(std::format("open {}", path), errno));
    }
    return fd;
}

auto file_size(const std::string& path) -> std::expected<uint64_t, util::Error> {
    struct stat st{};
    if (auto ok = stat_path(path, st); !ok) {
        return std::unexpected(ok.error());
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("{} is not a regular file", path)});
    }
    return static_cast<uint64_t>(st.st_size);
}

auto directory_size(const std::string& path) -> std::expected<uint64_t, util::Error> {
    auto files = list_directory_files(path);
    if (!files) {
        return std::unexpected(files.error());
    }
    uint64_t total = 0;
    for (const auto& file : *files) {
        auto size = file_size(file.string());
        if (!size) {
            return std::unexpected(size.error());
        }
        total += *size;
    }
    return total;
}

auto drive_size(const std::string& device) -> std::expected<uint64_t, util::Error> {
    auto fd = open_fd(device, O_RDONLY);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(util::io_error(std::format("fstat {}", device), errno));
    }
    if (!S_ISBLK(st.st_mode)) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("{} is not a block device", device)});
    }
    return block_device_size(fd->get(), device);
}

auto free_space_size(const std::string& volume, uint64_t reserve_bytes)
    -> std::expected<uint64_t, util::Error> {
    struct statvfs vfs{};
    if (::statvfs(volume.c_str(), &vfs) != 0) {
        return std::unexpected(util::io_error(std::format("statvfs {}", volume), errno));
    }
    const uint64_t available = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    if (available <= reserve_bytes + PLACEHOLDER_ALIGNMENT) {
        return std::unexpected(util::Error{
            util::ErrorKind::InvalidArgument,
            std::format("{} has only {} bytes free, {} must stay reserved", volume, available,
                        reserve_bytes)});
    }
    return (available - reserve_bytes) / PLACEHOLDER_ALIGNMENT * PLACEHOLDER_ALIGNMENT;
}

auto check_size(const JobRecord& job, uint64_t actual) -> std::expected<void, util::Error> {
    if (actual != job.target_size) {
        return target_changed(std::format("{} changed size: recorded {} bytes, now {} bytes",
                                          target_location(job.target), job.target_size, actual));
    }
    return {};
}

auto single_segment(std::string path, util::FileDescriptor fd, uint64_t length)
    -> std::unique_ptr<ITargetHandle> {
    std::vector<PosixTargetHandle::Segment> segments;
    segments.push_back(PosixTargetHandle::Segment{
        .path = std::move(path), .fd = std::move(fd), .start = 0, .length = length, .dirty = false});
    return std::make_unique<PosixTargetHandle>(std::move(segments));
}

auto open_file(const JobRecord& job, const FileTarget& target)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    auto fd = open_fd(target.path, O_RDWR | O_NOFOLLOW);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(util::io_error(std::format("fstat {}", target.path), errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return target_changed(std::format("{} is no longer a regular file", target.path));
    }
    if (auto ok = check_size(job, static_cast<uint64_t>(st.st_size)); !ok) {
        return std::unexpected(ok.error());
    }
    return single_segment(target.path, std::move(*fd), job.target_size);
}

auto open_directory(const JobRecord& job, const DirectoryTarget& target)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    auto files = list_directory_files(target.path);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<PosixTargetHandle::Segment> segments;
    segments.reserve(files->size());
    uint64_t total = 0;
    for (const auto& file : *files) {
        auto fd = open_fd(file.string(), O_RDWR | O_NOFOLLOW);
        if (!fd) {
            return std::unexpected(fd.error());
        }
        struct stat st{};
        if (::fstat(fd->get(), &st) != 0) {
            return std::unexpected(util::io_error(std::format("fstat {}", file.string()), errno));
        }
        const auto length = static_cast<uint64_t>(st.st_size);
        total += length;
        segments.push_back(PosixTargetHandle::Segment{
            .path = file.string(), .fd = std::move(*fd), .start = 0, .length = length,
            .dirty = false});
    }
    if (auto ok = check_size(job, total); !ok) {
        return std::unexpected(ok.error());
    }
    return std::make_unique<PosixTargetHandle>(std::move(segments));
}

auto open_free_space(const JobRecord& job, const FreeSpaceTarget& target)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    auto fd = open_fd(target.placeholder, O_RDWR | O_CREAT | O_NOFOLLOW, 0600);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(
            util::io_error(std::format("fstat {}", target.placeholder), errno));
    }

    const auto current = static_cast<uint64_t>(st.st_size);
    if (current == 0 && job.target_size > 0) {
        const int rc =
            ::posix_fallocate(fd->get(), 0, static_cast<off_t>(job.target_size));
        if (rc != 0) {
            return std::unexpected(
                util::io_error(std::format("preallocate {}", target.placeholder), rc));
        }
        LOG_INFO("Targets", std::format("Allocated placeholder {} ({} bytes)", target.placeholder,
                                        job.target_size));
    } else if (auto ok = check_size(job, current); !ok) {
        return std::unexpected(ok.error());
    }
    return single_segment(target.placeholder, std::move(*fd), job.target_size);
}

auto open_drive(const JobRecord& job, const DriveTarget& target)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    auto fd = open_fd(target.device, O_RDWR);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    struct stat st{};
    if (::fstat(fd->get(), &st) != 0 || !S_ISBLK(st.st_mode)) {
        return target_changed(std::format("{} is no longer a block device", target.device));
    }
    auto size = block_device_size(fd->get(), target.device);
    if (!size) {
        return std::unexpected(size.error());
    }
    if (auto ok = check_size(job, *size); !ok) {
        return std::unexpected(ok.error());
    }
    return single_segment(target.device, std::move(*fd), job.target_size);
}

auto sync_directory(const std::filesystem::path& dir) -> std::expected<void, util::Error> {
    auto fd = open_fd(dir.string(), O_RDONLY | O_DIRECTORY);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    if (::fsync(fd->get()) != 0) {
        return std::unexpected(util::io_error(std::format("fsync {}", dir.string()), errno));
    }
    return {};
}

auto random_name() -> std::string {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    return std::format(".{:016x}", generator());
}

/**
 * @brief Truncate, rename to a random name, unlink, then sync the parent
 */
auto remove_file(const std::filesystem::path& path) -> std::expected<void, util::Error> {
    if (::truncate(path.c_str(), 0) != 0) {
        return std::unexpected(util::io_error(std::format("truncate {}", path.string()), errno));
    }

    auto doomed = path;
    const auto renamed = path.parent_path() / random_name();
    if (::rename(path.c_str(), renamed.c_str()) == 0) {
        doomed = renamed;
    } else {
        LOG_WARNING("Targets", std::format("Could not rename {} before unlink: {}",
                                           path.string(), std::strerror(errno)));
    }

    if (::unlink(doomed.c_str()) != 0) {
        return std::unexpected(util::io_error(std::format("unlink {}", doomed.string()), errno));
    }
    return sync_directory(path.parent_path());
}

auto finalize_directory(const JobRecord& job, const DirectoryTarget& target)
    -> std::expected<void, util::Error> {
    if (!job.remove_after_wipe) {
        return {};
    }

    std::expected<void, util::Error> result;
    auto keep_first = [&result](std::expected<void, util::Error> step) {
        if (result && !step) {
            result = std::move(step);
        }
    };

    auto files = list_directory_files(target.path);
    if (!files) {
        return std::unexpected(files.error());
    }
    for (const auto& file : *files) {
        keep_first(remove_file(file));
    }

    std::vector<std::filesystem::path> directories;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(target.path, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            directories.push_back(it->path());
        }
    }
    if (ec) {
        keep_first(std::unexpected(util::io_error(std::format("scan {}", target.path),
                                                  ec.value())));
    }

    // Deepest first so every directory is empty when removed
    std::sort(directories.begin(), directories.end(),
              [](const auto& lhs, const auto& rhs) {
                  return std::distance(lhs.begin(), lhs.end()) >
                         std::distance(rhs.begin(), rhs.end());
              });
    directories.emplace_back(target.path);
    for (const auto& dir : directories) {
        if (::rmdir(dir.c_str()) != 0) {
            keep_first(std::unexpected(util::io_error(std::format("rmdir {}", dir.string()),
                                                      errno)));
        }
    }
    return result;
}

}  // namespace

auto target_identity(const TargetSpec& target) -> std::string {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(target_location(target), ec);
    std::string path = ec ? target_location(target) : canonical.string();
    if (path.size() > 1 && path.ends_with('/')) {
        path.pop_back();
    }
    if (target_kind(target) == TargetKind::FreeSpace) {
        return std::string(FREE_SPACE_IDENTITY_PREFIX) + path;
    }
    return path;
}

auto identities_conflict(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs == rhs) {
        return true;
    }
    if (lhs.starts_with(FREE_SPACE_IDENTITY_PREFIX) ||
        rhs.starts_with(FREE_SPACE_IDENTITY_PREFIX)) {
        return false;
    }
    auto is_ancestor = [](std::string_view parent, std::string_view child) {
        if (parent == "/") {
            return true;
        }
        return child.size() > parent.size() && child.starts_with(parent) &&
               child[parent.size()] == '/';
    };
    return is_ancestor(lhs, rhs) || is_ancestor(rhs, lhs);
}

auto placeholder_path(const std::string& volume, const std::string& job_id) -> std::string {
    return (std::filesystem::path(volume) / std::format(".storage-eraser-{}.fill", job_id))
        .string();
}

auto probe_size(const TargetSpec& target, uint64_t reserve_bytes)
    -> std::expected<uint64_t, util::Error> {
    return std::visit(
        [reserve_bytes](const auto& t) -> std::expected<uint64_t, util::Error> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FileTarget>) {
                return file_size(t.path);
            } else if constexpr (std::is_same_v<T, DirectoryTarget>) {
                return directory_size(t.path);
            } else if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                return free_space_size(t.volume, reserve_bytes);
            } else {
                return drive_size(t.device);
            }
        },
        target);
}

auto list_directory_files(const std::filesystem::path& root)
    -> std::expected<std::vector<std::filesystem::path>, util::Error> {
    std::error_code ec;
    if (!std::filesystem::is_directory(std::filesystem::symlink_status(root, ec))) {
        return std::unexpected(util::Error{util::ErrorKind::PermanentIO,
                                           std::format("{} is not a directory", root.string()),
                                           ENOTDIR});
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::recursive_directory_iterator it(root, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto status = it->symlink_status(ec);
        if (!ec && std::filesystem::is_regular_file(status)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(util::io_error(std::format("scan {}", root.string()), ec.value()));
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto validate_for_resume(const JobRecord& job) -> std::expected<void, util::Error> {
    return std::visit(
        [&job](const auto& t) -> std::expected<void, util::Error> {
            using T = std::decay_t<decltype(t)>;
            std::expected<uint64_t, util::Error> size;
            if constexpr (std::is_same_v<T, FileTarget>) {
                size = file_size(t.path);
            } else if constexpr (std::is_same_v<T, DirectoryTarget>) {
                size = directory_size(t.path);
            } else if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                std::error_code ec;
                if (!std::filesystem::exists(t.placeholder, ec)) {
                    if (job.checkpoint.position() == Checkpoint{}.position()) {
                        return {};
                    }
                    return target_changed(
                        std::format("placeholder {} disappeared", t.placeholder));
                }
                size = file_size(t.placeholder);
            } else {
                size = drive_size(t.device);
            }
            if (!size) {
                return target_changed(std::format("{} cannot be checked: {}",
                                                  target_location(job.target),
                                                  size.error().message));
            }
            return check_size(job, *size);
        },
        job.target);
}

auto open_target(const JobRecord& job)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    return std::visit(
        [&job](const auto& t) -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FileTarget>) {
                return open_file(job, t);
            } else if constexpr (std::is_same_v<T, DirectoryTarget>) {
                return open_directory(job, t);
            } else if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                return open_free_space(job, t);
            } else {
                return open_drive(job, t);
            }
        },
        job.target);
}

auto finalize_target(const JobRecord& job) -> std::expected<void, util::Error> {
    return std::visit(
        [&job](const auto& t) -> std::expected<void, util::Error> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FileTarget>) {
                if (!job.remove_after_wipe) {
                    return {};
                }
                return remove_file(t.path);
            } else if constexpr (std::is_same_v<T, DirectoryTarget>) {
                return finalize_directory(job, t);
            } else if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                if (::unlink(t.placeholder.c_str()) != 0 && errno != ENOENT) {
                    return std::unexpected(
                        util::io_error(std::format("unlink {}", t.placeholder), errno));
                }
                return {};
            } else {
                LOG_DEBUG("Targets", std::format("Drive {} left in place", t.device));
                return {};
            }
        },
        job.target);
}

}  // namespace targets

auto TargetOpener::probe_size(const TargetSpec& target) -> std::expected<uint64_t, util::Error> {
    return targets::probe_size(target, reserve_bytes_);
}

auto TargetOpener::open(const JobRecord& job)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> {
    return targets::open_target(job);
}

auto TargetOpener::validate_for_resume(const JobRecord& job) -> std::expected<void, util::Error> {
    return targets::validate_for_resume(job);
}

auto TargetOpener::finalize(const JobRecord& job) -> std::expected<void, util::Error> {
    return targets::finalize_target(job);
}
