/**
 * @file WipeTarget.hpp
 * @brief Per-variant target capabilities: identity, size, open, finalize
 *
 * TargetSpec is a closed variant; each capability below dispatches over it
 * with std::visit instead of a class hierarchy.
 */

#pragma once

#include "models/JobTypes.hpp"
#include "targets/ITargetHandle.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace targets {

inline constexpr std::string_view FREE_SPACE_IDENTITY_PREFIX = "freespace:";

/**
 * @brief Canonical identity used for per-target mutual exclusion
 *
 * Paths are resolved with weakly_canonical; free-space jobs use
 * "freespace:<canonical volume>".
 */
[[nodiscard]] auto target_identity(const TargetSpec& target) -> std::string;

/**
 * @brief Whether two identities may touch the same bytes
 *
 * True when they are equal or one path is an ancestor of the other.
 */
[[nodiscard]] auto identities_conflict(std::string_view lhs, std::string_view rhs) -> bool;

/**
 * @brief Placeholder file that occupies a volume's free space for one job
 */
[[nodiscard]] auto placeholder_path(const std::string& volume, const std::string& job_id)
    -> std::string;

/**
 * @brief Size of a target at submission time
 * @param reserve_bytes Space left free on the volume for FreeSpace targets
 */
[[nodiscard]] auto probe_size(const TargetSpec& target, uint64_t reserve_bytes)
    -> std::expected<uint64_t, util::Error>;

/**
 * @brief Regular files of a directory target, recursively, in lexicographic order
 *
 * Symbolic links are skipped.
 */
[[nodiscard]] auto list_directory_files(const std::filesystem::path& root)
    -> std::expected<std::vector<std::filesystem::path>, util::Error>;

/**
 * @brief Fail with TargetChanged unless the target still matches the record
 */
[[nodiscard]] auto validate_for_resume(const JobRecord& job) -> std::expected<void, util::Error>;

[[nodiscard]] auto open_target(const JobRecord& job)
    -> std::expected<std::unique_ptr<ITargetHandle>, util::Error>;

/**
 * @brief Unlink files, release the placeholder, or leave a drive untouched
 */
[[nodiscard]] auto finalize_target(const JobRecord& job) -> std::expected<void, util::Error>;

}  // namespace targets

/**
 * @class TargetOpener
 * @brief ITargetOpener over the real filesystem and block devices
 */
class TargetOpener : public ITargetOpener {
public:
    /**
     * @param reserve_bytes Space left free on the volume by free-space placeholders
     */
    explicit TargetOpener(uint64_t reserve_bytes) : reserve_bytes_(reserve_bytes) {}

    auto probe_size(const TargetSpec& target) -> std::expected<uint64_t, util::Error> override;
    auto open(const JobRecord& job)
        -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> override;
    auto validate_for_resume(const JobRecord& job) -> std::expected<void, util::Error> override;
    auto finalize(const JobRecord& job) -> std::expected<void, util::Error> override;

private:
    uint64_t reserve_bytes_;
};
