/**
 * @file TargetTypes.hpp
 * @brief Erasure target variants
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

/**
 * @enum TargetKind
 * @brief Discriminator for TargetSpec, also used on the wire
 */
enum class TargetKind {
    File,       ///< A single regular file
    Directory,  ///< Every regular file below a directory, laid end to end
    FreeSpace,  ///< Unallocated space of a mounted volume, via a placeholder file
    Drive       ///< A whole block device
};

struct FileTarget {
    std::string path;

    auto operator==(const FileTarget&) const -> bool = default;
};

struct DirectoryTarget {
    std::string path;

    auto operator==(const DirectoryTarget&) const -> bool = default;
};

struct FreeSpaceTarget {
    std::string volume;
    std::string placeholder;  ///< Fill file created on the volume, chosen at submission

    auto operator==(const FreeSpaceTarget&) const -> bool = default;
};

struct DriveTarget {
    std::string device;

    auto operator==(const DriveTarget&) const -> bool = default;
};

using TargetSpec = std::variant<FileTarget, DirectoryTarget, FreeSpaceTarget, DriveTarget>;

[[nodiscard]] inline auto target_kind(const TargetSpec& target) -> TargetKind {
    return std::visit(
        [](const auto& t) -> TargetKind {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FileTarget>) {
                return TargetKind::File;
            } else if constexpr (std::is_same_v<T, DirectoryTarget>) {
                return TargetKind::Directory;
            } else if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                return TargetKind::FreeSpace;
            } else {
                return TargetKind::Drive;
            }
        },
        target);
}

/**
 * @brief The user-facing location of a target (file, directory, volume or device path)
 */
[[nodiscard]] inline auto target_location(const TargetSpec& target) -> const std::string& {
    return std::visit(
        [](const auto& t) -> const std::string& {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FreeSpaceTarget>) {
                return t.volume;
            } else if constexpr (std::is_same_v<T, DriveTarget>) {
                return t.device;
            } else {
                return t.path;
            }
        },
        target);
}

[[nodiscard]] inline auto target_kind_to_string(TargetKind kind) -> std::string_view {
    switch (kind) {
        case TargetKind::File:
            return "file";
        case TargetKind::Directory:
            return "dir";
        case TargetKind::FreeSpace:
            return "free-space";
        case TargetKind::Drive:
            return "drive";
    }
    return "file";
}

[[nodiscard]] inline auto target_kind_from_string(std::string_view name)
    -> std::optional<TargetKind> {
    if (name == "file") {
        return TargetKind::File;
    }
    if (name == "dir" || name == "directory") {
        return TargetKind::Directory;
    }
    if (name == "free-space") {
        return TargetKind::FreeSpace;
    }
    if (name == "drive") {
        return TargetKind::Drive;
    }
    return std::nullopt;
}
