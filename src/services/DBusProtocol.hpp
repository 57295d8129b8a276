/**
 * @file DBusProtocol.hpp
 * @brief Names shared by the helper daemon and its D-Bus client
 */

#pragma once

#include "util/Error.hpp"

#include <string>
#include <string_view>

namespace dbus_protocol {

inline constexpr auto BUS_NAME = "org.storage_eraser.Engine";
inline constexpr auto OBJECT_PATH = "/org/storage_eraser/Engine";
inline constexpr auto INTERFACE = "org.storage_eraser.Engine";
inline constexpr auto PROGRESS_SIGNAL = "JobProgress";

inline constexpr auto POLKIT_ACTION_MANAGE = "org.storage_eraser.manage-jobs";
inline constexpr auto POLKIT_ACTION_LIST = "org.storage_eraser.list-jobs";

/// Job errors travel as "org.storage_eraser.Error.<kind>" with '-' mapped to '_'
inline constexpr std::string_view ERROR_PREFIX = "org.storage_eraser.Error.";

inline constexpr int CALL_TIMEOUT_MS = 30000;  // Covers interactive polkit dialogs

[[nodiscard]] inline auto error_name(util::ErrorKind kind) -> std::string {
    std::string name(ERROR_PREFIX);
    for (char c : util::kind_to_string(kind)) {
        name.push_back(c == '-' ? '_' : c);
    }
    return name;
}

[[nodiscard]] inline auto kind_from_error_name(std::string_view name) -> util::ErrorKind {
    if (!name.starts_with(ERROR_PREFIX)) {
        return util::ErrorKind::Unknown;
    }
    std::string kind(name.substr(ERROR_PREFIX.size()));
    for (auto& c : kind) {
        if (c == '_') {
            c = '-';
        }
    }
    return util::kind_from_string(kind);
}

}  // namespace dbus_protocol
