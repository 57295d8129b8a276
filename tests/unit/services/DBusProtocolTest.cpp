/**
 * @file DBusProtocolTest.cpp
 * @brief Unit tests for D-Bus names and error kind transport
 */

#include "services/DBusProtocol.hpp"

#include "util/Error.hpp"
#include "util/GLibPtr.hpp"

#include <gio/gio.h>
#include <gtest/gtest.h>

#include <array>

namespace {

constexpr std::array ALL_KINDS = {
    util::ErrorKind::TransientIO,   util::ErrorKind::PermanentIO,
    util::ErrorKind::TargetChanged, util::ErrorKind::VerificationMismatch,
    util::ErrorKind::StoreUnavailable, util::ErrorKind::Timeout,
    util::ErrorKind::InvalidArgument, util::ErrorKind::InvalidState,
    util::ErrorKind::NotFound,
};

}  // namespace

// ========== Name Tests ==========

TEST(DBusProtocolTest, Names_AreValidDBusNames) {
    EXPECT_TRUE(g_dbus_is_name(dbus_protocol::BUS_NAME));
    EXPECT_TRUE(g_dbus_is_interface_name(dbus_protocol::INTERFACE));
    EXPECT_TRUE(g_variant_is_object_path(dbus_protocol::OBJECT_PATH));
    EXPECT_TRUE(g_dbus_is_member_name(dbus_protocol::PROGRESS_SIGNAL));
}

TEST(DBusProtocolTest, ErrorName_UsesUnderscores) {
    EXPECT_EQ(dbus_protocol::error_name(util::ErrorKind::TargetChanged),
              "org.storage_eraser.Error.target_changed");
    EXPECT_EQ(dbus_protocol::error_name(util::ErrorKind::Timeout),
              "org.storage_eraser.Error.timeout");
}

// Test: Every kind survives the trip through its D-Bus error name
TEST(DBusProtocolTest, ErrorName_RoundTripsEveryKind) {
    for (auto kind : ALL_KINDS) {
        const auto name = dbus_protocol::error_name(kind);
        EXPECT_TRUE(g_dbus_is_interface_name(name.c_str())) << name;
        EXPECT_EQ(dbus_protocol::kind_from_error_name(name), kind) << name;
    }
}

TEST(DBusProtocolTest, KindFromErrorName_ForeignName_IsUnknown) {
    EXPECT_EQ(dbus_protocol::kind_from_error_name("org.freedesktop.DBus.Error.AccessDenied"),
              util::ErrorKind::Unknown);
    EXPECT_EQ(dbus_protocol::kind_from_error_name("org.storage_eraser.Error.exploded"),
              util::ErrorKind::Unknown);
}

// Test: A GError built from a remote error name carries the kind back
TEST(DBusProtocolTest, RemoteError_CarriesKindThroughGError) {
    const auto name = dbus_protocol::error_name(util::ErrorKind::InvalidState);
    GError* error = g_dbus_error_new_for_dbus_error(name.c_str(), "job is running");

    util::GCharPtr remote(g_dbus_error_get_remote_error(error));
    ASSERT_TRUE(remote);
    EXPECT_EQ(dbus_protocol::kind_from_error_name(remote.get()), util::ErrorKind::InvalidState);

    EXPECT_TRUE(g_dbus_error_strip_remote_error(error));
    EXPECT_STREQ(error->message, "job is running");
    g_error_free(error);
}

// ========== Error Kind Tests ==========

TEST(ErrorKindTest, KindToString_RoundTrips) {
    for (auto kind : ALL_KINDS) {
        EXPECT_EQ(util::kind_from_string(util::kind_to_string(kind)), kind);
    }
    EXPECT_EQ(util::kind_from_string("bogus"), util::ErrorKind::Unknown);
}

TEST(ErrorKindTest, ClassifyErrno_SeparatesTransientFromPermanent) {
    EXPECT_EQ(util::classify_errno(EINTR), util::ErrorKind::TransientIO);
    EXPECT_EQ(util::classify_errno(EAGAIN), util::ErrorKind::TransientIO);
    EXPECT_EQ(util::classify_errno(EBUSY), util::ErrorKind::TransientIO);
    EXPECT_EQ(util::classify_errno(EIO), util::ErrorKind::PermanentIO);
    EXPECT_EQ(util::classify_errno(ENOSPC), util::ErrorKind::PermanentIO);
    EXPECT_EQ(util::classify_errno(EACCES), util::ErrorKind::PermanentIO);
}

TEST(ErrorKindTest, IoError_KeepsCodeAndOperation) {
    auto error = util::io_error("write /dev/sdz", ENOSPC);

    EXPECT_EQ(error.code, ENOSPC);
    EXPECT_EQ(error.kind, util::ErrorKind::PermanentIO);
    EXPECT_FALSE(error.is_transient());
    EXPECT_EQ(error.message.rfind("write /dev/sdz: ", 0), 0u);
}
