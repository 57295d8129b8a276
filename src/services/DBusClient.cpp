/**
 * @file DBusClient.cpp
 * @brief Implementation of the D-Bus client for storage-eraser-helper
 */

#include "services/DBusClient.hpp"

#include "models/JobCodec.hpp"
#include "services/DBusProtocol.hpp"
#include "util/GLibPtr.hpp"
#include "util/Logger.hpp"

#include <format>
#include <utility>

namespace {

auto not_connected() -> std::unexpected<util::Error> {
    return std::unexpected(
        util::Error{util::ErrorKind::StoreUnavailable, "Not connected to helper service"});
}

/**
 * @brief Turn a failed call into an Error, recovering the helper's kind
 */
auto error_from_gerror(const char* method, GError* error) -> util::Error {
    if (error == nullptr) {
        return util::Error{util::ErrorKind::Unknown, std::format("{} failed", method)};
    }

    auto kind = util::ErrorKind::Unknown;
    util::GCharPtr remote(g_dbus_error_get_remote_error(error));
    if (remote) {
        kind = dbus_protocol::kind_from_error_name(remote.get());
        g_dbus_error_strip_remote_error(error);
    } else if (g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_SERVICE_UNKNOWN) ||
               g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_NAME_HAS_NO_OWNER)) {
        kind = util::ErrorKind::StoreUnavailable;
    } else if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_TIMED_OUT)) {
        kind = util::ErrorKind::Timeout;
    }
    return util::Error{kind, error->message};
}

}  // namespace

DBusClient::DBusClient(GBusType bus_type) : bus_type_(bus_type) {}

DBusClient::~DBusClient() {
    cleanup();
}

void DBusClient::cleanup() {
    if (signal_subscription_id_ != 0 && connection_) {
        g_dbus_connection_signal_unsubscribe(connection_, signal_subscription_id_);
        signal_subscription_id_ = 0;
    }

    if (proxy_) {
        g_object_unref(proxy_);
        proxy_ = nullptr;
    }

    if (connection_) {
        g_object_unref(connection_);
        connection_ = nullptr;
    }
}

auto DBusClient::connect() -> std::expected<void, util::Error> {
    GError* error = nullptr;

    connection_ = g_bus_get_sync(bus_type_, nullptr, &error);
    if (!connection_) {
        auto result = util::Error{util::ErrorKind::StoreUnavailable,
                                  std::format("Failed to connect to {} bus: {}",
                                              bus_type_ == G_BUS_TYPE_SYSTEM ? "system" : "session",
                                              error ? error->message : "unknown")};
        g_clear_error(&error);
        return std::unexpected(result);
    }

    // Autostart stays enabled so the bus activates the helper on first use
    proxy_ = g_dbus_proxy_new_sync(connection_, G_DBUS_PROXY_FLAGS_DO_NOT_LOAD_PROPERTIES,
                                   nullptr, dbus_protocol::BUS_NAME, dbus_protocol::OBJECT_PATH,
                                   dbus_protocol::INTERFACE, nullptr, &error);
    if (!proxy_) {
        auto result = util::Error{
            util::ErrorKind::StoreUnavailable,
            std::format("Failed to create D-Bus proxy: {}", error ? error->message : "unknown")};
        g_clear_error(&error);
        cleanup();
        return std::unexpected(result);
    }

    setup_signal_handler();
    LOG_DEBUG("CLI", std::format("Connected to {}", dbus_protocol::BUS_NAME));
    return {};
}

auto DBusClient::is_connected() const -> bool {
    return proxy_ != nullptr;
}

void DBusClient::setup_signal_handler() {
    if (!connection_) {
        return;
    }

    signal_subscription_id_ = g_dbus_connection_signal_subscribe(
        connection_, dbus_protocol::BUS_NAME, dbus_protocol::INTERFACE,
        dbus_protocol::PROGRESS_SIGNAL, dbus_protocol::OBJECT_PATH, nullptr,
        G_DBUS_SIGNAL_FLAGS_NONE, on_signal_received, this, nullptr);
}

void DBusClient::on_signal_received(GDBusConnection* /*connection*/,
                                    const gchar* /*sender_name*/,
                                    const gchar* /*object_path*/,
                                    const gchar* /*interface_name*/, const gchar* signal_name,
                                    GVariant* parameters, gpointer user_data) {
    auto* self = static_cast<DBusClient*>(user_data);

    if (g_strcmp0(signal_name, dbus_protocol::PROGRESS_SIGNAL) != 0 ||
        !g_variant_is_of_type(parameters, G_VARIANT_TYPE(codec::PROGRESS_TYPE))) {
        return;
    }

    auto progress = codec::progress_from_variant(parameters);

    std::lock_guard lock(self->callback_mutex_);
    if (self->progress_callback_) {
        self->progress_callback_(progress);
    }
}

void DBusClient::set_progress_callback(ProgressCallback callback) {
    std::lock_guard lock(callback_mutex_);
    progress_callback_ = std::move(callback);
}

auto DBusClient::call(const char* method, GVariant* parameters)
    -> std::expected<GVariant*, util::Error> {
    if (!proxy_) {
        if (parameters) {
            g_variant_unref(g_variant_ref_sink(parameters));
        }
        return not_connected();
    }

    GError* error = nullptr;
    GVariant* result =
        g_dbus_proxy_call_sync(proxy_, method, parameters, G_DBUS_CALL_FLAGS_NONE,
                               dbus_protocol::CALL_TIMEOUT_MS, nullptr, &error);
    if (!result) {
        auto failure = error_from_gerror(method, error);
        g_clear_error(&error);
        LOG_DEBUG("CLI", std::format("{} failed: {}", method, failure.message));
        return std::unexpected(failure);
    }
    return result;
}

auto DBusClient::call_with_id(const char* method, const std::string& id)
    -> std::expected<void, util::Error> {
    auto result = call(method, g_variant_new("(s)", id.c_str()));
    if (!result) {
        return std::unexpected(result.error());
    }
    g_variant_unref(*result);
    return {};
}

auto DBusClient::submit(const JobRequest& request) -> std::expected<std::string, util::Error> {
    auto result =
        call("SubmitJob", g_variant_new("(@(sssissasxb))", codec::request_to_variant(request)));
    if (!result) {
        return std::unexpected(result.error());
    }
    util::VariantPtr reply(*result);

    const gchar* id = nullptr;
    g_variant_get(reply.get(), "(&s)", &id);
    return std::string(id);
}

auto DBusClient::pause(const std::string& id) -> std::expected<void, util::Error> {
    return call_with_id("PauseJob", id);
}

auto DBusClient::resume(const std::string& id) -> std::expected<void, util::Error> {
    return call_with_id("ResumeJob", id);
}

auto DBusClient::cancel(const std::string& id) -> std::expected<void, util::Error> {
    return call_with_id("CancelJob", id);
}

auto DBusClient::remove(const std::string& id) -> std::expected<void, util::Error> {
    return call_with_id("DeleteJob", id);
}

auto DBusClient::get_job(const std::string& id) -> std::expected<JobSnapshot, util::Error> {
    auto result = call("GetJob", g_variant_new("(s)", id.c_str()));
    if (!result) {
        return std::unexpected(result.error());
    }
    util::VariantPtr reply(*result);
    util::VariantPtr snapshot(g_variant_get_child_value(reply.get(), 0));
    return codec::snapshot_from_variant(snapshot.get());
}

auto DBusClient::list_jobs(const JobFilter& filter)
    -> std::expected<std::vector<JobSnapshot>, util::Error> {
    std::string state;
    if (filter.state) {
        state = job_state_to_string(*filter.state);
    }

    auto result = call("ListJobs", g_variant_new("(s)", state.c_str()));
    if (!result) {
        return std::unexpected(result.error());
    }
    util::VariantPtr reply(*result);
    util::VariantPtr array(g_variant_get_child_value(reply.get(), 0));

    std::vector<JobSnapshot> jobs;
    GVariantIter iter;
    g_variant_iter_init(&iter, array.get());
    GVariant* child = nullptr;
    while ((child = g_variant_iter_next_value(&iter)) != nullptr) {
        util::VariantPtr item(child);
        auto snapshot = codec::snapshot_from_variant(item.get());
        if (!snapshot) {
            return std::unexpected(snapshot.error());
        }
        jobs.push_back(std::move(*snapshot));
    }
    return jobs;
}

auto DBusClient::list_plans() -> std::expected<std::vector<PlanInfo>, util::Error> {
    auto result = call("GetPlans", nullptr);
    if (!result) {
        return std::unexpected(result.error());
    }
    util::VariantPtr reply(*result);
    util::VariantPtr array(g_variant_get_child_value(reply.get(), 0));

    std::vector<PlanInfo> plans;
    GVariantIter iter;
    g_variant_iter_init(&iter, array.get());
    GVariant* child = nullptr;
    while ((child = g_variant_iter_next_value(&iter)) != nullptr) {
        util::VariantPtr item(child);
        plans.push_back(codec::plan_from_variant(item.get()));
    }
    return plans;
}
