/**
 * @file DBusClient.hpp
 * @brief D-Bus client for the storage-eraser-helper daemon
 *
 * Implements IJobManager by forwarding every call to the helper. Errors
 * raised by the helper come back with their original ErrorKind.
 */

#pragma once

#include "services/IJobManager.hpp"

#include <gio/gio.h>

#include <mutex>
#include <string>
#include <vector>

/**
 * @class DBusClient
 * @brief Client for the org.storage_eraser.Engine service
 *
 * Progress arrives as JobProgress signals, dispatched on the thread-default
 * main context of the thread that called connect(). Front ends that want
 * progress must iterate that context.
 */
class DBusClient : public IJobManager {
public:
    explicit DBusClient(GBusType bus_type = G_BUS_TYPE_SYSTEM);
    ~DBusClient() override;

    DBusClient(const DBusClient&) = delete;
    DBusClient& operator=(const DBusClient&) = delete;
    DBusClient(DBusClient&&) = delete;
    DBusClient& operator=(DBusClient&&) = delete;

    /**
     * @brief Connect to the bus and create the helper proxy
     */
    [[nodiscard]] auto connect() -> std::expected<void, util::Error>;

    [[nodiscard]] auto is_connected() const -> bool;

    auto submit(const JobRequest& request) -> std::expected<std::string, util::Error> override;
    auto pause(const std::string& id) -> std::expected<void, util::Error> override;
    auto resume(const std::string& id) -> std::expected<void, util::Error> override;
    auto cancel(const std::string& id) -> std::expected<void, util::Error> override;
    auto remove(const std::string& id) -> std::expected<void, util::Error> override;
    [[nodiscard]] auto get_job(const std::string& id)
        -> std::expected<JobSnapshot, util::Error> override;
    [[nodiscard]] auto list_jobs(const JobFilter& filter)
        -> std::expected<std::vector<JobSnapshot>, util::Error> override;
    [[nodiscard]] auto list_plans() -> std::expected<std::vector<PlanInfo>, util::Error> override;
    void set_progress_callback(ProgressCallback callback) override;

private:
    /**
     * @brief Synchronous method call; takes ownership of floating @p parameters
     * @return The reply tuple, owned by the caller
     */
    [[nodiscard]] auto call(const char* method, GVariant* parameters)
        -> std::expected<GVariant*, util::Error>;
    [[nodiscard]] auto call_with_id(const char* method, const std::string& id)
        -> std::expected<void, util::Error>;

    void setup_signal_handler();
    void cleanup();

    static void on_signal_received(GDBusConnection* connection, const gchar* sender_name,
                                   const gchar* object_path, const gchar* interface_name,
                                   const gchar* signal_name, GVariant* parameters,
                                   gpointer user_data);

    GBusType bus_type_;
    GDBusConnection* connection_ = nullptr;
    GDBusProxy* proxy_ = nullptr;
    guint signal_subscription_id_ = 0;
    ProgressCallback progress_callback_;
    mutable std::mutex callback_mutex_;
};
