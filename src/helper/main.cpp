/**
 * @file main.cpp
 * @brief D-Bus system service hosting the storage-eraser scheduler
 *
 * This privileged helper runs as root and provides D-Bus methods for:
 * - Submitting, pausing, resuming, cancelling and deleting erasure jobs
 * - Job and plan listing
 * - Progress reporting via the JobProgress signal
 *
 * Authorization is handled via polkit.
 */

#include "config.h"

#include "config/ConfigLoader.hpp"
#include "engine/ChunkedExecutionEngine.hpp"
#include "models/JobCodec.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "patterns/PassPlanCatalog.hpp"
#include "patterns/PatternSource.hpp"
#include "services/DBusProtocol.hpp"
#include "services/JobManager.hpp"
#include "store/FileJobStore.hpp"
#include "targets/WipeTarget.hpp"
#include "util/Logger.hpp"
#include "verification/Verifier.hpp"

#include <getopt.h>
#include <gio/gio.h>
#include <glib-unix.h>
#include <polkit/polkit.h>
#include <unistd.h>

#include <csignal>
#include <expected>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace {

// Global state
GDBusConnection* g_connection = nullptr;
GMainLoop* g_main_loop = nullptr;
std::shared_ptr<JobManager> g_job_manager;
bool g_skip_authorization = false;  // Session-bus development mode
int g_exit_code = 0;

// D-Bus introspection XML
const char* introspection_xml = R"XML(
<node>
  <interface name="org.storage_eraser.Engine">
    <method name="SubmitJob">
      <arg name="request" type="(sssissasxb)" direction="in"/>
      <arg name="job_id" type="s" direction="out"/>
    </method>
    <method name="PauseJob">
      <arg name="job_id" type="s" direction="in"/>
    </method>
    <method name="ResumeJob">
      <arg name="job_id" type="s" direction="in"/>
    </method>
    <method name="CancelJob">
      <arg name="job_id" type="s" direction="in"/>
    </method>
    <method name="DeleteJob">
      <arg name="job_id" type="s" direction="in"/>
    </method>
    <method name="GetJob">
      <arg name="job_id" type="s" direction="in"/>
      <arg name="job" type="((ua{sv})b(suutttxs))" direction="out"/>
    </method>
    <method name="ListJobs">
      <arg name="state" type="s" direction="in"/>
      <arg name="jobs" type="a((ua{sv})b(suutttxs))" direction="out"/>
    </method>
    <method name="GetPlans">
      <arg name="plans" type="a(ssu)" direction="out"/>
    </method>
    <signal name="JobProgress">
      <arg name="job_id" type="s"/>
      <arg name="current_pass" type="u"/>
      <arg name="total_passes" type="u"/>
      <arg name="bytes_done" type="t"/>
      <arg name="pass_bytes" type="t"/>
      <arg name="speed" type="t"/>
      <arg name="eta_seconds" type="x"/>
      <arg name="state" type="s"/>
    </signal>
  </interface>
</node>
)XML";

/**
 * Check polkit authorization for the calling process
 */
auto check_authorization(GDBusMethodInvocation* invocation, const char* action_id) -> bool {
    if (g_skip_authorization) {
        return true;
    }

    GError* error = nullptr;

    const char* sender = g_dbus_method_invocation_get_sender(invocation);
    if (!sender) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Could not determine caller");
        return false;
    }

    PolkitAuthority* authority = polkit_authority_get_sync(nullptr, &error);
    if (!authority) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Could not get polkit authority: %s",
                                              error ? error->message : "unknown error");
        g_clear_error(&error);
        return false;
    }

    PolkitSubject* subject = polkit_system_bus_name_new(sender);

    PolkitAuthorizationResult* result = polkit_authority_check_authorization_sync(
        authority, subject, action_id, nullptr,
        POLKIT_CHECK_AUTHORIZATION_FLAGS_ALLOW_USER_INTERACTION, nullptr, &error);

    g_object_unref(subject);
    g_object_unref(authority);

    if (!result) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Authorization check failed: %s",
                                              error ? error->message : "unknown error");
        g_clear_error(&error);
        return false;
    }

    bool authorized = polkit_authorization_result_get_is_authorized(result);
    g_object_unref(result);

    if (!authorized) {
        LOG_WARNING("Helper", std::format("Caller {} denied {}", sender, action_id));
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED,
                                              "Not authorized for action: %s", action_id);
        return false;
    }

    return true;
}

void return_error(GDBusMethodInvocation* invocation, const util::Error& error) {
    g_dbus_method_invocation_return_dbus_error(
        invocation, dbus_protocol::error_name(error.kind).c_str(), error.message.c_str());
}

void return_void(GDBusMethodInvocation* invocation,
                 const std::expected<void, util::Error>& result) {
    if (!result) {
        return_error(invocation, result.error());
        return;
    }
    g_dbus_method_invocation_return_value(invocation, nullptr);
}

/**
 * Emit JobProgress signal on D-Bus
 */
void emit_job_progress(const WipeProgress& progress) {
    if (!g_connection) {
        return;
    }

    GError* error = nullptr;
    g_dbus_connection_emit_signal(g_connection, nullptr, dbus_protocol::OBJECT_PATH,
                                  dbus_protocol::INTERFACE, dbus_protocol::PROGRESS_SIGNAL,
                                  codec::progress_to_variant(progress), &error);

    if (error) {
        LOG_WARNING("Helper", std::format("Failed to emit progress: {}", error->message));
        g_error_free(error);
    }
}

/**
 * Handle SubmitJob method call
 */
void handle_submit_job(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, dbus_protocol::POLKIT_ACTION_MANAGE)) {
        return;
    }

    GVariant* raw_request = g_variant_get_child_value(parameters, 0);
    auto request = codec::request_from_variant(raw_request);
    g_variant_unref(raw_request);
    if (!request) {
        return_error(invocation, request.error());
        return;
    }

    auto id = g_job_manager->submit(*request);
    if (!id) {
        return_error(invocation, id.error());
        return;
    }

    g_dbus_method_invocation_return_value(invocation, g_variant_new("(s)", id->c_str()));
}

/**
 * Handle PauseJob, ResumeJob, CancelJob and DeleteJob
 */
template <typename Action>
void handle_job_action(GDBusMethodInvocation* invocation, GVariant* parameters, Action&& action) {
    if (!check_authorization(invocation, dbus_protocol::POLKIT_ACTION_MANAGE)) {
        return;
    }

    const char* job_id = nullptr;
    g_variant_get(parameters, "(&s)", &job_id);
    return_void(invocation, action(std::string(job_id)));
}

void handle_get_job(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, dbus_protocol::POLKIT_ACTION_LIST)) {
        return;
    }

    const char* job_id = nullptr;
    g_variant_get(parameters, "(&s)", &job_id);

    auto snapshot = g_job_manager->get_job(job_id);
    if (!snapshot) {
        return_error(invocation, snapshot.error());
        return;
    }

    g_dbus_method_invocation_return_value(
        invocation, g_variant_new("(@((ua{sv})b(suutttxs)))", codec::snapshot_to_variant(*snapshot)));
}

void handle_list_jobs(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, dbus_protocol::POLKIT_ACTION_LIST)) {
        return;
    }

    const char* state_name = nullptr;
    g_variant_get(parameters, "(&s)", &state_name);

    JobFilter filter;
    if (state_name[0] != '\0') {
        filter.state = job_state_from_string(state_name);
        if (!filter.state) {
            return_error(invocation, util::Error{util::ErrorKind::InvalidArgument,
                                                 std::format("unknown state '{}'", state_name)});
            return;
        }
    }

    auto jobs = g_job_manager->list_jobs(filter);
    if (!jobs) {
        return_error(invocation, jobs.error());
        return;
    }

    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a((ua{sv})b(suutttxs))"));
    for (const auto& job : *jobs) {
        g_variant_builder_add_value(&builder, codec::snapshot_to_variant(job));
    }

    g_dbus_method_invocation_return_value(invocation,
                                          g_variant_new("(a((ua{sv})b(suutttxs)))", &builder));
}

void handle_get_plans(GDBusMethodInvocation* invocation) {
    if (!check_authorization(invocation, dbus_protocol::POLKIT_ACTION_LIST)) {
        return;
    }

    auto plans = g_job_manager->list_plans();
    if (!plans) {
        return_error(invocation, plans.error());
        return;
    }

    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a(ssu)"));
    for (const auto& plan : *plans) {
        g_variant_builder_add_value(&builder, codec::plan_to_variant(plan));
    }

    g_dbus_method_invocation_return_value(invocation, g_variant_new("(a(ssu))", &builder));
}

/**
 * D-Bus method call handler
 */
void handle_method_call(GDBusConnection* /*connection*/, const gchar* /*sender*/,
                        const gchar* /*object_path*/, const gchar* /*interface_name*/,
                        const gchar* method_name, GVariant* parameters,
                        GDBusMethodInvocation* invocation, gpointer /*user_data*/) {
    if (g_strcmp0(method_name, "SubmitJob") == 0) {
        handle_submit_job(invocation, parameters);
    } else if (g_strcmp0(method_name, "PauseJob") == 0) {
        handle_job_action(invocation, parameters,
                          [](const std::string& id) { return g_job_manager->pause(id); });
    } else if (g_strcmp0(method_name, "ResumeJob") == 0) {
        handle_job_action(invocation, parameters,
                          [](const std::string& id) { return g_job_manager->resume(id); });
    } else if (g_strcmp0(method_name, "CancelJob") == 0) {
        handle_job_action(invocation, parameters,
                          [](const std::string& id) { return g_job_manager->cancel(id); });
    } else if (g_strcmp0(method_name, "DeleteJob") == 0) {
        handle_job_action(invocation, parameters,
                          [](const std::string& id) { return g_job_manager->remove(id); });
    } else if (g_strcmp0(method_name, "GetJob") == 0) {
        handle_get_job(invocation, parameters);
    } else if (g_strcmp0(method_name, "ListJobs") == 0) {
        handle_list_jobs(invocation, parameters);
    } else if (g_strcmp0(method_name, "GetPlans") == 0) {
        handle_get_plans(invocation);
    } else {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR,
                                              G_DBUS_ERROR_UNKNOWN_METHOD, "Unknown method: %s",
                                              method_name);
    }
}

// D-Bus interface vtable
const GDBusInterfaceVTable interface_vtable = {
    .method_call = handle_method_call,
    .get_property = nullptr,
    .set_property = nullptr,
    .padding = {nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr}};

/**
 * Callback when D-Bus name is acquired
 */
void on_name_acquired(GDBusConnection* connection, const gchar* name, gpointer /*user_data*/) {
    LOG_INFO("Helper", std::format("Acquired D-Bus name: {}", name));
    g_connection = connection;

    GError* error = nullptr;
    GDBusNodeInfo* introspection_data = g_dbus_node_info_new_for_xml(introspection_xml, &error);

    if (!introspection_data) {
        LOG_ERROR("Helper", std::format("Failed to parse introspection XML: {}",
                                        error ? error->message : "unknown"));
        g_clear_error(&error);
        g_exit_code = 1;
        g_main_loop_quit(g_main_loop);
        return;
    }

    guint registration_id = g_dbus_connection_register_object(
        connection, dbus_protocol::OBJECT_PATH, introspection_data->interfaces[0],
        &interface_vtable, nullptr, nullptr, &error);

    g_dbus_node_info_unref(introspection_data);

    if (registration_id == 0) {
        LOG_ERROR("Helper", std::format("Failed to register object: {}",
                                        error ? error->message : "unknown"));
        g_clear_error(&error);
        g_exit_code = 1;
        g_main_loop_quit(g_main_loop);
        return;
    }

    LOG_INFO("Helper", std::format("D-Bus object registered at {}", dbus_protocol::OBJECT_PATH));
}

/**
 * Callback when D-Bus name is lost
 */
void on_name_lost(GDBusConnection* /*connection*/, const gchar* name, gpointer /*user_data*/) {
    LOG_ERROR("Helper", std::format("Lost D-Bus name: {}", name));
    g_connection = nullptr;
    g_exit_code = 1;
    g_main_loop_quit(g_main_loop);
}

auto on_quit_signal(gpointer /*user_data*/) -> gboolean {
    LOG_INFO("Helper", "Termination requested, pausing running jobs");
    g_main_loop_quit(g_main_loop);
    return G_SOURCE_REMOVE;
}

struct HelperOptions {
    std::string config_path = STORAGE_ERASER_CONFIG_DIR "/engine.conf";
    bool session_bus = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config PATH] [--session]\n\n"
              << "  -c, --config PATH   Configuration file (default: "
              << STORAGE_ERASER_CONFIG_DIR "/engine.conf)\n"
              << "      --session       Own the name on the session bus without polkit\n"
              << "  -h, --help          Show this help\n"
              << "  -v, --version       Show version\n";
}

/**
 * @return Options, or the exit code when the process should stop
 */
auto parse_options(int argc, char* argv[]) -> std::expected<HelperOptions, int> {
    static constexpr int OPT_SESSION = 1000;
    static const struct option long_options[] = {{"config", required_argument, nullptr, 'c'},
                                                 {"session", no_argument, nullptr, OPT_SESSION},
                                                 {"help", no_argument, nullptr, 'h'},
                                                 {"version", no_argument, nullptr, 'v'},
                                                 {nullptr, 0, nullptr, 0}};

    HelperOptions options;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "c:hv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.config_path = optarg;
                break;
            case OPT_SESSION:
                options.session_bus = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return std::unexpected(0);
            case 'v':
                std::cout << "storage-eraser-helper " << PROJECT_VERSION << "\n";
                return std::unexpected(0);
            default:
                print_usage(argv[0]);
                return std::unexpected(1);
        }
    }
    return options;
}

/**
 * Assemble the scheduler and its collaborators from the configuration
 */
auto build_job_manager(const config::EngineConfig& cfg)
    -> std::expected<std::pair<std::shared_ptr<JobManager>, std::shared_ptr<ResourceMonitor>>,
                     util::Error> {
    auto store = std::make_shared<FileJobStore>(cfg.store.directory, cfg.store.compact_every);
    if (auto ready = store->initialize(); !ready) {
        return std::unexpected(ready.error());
    }

    auto patterns = std::make_shared<PatternSource>();
    auto catalog = std::make_shared<PassPlanCatalog>(patterns);

    auto monitor = std::make_shared<ResourceMonitor>(
        std::make_shared<ProcLoadSampler>(), cfg.monitor,
        MonitorBounds{.base_chunk_size = cfg.monitor.base_chunk_size,
                      .min_chunk_size = cfg.engine.min_chunk_size,
                      .max_chunk_size = cfg.engine.max_chunk_size,
                      .worker_ceiling = cfg.scheduler.worker_ceiling});

    auto opener = std::make_shared<TargetOpener>(cfg.free_space.reserve_bytes);
    auto verifier = std::make_shared<verification::Verifier>(cfg.verification);
    auto engine = std::make_shared<ChunkedExecutionEngine>(store, patterns, monitor, opener,
                                                           verifier, cfg.engine);

    auto manager = std::make_shared<JobManager>(store, engine, monitor, opener, catalog, cfg);
    return std::make_pair(manager, monitor);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_options(argc, argv);
    if (!options) {
        return options.error();
    }

    if (!options->session_bus && getuid() != 0) {
        std::cerr << "Error: This helper must run as root" << std::endl;
        return 1;
    }

    auto cfg = config::load_config(options->config_path);
    if (!cfg) {
        std::cerr << "Error: " << cfg.error().message << std::endl;
        return 1;
    }

    auto& logger = util::Logger::instance();
    if (!logger.initialize(cfg->logging.directory, "storage-eraser-helper", cfg->logging.level)) {
        std::cerr << "Warning: cannot write logs to " << cfg->logging.directory << std::endl;
    }
    logger.set_console_output(cfg->logging.console);

    LOG_INFO("Helper", std::format("storage-eraser-helper {} starting (config {})",
                                   PROJECT_VERSION, options->config_path));

    auto components = build_job_manager(*cfg);
    if (!components) {
        LOG_ERROR("Helper", std::format("Startup failed: {}", components.error().message));
        std::cerr << "Error: " << components.error().message << std::endl;
        return 1;
    }
    auto [manager, monitor] = std::move(*components);
    g_job_manager = manager;
    g_skip_authorization = options->session_bus;

    // Progress is produced on worker threads; signals are emitted from the main loop
    g_job_manager->set_progress_callback([](const WipeProgress& progress) {
        auto* progress_copy = new WipeProgress(progress);
        g_idle_add(
            [](gpointer data) -> gboolean {
                auto* progress = static_cast<WipeProgress*>(data);
                emit_job_progress(*progress);
                delete progress;
                return G_SOURCE_REMOVE;
            },
            progress_copy);
    });

    monitor->start();
    if (auto started = g_job_manager->start(); !started) {
        LOG_ERROR("Helper", std::format("Scheduler start failed: {}", started.error().message));
        monitor->stop();
        return 1;
    }

    g_main_loop = g_main_loop_new(nullptr, FALSE);
    g_unix_signal_add(SIGINT, on_quit_signal, nullptr);
    g_unix_signal_add(SIGTERM, on_quit_signal, nullptr);

    guint owner_id = g_bus_own_name(options->session_bus ? G_BUS_TYPE_SESSION : G_BUS_TYPE_SYSTEM,
                                    dbus_protocol::BUS_NAME, G_BUS_NAME_OWNER_FLAGS_NONE, nullptr,
                                    on_name_acquired, on_name_lost, nullptr, nullptr);

    g_main_loop_run(g_main_loop);

    // Running jobs stop at their next chunk boundary and stay Paused for the next start
    g_bus_unown_name(owner_id);
    g_job_manager->shutdown();
    monitor->stop();

    // Drain progress emissions queued by the workers
    while (g_main_context_iteration(nullptr, FALSE)) {
    }
    g_main_loop_unref(g_main_loop);
    g_job_manager.reset();

    LOG_INFO("Helper", "storage-eraser-helper stopped");
    logger.shutdown();
    return g_exit_code;
}
