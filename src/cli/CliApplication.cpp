/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "services/DBusClient.hpp"
#include "util/Logger.hpp"

#include <gio/gio.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_pause_requested{false};

void signal_handler(int /*signal*/) {
    g_pause_requested.store(true);
}

// Application name
constexpr auto APP_NAME = "storage-eraser-cli";

constexpr auto WATCH_POLL_INTERVAL = std::chrono::milliseconds{500};

enum LongOnlyOption {
    OPT_AFTER = 1000,
    OPT_VERIFY,
    OPT_HASH,
    OPT_DEADLINE,
    OPT_KEEP,
    OPT_STATE,
    OPT_SHOW,
    OPT_PAUSE,
    OPT_RESUME,
    OPT_CANCEL,
    OPT_DELETE,
    OPT_PLANS,
    OPT_PRIORITY,
    OPT_SESSION
};

// Command line options
const struct option long_options[] = {
    {    "help",       no_argument, nullptr,           'h'},
    { "version",       no_argument, nullptr,           'V'},
    {  "submit", required_argument, nullptr,           's'},
    {    "kind", required_argument, nullptr,           'k'},
    {    "plan", required_argument, nullptr,           'p'},
    {"priority", required_argument, nullptr,  OPT_PRIORITY},
    {   "after", required_argument, nullptr,     OPT_AFTER},
    {  "verify", required_argument, nullptr,    OPT_VERIFY},
    {    "hash", required_argument, nullptr,      OPT_HASH},
    {"deadline", required_argument, nullptr,  OPT_DEADLINE},
    {    "keep",       no_argument, nullptr,      OPT_KEEP},
    {   "watch",       no_argument, nullptr,           'w'},
    {    "list",       no_argument, nullptr,           'l'},
    {   "state", required_argument, nullptr,     OPT_STATE},
    {    "show", required_argument, nullptr,      OPT_SHOW},
    {   "pause", required_argument, nullptr,     OPT_PAUSE},
    {  "resume", required_argument, nullptr,    OPT_RESUME},
    {  "cancel", required_argument, nullptr,    OPT_CANCEL},
    {  "delete", required_argument, nullptr,    OPT_DELETE},
    {   "plans",       no_argument, nullptr,     OPT_PLANS},
    {    "json",       no_argument, nullptr,           'j'},
    {     "yes",       no_argument, nullptr,           'y'},
    { "session",       no_argument, nullptr,   OPT_SESSION},
    {   nullptr,                 0, nullptr,             0}
};

template <typename T>
auto parse_number(const char* text) -> std::optional<T> {
    T value{};
    const char* end = text + std::char_traits<char>::length(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto split_list(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::string current;
    for (char c : text) {
        if (c == ',') {
            if (!current.empty()) {
                items.push_back(current);
            }
            current.clear();
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (!current.empty()) {
        items.push_back(current);
    }
    return items;
}

auto format_timestamp(int64_t usec) -> std::string {
    if (usec <= 0) {
        return "";
    }
    GDateTime* time = g_date_time_new_from_unix_utc(usec / G_USEC_PER_SEC);
    if (!time) {
        return "";
    }
    gchar* text = g_date_time_format_iso8601(time);
    std::string result = text ? text : "";
    g_free(text);
    g_date_time_unref(time);
    return result;
}

/**
 * Overall completion of a job, from live progress when available
 */
auto job_percentage(const JobSnapshot& job) -> double {
    const auto& record = job.record;
    if (record.state == JobState::Completed) {
        return 100.0;
    }
    if (job.progress && job.progress->pass_bytes > 0) {
        return job.progress->percentage();
    }
    if (record.passes.empty() || record.target_size == 0) {
        return 0.0;
    }
    const double fraction =
        (static_cast<double>(record.checkpoint.pass_index) +
         static_cast<double>(record.checkpoint.byte_offset) /
             static_cast<double>(record.target_size)) /
        static_cast<double>(record.passes.size());
    return std::clamp(fraction * 100.0, 0.0, 100.0);
}

auto json_string(const std::string& text) -> std::string {
    return "\"" + CliApplication::json_escape(text) + "\"";
}

auto json_bool(bool value) -> const char* {
    return value ? "true" : "false";
}

void print_job_object(std::ostream& out, const JobSnapshot& job, const std::string& indent) {
    const auto& record = job.record;
    const std::string in = indent + "  ";

    out << indent << "{\n";
    out << in << "\"id\": " << json_string(record.id) << ",\n";
    out << in << "\"state\": " << json_string(std::string(job_state_to_string(record.state)))
        << ",\n";
    out << in << "\"kind\": "
        << json_string(std::string(target_kind_to_string(target_kind(record.target)))) << ",\n";
    out << in << "\"target\": " << json_string(target_location(record.target)) << ",\n";
    out << in << "\"size_bytes\": " << record.target_size << ",\n";
    out << in << "\"plan\": " << json_string(record.plan_name) << ",\n";
    out << in << "\"passes\": " << record.passes.size() << ",\n";
    out << in << "\"priority\": " << record.priority << ",\n";
    out << in << "\"depends_on\": "
        << (record.depends_on ? json_string(*record.depends_on) : std::string("null")) << ",\n";
    out << in << "\"checkpoint\": {\"pass\": " << record.checkpoint.pass_index
        << ", \"offset\": " << record.checkpoint.byte_offset
        << ", \"chunk_size\": " << record.checkpoint.chunk_size << "},\n";
    out << in << "\"percentage\": " << std::format("{:.1f}", job_percentage(job)) << ",\n";
    out << in << "\"created_at\": " << json_string(format_timestamp(record.created_at)) << ",\n";
    out << in << "\"updated_at\": " << json_string(format_timestamp(record.updated_at)) << ",\n";
    out << in << "\"active_seconds\": " << std::format("{:.1f}", record.active_seconds) << ",\n";
    out << in << "\"deadline\": "
        << (record.deadline ? json_string(format_timestamp(*record.deadline)) : std::string("null"))
        << ",\n";

    out << in << "\"verification\": {\"level\": "
        << json_string(std::string(verification_level_to_string(record.verification.level)));
    if (record.verification_result) {
        const auto& result = *record.verification_result;
        out << ", \"verified\": " << json_bool(result.verified)
            << ", \"windows_checked\": " << result.windows_checked
            << ", \"note\": " << json_string(result.note) << ", \"algorithms\": {";
        bool first = true;
        for (const auto& [name, verdict] : result.algorithms) {
            out << (first ? "" : ", ") << json_string(name) << ": {\"before\": "
                << json_string(verdict.before) << ", \"after\": " << json_string(verdict.after)
                << ", \"verified\": " << json_bool(verdict.verified)
                << ", \"unchanged_windows\": " << verdict.unchanged_windows << "}";
            first = false;
        }
        out << "}";
    }
    out << "},\n";

    out << in << "\"warnings\": [";
    for (size_t i = 0; i < record.warnings.size(); ++i) {
        out << (i > 0 ? ", " : "") << json_string(record.warnings[i]);
    }
    out << "],\n";

    out << in << "\"error\": ";
    if (record.error) {
        out << "{\"kind\": " << json_string(std::string(util::kind_to_string(record.error->kind)))
            << ", \"message\": " << json_string(record.error->message) << "}";
    } else {
        out << "null";
    }
    out << ",\n";

    out << in << "\"progress\": ";
    if (job.progress) {
        const auto& p = *job.progress;
        out << "{\"pass\": " << p.current_pass << ", \"total_passes\": " << p.total_passes
            << ", \"bytes_done\": " << p.bytes_done << ", \"pass_bytes\": " << p.pass_bytes
            << ", \"speed\": " << p.speed_bytes_per_sec
            << ", \"eta_seconds\": " << p.estimated_seconds_remaining << "}";
    } else {
        out << "null";
    }
    out << "\n" << indent << "}";
}

}  // namespace

CliApplication::CliApplication(std::unique_ptr<IJobManager> manager)
    : manager_(std::move(manager)) {}

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "storage-eraser" / "logs";
    util::Logger::instance().initialize(log_dir, "storage-eraser-cli");

    auto options = parse_args(argc, argv);

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help for usage.\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.command == Command::None) {
        print_help();
        return 1;
    }

    if (!connect(options.session_bus)) {
        std::cerr << "Error: Failed to connect to storage-eraser-helper service.\n"
                  << "Make sure the helper is installed and D-Bus is running.\n";
        return 1;
    }

    return execute(options);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    auto set_command = [&options](Command command, const char* argument) {
        if (options.command != Command::None && options.command != command) {
            options.error = "only one command may be given";
        }
        options.command = command;
        options.argument = argument ? argument : "";
    };

    optind = 1;
    int opt;
    while ((opt = getopt_long(argc, argv, "hVs:k:p:wljy", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 's':
                set_command(Command::Submit, optarg);
                break;
            case 'k': {
                auto kind = target_kind_from_string(optarg);
                if (!kind) {
                    options.error = std::format("unknown target kind '{}'", optarg);
                } else {
                    options.request.kind = *kind;
                }
                break;
            }
            case 'p':
                options.request.plan = optarg;
                break;
            case OPT_PRIORITY: {
                auto priority = parse_number<int32_t>(optarg);
                if (!priority) {
                    options.error = std::format("invalid priority '{}'", optarg);
                } else {
                    options.request.priority = *priority;
                }
                break;
            }
            case OPT_AFTER:
                options.request.depends_on = optarg;
                break;
            case OPT_VERIFY: {
                auto level = verification_level_from_string(optarg);
                if (!level) {
                    options.error = std::format("unknown verification level '{}'", optarg);
                } else {
                    options.request.verify = *level;
                }
                break;
            }
            case OPT_HASH:
                options.request.algorithms = split_list(optarg);
                if (options.request.algorithms.empty()) {
                    options.error = "--hash needs at least one algorithm";
                }
                break;
            case OPT_DEADLINE: {
                auto seconds = parse_number<int64_t>(optarg);
                if (!seconds || *seconds <= 0) {
                    options.error = std::format("invalid deadline '{}'", optarg);
                } else {
                    options.request.deadline_seconds = *seconds;
                }
                break;
            }
            case OPT_KEEP:
                options.request.keep = true;
                break;
            case 'w':
                options.watch = true;
                break;
            case 'l':
                set_command(Command::List, nullptr);
                break;
            case OPT_STATE: {
                auto state = job_state_from_string(optarg);
                if (!state) {
                    options.error = std::format("unknown state '{}'", optarg);
                } else {
                    options.state_filter = *state;
                }
                break;
            }
            case OPT_SHOW:
                set_command(Command::Show, optarg);
                break;
            case OPT_PAUSE:
                set_command(Command::Pause, optarg);
                break;
            case OPT_RESUME:
                set_command(Command::Resume, optarg);
                break;
            case OPT_CANCEL:
                set_command(Command::Cancel, optarg);
                break;
            case OPT_DELETE:
                set_command(Command::Delete, optarg);
                break;
            case OPT_PLANS:
                set_command(Command::Plans, nullptr);
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            case OPT_SESSION:
                options.session_bus = true;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    if (optind < argc && options.error.empty()) {
        options.error = std::format("unexpected argument '{}'", argv[optind]);
    }

    if (options.command == Command::Submit && options.argument.empty() && options.error.empty()) {
        options.error = "--submit needs a target path";
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Resumable, verifiable storage erasure\n\n"
              << "Commands:\n"
              << "  -s, --submit <path>     Queue an erasure job for <path>\n"
              << "  -l, --list              List jobs\n"
              << "      --show <id>         Show one job\n"
              << "      --pause <id>        Pause a running job at its next checkpoint\n"
              << "      --resume <id>       Resume a paused job from its checkpoint\n"
              << "      --cancel <id>       Cancel a queued, running or paused job\n"
              << "      --delete <id>       Remove a job that is not running\n"
              << "      --plans             List pass plans\n\n"
              << "Submit options:\n"
              << "  -k, --kind <kind>       file, dir, free-space or drive (default: file)\n"
              << "  -p, --plan <name>       Pass plan (default: zero), or custom:<d1>,<d2>,...\n"
              << "      --priority <n>      Higher runs first (default: 0)\n"
              << "      --after <id>        Run only after job <id> completed\n"
              << "      --verify <level>    none, sample, standard or full (default: standard)\n"
              << "      --hash <list>       Digest algorithms, e.g. sha256,sha512\n"
              << "      --deadline <sec>    Fail the job if not done within <sec> seconds\n"
              << "      --keep              Keep erased files in place\n"
              << "  -w, --watch             Show progress until the job stops\n"
              << "  -y, --yes               Skip confirmation prompt\n\n"
              << "Other options:\n"
              << "      --state <state>     Filter --list by state\n"
              << "  -j, --json              Output in JSON format\n"
              << "      --session           Talk to a helper on the session bus\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --plans\n"
              << "  " << APP_NAME << " --submit ~/old-taxes --kind dir --plan dod-3pass --watch\n"
              << "  " << APP_NAME << " --submit /dev/sdb --kind drive --verify full\n"
              << "  " << APP_NAME << " --list --state paused --json\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of storage-eraser - resumable, verifiable storage erasure\n";
}

auto CliApplication::connect(bool session_bus) -> bool {
    if (manager_) {
        return true;
    }

    auto client = std::make_unique<DBusClient>(session_bus ? G_BUS_TYPE_SESSION : G_BUS_TYPE_SYSTEM);
    auto connected = client->connect();
    if (!connected) {
        LOG_ERROR("CLI", connected.error().message);
        return false;
    }
    manager_ = std::move(client);
    return true;
}

auto CliApplication::execute(const CliOptions& options) -> int {
    switch (options.command) {
        case Command::Submit:
            return cmd_submit(options);
        case Command::List:
            return cmd_list(options);
        case Command::Show:
            return cmd_show(options);
        case Command::Pause:
        case Command::Resume:
        case Command::Cancel:
        case Command::Delete:
            return cmd_control(options);
        case Command::Plans:
            return cmd_plans(options);
        case Command::None:
            break;
    }
    print_help();
    return 1;
}

auto CliApplication::report_error(const std::string& what, const util::Error& error) -> int {
    LOG_ERROR("CLI", std::format("{}: {} ({})", what, error.message,
                                 util::kind_to_string(error.kind)));
    std::cerr << "Error: " << what << ": " << error.message << "\n";
    return 1;
}

auto CliApplication::cmd_submit(const CliOptions& options) -> int {
    JobRequest request = options.request;
    std::error_code ec;
    auto absolute = std::filesystem::absolute(options.argument, ec);
    request.path = ec ? options.argument : absolute.lexically_normal().string();

    if (!options.no_confirm) {
        CliOptions shown = options;
        shown.request = request;
        if (!confirm_submit(shown)) {
            std::cout << "Aborted.\n";
            return 1;
        }
    }

    auto id = manager_->submit(request);
    if (!id) {
        return report_error(std::format("cannot submit {}", request.path), id.error());
    }

    LOG_INFO("CLI", std::format("Submitted job {} for {}", *id, request.path));
    if (options.json_output) {
        std::cout << "{\"id\": " << json_string(*id) << "}\n";
    } else {
        std::cout << "Submitted job " << *id << "\n";
    }

    if (options.watch) {
        return watch_job(*id);
    }
    return 0;
}

auto CliApplication::cmd_list(const CliOptions& options) -> int {
    auto jobs = manager_->list_jobs(JobFilter{.state = options.state_filter});
    if (!jobs) {
        return report_error("cannot list jobs", jobs.error());
    }

    if (jobs->empty()) {
        if (options.json_output) {
            std::cout << "[]\n";
        } else {
            std::cout << "No jobs found.\n";
        }
        return 0;
    }

    if (options.json_output) {
        print_jobs_json(std::cout, *jobs);
    } else {
        print_jobs_table(std::cout, *jobs);
    }
    return 0;
}

auto CliApplication::cmd_show(const CliOptions& options) -> int {
    auto job = manager_->get_job(options.argument);
    if (!job) {
        return report_error(std::format("cannot show job {}", options.argument), job.error());
    }

    if (options.json_output) {
        print_job_json(std::cout, *job);
    } else {
        print_job_details(std::cout, *job);
    }
    return 0;
}

auto CliApplication::cmd_control(const CliOptions& options) -> int {
    const auto& id = options.argument;
    std::expected<void, util::Error> result;
    std::string done;

    switch (options.command) {
        case Command::Pause:
            result = manager_->pause(id);
            done = "pause requested";
            break;
        case Command::Resume:
            result = manager_->resume(id);
            done = "resumed";
            break;
        case Command::Cancel:
            result = manager_->cancel(id);
            done = "cancel requested";
            break;
        case Command::Delete:
            result = manager_->remove(id);
            done = "deleted";
            break;
        default:
            return 1;
    }

    if (!result) {
        return report_error(std::format("job {}", id), result.error());
    }

    LOG_INFO("CLI", std::format("Job {} {}", id, done));
    std::cout << "Job " << id << " " << done << "\n";

    if (options.watch && options.command == Command::Resume) {
        return watch_job(id);
    }
    return 0;
}

auto CliApplication::cmd_plans(const CliOptions& options) -> int {
    auto plans = manager_->list_plans();
    if (!plans) {
        return report_error("cannot list plans", plans.error());
    }

    if (options.json_output) {
        std::cout << "[\n";
        for (size_t i = 0; i < plans->size(); ++i) {
            const auto& plan = (*plans)[i];
            std::cout << "  {\"name\": " << json_string(plan.name)
                      << ", \"passes\": " << plan.pass_count
                      << ", \"description\": " << json_string(plan.description) << "}"
                      << (i + 1 < plans->size() ? "," : "") << "\n";
        }
        std::cout << "]\n";
    } else {
        print_plans_table(std::cout, *plans);
    }
    return 0;
}

auto CliApplication::watch_job(const std::string& id) -> int {
    auto job = manager_->get_job(id);
    if (!job) {
        return report_error(std::format("cannot watch job {}", id), job.error());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    g_pause_requested.store(false);

    ProgressDisplay display(*job, std::cout, ProgressDisplay::is_terminal());

    std::mutex latest_mutex;
    std::optional<WipeProgress> latest;
    manager_->set_progress_callback([&](const WipeProgress& progress) {
        if (progress.job_id != id || progress.pass_bytes == 0) {
            return;
        }
        std::lock_guard lock(latest_mutex);
        latest = progress;
    });

    auto* main_context = g_main_context_default();
    auto next_poll = std::chrono::steady_clock::now();
    bool pause_sent = false;
    JobSnapshot current = *job;
    int exit_code = 0;

    while (true) {
        // Process GLib events for D-Bus signals
        while (g_main_context_iteration(main_context, FALSE)) {
        }

        {
            std::lock_guard lock(latest_mutex);
            if (latest) {
                display.update(*latest);
                latest.reset();
            }
        }

        if (g_pause_requested.load() && !pause_sent) {
            pause_sent = true;
            std::cerr << "\nPause requested...\n";
            if (auto paused = manager_->pause(id); !paused) {
                exit_code = report_error(std::format("cannot pause job {}", id), paused.error());
                break;
            }
        }

        if (std::chrono::steady_clock::now() >= next_poll) {
            auto snapshot = manager_->get_job(id);
            if (!snapshot) {
                exit_code = report_error(std::format("lost job {}", id), snapshot.error());
                break;
            }
            current = std::move(*snapshot);
            if (current.record.state != JobState::Queued &&
                current.record.state != JobState::Running) {
                break;
            }
            next_poll = std::chrono::steady_clock::now() + WATCH_POLL_INTERVAL;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    manager_->set_progress_callback(nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (exit_code != 0) {
        return exit_code;
    }

    const auto& record = current.record;
    switch (record.state) {
        case JobState::Completed: {
            std::string message = "Erasure completed";
            if (record.verification_result) {
                message += record.verification_result->verified
                               ? ", verification confirmed every digest changed"
                               : ", verification did not confirm the erasure";
            }
            display.complete(true, message);
            return 0;
        }
        case JobState::Paused:
            display.paused(std::format("Stopped at pass {}, offset {}. Resume with --resume {}",
                                       record.checkpoint.pass_index + 1,
                                       record.checkpoint.byte_offset, id));
            return 0;
        case JobState::Failed:
            display.complete(false, record.error ? record.error->message : "Job failed");
            return 1;
        default:
            display.complete(false, "Job cancelled");
            return 1;
    }
}

auto CliApplication::confirm_submit(const CliOptions& options) -> bool {
    const auto& request = options.request;
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will PERMANENTLY DESTROY all data in " << request.path
              << "!\033[0m\n";
    std::cout << "Target kind: " << target_kind_to_string(request.kind) << "\n";
    std::cout << "Plan: " << request.plan << "\n";
    if (request.kind != TargetKind::Drive && request.kind != TargetKind::FreeSpace) {
        std::cout << (request.keep ? "Files are kept in place after erasure\n"
                                   : "Files are removed after erasure\n");
    }
    std::cout << "\nType 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

auto CliApplication::json_escape(const std::string& text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    escaped.push_back(c);
                }
        }
    }
    return escaped;
}

void CliApplication::print_jobs_json(std::ostream& out, const std::vector<JobSnapshot>& jobs) {
    out << "[\n";
    for (size_t i = 0; i < jobs.size(); ++i) {
        print_job_object(out, jobs[i], "  ");
        out << (i < jobs.size() - 1 ? "," : "") << "\n";
    }
    out << "]\n";
}

void CliApplication::print_job_json(std::ostream& out, const JobSnapshot& job) {
    print_job_object(out, job, "");
    out << "\n";
}

void CliApplication::print_jobs_table(std::ostream& out, const std::vector<JobSnapshot>& jobs) {
    // Column widths for table formatting
    constexpr int COL_ID = 38;
    constexpr int COL_STATE = 11;
    constexpr int COL_KIND = 12;
    constexpr int COL_PROGRESS = 10;
    constexpr int COL_PLAN = 18;

    out << std::left << std::setw(COL_ID) << "ID" << std::setw(COL_STATE) << "STATE"
        << std::setw(COL_KIND) << "KIND" << std::setw(COL_PROGRESS) << "PROGRESS"
        << std::setw(COL_PLAN) << "PLAN"
        << "TARGET\n";
    out << std::string(COL_ID + COL_STATE + COL_KIND + COL_PROGRESS + COL_PLAN + 20, '-') << "\n";

    for (const auto& job : jobs) {
        const auto& record = job.record;

        std::string plan = record.plan_name;
        if (plan.length() > COL_PLAN - 2) {
            plan = plan.substr(0, COL_PLAN - 5) + "...";
        }

        out << std::left << std::setw(COL_ID) << record.id << std::setw(COL_STATE)
            << job_state_to_string(record.state) << std::setw(COL_KIND)
            << target_kind_to_string(target_kind(record.target)) << std::setw(COL_PROGRESS)
            << std::format("{:.1f}%", job_percentage(job)) << std::setw(COL_PLAN) << plan
            << target_location(record.target) << "\n";
    }
}

void CliApplication::print_job_details(std::ostream& out, const JobSnapshot& job) {
    const auto& record = job.record;
    constexpr int LABEL = 16;

    auto row = [&out](const std::string& label, const std::string& value) {
        out << std::left << std::setw(LABEL) << label << value << "\n";
    };

    row("Job:", record.id);
    row("State:", std::string(job_state_to_string(record.state)));
    row("Target:", std::format("{} ({}, {})", target_location(record.target),
                               target_kind_to_string(target_kind(record.target)),
                               ProgressDisplay::format_bytes(record.target_size)));
    row("Plan:", std::format("{} ({} pass{})", record.plan_name, record.passes.size(),
                             record.passes.size() == 1 ? "" : "es"));
    row("Priority:", std::to_string(record.priority));
    if (record.depends_on) {
        row("After:", *record.depends_on);
    }
    row("Progress:", std::format("{:.1f}% (pass {}, offset {})", job_percentage(job),
                                 record.checkpoint.pass_index + 1, record.checkpoint.byte_offset));
    if (job.progress && job.progress->speed_bytes_per_sec > 0) {
        row("Speed:", ProgressDisplay::format_speed(job.progress->speed_bytes_per_sec));
        row("ETA:", ProgressDisplay::format_duration(job.progress->estimated_seconds_remaining));
    }
    row("Created:", format_timestamp(record.created_at));
    row("Updated:", format_timestamp(record.updated_at));
    row("Active time:", ProgressDisplay::format_duration(static_cast<int64_t>(record.active_seconds)));
    if (record.deadline) {
        row("Deadline:", format_timestamp(*record.deadline));
    }

    row("Verification:", std::string(verification_level_to_string(record.verification.level)));
    if (record.verification_result) {
        const auto& result = *record.verification_result;
        row("  Verified:", result.verified ? "yes" : "no");
        row("  Windows:", std::to_string(result.windows_checked));
        for (const auto& [name, verdict] : result.algorithms) {
            row("  " + name + ":",
                std::format("{} ({} unchanged window{})", verdict.verified ? "changed" : "UNCHANGED",
                            verdict.unchanged_windows, verdict.unchanged_windows == 1 ? "" : "s"));
        }
        if (!result.note.empty()) {
            row("  Note:", result.note);
        }
    }

    if (record.error) {
        row("Error:", std::format("{} ({})", record.error->message,
                                  util::kind_to_string(record.error->kind)));
    }
    for (const auto& warning : record.warnings) {
        row("Warning:", warning);
    }
}

void CliApplication::print_plans_table(std::ostream& out, const std::vector<PlanInfo>& plans) {
    constexpr int COL_NAME = 20;
    constexpr int COL_PASSES = 8;

    out << std::left << std::setw(COL_NAME) << "PLAN" << std::setw(COL_PASSES) << "PASSES"
        << "DESCRIPTION\n";
    out << std::string(COL_NAME + COL_PASSES + 40, '-') << "\n";
    for (const auto& plan : plans) {
        out << std::left << std::setw(COL_NAME) << plan.name << std::setw(COL_PASSES)
            << plan.pass_count << plan.description << "\n";
    }
}

}  // namespace cli
