/**
 * @file CliApplication.hpp
 * @brief CLI application for storage erasure jobs
 */

#pragma once

#include "models/JobTypes.hpp"
#include "services/IJobManager.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cli {

enum class Command { None, Submit, List, Show, Pause, Resume, Cancel, Delete, Plans };

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool json_output = false;
    bool no_confirm = false;
    bool watch = false;
    bool session_bus = false;
    Command command = Command::None;
    std::string argument;             ///< Target path for --submit, job id otherwise
    JobRequest request;
    std::optional<JobState> state_filter;
    std::string error;                ///< Non-empty when the command line was rejected
};

/**
 * @class CliApplication
 * @brief Command-line front end for the erasure helper
 *
 * Provides command-line interface for:
 * - Submitting jobs and watching their progress
 * - Listing and inspecting jobs as tables or JSON
 * - Pausing, resuming, cancelling and deleting jobs
 */
class CliApplication {
public:
    /**
     * @param manager Job manager to drive; connect() creates a DBusClient when null
     */
    explicit CliApplication(std::unique_ptr<IJobManager> manager = nullptr);
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Execute an already parsed command against the job manager
     */
    auto execute(const CliOptions& options) -> int;

    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

    static void print_jobs_json(std::ostream& out, const std::vector<JobSnapshot>& jobs);
    static void print_jobs_table(std::ostream& out, const std::vector<JobSnapshot>& jobs);
    static void print_job_json(std::ostream& out, const JobSnapshot& job);
    static void print_job_details(std::ostream& out, const JobSnapshot& job);
    static void print_plans_table(std::ostream& out, const std::vector<PlanInfo>& plans);

    /**
     * @brief Escape a string for inclusion in a JSON document
     */
    [[nodiscard]] static auto json_escape(const std::string& text) -> std::string;

private:
    [[nodiscard]] auto connect(bool session_bus) -> bool;

    auto cmd_submit(const CliOptions& options) -> int;
    auto cmd_list(const CliOptions& options) -> int;
    auto cmd_show(const CliOptions& options) -> int;
    auto cmd_control(const CliOptions& options) -> int;
    auto cmd_plans(const CliOptions& options) -> int;

    /**
     * @brief Follow a job until it leaves Queued and Running
     *
     * Ctrl-C asks the helper to pause the job.
     */
    auto watch_job(const std::string& id) -> int;

    [[nodiscard]] static auto confirm_submit(const CliOptions& options) -> bool;

    static auto report_error(const std::string& what, const util::Error& error) -> int;

    std::unique_ptr<IJobManager> manager_;
};

}  // namespace cli
