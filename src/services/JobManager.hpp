/**
 * @file JobManager.hpp
 * @brief Scheduler owning the job registry and the worker pool
 */

#pragma once

#include "config/EngineConfig.hpp"
#include "engine/ChunkedExecutionEngine.hpp"
#include "engine/JobControl.hpp"
#include "monitor/IResourceMonitor.hpp"
#include "patterns/PassPlanCatalog.hpp"
#include "services/IJobManager.hpp"
#include "store/IJobStore.hpp"
#include "targets/ITargetHandle.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @class JobManager
 * @brief Dispatches jobs by priority, dependency and target exclusion
 *
 * A pool of worker_ceiling threads pulls runnable jobs while fewer than
 * min(monitor workers, worker_ceiling) jobs run. A job is runnable when its
 * dependency (if any) is Completed and its target identity does not
 * conflict with a running job. Among runnable jobs the highest priority
 * wins, then the earliest createdAt.
 *
 * All mutations of a running job's record happen on its worker through
 * the engine; pause and cancel only raise the job's JobControl signal.
 */
class JobManager : public IJobManager {
public:
    JobManager(std::shared_ptr<IJobStore> store, std::shared_ptr<ChunkedExecutionEngine> engine,
               std::shared_ptr<IResourceMonitor> monitor, std::shared_ptr<ITargetOpener> opener,
               std::shared_ptr<PassPlanCatalog> catalog, const config::EngineConfig& config);
    ~JobManager() override;

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * @brief Recover stored jobs and start the worker pool
     *
     * Jobs found Running were interrupted by a crash: they become Paused
     * and, with auto_resume_interrupted, are queued for resumption along
     * with jobs paused by a previous shutdown().
     */
    [[nodiscard]] auto start() -> std::expected<void, util::Error>;

    /**
     * @brief Pause every running job at its next chunk boundary and join the workers
     */
    void shutdown();

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

    [[nodiscard]] auto running_jobs() const -> std::vector<std::string>;

private:
    static constexpr auto DISPATCH_RECHECK = std::chrono::milliseconds{250};

    struct PendingJob {
        std::string id;
        int32_t priority = 0;
        int64_t created_at = 0;
        std::optional<std::string> depends_on;
        std::string identity;
        bool resume = false;  ///< Continue from the stored checkpoint
    };

    struct ActiveJob {
        std::string identity;
        std::shared_ptr<JobControl> control;
    };

    void worker_loop();

    /**
     * @brief Run one dispatched job and retire it from active_
     *
     * A cancel that reaches the control after the engine already stopped
     * for a pause is completed here, so it is never lost.
     */
    void run_job(const PendingJob& job, JobControl& control);
    [[nodiscard]] auto execute_job(const PendingJob& job, JobControl& control)
        -> std::optional<EngineOutcome>;
    void fail_dispatch(const std::string& id, const util::Error& error);
    [[nodiscard]] auto cancel_idle_locked(const JobRecord& record)
        -> std::expected<void, util::Error>;

    [[nodiscard]] auto capacity() const -> size_t;
    [[nodiscard]] auto take_runnable_locked() -> std::optional<PendingJob>;
    [[nodiscard]] auto conflicts_with_active_locked(const std::string& identity) const -> bool;
    void enqueue_locked(const JobRecord& record, bool resume);

    [[nodiscard]] auto build_record(const JobRequest& request)
        -> std::expected<JobRecord, util::Error>;
    void release_placeholder(const JobRecord& record);

    void on_progress(const WipeProgress& progress);
    void publish_state(const std::string& id, JobState state);
    [[nodiscard]] auto snapshot(JobRecord record) const -> JobSnapshot;

    std::shared_ptr<IJobStore> store_;
    std::shared_ptr<ChunkedExecutionEngine> engine_;
    std::shared_ptr<IResourceMonitor> monitor_;
    std::shared_ptr<ITargetOpener> opener_;
    std::shared_ptr<PassPlanCatalog> catalog_;
    config::EngineConfig config_;

    mutable std::mutex mutex_;  // Protects pending_, active_, shutdown state and workers_
    std::condition_variable dispatch_cv_;
    std::map<std::string, PendingJob> pending_;
    std::map<std::string, ActiveJob> active_;
    std::set<std::string> paused_for_shutdown_;
    bool started_ = false;
    bool stopping_ = false;
    std::vector<std::thread> workers_;

    mutable std::mutex progress_mutex_;  // Protects progress_ and progress_callback_
    std::map<std::string, WipeProgress> progress_;
    ProgressCallback progress_callback_;
};
