/**
 * @file IJobManager.hpp
 * @brief Control surface for erasure jobs
 *
 * Implemented in-process by JobManager (inside the helper) and remotely by
 * DBusClient (inside the CLI), so front ends do not care where jobs run.
 */

#pragma once

#include "models/JobTypes.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>
#include <vector>

class IJobManager {
public:
    virtual ~IJobManager() = default;

    /**
     * @brief Create a Queued job
     * @return The new job id
     */
    virtual auto submit(const JobRequest& request) -> std::expected<std::string, util::Error> = 0;

    /**
     * @brief Ask a running job to stop at its next chunk boundary
     */
    virtual auto pause(const std::string& id) -> std::expected<void, util::Error> = 0;

    /**
     * @brief Re-dispatch a Paused job from its checkpoint; no-op on Completed jobs
     */
    virtual auto resume(const std::string& id) -> std::expected<void, util::Error> = 0;

    virtual auto cancel(const std::string& id) -> std::expected<void, util::Error> = 0;

    /**
     * @brief Remove a job that is not running from the store
     */
    virtual auto remove(const std::string& id) -> std::expected<void, util::Error> = 0;

    [[nodiscard]] virtual auto get_job(const std::string& id)
        -> std::expected<JobSnapshot, util::Error> = 0;

    [[nodiscard]] virtual auto list_jobs(const JobFilter& filter)
        -> std::expected<std::vector<JobSnapshot>, util::Error> = 0;

    [[nodiscard]] virtual auto list_plans() -> std::expected<std::vector<PlanInfo>, util::Error> = 0;

    /**
     * @brief Receive progress of every job; called from worker threads
     */
    virtual void set_progress_callback(ProgressCallback callback) = 0;
};
