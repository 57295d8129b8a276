/**
 * @file IJobStore.hpp
 * @brief Durable persistence of job records and checkpoints
 */

#pragma once

#include "models/JobTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

/**
 * @class IJobStore
 * @brief Single source of truth for JobRecord state
 *
 * Every mutating call is durable before it returns success. Failures are
 * reported with ErrorKind::StoreUnavailable unless the request itself was
 * invalid (NotFound, InvalidState).
 */
class IJobStore {
public:
    virtual ~IJobStore() = default;

    virtual auto create(const JobRecord& record) -> std::expected<void, util::Error> = 0;

    /**
     * @brief Load a record with its most recent durable checkpoint
     */
    virtual auto load(const std::string& id) -> std::expected<JobRecord, util::Error> = 0;

    /**
     * @brief Persist a checkpoint; rejects one that precedes the stored checkpoint
     */
    virtual auto save_checkpoint(const std::string& id, const Checkpoint& checkpoint)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Change state and replace the recorded error (nullopt clears it)
     */
    virtual auto set_state(const std::string& id, JobState state,
                           std::optional<util::Error> error)
        -> std::expected<void, util::Error> = 0;

    virtual auto attach_before_digests(const std::string& id, const DigestSet& digests)
        -> std::expected<void, util::Error> = 0;

    virtual auto attach_verification(const std::string& id, const VerificationResult& result)
        -> std::expected<void, util::Error> = 0;

    virtual auto record_warning(const std::string& id, const std::string& warning)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Accumulate running time of one engine run
     */
    virtual auto add_active_time(const std::string& id, double seconds)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Mark a paused job for automatic resumption on the next start
     */
    virtual auto set_interrupted(const std::string& id, bool interrupted)
        -> std::expected<void, util::Error> = 0;

    virtual auto list_jobs(const JobFilter& filter)
        -> std::expected<std::vector<JobRecord>, util::Error> = 0;

    virtual auto delete_job(const std::string& id) -> std::expected<void, util::Error> = 0;
};
