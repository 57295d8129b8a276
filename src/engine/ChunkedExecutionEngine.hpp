/**
 * @file ChunkedExecutionEngine.hpp
 * @brief Drives one job's passes as durable, checkpointed chunk writes
 */

#pragma once

#include "config/EngineConfig.hpp"
#include "engine/JobControl.hpp"
#include "models/JobTypes.hpp"
#include "monitor/IResourceMonitor.hpp"
#include "patterns/IPatternSource.hpp"
#include "store/IJobStore.hpp"
#include "targets/ITargetHandle.hpp"
#include "util/Error.hpp"
#include "verification/Verifier.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @struct EngineOutcome
 * @brief Final state of one engine run
 */
struct EngineOutcome {
    JobState state = JobState::Failed;
    std::optional<util::Error> error;
};

/**
 * @class ChunkedExecutionEngine
 * @brief Turns a job into a resumable sequence of chunk writes
 *
 * For every chunk: generate, write, and (every sync_interval_chunks chunks
 * and at the end of each pass) sync the target before persisting the
 * checkpoint. Pause, cancel and the job deadline are honoured only at chunk
 * boundaries, after any pending data has been synced and checkpointed.
 *
 * One engine instance can run several jobs concurrently; each run is
 * single-threaded.
 */
class ChunkedExecutionEngine {
public:
    ChunkedExecutionEngine(std::shared_ptr<IJobStore> store,
                           std::shared_ptr<IPatternSource> patterns,
                           std::shared_ptr<IResourceMonitor> monitor,
                           std::shared_ptr<ITargetOpener> opener,
                           std::shared_ptr<verification::Verifier> verifier,
                           const config::EngineSettings& settings);

    /**
     * @brief Run a Queued or Paused job to its next stopping point
     * @param job Record as last read from the store
     * @param resume_from_checkpoint Continue from the stored checkpoint after
     *        re-validating the target; false requires a job that never wrote
     * @param control Pause/cancel signal for this run
     * @param progress Optional per-chunk progress sink
     *
     * Running a Completed job is a no-op returning Completed.
     */
    auto run(const JobRecord& job, bool resume_from_checkpoint, JobControl& control,
             const ProgressCallback& progress) -> EngineOutcome;

    /**
     * @brief Clamp and align a recommended chunk size to the configured bounds
     */
    [[nodiscard]] auto effective_chunk_size(uint64_t recommended) const -> uint64_t;

private:
    struct RunState;

    auto execute(RunState& run) -> EngineOutcome;
    auto capture_before(RunState& run) -> std::expected<void, util::Error>;
    auto run_pass(RunState& run, uint32_t pass_index) -> std::optional<EngineOutcome>;
    auto finish_verification(RunState& run) -> std::expected<void, util::Error>;
    auto stop_outcome(RunState& run, ControlSignal signal) -> EngineOutcome;
    auto fail(RunState& run, util::Error error) -> EngineOutcome;

    template <typename Op>
    auto with_retry(const std::string& job_id, std::string_view what, Op&& op)
        -> std::expected<void, util::Error>;

    [[nodiscard]] static auto deadline_passed(const JobRecord& job) -> bool;

    std::shared_ptr<IJobStore> store_;
    std::shared_ptr<IPatternSource> patterns_;
    std::shared_ptr<IResourceMonitor> monitor_;
    std::shared_ptr<ITargetOpener> opener_;
    std::shared_ptr<verification::Verifier> verifier_;
    config::EngineSettings settings_;
};
