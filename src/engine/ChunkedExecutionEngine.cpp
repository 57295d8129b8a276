/**
 * @file ChunkedExecutionEngine.cpp
 * @brief Drives one job's passes as durable, checkpointed chunk writes
 */

#include "engine/ChunkedExecutionEngine.hpp"

#include "engine/ProgressTracker.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

struct ChunkedExecutionEngine::RunState {
    JobRecord job;
    JobControl& control;
    ProgressTracker tracker;
    std::unique_ptr<ITargetHandle> target;
    std::vector<uint8_t> buffer;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    bool time_recorded = false;
};

namespace {

auto signal_name(ControlSignal signal) -> std::string_view {
    return signal == ControlSignal::Cancel ? "cancel" : "pause";
}

}  // namespace

ChunkedExecutionEngine::ChunkedExecutionEngine(std::shared_ptr<IJobStore> store,
                                               std::shared_ptr<IPatternSource> patterns,
                                               std::shared_ptr<IResourceMonitor> monitor,
                                               std::shared_ptr<ITargetOpener> opener,
                                               std::shared_ptr<verification::Verifier> verifier,
                                               const config::EngineSettings& settings)
    : store_(std::move(store)),
      patterns_(std::move(patterns)),
      monitor_(std::move(monitor)),
      opener_(std::move(opener)),
      verifier_(std::move(verifier)),
      settings_(settings) {}

auto ChunkedExecutionEngine::effective_chunk_size(uint64_t recommended) const -> uint64_t {
    const uint64_t lower = std::max(settings_.min_chunk_size, config::CHUNK_ALIGNMENT);
    const uint64_t upper = std::max(settings_.max_chunk_size, lower);
    const uint64_t clamped = std::clamp(recommended, lower, upper);
    return std::max(clamped / config::CHUNK_ALIGNMENT * config::CHUNK_ALIGNMENT,
                    config::CHUNK_ALIGNMENT);
}

auto ChunkedExecutionEngine::deadline_passed(const JobRecord& job) -> bool {
    return job.deadline && g_get_real_time() >= *job.deadline;
}

template <typename Op>
auto ChunkedExecutionEngine::with_retry(const std::string& job_id, std::string_view what, Op&& op)
    -> std::expected<void, util::Error> {
    for (uint32_t attempt = 0;; ++attempt) {
        auto result = op();
        if (result || !result.error().is_transient()) {
            return result;
        }
        if (attempt >= settings_.max_transient_retries) {
            return std::unexpected(util::Error{
                result.error().kind,
                std::format("{} (gave up after {} retries)", result.error().message, attempt),
                result.error().code});
        }
        const auto delay =
            std::chrono::milliseconds(static_cast<uint64_t>(settings_.retry_backoff_ms) << attempt);
        LOG_WARNING("Engine", std::format("Job {}: {} failed: {}; retry {}/{} in {} ms", job_id,
                                          what, result.error().message, attempt + 1,
                                          settings_.max_transient_retries, delay.count()));
        std::this_thread::sleep_for(delay);
    }
}

auto ChunkedExecutionEngine::run(const JobRecord& job, bool resume_from_checkpoint,
                                 JobControl& control, const ProgressCallback& progress)
    -> EngineOutcome {
    if (job.state == JobState::Completed) {
        LOG_INFO("Engine", std::format("Job {} already completed; nothing to run", job.id));
        return EngineOutcome{.state = JobState::Completed, .error = std::nullopt};
    }
    if (job.state != JobState::Queued && job.state != JobState::Paused) {
        return EngineOutcome{
            .state = job.state,
            .error = util::Error{util::ErrorKind::InvalidState,
                                 std::format("job {} is {} and cannot run", job.id,
                                             job_state_to_string(job.state))}};
    }

    // The store holds the newest durable checkpoint
    auto current = store_->load(job.id);
    if (!current) {
        LOG_ERROR("Engine", std::format("Job {}: cannot load record: {}", job.id,
                                        current.error().message));
        return EngineOutcome{.state = JobState::Failed, .error = current.error()};
    }

    const bool at_origin = current->checkpoint.position() == Checkpoint{}.position();
    if (!resume_from_checkpoint && !at_origin) {
        return EngineOutcome{
            .state = current->state,
            .error = util::Error{util::ErrorKind::InvalidState,
                                 std::format("job {} has progress and must be resumed", job.id)}};
    }

    RunState run{.job = std::move(*current),
                 .control = control,
                 .tracker = ProgressTracker(progress),
                 .target = nullptr,
                 .buffer = {}};

    if (resume_from_checkpoint && !at_origin) {
        if (auto valid = opener_->validate_for_resume(run.job); !valid) {
            return fail(run, valid.error());
        }
    }

    if (auto started = store_->set_state(run.job.id, JobState::Running, std::nullopt); !started) {
        LOG_ERROR("Engine", std::format("Job {}: cannot mark running: {}", run.job.id,
                                        started.error().message));
        return EngineOutcome{.state = JobState::Failed, .error = started.error()};
    }
    run.job.state = JobState::Running;
    run.job.error.reset();

    LOG_INFO("Engine",
             std::format("Job {} running from pass {}/{} at offset {}", run.job.id,
                         run.job.checkpoint.pass_index + 1, run.job.passes.size(),
                         run.job.checkpoint.byte_offset));

    auto opened = opener_->open(run.job);
    if (!opened) {
        return fail(run, opened.error());
    }
    run.target = std::move(*opened);

    return execute(run);
}

auto ChunkedExecutionEngine::execute(RunState& run) -> EngineOutcome {
    if (deadline_passed(run.job)) {
        return fail(run, util::Error{util::ErrorKind::Timeout, "deadline exceeded"});
    }

    if (run.job.verification.enabled() && !run.job.before_digests) {
        if (run.job.checkpoint.position() == Checkpoint{}.position()) {
            if (auto captured = capture_before(run); !captured) {
                return fail(run, captured.error());
            }
        } else {
            const std::string warning =
                "before digests missing for a job with progress; verification skipped";
            LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, warning));
            if (auto recorded = store_->record_warning(run.job.id, warning); !recorded) {
                return fail(run, recorded.error());
            }
        }
    }

    for (auto pass = run.job.checkpoint.pass_index;
         pass < static_cast<uint32_t>(run.job.passes.size()); ++pass) {
        if (auto stopped = run_pass(run, pass)) {
            return *stopped;
        }
    }

    if (auto closed = run.target->close(); !closed) {
        LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, closed.error().message));
    }

    if (run.job.before_digests) {
        if (auto verified = finish_verification(run); !verified) {
            return fail(run, verified.error());
        }
    }

    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - run.started).count();
    run.time_recorded = true;
    if (auto timed = store_->add_active_time(run.job.id, seconds); !timed) {
        return fail(run, timed.error());
    }
    if (auto completed = store_->set_state(run.job.id, JobState::Completed, std::nullopt);
        !completed) {
        LOG_ERROR("Engine", std::format("Job {}: cannot mark completed: {}", run.job.id,
                                        completed.error().message));
        return EngineOutcome{.state = JobState::Failed, .error = completed.error()};
    }
    LOG_INFO("Engine", std::format("Job {} completed {} passes in {:.1f}s", run.job.id,
                                   run.job.passes.size(), run.job.active_seconds + seconds));

    // A failed finalize does not undo the wipe
    if (auto finalized = opener_->finalize(run.job); !finalized) {
        const auto warning = std::format("finalize failed: {}", finalized.error().message);
        LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, warning));
        if (auto recorded = store_->record_warning(run.job.id, warning); !recorded) {
            LOG_ERROR("Engine", std::format("Job {}: cannot record warning: {}", run.job.id,
                                            recorded.error().message));
        }
    }

    return EngineOutcome{.state = JobState::Completed, .error = std::nullopt};
}

auto ChunkedExecutionEngine::capture_before(RunState& run) -> std::expected<void, util::Error> {
    const uint64_t window_size = effective_chunk_size(monitor_->recommend().chunk_size);
    auto digests =
        verifier_->capture_before(*run.target, run.job.id, run.job.verification, window_size);
    if (!digests) {
        return std::unexpected(digests.error());
    }
    if (auto attached = store_->attach_before_digests(run.job.id, *digests); !attached) {
        return attached;
    }
    run.job.before_digests = std::move(*digests);
    return {};
}

auto ChunkedExecutionEngine::run_pass(RunState& run, uint32_t pass_index)
    -> std::optional<EngineOutcome> {
    const auto& pass = run.job.passes[pass_index];
    const uint64_t pass_bytes = pass.expected_bytes;
    const Checkpoint resume_point = run.job.checkpoint;

    uint64_t offset = 0;
    uint64_t chunk = 0;
    uint64_t persist_from = 0;
    const auto recommendation = monitor_->recommend();

    if (pass_index == resume_point.pass_index && resume_point.byte_offset > 0) {
        if (resume_point.byte_offset >= pass_bytes) {
            return std::nullopt;
        }
        chunk = resume_point.chunk_size > 0 ? resume_point.chunk_size
                                            : effective_chunk_size(recommendation.chunk_size);
        if (patterns_->is_deterministic(pass.descriptor)) {
            offset = resume_point.byte_offset;
        } else {
            // Random bytes cannot be regenerated; rewrite the whole pass
            persist_from = resume_point.byte_offset;
            LOG_INFO("Engine", std::format("Job {}: pass {} is not reproducible, restarting it "
                                           "from offset 0",
                                           run.job.id, pass_index + 1));
        }
    } else {
        chunk = effective_chunk_size(recommendation.chunk_size);
    }

    if (auto applied = apply_io_priority(recommendation.io_priority); !applied) {
        LOG_DEBUG("Engine", std::format("Job {}: {}", run.job.id, applied.error().message));
    }

    LOG_INFO("Engine", std::format("Job {}: pass {}/{} ({}, {}) from {} in {} byte chunks",
                                   run.job.id, pass_index + 1, run.job.passes.size(), pass.method,
                                   pass.descriptor, offset, chunk));

    if (run.buffer.size() < chunk) {
        run.buffer.resize(static_cast<size_t>(chunk));
    }

    uint32_t unsynced = 0;
    auto commit = [&](uint64_t at) -> std::optional<EngineOutcome> {
        if (unsynced == 0) {
            return std::nullopt;
        }
        if (auto synced = with_retry(run.job.id, "sync", [&] { return run.target->sync(); });
            !synced) {
            return fail(run, synced.error());
        }
        unsynced = 0;
        if (at < persist_from) {
            return std::nullopt;
        }
        const Checkpoint next{.pass_index = pass_index, .byte_offset = at, .chunk_size = chunk};
        if (auto saved = store_->save_checkpoint(run.job.id, next); !saved) {
            LOG_ERROR("Engine", std::format("Job {}: checkpoint ({}, {}) not persisted: {}",
                                            run.job.id, pass_index, at, saved.error().message));
            return fail(run, saved.error());
        }
        run.job.checkpoint = next;
        return std::nullopt;
    };

    while (offset < pass_bytes) {
        if (const auto signal = run.control.signal(); signal != ControlSignal::None) {
            if (auto failed = commit(offset)) {
                return failed;
            }
            return stop_outcome(run, signal);
        }
        if (deadline_passed(run.job)) {
            if (auto failed = commit(offset)) {
                return failed;
            }
            return fail(run, util::Error{util::ErrorKind::Timeout, "deadline exceeded"});
        }

        const auto length = static_cast<size_t>(std::min(chunk, pass_bytes - offset));
        std::span<uint8_t> bytes(run.buffer.data(), length);
        if (auto generated = patterns_->generate(pass.descriptor, offset, bytes); !generated) {
            return fail(run, generated.error());
        }
        if (auto written = with_retry(run.job.id, std::format("write at {}", offset),
                                      [&] { return run.target->write_at(offset, bytes); });
            !written) {
            return fail(run, written.error());
        }
        offset += length;
        ++unsynced;

        if (unsynced >= std::max<uint32_t>(settings_.sync_interval_chunks, 1) ||
            offset == pass_bytes) {
            if (auto failed = commit(offset)) {
                return failed;
            }
        }

        run.tracker.report(WipeProgress{
            .job_id = run.job.id,
            .current_pass = pass_index + 1,
            .total_passes = static_cast<uint32_t>(run.job.passes.size()),
            .bytes_done = offset,
            .pass_bytes = pass_bytes,
            .speed_bytes_per_sec = 0,
            .estimated_seconds_remaining = -1,
            .state = std::string(job_state_to_string(JobState::Running)),
        });
    }
    return std::nullopt;
}

auto ChunkedExecutionEngine::finish_verification(RunState& run)
    -> std::expected<void, util::Error> {
    VerificationResult result;
    auto reopened = opener_->open(run.job);
    std::expected<DigestSet, util::Error> after =
        reopened ? verifier_->capture_after(**reopened, *run.job.before_digests)
                 : std::expected<DigestSet, util::Error>(std::unexpected(reopened.error()));
    if (reopened) {
        if (auto closed = (*reopened)->close(); !closed) {
            LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, closed.error().message));
        }
    }

    if (after) {
        result = verification::Verifier::compare(*run.job.before_digests, *after,
                                                 run.job.verification.level);
    } else {
        // The wipe is done; an unreadable target only leaves it unverified
        result.level = run.job.verification.level;
        result.note = std::format("after capture failed: {}", after.error().message);
    }

    if (result.verified) {
        LOG_INFO("Engine", std::format("Job {}: verification passed over {} windows", run.job.id,
                                       result.windows_checked));
    } else {
        const util::Error mismatch{util::ErrorKind::VerificationMismatch,
                                   result.note.empty() ? "sampled data unchanged by the wipe"
                                                       : result.note};
        LOG_WARNING("Engine", std::format("Job {}: verification failed ({}): {}", run.job.id,
                                          util::kind_to_string(mismatch.kind), mismatch.message));
    }

    if (auto attached = store_->attach_verification(run.job.id, result); !attached) {
        return attached;
    }
    run.job.verification_result = std::move(result);
    return {};
}

auto ChunkedExecutionEngine::stop_outcome(RunState& run, ControlSignal signal) -> EngineOutcome {
    const JobState state =
        signal == ControlSignal::Cancel ? JobState::Cancelled : JobState::Paused;
    LOG_INFO("Engine", std::format("Job {}: {} observed at pass {} offset {}", run.job.id,
                                   signal_name(signal), run.job.checkpoint.pass_index + 1,
                                   run.job.checkpoint.byte_offset));

    if (auto closed = run.target->close(); !closed) {
        LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, closed.error().message));
    }

    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - run.started).count();
    run.time_recorded = true;
    if (auto timed = store_->add_active_time(run.job.id, seconds); !timed) {
        LOG_ERROR("Engine", std::format("Job {}: cannot record run time: {}", run.job.id,
                                        timed.error().message));
    }

    if (state == JobState::Cancelled && target_kind(run.job.target) == TargetKind::FreeSpace) {
        if (auto released = opener_->finalize(run.job); !released) {
            LOG_WARNING("Engine", std::format("Job {}: placeholder not released: {}", run.job.id,
                                              released.error().message));
        }
    }

    if (auto stored = store_->set_state(run.job.id, state, std::nullopt); !stored) {
        LOG_ERROR("Engine", std::format("Job {}: cannot record {}: {}", run.job.id,
                                        job_state_to_string(state), stored.error().message));
        return EngineOutcome{.state = JobState::Failed, .error = stored.error()};
    }
    return EngineOutcome{.state = state, .error = std::nullopt};
}

auto ChunkedExecutionEngine::fail(RunState& run, util::Error error) -> EngineOutcome {
    LOG_ERROR("Engine", std::format("Job {} failed ({}): {}", run.job.id,
                                    util::kind_to_string(error.kind), error.message));

    if (run.target) {
        if (auto closed = run.target->close(); !closed) {
            LOG_WARNING("Engine", std::format("Job {}: {}", run.job.id, closed.error().message));
        }
    }

    if (error.kind != util::ErrorKind::StoreUnavailable) {
        if (!run.time_recorded) {
            const double seconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - run.started)
                    .count();
            run.time_recorded = true;
            if (auto timed = store_->add_active_time(run.job.id, seconds); !timed) {
                LOG_ERROR("Engine", std::format("Job {}: cannot record run time: {}", run.job.id,
                                                timed.error().message));
            }
        }
        if (target_kind(run.job.target) == TargetKind::FreeSpace) {
            if (auto released = opener_->finalize(run.job); !released) {
                LOG_WARNING("Engine", std::format("Job {}: placeholder not released: {}",
                                                  run.job.id, released.error().message));
            }
        }
    }

    // With the store unavailable this write is best effort; the outcome still carries the cause
    if (auto stored = store_->set_state(run.job.id, JobState::Failed, error); !stored) {
        LOG_ERROR("Engine", std::format("Job {}: cannot record failure: {}", run.job.id,
                                        stored.error().message));
    }
    return EngineOutcome{.state = JobState::Failed, .error = std::move(error)};
}
