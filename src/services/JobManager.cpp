/**
 * @file JobManager.cpp
 * @brief Scheduler owning the job registry and the worker pool
 */

#include "services/JobManager.hpp"

#include "targets/WipeTarget.hpp"
#include "util/GLibPtr.hpp"
#include "util/Logger.hpp"
#include "verification/DigestAlgorithm.hpp"

#include <glib.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <tuple>

namespace {

constexpr int64_t MICROSECONDS_PER_SECOND = 1'000'000;

auto invalid_state(const std::string& id, JobState state, std::string_view action)
    -> util::Error {
    return util::Error{util::ErrorKind::InvalidState,
                       std::format("cannot {} job {}: it is {}", action, id,
                                   job_state_to_string(state))};
}

}  // namespace

JobManager::JobManager(std::shared_ptr<IJobStore> store,
                       std::shared_ptr<ChunkedExecutionEngine> engine,
                       std::shared_ptr<IResourceMonitor> monitor,
                       std::shared_ptr<ITargetOpener> opener,
                       std::shared_ptr<PassPlanCatalog> catalog,
                       const config::EngineConfig& config)
    : store_(std::move(store)),
      engine_(std::move(engine)),
      monitor_(std::move(monitor)),
      opener_(std::move(opener)),
      catalog_(std::move(catalog)),
      config_(config) {}

JobManager::~JobManager() {
    shutdown();
}

auto JobManager::start() -> std::expected<void, util::Error> {
    auto jobs = store_->list_jobs(JobFilter{});
    if (!jobs) {
        return std::unexpected(jobs.error());
    }

    std::lock_guard lock(mutex_);
    if (started_) {
        return {};
    }

    size_t recovered = 0;
    for (auto& job : *jobs) {
        if (job.state == JobState::Running) {
            LOG_WARNING("Scheduler", std::format("Job {} was interrupted at pass {} offset {}",
                                                 job.id, job.checkpoint.pass_index + 1,
                                                 job.checkpoint.byte_offset));
            if (auto paused = store_->set_state(job.id, JobState::Paused, std::nullopt); !paused) {
                return std::unexpected(paused.error());
            }
            if (auto marked = store_->set_interrupted(job.id, true); !marked) {
                return std::unexpected(marked.error());
            }
            job.state = JobState::Paused;
            job.interrupted = true;
        }

        if (job.state == JobState::Queued) {
            enqueue_locked(job, false);
            ++recovered;
        } else if (job.state == JobState::Paused && job.interrupted &&
                   config_.scheduler.auto_resume_interrupted) {
            enqueue_locked(job, true);
            ++recovered;
        }
    }

    const uint32_t threads = std::max<uint32_t>(config_.scheduler.worker_ceiling, 1);
    for (uint32_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    started_ = true;
    LOG_INFO("Scheduler", std::format("Started {} workers; {} stored jobs, {} queued", threads,
                                      jobs->size(), recovered));
    return {};
}

void JobManager::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        for (const auto& [id, active] : active_) {
            if (active.control->signal() == ControlSignal::None) {
                active.control->request_pause();
                paused_for_shutdown_.insert(id);
            }
        }
        workers.swap(workers_);
    }
    dispatch_cv_.notify_all();

    if (!workers.empty()) {
        LOG_INFO("Scheduler", "Waiting for running jobs to reach a chunk boundary");
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

auto JobManager::capacity() const -> size_t {
    const uint32_t ceiling = std::max<uint32_t>(config_.scheduler.worker_ceiling, 1);
    const uint32_t recommended = monitor_ ? monitor_->recommend().worker_count : ceiling;
    return std::clamp<uint32_t>(recommended, 1, ceiling);
}

auto JobManager::conflicts_with_active_locked(const std::string& identity) const -> bool {
    return std::ranges::any_of(active_, [&identity](const auto& entry) {
        return targets::identities_conflict(entry.second.identity, identity);
    });
}

void JobManager::enqueue_locked(const JobRecord& record, bool resume) {
    pending_[record.id] = PendingJob{.id = record.id,
                                     .priority = record.priority,
                                     .created_at = record.created_at,
                                     .depends_on = record.depends_on,
                                     .identity = targets::target_identity(record.target),
                                     .resume = resume};
}

auto JobManager::take_runnable_locked() -> std::optional<PendingJob> {
    if (pending_.empty() || active_.size() >= capacity()) {
        return std::nullopt;
    }

    std::vector<const PendingJob*> candidates;
    candidates.reserve(pending_.size());
    for (const auto& [id, job] : pending_) {
        candidates.push_back(&job);
    }
    std::ranges::sort(candidates, [](const PendingJob* lhs, const PendingJob* rhs) {
        return std::tuple(-static_cast<int64_t>(lhs->priority), lhs->created_at, lhs->id) <
               std::tuple(-static_cast<int64_t>(rhs->priority), rhs->created_at, rhs->id);
    });

    for (const auto* job : candidates) {
        if (job->depends_on) {
            auto dependency = store_->load(*job->depends_on);
            if (!dependency || dependency->state != JobState::Completed) {
                continue;
            }
        }
        if (conflicts_with_active_locked(job->identity)) {
            continue;
        }
        PendingJob next = *job;
        pending_.erase(next.id);
        return next;
    }
    return std::nullopt;
}

void JobManager::worker_loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        auto next = take_runnable_locked();
        if (!next) {
            // Dependencies and monitor advice change without notification
            dispatch_cv_.wait_for(lock, DISPATCH_RECHECK);
            continue;
        }

        auto control = std::make_shared<JobControl>();
        active_.emplace(next->id, ActiveJob{.identity = next->identity, .control = control});
        lock.unlock();

        run_job(*next, *control);

        lock.lock();
        dispatch_cv_.notify_all();
    }
}

auto JobManager::execute_job(const PendingJob& job, JobControl& control)
    -> std::optional<EngineOutcome> {
    auto record = store_->load(job.id);
    if (!record) {
        if (record.error().kind == util::ErrorKind::NotFound) {
            LOG_WARNING("Scheduler", std::format("Job {} vanished before dispatch", job.id));
        } else {
            fail_dispatch(job.id, record.error());
        }
        return std::nullopt;
    }
    if (record->interrupted) {
        if (auto cleared = store_->set_interrupted(job.id, false); !cleared) {
            fail_dispatch(job.id, cleared.error());
            release_placeholder(*record);
            return std::nullopt;
        }
    }

    LOG_INFO("Scheduler", std::format("Dispatching job {} ({} {}, plan {}, priority {}{})", job.id,
                                      target_kind_to_string(target_kind(record->target)),
                                      target_location(record->target), record->plan_name,
                                      record->priority, job.resume ? ", resuming" : ""));

    return engine_->run(*record, job.resume, control, [this](const WipeProgress& progress) {
        on_progress(progress);
    });
}

void JobManager::fail_dispatch(const std::string& id, const util::Error& error) {
    LOG_ERROR("Scheduler", std::format("Cannot dispatch job {}: {}", id, error.message));
    if (auto failed = store_->set_state(id, JobState::Failed, error); !failed) {
        LOG_ERROR("Scheduler", std::format("Job {} left queued until restart: {}", id,
                                           failed.error().message));
        return;
    }
    publish_state(id, JobState::Failed);
}

void JobManager::run_job(const PendingJob& job, JobControl& control) {
    const auto outcome = execute_job(job, control);

    // From here on pause, resume and cancel see the job as idle
    std::lock_guard lock(mutex_);
    active_.erase(job.id);
    const bool shutdown_pause = paused_for_shutdown_.erase(job.id) > 0;
    if (!outcome) {
        return;
    }

    if (outcome->state == JobState::Paused && control.signal() == ControlSignal::Cancel) {
        LOG_INFO("Scheduler",
                 std::format("Job {} paused before its cancel was observed", job.id));
        auto record = store_->load(job.id);
        if (!record) {
            LOG_ERROR("Scheduler", std::format("Job {} stays paused: {}", job.id,
                                               record.error().message));
        } else if (auto cancelled = cancel_idle_locked(*record); !cancelled) {
            LOG_ERROR("Scheduler", std::format("Job {} stays paused: {}", job.id,
                                               cancelled.error().message));
        } else {
            return;
        }
    } else if (outcome->state == JobState::Paused && shutdown_pause) {
        if (auto marked = store_->set_interrupted(job.id, true); !marked) {
            LOG_ERROR("Scheduler", std::format("Job {} will not resume automatically: {}", job.id,
                                               marked.error().message));
        }
    }

    if (outcome->error) {
        LOG_WARNING("Scheduler", std::format("Job {} -> {} ({}: {})", job.id,
                                             job_state_to_string(outcome->state),
                                             util::kind_to_string(outcome->error->kind),
                                             outcome->error->message));
    } else {
        LOG_INFO("Scheduler",
                 std::format("Job {} -> {}", job.id, job_state_to_string(outcome->state)));
    }
    publish_state(job.id, outcome->state);
}

auto JobManager::build_record(const JobRequest& request) -> std::expected<JobRecord, util::Error> {
    if (request.path.empty()) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument, "target path is empty"});
    }

    util::GCharPtr uuid(g_uuid_string_random());
    JobRecord record;
    record.id = uuid.get();

    std::error_code ec;
    auto absolute = std::filesystem::absolute(request.path, ec);
    const std::string path = ec ? request.path : absolute.lexically_normal().string();
    switch (request.kind) {
        case TargetKind::File:
            record.target = FileTarget{.path = path};
            break;
        case TargetKind::Directory:
            record.target = DirectoryTarget{.path = path};
            break;
        case TargetKind::FreeSpace:
            record.target = FreeSpaceTarget{.volume = path,
                                            .placeholder = targets::placeholder_path(path, record.id)};
            break;
        case TargetKind::Drive:
            record.target = DriveTarget{.device = path};
            break;
    }

    auto size = opener_->probe_size(record.target);
    if (!size) {
        return std::unexpected(size.error());
    }
    record.target_size = *size;

    auto passes = catalog_->build_plan(request.plan, record.target_size);
    if (!passes) {
        return std::unexpected(passes.error());
    }
    record.passes = std::move(*passes);
    record.plan_name = request.plan;

    record.verification.level = request.verify;
    record.verification.algorithms =
        request.algorithms.empty() ? config_.verification.algorithms : request.algorithms;
    for (const auto& algorithm : record.verification.algorithms) {
        if (!verification::is_supported_algorithm(algorithm)) {
            return std::unexpected(util::Error{
                util::ErrorKind::InvalidArgument,
                std::format("unsupported digest algorithm '{}'", algorithm)});
        }
    }

    if (request.depends_on) {
        auto dependency = store_->load(*request.depends_on);
        if (!dependency) {
            return std::unexpected(util::Error{
                dependency.error().kind,
                std::format("dependency {}: {}", *request.depends_on, dependency.error().message)});
        }
        record.depends_on = request.depends_on;
    }

    record.priority = request.priority;
    record.created_at = g_get_real_time();
    record.updated_at = record.created_at;
    if (request.deadline_seconds) {
        if (*request.deadline_seconds <= 0) {
            return std::unexpected(
                util::Error{util::ErrorKind::InvalidArgument, "deadline must be positive"});
        }
        record.deadline = record.created_at + *request.deadline_seconds * MICROSECONDS_PER_SECOND;
    }
    record.remove_after_wipe = config_.scheduler.remove_files_after_wipe && !request.keep;
    record.state = JobState::Queued;
    return record;
}

auto JobManager::submit(const JobRequest& request) -> std::expected<std::string, util::Error> {
    auto record = build_record(request);
    if (!record) {
        LOG_WARNING("Scheduler", std::format("Rejected submission for {}: {}", request.path,
                                             record.error().message));
        return std::unexpected(record.error());
    }
    if (auto created = store_->create(*record); !created) {
        return std::unexpected(created.error());
    }

    {
        std::lock_guard lock(mutex_);
        enqueue_locked(*record, false);
    }
    dispatch_cv_.notify_all();

    LOG_INFO("Scheduler",
             std::format("Submitted job {}: {} {} ({} bytes), plan {} with {} passes", record->id,
                         target_kind_to_string(target_kind(record->target)),
                         target_location(record->target), record->target_size,
                         record->plan_name, record->passes.size()));
    publish_state(record->id, JobState::Queued);
    return record->id;
}

auto JobManager::pause(const std::string& id) -> std::expected<void, util::Error> {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        it->second.control->request_pause();
        LOG_INFO("Scheduler", std::format("Pause requested for job {}", id));
        return {};
    }

    auto record = store_->load(id);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (auto it = pending_.find(id); it != pending_.end()) {
        if (!it->second.resume) {
            return std::unexpected(util::Error{
                util::ErrorKind::InvalidState,
                std::format("job {} has not started; cancel it instead of pausing", id)});
        }
        // Resumed but not yet dispatched: it simply stays Paused
        pending_.erase(it);
        return {};
    }
    if (record->state == JobState::Paused) {
        return {};
    }
    return std::unexpected(invalid_state(id, record->state, "pause"));
}

auto JobManager::resume(const std::string& id) -> std::expected<void, util::Error> {
    {
        std::lock_guard lock(mutex_);
        if (active_.contains(id)) {
            return std::unexpected(invalid_state(id, JobState::Running, "resume"));
        }
        if (pending_.contains(id)) {
            return {};
        }

        auto record = store_->load(id);
        if (!record) {
            return std::unexpected(record.error());
        }
        if (record->state == JobState::Completed) {
            return {};
        }
        if (record->state != JobState::Paused) {
            return std::unexpected(invalid_state(id, record->state, "resume"));
        }

        if (auto valid = opener_->validate_for_resume(*record); !valid) {
            LOG_WARNING("Scheduler", std::format("Job {} cannot resume: {}", id,
                                                 valid.error().message));
            if (auto failed = store_->set_state(id, JobState::Failed, valid.error()); !failed) {
                return std::unexpected(failed.error());
            }
            release_placeholder(*record);
            publish_state(id, JobState::Failed);
            return std::unexpected(valid.error());
        }
        enqueue_locked(*record, true);
    }
    dispatch_cv_.notify_all();
    LOG_INFO("Scheduler", std::format("Job {} queued for resumption", id));
    return {};
}

auto JobManager::cancel(const std::string& id) -> std::expected<void, util::Error> {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        it->second.control->request_cancel();
        LOG_INFO("Scheduler", std::format("Cancel requested for job {}", id));
        return {};
    }

    auto record = store_->load(id);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (record->state != JobState::Queued && record->state != JobState::Paused) {
        return std::unexpected(invalid_state(id, record->state, "cancel"));
    }
    return cancel_idle_locked(*record);
}

auto JobManager::cancel_idle_locked(const JobRecord& record) -> std::expected<void, util::Error> {
    pending_.erase(record.id);
    if (auto cancelled = store_->set_state(record.id, JobState::Cancelled, std::nullopt);
        !cancelled) {
        return std::unexpected(cancelled.error());
    }
    if (record.state == JobState::Paused) {
        release_placeholder(record);
    }
    LOG_INFO("Scheduler", std::format("Job {} -> cancelled", record.id));
    publish_state(record.id, JobState::Cancelled);
    return {};
}

auto JobManager::remove(const std::string& id) -> std::expected<void, util::Error> {
    {
        std::lock_guard lock(mutex_);
        if (active_.contains(id)) {
            return std::unexpected(util::Error{
                util::ErrorKind::InvalidState,
                std::format("job {} is running; cancel it before deleting", id)});
        }
        auto record = store_->load(id);
        if (!record) {
            return std::unexpected(record.error());
        }
        pending_.erase(id);
        if (record->state == JobState::Paused) {
            release_placeholder(*record);
        }
        if (auto deleted = store_->delete_job(id); !deleted) {
            return deleted;
        }
    }
    std::lock_guard lock(progress_mutex_);
    progress_.erase(id);
    return {};
}

void JobManager::release_placeholder(const JobRecord& record) {
    if (target_kind(record.target) != TargetKind::FreeSpace) {
        return;
    }
    if (auto released = opener_->finalize(record); !released) {
        LOG_WARNING("Scheduler", std::format("Job {}: placeholder not released: {}", record.id,
                                             released.error().message));
    }
}

auto JobManager::snapshot(JobRecord record) const -> JobSnapshot {
    JobSnapshot result{.record = std::move(record), .progress = std::nullopt};
    std::lock_guard lock(progress_mutex_);
    if (auto it = progress_.find(result.record.id); it != progress_.end()) {
        result.progress = it->second;
    }
    return result;
}

auto JobManager::get_job(const std::string& id) -> std::expected<JobSnapshot, util::Error> {
    auto record = store_->load(id);
    if (!record) {
        return std::unexpected(record.error());
    }
    return snapshot(std::move(*record));
}

auto JobManager::list_jobs(const JobFilter& filter)
    -> std::expected<std::vector<JobSnapshot>, util::Error> {
    auto records = store_->list_jobs(filter);
    if (!records) {
        return std::unexpected(records.error());
    }
    std::vector<JobSnapshot> snapshots;
    snapshots.reserve(records->size());
    for (auto& record : *records) {
        snapshots.push_back(snapshot(std::move(record)));
    }
    return snapshots;
}

auto JobManager::list_plans() -> std::expected<std::vector<PlanInfo>, util::Error> {
    return catalog_->list_plans();
}

auto JobManager::running_jobs() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, active] : active_) {
        ids.push_back(id);
    }
    return ids;
}

void JobManager::set_progress_callback(ProgressCallback callback) {
    std::lock_guard lock(progress_mutex_);
    progress_callback_ = std::move(callback);
}

void JobManager::on_progress(const WipeProgress& progress) {
    ProgressCallback callback;
    {
        std::lock_guard lock(progress_mutex_);
        progress_[progress.job_id] = progress;
        callback = progress_callback_;
    }
    if (callback) {
        callback(progress);
    }
}

void JobManager::publish_state(const std::string& id, JobState state) {
    WipeProgress progress;
    ProgressCallback callback;
    {
        std::lock_guard lock(progress_mutex_);
        auto& latest = progress_[id];
        latest.job_id = id;
        latest.state = std::string(job_state_to_string(state));
        if (state != JobState::Running) {
            latest.speed_bytes_per_sec = 0;
            latest.estimated_seconds_remaining = state == JobState::Completed ? 0 : -1;
        }
        progress = latest;
        callback = progress_callback_;
    }
    if (callback) {
        callback(progress);
    }
}
