/**
 * @file JobManagerTest.cpp
 * @brief Unit tests for the JobManager scheduler
 */

#include "services/JobManager.hpp"

#include "store/FileJobStore.hpp"
#include "targets/WipeTarget.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockJobStore.hpp"
#include "mocks/MockPatternSource.hpp"
#include "mocks/MockResourceMonitor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <condition_variable>
#include <mutex>

using ::testing::_;
using ::testing::Return;

namespace {

constexpr uint64_t JOB_SIZE = 256 * config::KiB;

}  // namespace

class JobManagerTest : public TempDirFixture {
protected:
    void SetUp() override {
        TempDirFixture::SetUp();
        store = std::make_shared<FileJobStore>(temp_dir / "jobs", 64);
        ASSERT_TRUE(store->initialize().has_value());

        // Every chunk waits for the gate, so tests decide when running jobs advance
        patterns = MockPatternSource::CreateNiceMock();
        ON_CALL(*patterns, generate(_, _, _))
            .WillByDefault([this](const std::string&, uint64_t, std::span<uint8_t> out) {
                std::unique_lock lock(gate_mutex);
                gate_cv.wait(lock, [this] { return gate_open; });
                std::ranges::fill(out, uint8_t{0xAA});
                return std::expected<void, util::Error>{};
            });
        monitor = MockResourceMonitor::CreateNiceMock(64 * config::KiB, 4);
    }

    void TearDown() override {
        OpenGate();
        ReleasePauseRecord();
        if (manager) {
            manager->shutdown();
            manager.reset();
        }
        TempDirFixture::TearDown();
    }

    void StartManager(uint32_t worker_ceiling, bool auto_resume = true) {
        config::EngineConfig cfg;
        cfg.engine.min_chunk_size = 4 * config::KiB;
        cfg.engine.retry_backoff_ms = 1;
        cfg.scheduler.worker_ceiling = worker_ceiling;
        cfg.scheduler.auto_resume_interrupted = auto_resume;
        auto opener = std::make_shared<TargetOpener>(0);
        std::shared_ptr<IJobStore> job_store = observed_store;
        if (!job_store) {
            job_store = store;
        }
        auto engine = std::make_shared<ChunkedExecutionEngine>(
            job_store, patterns, monitor, opener,
            std::make_shared<verification::Verifier>(cfg.verification), cfg.engine);
        manager = std::make_unique<JobManager>(job_store, engine, monitor, opener,
                                               std::make_shared<PassPlanCatalog>(patterns), cfg);
        manager->set_progress_callback([this](const WipeProgress& progress) {
            std::lock_guard lock(events_mutex);
            if (progress.state == "running" &&
                std::ranges::find(dispatch_order, progress.job_id) == dispatch_order.end()) {
                dispatch_order.push_back(progress.job_id);
            }
        });
        ASSERT_TRUE(manager->start().has_value());
    }

    // Route the store through a mock whose Paused transition blocks until released
    void HoldPauseRecord() {
        observed_store = MockJobStore::CreateDelegatingMock(store);
        ON_CALL(*observed_store, set_state(_, JobState::Paused, _))
            .WillByDefault(
                [this](const std::string& id, JobState state, std::optional<util::Error> error) {
                    auto stored = store->set_state(id, state, std::move(error));
                    std::unique_lock lock(hold_mutex);
                    pause_recorded = true;
                    hold_cv.notify_all();
                    hold_cv.wait(lock, [this] { return pause_released; });
                    return stored;
                });
    }

    bool WaitForPauseRecord() {
        std::unique_lock lock(hold_mutex);
        return hold_cv.wait_for(lock, std::chrono::seconds{5}, [this] { return pause_recorded; });
    }

    void ReleasePauseRecord() {
        {
            std::lock_guard lock(hold_mutex);
            pause_released = true;
        }
        hold_cv.notify_all();
    }

    void OpenGate() {
        {
            std::lock_guard lock(gate_mutex);
            gate_open = true;
        }
        gate_cv.notify_all();
    }

    JobRequest FileRequest(const std::string& name, int32_t priority = 0) {
        auto path = CreateFile(name, JOB_SIZE, 0x11);
        return JobRequest{.kind = TargetKind::File,
                          .path = path.string(),
                          .plan = "zero",
                          .priority = priority,
                          .verify = VerificationLevel::None,
                          .keep = true};
    }

    std::string Submit(const JobRequest& request) {
        auto id = manager->submit(request);
        EXPECT_TRUE(id.has_value()) << (id ? "" : id.error().message);
        return id.value_or("");
    }

    std::optional<JobState> StateOf(const std::string& id) {
        auto job = manager->get_job(id);
        if (!job) {
            return std::nullopt;
        }
        return job->record.state;
    }

    bool WaitForState(const std::string& id, JobState state) {
        return ThreadingTestHelper::WaitUntil([&] { return StateOf(id) == state; });
    }

    bool WaitForRunning(const std::string& id) {
        return ThreadingTestHelper::WaitUntil([&] {
            auto running = manager->running_jobs();
            return std::ranges::find(running, id) != running.end();
        });
    }

    std::vector<std::string> DispatchOrder() {
        std::lock_guard lock(events_mutex);
        return dispatch_order;
    }

    std::shared_ptr<FileJobStore> store;
    std::shared_ptr<MockJobStore> observed_store;
    std::shared_ptr<MockPatternSource> patterns;
    std::shared_ptr<MockResourceMonitor> monitor;
    std::unique_ptr<JobManager> manager;

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool gate_open = false;

    std::mutex hold_mutex;
    std::condition_variable hold_cv;
    bool pause_recorded = false;
    bool pause_released = false;

    std::mutex events_mutex;
    std::vector<std::string> dispatch_order;
};

// ========== submit Tests ==========

TEST_F(JobManagerTest, Submit_FileTarget_RunsToCompletion) {
    StartManager(2);
    OpenGate();

    auto id = Submit(FileRequest("plain.bin"));

    ASSERT_TRUE(WaitForState(id, JobState::Completed));
    EXPECT_TRUE(AllBytesEqual(ReadFile(temp_dir / "plain.bin"), 0xAA));
    auto job = manager->get_job(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->record.target_size, JOB_SIZE);
    EXPECT_EQ(job->record.passes.size(), 1u);
    ASSERT_TRUE(job->progress.has_value());
    EXPECT_EQ(job->progress->state, "completed");
}

// Test: Without --keep the wiped file is removed
TEST_F(JobManagerTest, Submit_WithoutKeep_RemovesFileAfterWipe) {
    StartManager(1);
    OpenGate();
    auto request = FileRequest("doomed.bin");
    request.keep = false;

    auto id = Submit(request);

    ASSERT_TRUE(WaitForState(id, JobState::Completed));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "doomed.bin"));
}

TEST_F(JobManagerTest, Submit_MissingTarget_IsRejected) {
    StartManager(1);
    JobRequest request{.kind = TargetKind::File, .path = (temp_dir / "absent").string()};

    auto id = manager->submit(request);

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, util::ErrorKind::PermanentIO);
}

TEST_F(JobManagerTest, Submit_UnknownPlan_ReturnsInvalidArgument) {
    StartManager(1);
    auto request = FileRequest("plan.bin");
    request.plan = "nonsense";

    auto id = manager->submit(request);

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, util::ErrorKind::InvalidArgument);
}

TEST_F(JobManagerTest, Submit_UnsupportedDigest_ReturnsInvalidArgument) {
    StartManager(1);
    auto request = FileRequest("digest.bin");
    request.verify = VerificationLevel::Full;
    request.algorithms = {"crc32"};

    auto id = manager->submit(request);

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, util::ErrorKind::InvalidArgument);
}

TEST_F(JobManagerTest, Submit_UnknownDependency_ReturnsNotFound) {
    StartManager(1);
    auto request = FileRequest("orphan.bin");
    request.depends_on = "no-such-job";

    auto id = manager->submit(request);

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, util::ErrorKind::NotFound);
}

TEST_F(JobManagerTest, Submit_ZeroDeadline_ReturnsInvalidArgument) {
    StartManager(1);
    auto request = FileRequest("deadline.bin");
    request.deadline_seconds = 0;

    EXPECT_FALSE(manager->submit(request).has_value());
}

// ========== dispatch order Tests ==========

// Test: Among runnable jobs the highest priority is dispatched first
TEST_F(JobManagerTest, Dispatch_HigherPriorityFirst) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));

    auto low = Submit(FileRequest("low.bin", 0));
    auto high = Submit(FileRequest("high.bin", 5));
    OpenGate();

    ASSERT_TRUE(WaitForState(low, JobState::Completed));
    ASSERT_TRUE(WaitForState(high, JobState::Completed));
    EXPECT_EQ(DispatchOrder(), (std::vector<std::string>{blocker, high, low}));
}

TEST_F(JobManagerTest, Dispatch_EqualPriority_OldestFirst) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));

    auto first = Submit(FileRequest("first.bin", 1));
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
    auto second = Submit(FileRequest("second.bin", 1));
    OpenGate();

    ASSERT_TRUE(WaitForState(second, JobState::Completed));
    EXPECT_EQ(DispatchOrder(), (std::vector<std::string>{blocker, first, second}));
}

// Test: A dependent job waits until its dependency completes
TEST_F(JobManagerTest, Dispatch_DependencyRunning_WaitsForCompletion) {
    StartManager(2);
    auto parent = Submit(FileRequest("parent.bin"));
    ASSERT_TRUE(WaitForRunning(parent));
    auto request = FileRequest("child.bin");
    request.depends_on = parent;

    auto child = Submit(request);
    std::this_thread::sleep_for(std::chrono::milliseconds{600});

    EXPECT_EQ(StateOf(child), JobState::Queued);
    OpenGate();
    ASSERT_TRUE(WaitForState(child, JobState::Completed));
    EXPECT_EQ(DispatchOrder(), (std::vector<std::string>{parent, child}));
}

TEST_F(JobManagerTest, Dispatch_DependencyCancelled_ChildStaysQueued) {
    StartManager(2);
    auto parent = Submit(FileRequest("parent.bin"));
    ASSERT_TRUE(WaitForRunning(parent));
    auto request = FileRequest("child.bin");
    request.depends_on = parent;
    auto child = Submit(request);

    ASSERT_TRUE(manager->cancel(parent).has_value());
    OpenGate();

    ASSERT_TRUE(WaitForState(parent, JobState::Cancelled));
    std::this_thread::sleep_for(std::chrono::milliseconds{600});
    EXPECT_EQ(StateOf(child), JobState::Queued);
}

// Test: Two jobs on the same target never run together
TEST_F(JobManagerTest, Dispatch_SameTarget_RunsOneAtATime) {
    StartManager(4);
    auto request = FileRequest("shared.bin");
    auto first = Submit(request);
    ASSERT_TRUE(WaitForRunning(first));

    auto second = Submit(request);
    std::this_thread::sleep_for(std::chrono::milliseconds{400});

    EXPECT_EQ(manager->running_jobs(), std::vector<std::string>{first});
    EXPECT_EQ(StateOf(second), JobState::Queued);
    OpenGate();
    ASSERT_TRUE(WaitForState(second, JobState::Completed));
}

TEST_F(JobManagerTest, Dispatch_MonitorAdvisesOneWorker_LimitsConcurrency) {
    ON_CALL(*monitor, recommend())
        .WillByDefault(::testing::Return(Recommendation{.chunk_size = 64 * config::KiB,
                                                        .worker_count = 1,
                                                        .io_priority = IoPriority::BestEffort}));
    StartManager(4);
    auto a = Submit(FileRequest("a.bin"));
    auto b = Submit(FileRequest("b.bin"));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([&] { return !manager->running_jobs().empty(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds{400});

    EXPECT_EQ(manager->running_jobs().size(), 1u);
    OpenGate();
    ASSERT_TRUE(WaitForState(a, JobState::Completed));
    ASSERT_TRUE(WaitForState(b, JobState::Completed));
}

// ========== control Tests ==========

TEST_F(JobManagerTest, Cancel_QueuedJob_NeverRuns) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));
    auto waiting = Submit(FileRequest("waiting.bin"));

    ASSERT_TRUE(manager->cancel(waiting).has_value());
    OpenGate();

    EXPECT_EQ(StateOf(waiting), JobState::Cancelled);
    ASSERT_TRUE(WaitForState(blocker, JobState::Completed));
    EXPECT_EQ(StateOf(waiting), JobState::Cancelled);
    EXPECT_TRUE(AllBytesEqual(ReadFile(temp_dir / "waiting.bin"), 0x11));
}

// Test: Cancelling a running job stops it at a chunk boundary with the pass unfinished
TEST_F(JobManagerTest, Cancel_RunningJob_StopsBeforePassEnds) {
    StartManager(1);
    auto id = Submit(FileRequest("running.bin"));
    ASSERT_TRUE(WaitForRunning(id));

    ASSERT_TRUE(manager->cancel(id).has_value());
    OpenGate();

    ASSERT_TRUE(WaitForState(id, JobState::Cancelled));
    auto job = store->load(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->checkpoint.pass_index, 0u);
    EXPECT_LT(job->checkpoint.byte_offset, JOB_SIZE);
    EXPECT_FALSE(AllBytesEqual(ReadFile(temp_dir / "running.bin"), 0xAA));
    EXPECT_TRUE(ThreadingTestHelper::WaitUntil([&] { return manager->running_jobs().empty(); }));
}

TEST_F(JobManagerTest, Resume_CancelledJob_ReturnsInvalidState) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));
    auto waiting = Submit(FileRequest("waiting.bin"));
    ASSERT_TRUE(manager->cancel(waiting).has_value());

    auto result = manager->resume(waiting);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::InvalidState);
    EXPECT_EQ(StateOf(waiting), JobState::Cancelled);
}

// Test: A cancel arriving while the engine records a pause still cancels the job
TEST_F(JobManagerTest, Cancel_WhilePauseIsRecorded_EndsCancelled) {
    HoldPauseRecord();
    StartManager(1);
    auto id = Submit(FileRequest("contested.bin"));
    ASSERT_TRUE(WaitForRunning(id));
    ASSERT_TRUE(manager->pause(id).has_value());
    OpenGate();
    ASSERT_TRUE(WaitForPauseRecord());

    EXPECT_TRUE(manager->cancel(id).has_value());
    ReleasePauseRecord();

    ASSERT_TRUE(WaitForState(id, JobState::Cancelled));
    EXPECT_TRUE(ThreadingTestHelper::WaitUntil([&] { return manager->running_jobs().empty(); }));
    auto resumed = manager->resume(id);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().kind, util::ErrorKind::InvalidState);
}

TEST_F(JobManagerTest, Pause_QueuedJob_ReturnsInvalidState) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));
    auto waiting = Submit(FileRequest("waiting.bin"));

    auto result = manager->pause(waiting);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::InvalidState);
}

// Test: A paused job resumes from its checkpoint and completes
TEST_F(JobManagerTest, PauseResume_RunningJob_Completes) {
    StartManager(1);
    auto id = Submit(FileRequest("pausable.bin"));
    ASSERT_TRUE(WaitForRunning(id));

    ASSERT_TRUE(manager->pause(id).has_value());
    OpenGate();
    ASSERT_TRUE(WaitForState(id, JobState::Paused));
    auto paused = store->load(id);
    ASSERT_TRUE(paused.has_value());
    EXPECT_GT(paused->checkpoint.byte_offset, 0u);
    EXPECT_FALSE(paused->interrupted);

    ASSERT_TRUE(manager->resume(id).has_value());
    ASSERT_TRUE(WaitForState(id, JobState::Completed));
    EXPECT_TRUE(AllBytesEqual(ReadFile(temp_dir / "pausable.bin"), 0xAA));
}

TEST_F(JobManagerTest, Resume_CompletedJob_IsNoOp) {
    StartManager(1);
    OpenGate();
    auto id = Submit(FileRequest("done.bin"));
    ASSERT_TRUE(WaitForState(id, JobState::Completed));

    EXPECT_TRUE(manager->resume(id).has_value());
    EXPECT_EQ(StateOf(id), JobState::Completed);
}

TEST_F(JobManagerTest, Resume_TargetChangedWhilePaused_FailsJob) {
    StartManager(1);
    auto id = Submit(FileRequest("shrinking.bin"));
    ASSERT_TRUE(WaitForRunning(id));
    ASSERT_TRUE(manager->pause(id).has_value());
    OpenGate();
    ASSERT_TRUE(WaitForState(id, JobState::Paused));
    std::filesystem::resize_file(temp_dir / "shrinking.bin", JOB_SIZE / 2);

    auto result = manager->resume(id);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::TargetChanged);
    EXPECT_EQ(StateOf(id), JobState::Failed);
}

TEST_F(JobManagerTest, Remove_RunningJob_ReturnsInvalidState) {
    StartManager(1);
    auto id = Submit(FileRequest("busy.bin"));
    ASSERT_TRUE(WaitForRunning(id));

    auto result = manager->remove(id);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::InvalidState);
}

TEST_F(JobManagerTest, Remove_FinishedJob_DeletesRecord) {
    StartManager(1);
    OpenGate();
    auto id = Submit(FileRequest("finished.bin"));
    ASSERT_TRUE(WaitForState(id, JobState::Completed));

    ASSERT_TRUE(manager->remove(id).has_value());

    auto job = manager->get_job(id);
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().kind, util::ErrorKind::NotFound);
}

TEST_F(JobManagerTest, ListJobs_StateFilter) {
    StartManager(1);
    auto blocker = Submit(FileRequest("blocker.bin"));
    ASSERT_TRUE(WaitForRunning(blocker));
    Submit(FileRequest("q1.bin"));
    Submit(FileRequest("q2.bin"));

    auto queued = manager->list_jobs({.state = JobState::Queued});
    auto all = manager->list_jobs({});

    ASSERT_TRUE(queued.has_value());
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(queued->size(), 2u);
    EXPECT_EQ(all->size(), 3u);
}

TEST_F(JobManagerTest, ListPlans_ReturnsCatalog) {
    StartManager(1);

    auto plans = manager->list_plans();

    ASSERT_TRUE(plans.has_value());
    EXPECT_TRUE(std::ranges::any_of(*plans, [](const PlanInfo& p) { return p.name == "gutmann"; }));
}

// ========== recovery Tests ==========

// Test: A job left Running by a crash is resumed automatically on start
TEST_F(JobManagerTest, Start_JobLeftRunning_ResumesIt) {
    auto path = CreateFile("crashed.bin", JOB_SIZE, 0x11);
    auto record = MakeFileJob("crashed", path.string(), JOB_SIZE, {"zero"});
    ASSERT_TRUE(store->create(record).has_value());
    ASSERT_TRUE(store->save_checkpoint("crashed", {0, 64 * config::KiB, 64 * config::KiB})
                    .has_value());
    ASSERT_TRUE(store->set_state("crashed", JobState::Running, std::nullopt).has_value());
    OpenGate();

    StartManager(1);

    ASSERT_TRUE(WaitForState("crashed", JobState::Completed));
    EXPECT_FALSE(store->load("crashed")->interrupted);
}

// Test: A job the store cannot prepare for dispatch fails instead of vanishing from the queue
TEST_F(JobManagerTest, Dispatch_InterruptedFlagNotCleared_FailsJob) {
    auto path = CreateFile("crashed.bin", JOB_SIZE, 0x11);
    ASSERT_TRUE(store->create(MakeFileJob("crashed", path.string(), JOB_SIZE, {"zero"}))
                    .has_value());
    ASSERT_TRUE(store->set_state("crashed", JobState::Running, std::nullopt).has_value());
    observed_store = MockJobStore::CreateDelegatingMock(store);
    ON_CALL(*observed_store, set_interrupted("crashed", false))
        .WillByDefault(Return(std::unexpected(
            util::Error{util::ErrorKind::StoreUnavailable, "read-only file system", EROFS})));
    OpenGate();

    StartManager(1);

    ASSERT_TRUE(WaitForState("crashed", JobState::Failed));
    auto job = store->load("crashed");
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(job->error.has_value());
    EXPECT_EQ(job->error->kind, util::ErrorKind::StoreUnavailable);
    EXPECT_TRUE(AllBytesEqual(ReadFile(path), 0x11));
}

TEST_F(JobManagerTest, Start_AutoResumeDisabled_LeavesInterruptedJobPaused) {
    auto path = CreateFile("crashed.bin", JOB_SIZE, 0x11);
    ASSERT_TRUE(store->create(MakeFileJob("crashed", path.string(), JOB_SIZE, {"zero"}))
                    .has_value());
    ASSERT_TRUE(store->set_state("crashed", JobState::Running, std::nullopt).has_value());
    OpenGate();

    StartManager(1, false);
    std::this_thread::sleep_for(std::chrono::milliseconds{400});

    auto job = store->load("crashed");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Paused);
    EXPECT_TRUE(job->interrupted);
}

TEST_F(JobManagerTest, Start_OperatorPausedJob_StaysPaused) {
    auto path = CreateFile("held.bin", JOB_SIZE, 0x11);
    ASSERT_TRUE(store->create(MakeFileJob("held", path.string(), JOB_SIZE, {"zero"})).has_value());
    ASSERT_TRUE(store->set_state("held", JobState::Paused, std::nullopt).has_value());
    auto queued_path = CreateFile("queued.bin", JOB_SIZE, 0x11);
    ASSERT_TRUE(store->create(MakeFileJob("queued", queued_path.string(), JOB_SIZE, {"zero"}))
                    .has_value());
    OpenGate();

    StartManager(1);

    ASSERT_TRUE(WaitForState("queued", JobState::Completed));
    EXPECT_EQ(StateOf("held"), JobState::Paused);
}

// Test: Shutdown pauses running jobs and marks them for automatic resumption
TEST_F(JobManagerTest, Shutdown_RunningJob_PausedAndInterrupted) {
    StartManager(1);
    auto id = Submit(FileRequest("interrupted.bin"));
    ASSERT_TRUE(WaitForRunning(id));

    std::thread stopper([this] { manager->shutdown(); });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    OpenGate();
    stopper.join();

    auto job = store->load(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Paused);
    EXPECT_TRUE(job->interrupted);
}
