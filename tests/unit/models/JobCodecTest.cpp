/**
 * @file JobCodecTest.cpp
 * @brief Unit tests for the GVariant job encoding
 */

#include "models/JobCodec.hpp"

#include "util/GLibPtr.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

namespace {

JobRecord MakeFullRecord() {
    auto record = MakeFileJob("job-42", "/srv/data.bin", 8192, {"zero", "ones", "random"});
    record.target = FreeSpaceTarget{.volume = "/mnt/vol", .placeholder = "/mnt/vol/.fill-42"};
    record.priority = -3;
    record.checkpoint = Checkpoint{2, 4096, 1024};
    record.depends_on = "job-41";
    record.deadline = 1'700'000'000'000'000;
    record.active_seconds = 12.5;
    record.error = util::Error{util::ErrorKind::TransientIO, "device busy", 16};
    record.verification = VerificationRequest{.level = VerificationLevel::Sample,
                                              .algorithms = {"sha256", "sha512"}};
    record.before_digests = DigestSet{.window_size = 1024,
                                      .windows = {1, 5, 7},
                                      .window_digests = {{"sha256", {1, 2, 3}}},
                                      .combined = {{"sha256", "00ff"}}};
    record.verification_result =
        VerificationResult{.level = VerificationLevel::Sample,
                           .algorithms = {{"sha256", {"00ff", "ff00", true, 0}}},
                           .windows_checked = 3,
                           .verified = true,
                           .note = "sampled"};
    record.warnings = {"finalize failed"};
    record.remove_after_wipe = true;
    record.interrupted = true;
    return record;
}

}  // namespace

// ========== job record Tests ==========

// Test: Every field of a stored record survives encoding
TEST(JobCodecTest, JobFromVariant_FullRecord_PreservesEveryField) {
    const auto record = MakeFullRecord();
    auto value = util::adopt_variant(codec::job_to_variant(record, true));

    auto decoded = codec::job_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, record);
}

TEST(JobCodecTest, JobToVariant_WithoutWindows_DropsWindowDigestsOnly) {
    const auto record = MakeFullRecord();
    auto value = util::adopt_variant(codec::job_to_variant(record, false));

    auto decoded = codec::job_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->before_digests.has_value());
    EXPECT_TRUE(decoded->before_digests->windows.empty());
    EXPECT_TRUE(decoded->before_digests->window_digests.at("sha256").empty());
    EXPECT_EQ(decoded->before_digests->combined, record.before_digests->combined);
    EXPECT_EQ(decoded->before_digests->window_size, 1024u);
}

TEST(JobCodecTest, JobFromVariant_WrongType_ReturnsInvalidArgument) {
    auto value = util::adopt_variant(g_variant_new("(s)", "nope"));

    auto decoded = codec::job_from_variant(value.get());

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, util::ErrorKind::InvalidArgument);
}

TEST(JobCodecTest, JobFromVariant_FutureVersion_ReturnsInvalidArgument) {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a{sv}"));
    auto value = util::adopt_variant(g_variant_new("(ua{sv})", 99u, &builder));

    auto decoded = codec::job_from_variant(value.get());

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, util::ErrorKind::InvalidArgument);
}

// Test: Records written before optional keys existed still load
TEST(JobCodecTest, JobFromVariant_MinimalDictionary_UsesDefaults) {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&builder, "{sv}", "id", g_variant_new_string("old"));
    g_variant_builder_add(&builder, "{sv}", "target-kind", g_variant_new_string("drive"));
    g_variant_builder_add(&builder, "{sv}", "target-path", g_variant_new_string("/dev/sdz"));
    g_variant_builder_add(&builder, "{sv}", "state", g_variant_new_string("paused"));
    auto value = util::adopt_variant(g_variant_new("(ua{sv})", codec::RECORD_FORMAT_VERSION, &builder));

    auto decoded = codec::job_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->target, TargetSpec{DriveTarget{.device = "/dev/sdz"}});
    EXPECT_EQ(decoded->state, JobState::Paused);
    EXPECT_TRUE(decoded->passes.empty());
    EXPECT_TRUE(decoded->remove_after_wipe);
    EXPECT_FALSE(decoded->interrupted);
    EXPECT_FALSE(decoded->depends_on.has_value());
}

TEST(JobCodecTest, JobFromVariant_UnknownState_ReturnsInvalidArgument) {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&builder, "{sv}", "id", g_variant_new_string("x"));
    g_variant_builder_add(&builder, "{sv}", "target-kind", g_variant_new_string("file"));
    g_variant_builder_add(&builder, "{sv}", "target-path", g_variant_new_string("/tmp/x"));
    g_variant_builder_add(&builder, "{sv}", "state", g_variant_new_string("exploded"));
    auto value = util::adopt_variant(g_variant_new("(ua{sv})", codec::RECORD_FORMAT_VERSION, &builder));

    EXPECT_FALSE(codec::job_from_variant(value.get()).has_value());
}

// ========== request Tests ==========

TEST(JobCodecTest, RequestFromVariant_AllOptionsSet_PreservesThem) {
    JobRequest request{.kind = TargetKind::Directory,
                       .path = "/home/user/secret",
                       .plan = "dod",
                       .priority = 5,
                       .depends_on = "job-1",
                       .verify = VerificationLevel::Full,
                       .algorithms = {"sha512"},
                       .deadline_seconds = 3600,
                       .keep = true};
    auto value = util::adopt_variant(codec::request_to_variant(request));

    auto decoded = codec::request_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->kind, TargetKind::Directory);
    EXPECT_EQ(decoded->path, "/home/user/secret");
    EXPECT_EQ(decoded->plan, "dod");
    EXPECT_EQ(decoded->priority, 5);
    EXPECT_EQ(decoded->depends_on, std::optional<std::string>("job-1"));
    EXPECT_EQ(decoded->verify, VerificationLevel::Full);
    EXPECT_EQ(decoded->algorithms, (std::vector<std::string>{"sha512"}));
    EXPECT_EQ(decoded->deadline_seconds, std::optional<int64_t>(3600));
    EXPECT_TRUE(decoded->keep);
}

// Test: Empty dependency and negative deadline mean "not set"
TEST(JobCodecTest, RequestFromVariant_Defaults_LeavesOptionalsUnset) {
    auto value = util::adopt_variant(codec::request_to_variant(JobRequest{.path = "/tmp/f"}));

    auto decoded = codec::request_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->depends_on.has_value());
    EXPECT_FALSE(decoded->deadline_seconds.has_value());
    EXPECT_TRUE(decoded->algorithms.empty());
}

TEST(JobCodecTest, RequestFromVariant_UnknownKind_ReturnsInvalidArgument) {
    GVariantBuilder algorithms;
    g_variant_builder_init(&algorithms, G_VARIANT_TYPE("as"));
    auto value = util::adopt_variant(g_variant_new("(sssissasxb)", "tape", "/dev/st0", "zero", 0, "", "none",
                                    &algorithms, static_cast<gint64>(-1), FALSE));

    auto decoded = codec::request_from_variant(value.get());

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, util::ErrorKind::InvalidArgument);
}

TEST(JobCodecTest, RequestFromVariant_UnknownVerifyLevel_ReturnsInvalidArgument) {
    GVariantBuilder algorithms;
    g_variant_builder_init(&algorithms, G_VARIANT_TYPE("as"));
    auto value = util::adopt_variant(g_variant_new("(sssissasxb)", "file", "/tmp/f", "zero", 0, "", "paranoid",
                                    &algorithms, static_cast<gint64>(-1), FALSE));

    EXPECT_FALSE(codec::request_from_variant(value.get()).has_value());
}

// ========== snapshot / progress / plan Tests ==========

TEST(JobCodecTest, SnapshotFromVariant_WithProgress_KeepsProgress) {
    JobSnapshot snapshot{.record = MakeFullRecord(),
                         .progress = WipeProgress{.job_id = "job-42",
                                                  .current_pass = 2,
                                                  .total_passes = 3,
                                                  .bytes_done = 4096,
                                                  .pass_bytes = 8192,
                                                  .speed_bytes_per_sec = 1000,
                                                  .estimated_seconds_remaining = 12,
                                                  .state = "running"}};
    auto value = util::adopt_variant(codec::snapshot_to_variant(snapshot));

    auto decoded = codec::snapshot_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->record.id, "job-42");
    EXPECT_EQ(decoded->progress, snapshot.progress);
}

TEST(JobCodecTest, SnapshotFromVariant_WithoutProgress_LeavesItUnset) {
    JobSnapshot snapshot{.record = MakeFileJob("idle", "/tmp/idle", 10, {"zero"})};
    auto value = util::adopt_variant(codec::snapshot_to_variant(snapshot));

    auto decoded = codec::snapshot_from_variant(value.get());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->progress.has_value());
}

TEST(JobCodecTest, ProgressFromVariant_UnknownEta_IsNegative) {
    WipeProgress progress{.job_id = "p", .current_pass = 1, .total_passes = 1, .state = "queued"};
    auto value = util::adopt_variant(codec::progress_to_variant(progress));

    auto decoded = codec::progress_from_variant(value.get());

    EXPECT_EQ(decoded, progress);
    EXPECT_EQ(decoded.estimated_seconds_remaining, -1);
}

TEST(JobCodecTest, PlanFromVariant_PreservesCatalogEntry) {
    PlanInfo plan{.name = "gutmann", .description = "35 passes", .pass_count = 35};
    auto value = util::adopt_variant(codec::plan_to_variant(plan));

    auto decoded = codec::plan_from_variant(value.get());

    EXPECT_EQ(decoded.name, "gutmann");
    EXPECT_EQ(decoded.description, "35 passes");
    EXPECT_EQ(decoded.pass_count, 35u);
}
