/**
 * @file WipeTargetTest.cpp
 * @brief Unit tests for target identity, sizing, access and finalization
 */

#include "targets/WipeTarget.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
using namespace targets;

class WipeTargetTest : public TempDirFixture {
protected:
    JobRecord Job(TargetSpec target, uint64_t size) {
        auto job = MakeFileJob("job-1", "", size, {"zero"});
        job.target = std::move(target);
        return job;
    }
};

// ========== Identity Tests ==========

TEST(IdentitiesConflictTest, EqualPaths_Conflict) {
    EXPECT_TRUE(identities_conflict("/srv/a", "/srv/a"));
}

TEST(IdentitiesConflictTest, AncestorAndDescendant_Conflict) {
    EXPECT_TRUE(identities_conflict("/srv", "/srv/a/b"));
    EXPECT_TRUE(identities_conflict("/srv/a/b", "/srv"));
    EXPECT_TRUE(identities_conflict("/", "/dev/sdb"));
}

TEST(IdentitiesConflictTest, SharedPrefixOnly_DoesNotConflict) {
    EXPECT_FALSE(identities_conflict("/srv/a", "/srv/ab"));
    EXPECT_FALSE(identities_conflict("/srv/a", "/srv/b"));
}

// Test: Free-space jobs conflict only with the same volume's free space
TEST(IdentitiesConflictTest, FreeSpace_ConflictsOnlyWithSameVolume) {
    EXPECT_TRUE(identities_conflict("freespace:/home", "freespace:/home"));
    EXPECT_FALSE(identities_conflict("freespace:/home", "/home/user/file"));
    EXPECT_FALSE(identities_conflict("freespace:/", "freespace:/home"));
}

TEST_F(WipeTargetTest, TargetIdentity_NormalizesPath) {
    CreateFile("a/b.bin", 16, 0);
    const auto canonical = fs::canonical(temp_dir / "a" / "b.bin").string();

    EXPECT_EQ(target_identity(FileTarget{.path = (temp_dir / "a" / ".." / "a" / "b.bin").string()}),
              canonical);
    EXPECT_EQ(target_identity(DirectoryTarget{.path = (temp_dir / "a").string() + "/"}),
              fs::canonical(temp_dir / "a").string());
}

TEST_F(WipeTargetTest, TargetIdentity_ResolvesSymlinks) {
    auto file = CreateFile("real.bin", 16, 0);
    fs::create_symlink(file, temp_dir / "link.bin");

    EXPECT_EQ(target_identity(FileTarget{.path = (temp_dir / "link.bin").string()}),
              target_identity(FileTarget{.path = file.string()}));
}

TEST_F(WipeTargetTest, TargetIdentity_FreeSpaceIsPrefixed) {
    auto identity = target_identity(FreeSpaceTarget{.volume = temp_dir.string(), .placeholder = ""});

    EXPECT_EQ(identity, "freespace:" + fs::canonical(temp_dir).string());
}

TEST(PlaceholderPathTest, LivesOnVolumeAndNamesJob) {
    EXPECT_EQ(placeholder_path("/mnt/data", "abc"), "/mnt/data/.storage-eraser-abc.fill");
}

// ========== probe_size Tests ==========

TEST_F(WipeTargetTest, ProbeSize_File) {
    auto file = CreateFile("f.bin", 12345, 1);

    EXPECT_EQ(probe_size(FileTarget{.path = file.string()}, 0).value(), 12345u);
}

TEST_F(WipeTargetTest, ProbeSize_DirectorySumsFiles) {
    CreateFile("d/one.bin", 100, 1);
    CreateFile("d/sub/two.bin", 250, 2);

    EXPECT_EQ(probe_size(DirectoryTarget{.path = (temp_dir / "d").string()}, 0).value(), 350u);
}

TEST_F(WipeTargetTest, ProbeSize_MissingFile_IsPermanentIO) {
    auto size = probe_size(FileTarget{.path = (temp_dir / "absent").string()}, 0);

    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().kind, util::ErrorKind::PermanentIO);
    EXPECT_EQ(size.error().code, ENOENT);
}

TEST_F(WipeTargetTest, ProbeSize_WrongKind_IsInvalidArgument) {
    auto file = CreateFile("f.bin", 10, 1);

    auto as_file = probe_size(FileTarget{.path = temp_dir.string()}, 0);
    auto as_drive = probe_size(DriveTarget{.device = file.string()}, 0);

    ASSERT_FALSE(as_file.has_value());
    EXPECT_EQ(as_file.error().kind, util::ErrorKind::InvalidArgument);
    ASSERT_FALSE(as_drive.has_value());
    EXPECT_EQ(as_drive.error().kind, util::ErrorKind::InvalidArgument);
}

TEST_F(WipeTargetTest, ProbeSize_FreeSpace_RespectsReserve) {
    FreeSpaceTarget target{.volume = temp_dir.string(), .placeholder = ""};

    auto size = probe_size(target, 0);
    auto starved = probe_size(target, UINT64_MAX / 2);

    ASSERT_TRUE(size.has_value()) << size.error().message;
    EXPECT_GT(*size, 0u);
    EXPECT_EQ(*size % 4096, 0u);
    ASSERT_FALSE(starved.has_value());
    EXPECT_EQ(starved.error().kind, util::ErrorKind::InvalidArgument);
}

// ========== list_directory_files Tests ==========

TEST_F(WipeTargetTest, ListDirectoryFiles_RecursiveSortedWithoutSymlinks) {
    CreateFile("d/b.bin", 1, 0);
    CreateFile("d/a.bin", 1, 0);
    CreateFile("d/sub/c.bin", 1, 0);
    fs::create_symlink(temp_dir / "d" / "a.bin", temp_dir / "d" / "z-link");

    auto files = list_directory_files(temp_dir / "d");

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(*files, (std::vector<fs::path>{temp_dir / "d" / "a.bin", temp_dir / "d" / "b.bin",
                                             temp_dir / "d" / "sub" / "c.bin"}));
}

TEST_F(WipeTargetTest, ListDirectoryFiles_NotADirectory_Fails) {
    auto file = CreateFile("f.bin", 1, 0);

    auto files = list_directory_files(file);

    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, ENOTDIR);
}

// ========== open_target Tests ==========

// Test: A directory is one byte range, its files laid end to end
TEST_F(WipeTargetTest, OpenDirectory_WritesAcrossFileBoundaries) {
    CreateFile("d/a.bin", 3, 0x11);
    CreateFile("d/b.bin", 5, 0x22);
    auto job = Job(DirectoryTarget{.path = (temp_dir / "d").string()}, 8);

    auto handle = open_target(job);
    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_EQ((*handle)->size(), 8u);

    const std::vector<uint8_t> data{1, 2, 3, 4};
    ASSERT_TRUE((*handle)->write_at(1, data).has_value());
    ASSERT_TRUE((*handle)->sync().has_value());

    std::vector<uint8_t> back(8);
    ASSERT_TRUE((*handle)->read_at(0, back).has_value());
    EXPECT_EQ(back, (std::vector<uint8_t>{0x11, 1, 2, 3, 4, 0x22, 0x22, 0x22}));
    ASSERT_TRUE((*handle)->close().has_value());

    EXPECT_EQ(ReadFile(temp_dir / "d" / "a.bin"), (std::vector<uint8_t>{0x11, 1, 2}));
    EXPECT_EQ(ReadFile(temp_dir / "d" / "b.bin"), (std::vector<uint8_t>{3, 4, 0x22, 0x22, 0x22}));
}

TEST_F(WipeTargetTest, OpenFile_WriteBeyondEnd_Fails) {
    auto file = CreateFile("f.bin", 16, 0);
    auto handle = open_target(Job(FileTarget{.path = file.string()}, 16));
    ASSERT_TRUE(handle.has_value());

    const std::vector<uint8_t> data(8, 0xFF);
    auto result = (*handle)->write_at(12, data);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PermanentIO);
    EXPECT_TRUE(AllBytesEqual(ReadFile(file), 0));
}

TEST_F(WipeTargetTest, OpenFile_SizeChanged_IsTargetChanged) {
    auto file = CreateFile("f.bin", 100, 0);

    auto handle = open_target(Job(FileTarget{.path = file.string()}, 64));

    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().kind, util::ErrorKind::TargetChanged);
}

TEST_F(WipeTargetTest, OpenFreeSpace_AllocatesPlaceholder) {
    const auto placeholder = placeholder_path(temp_dir.string(), "job-1");
    auto job = Job(FreeSpaceTarget{.volume = temp_dir.string(), .placeholder = placeholder},
                   64 * 1024);

    auto handle = open_target(job);

    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_EQ((*handle)->size(), 64u * 1024);
    EXPECT_EQ(fs::file_size(placeholder), 64u * 1024);
}

// ========== validate_for_resume Tests ==========

TEST_F(WipeTargetTest, ValidateForResume_Unchanged_Succeeds) {
    auto file = CreateFile("f.bin", 100, 0);

    EXPECT_TRUE(validate_for_resume(Job(FileTarget{.path = file.string()}, 100)).has_value());
}

TEST_F(WipeTargetTest, ValidateForResume_ResizedOrMissing_IsTargetChanged) {
    auto file = CreateFile("f.bin", 100, 0);

    auto resized = validate_for_resume(Job(FileTarget{.path = file.string()}, 50));
    auto missing =
        validate_for_resume(Job(FileTarget{.path = (temp_dir / "gone").string()}, 100));

    ASSERT_FALSE(resized.has_value());
    EXPECT_EQ(resized.error().kind, util::ErrorKind::TargetChanged);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, util::ErrorKind::TargetChanged);
}

// Test: A placeholder may be missing only if nothing was written yet
TEST_F(WipeTargetTest, ValidateForResume_MissingPlaceholder_DependsOnProgress) {
    auto job = Job(FreeSpaceTarget{.volume = temp_dir.string(),
                                   .placeholder = placeholder_path(temp_dir.string(), "job-1")},
                   64 * 1024);

    EXPECT_TRUE(validate_for_resume(job).has_value());

    job.checkpoint.byte_offset = 4096;
    auto result = validate_for_resume(job);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::TargetChanged);
}

// ========== finalize_target Tests ==========

TEST_F(WipeTargetTest, Finalize_File_RemovesUnlessKept) {
    auto kept = CreateFile("kept.bin", 10, 0);
    auto removed = CreateFile("removed.bin", 10, 0);
    auto keep_job = Job(FileTarget{.path = kept.string()}, 10);
    auto remove_job = Job(FileTarget{.path = removed.string()}, 10);
    remove_job.remove_after_wipe = true;

    ASSERT_TRUE(finalize_target(keep_job).has_value());
    ASSERT_TRUE(finalize_target(remove_job).has_value());

    EXPECT_TRUE(fs::exists(kept));
    EXPECT_FALSE(fs::exists(removed));
    EXPECT_EQ(std::distance(fs::directory_iterator(temp_dir), fs::directory_iterator{}), 1);
}

TEST_F(WipeTargetTest, Finalize_Directory_RemovesTree) {
    CreateFile("d/a.bin", 1, 0);
    CreateFile("d/sub/deeper/b.bin", 1, 0);
    auto job = Job(DirectoryTarget{.path = (temp_dir / "d").string()}, 2);
    job.remove_after_wipe = true;

    ASSERT_TRUE(finalize_target(job).has_value());

    EXPECT_FALSE(fs::exists(temp_dir / "d"));
}

TEST_F(WipeTargetTest, Finalize_FreeSpace_ReleasesPlaceholder) {
    auto placeholder = CreateFile(".storage-eraser-job-1.fill", 4096, 0);
    auto job = Job(FreeSpaceTarget{.volume = temp_dir.string(), .placeholder = placeholder.string()},
                   4096);

    ASSERT_TRUE(finalize_target(job).has_value());
    EXPECT_FALSE(fs::exists(placeholder));

    // Already released
    EXPECT_TRUE(finalize_target(job).has_value());
}

TEST_F(WipeTargetTest, Finalize_Drive_IsNoOp) {
    EXPECT_TRUE(finalize_target(Job(DriveTarget{.device = "/dev/null-device"}, 0)).has_value());
}
