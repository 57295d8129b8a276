/**
 * @file ConfigLoaderTest.cpp
 * @brief Unit tests for configuration loading and validation
 */

#include "config/ConfigLoader.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace config;

// ========== parse_size Tests ==========

TEST(ParseSizeTest, PlainBytes) {
    EXPECT_EQ(parse_size("4096").value(), 4096u);
    EXPECT_EQ(parse_size("12B").value(), 12u);
}

TEST(ParseSizeTest, BinarySuffixes) {
    EXPECT_EQ(parse_size("512K").value(), 512 * KiB);
    EXPECT_EQ(parse_size("10MiB").value(), 10 * MiB);
    EXPECT_EQ(parse_size("2g").value(), 2048 * MiB);
    EXPECT_EQ(parse_size("64 KB").value(), 64 * KiB);
}

TEST(ParseSizeTest, Malformed_IsInvalidArgument) {
    for (const char* text : {"", "MiB", "12X", "-5", "1.5M"}) {
        auto result = parse_size(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().kind, util::ErrorKind::InvalidArgument) << text;
    }
}

TEST(ParseSizeTest, Overflow_IsRejected) {
    EXPECT_FALSE(parse_size("18446744073709551615G").has_value());
}

// ========== load_config_from_data Tests ==========

TEST(LoadConfigTest, EmptyData_YieldsDefaults) {
    auto config = load_config_from_data("");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->engine.min_chunk_size, 64 * KiB);
    EXPECT_EQ(config->engine.sync_interval_chunks, 1u);
    EXPECT_EQ(config->scheduler.worker_ceiling, 4u);
    EXPECT_TRUE(config->scheduler.auto_resume_interrupted);
    EXPECT_EQ(config->verification.level, VerificationLevel::Standard);
    EXPECT_EQ(config->verification.algorithms, (std::vector<std::string>{"sha256", "sha512"}));
    EXPECT_EQ(config->logging.level, util::LogLevel::INFO);
}

TEST(LoadConfigTest, AllSections_Parsed) {
    auto config = load_config_from_data(R"(
[engine]
min_chunk_size = 1MiB
max_chunk_size = 128M
sync_interval_chunks = 8
max_transient_retries = 5
retry_backoff_ms = 10

[scheduler]
worker_ceiling = 2
auto_resume_interrupted = false
remove_files_after_wipe = false

[monitor]
sample_interval_ms = 500
base_chunk_size = 4MiB
smoothing = 0.5
hysteresis_samples = 3

[verification]
level = full
algorithms = sha1; md5
sample_fraction = 0.2
standard_fraction = 0.5

[store]
directory = /tmp/jobs
compact_every = 16

[free_space]
reserve_bytes = 1G

[logging]
directory = /tmp/logs
level = debug
console = true
)");

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->engine.min_chunk_size, 1 * MiB);
    EXPECT_EQ(config->engine.max_chunk_size, 128 * MiB);
    EXPECT_EQ(config->engine.sync_interval_chunks, 8u);
    EXPECT_EQ(config->engine.max_transient_retries, 5u);
    EXPECT_EQ(config->engine.retry_backoff_ms, 10u);
    EXPECT_EQ(config->scheduler.worker_ceiling, 2u);
    EXPECT_FALSE(config->scheduler.auto_resume_interrupted);
    EXPECT_FALSE(config->scheduler.remove_files_after_wipe);
    EXPECT_EQ(config->monitor.sample_interval_ms, 500u);
    EXPECT_EQ(config->monitor.base_chunk_size, 4 * MiB);
    EXPECT_DOUBLE_EQ(config->monitor.smoothing, 0.5);
    EXPECT_EQ(config->monitor.hysteresis_samples, 3u);
    EXPECT_EQ(config->verification.level, VerificationLevel::Full);
    EXPECT_EQ(config->verification.algorithms, (std::vector<std::string>{"sha1", "md5"}));
    EXPECT_DOUBLE_EQ(config->verification.sample_fraction, 0.2);
    EXPECT_DOUBLE_EQ(config->verification.standard_fraction, 0.5);
    EXPECT_EQ(config->store.directory, "/tmp/jobs");
    EXPECT_EQ(config->store.compact_every, 16u);
    EXPECT_EQ(config->free_space.reserve_bytes, 1024 * MiB);
    EXPECT_EQ(config->logging.directory, "/tmp/logs");
    EXPECT_EQ(config->logging.level, util::LogLevel::DEBUG);
    EXPECT_TRUE(config->logging.console);
}

TEST(LoadConfigTest, UnknownKeys_AreIgnored) {
    auto config = load_config_from_data("[engine]\nturbo = yes\n[extras]\nfoo = 1\n");
    EXPECT_TRUE(config.has_value());
}

// Test: Each rejected value reports the offending key
TEST(LoadConfigTest, InvalidValues_AreInvalidArgument) {
    const std::pair<const char*, const char*> cases[] = {
        {"[engine]\nmin_chunk_size = 1000\n", "min_chunk_size"},
        {"[engine]\nmin_chunk_size = 1M\nmax_chunk_size = 512K\n", "max_chunk_size"},
        {"[engine]\nsync_interval_chunks = 0\n", "sync_interval_chunks"},
        {"[engine]\nmax_transient_retries = -1\n", "max_transient_retries"},
        {"[engine]\nretry_backoff_ms = soon\n", "retry_backoff_ms"},
        {"[scheduler]\nworker_ceiling = 0\n", "worker_ceiling"},
        {"[scheduler]\nauto_resume_interrupted = maybe\n", "auto_resume_interrupted"},
        {"[monitor]\nsmoothing = 1.5\n", "smoothing"},
        {"[verification]\nlevel = paranoid\n", "level"},
        {"[verification]\nalgorithms = sha256;whirlpool\n", "algorithms"},
        {"[verification]\nsample_fraction = 0\n", "sample_fraction"},
        {"[verification]\nstandard_fraction = 1.5\n", "standard_fraction"},
        {"[store]\ncompact_every = 0\n", "compact_every"},
        {"[free_space]\nreserve_bytes = lots\n", "reserve_bytes"},
        {"[logging]\nlevel = chatty\n", "level"},
    };

    for (const auto& [data, key] : cases) {
        auto config = load_config_from_data(data);
        ASSERT_FALSE(config.has_value()) << data;
        EXPECT_EQ(config.error().kind, util::ErrorKind::InvalidArgument) << data;
        EXPECT_NE(config.error().message.find(key), std::string::npos)
            << data << " -> " << config.error().message;
    }
}

TEST(LoadConfigTest, MalformedSyntax_IsInvalidArgument) {
    auto config = load_config_from_data("this is not a key file");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, util::ErrorKind::InvalidArgument);
}

// ========== load_config Tests ==========

class LoadConfigFileTest : public TempDirFixture {};

TEST_F(LoadConfigFileTest, MissingFile_YieldsDefaults) {
    auto config = load_config(temp_dir / "absent.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->store.directory, "/var/lib/storage-eraser/jobs");
}

TEST_F(LoadConfigFileTest, ExistingFile_IsParsed) {
    {
        std::ofstream out(temp_dir / "engine.conf");
        out << "[store]\ndirectory = " << (temp_dir / "jobs").string() << "\n";
    }

    auto config = load_config(temp_dir / "engine.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->store.directory, (temp_dir / "jobs").string());
}

TEST_F(LoadConfigFileTest, BrokenFile_IsInvalidArgument) {
    {
        std::ofstream out(temp_dir / "engine.conf");
        out << "[engine\nmin_chunk_size\n";
    }

    auto config = load_config(temp_dir / "engine.conf");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, util::ErrorKind::InvalidArgument);
}

// ========== validate Tests ==========

TEST(ValidateConfigTest, Defaults_AreValid) {
    EXPECT_TRUE(validate(EngineConfig{}).has_value());
}

TEST(ValidateConfigTest, EmptyStoreDirectory_IsRejected) {
    EngineConfig config;
    config.store.directory.clear();

    EXPECT_FALSE(validate(config).has_value());
}
