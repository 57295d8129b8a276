/**
 * @file EngineConfig.hpp
 * @brief Runtime configuration of the helper and the engine
 */

#pragma once

#include "models/VerificationTypes.hpp"
#include "util/Logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace config {

inline constexpr uint64_t KiB = 1024;
inline constexpr uint64_t MiB = 1024 * KiB;

/// Chunk sizes are kept multiples of this so O_DIRECT-friendly devices stay aligned
inline constexpr uint64_t CHUNK_ALIGNMENT = 4 * KiB;

struct EngineSettings {
    uint64_t min_chunk_size = 64 * KiB;
    uint64_t max_chunk_size = 64 * MiB;
    uint32_t sync_interval_chunks = 1;   ///< Durability barrier every N chunks
    uint32_t max_transient_retries = 3;
    uint32_t retry_backoff_ms = 50;      ///< Doubled on every attempt
};

struct SchedulerSettings {
    uint32_t worker_ceiling = 4;
    bool auto_resume_interrupted = true;
    bool remove_files_after_wipe = true;
};

struct MonitorSettings {
    uint32_t sample_interval_ms = 2000;
    uint64_t base_chunk_size = 10 * MiB;
    double smoothing = 0.3;            ///< EMA weight of the newest sample
    uint32_t hysteresis_samples = 2;   ///< Consecutive samples required before a change
};

struct VerificationSettings {
    VerificationLevel level = VerificationLevel::Standard;
    std::vector<std::string> algorithms{"sha256", "sha512"};
    double sample_fraction = 0.10;
    double standard_fraction = 0.25;
};

struct StoreSettings {
    std::string directory = "/var/lib/storage-eraser/jobs";
    uint32_t compact_every = 4096;
};

struct FreeSpaceSettings {
    uint64_t reserve_bytes = 64 * MiB;
};

struct LoggingSettings {
    std::string directory = "/var/log/storage-eraser";
    util::LogLevel level = util::LogLevel::INFO;
    bool console = false;
};

struct EngineConfig {
    EngineSettings engine;
    SchedulerSettings scheduler;
    MonitorSettings monitor;
    VerificationSettings verification;
    StoreSettings store;
    FreeSpaceSettings free_space;
    LoggingSettings logging;
};

}  // namespace config
