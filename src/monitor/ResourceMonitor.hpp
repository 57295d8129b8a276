/**
 * @file ResourceMonitor.hpp
 * @brief Smoothed load tracking and the /proc sampler
 */

#pragma once

#include "config/EngineConfig.hpp"
#include "monitor/IResourceMonitor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @class ProcLoadSampler
 * @brief Reads /proc/stat, /proc/meminfo and /proc/pressure/io
 *
 * CPU usage is the busy share between two consecutive calls, so the first
 * reading reports 0. Kernels without PSI report zero I/O pressure.
 */
class ProcLoadSampler : public ILoadSampler {
public:
    auto sample() -> std::expected<LoadSample, util::Error> override;

private:
    struct CpuTimes {
        uint64_t busy = 0;
        uint64_t total = 0;
    };

    std::optional<CpuTimes> previous_;
};

struct MonitorBounds {
    uint64_t base_chunk_size = 10 * config::MiB;
    uint64_t min_chunk_size = 64 * config::KiB;
    uint64_t max_chunk_size = 64 * config::MiB;
    uint32_t worker_ceiling = 4;
};

/**
 * @brief Map a (smoothed) load sample to a recommendation
 *
 * Non-increasing in every load input. Memory pressure scales the chunk
 * size, CPU load scales the worker count, and I/O pressure above 0.5
 * selects the idle I/O class.
 */
[[nodiscard]] auto compute_recommendation(const LoadSample& load, const MonitorBounds& bounds)
    -> Recommendation;

/**
 * @class ResourceMonitor
 * @brief EMA-smoothed, hysteresis-damped recommendation
 *
 * update() folds one sample into the moving average; a recommendation
 * different from the published one replaces it only after
 * hysteresis_samples consecutive updates produced that same value.
 * recommend() reads atomics and never blocks.
 */
class ResourceMonitor : public IResourceMonitor {
public:
    ResourceMonitor(std::shared_ptr<ILoadSampler> sampler, const config::MonitorSettings& settings,
                    const MonitorBounds& bounds);
    ~ResourceMonitor() override;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    [[nodiscard]] auto recommend() const -> Recommendation override;

    /**
     * @brief Take one sample and update the published recommendation
     */
    auto update() -> std::expected<void, util::Error>;

    /**
     * @brief Sample every sample_interval_ms on a background thread
     */
    void start();
    void stop();

private:
    void publish(const Recommendation& recommendation);
    void sampling_loop();

    std::shared_ptr<ILoadSampler> sampler_;
    config::MonitorSettings settings_;
    MonitorBounds bounds_;

    std::mutex update_mutex_;
    std::optional<LoadSample> smoothed_;
    std::optional<Recommendation> candidate_;
    uint32_t candidate_count_ = 0;

    std::atomic<uint64_t> chunk_size_;
    std::atomic<uint32_t> worker_count_;
    std::atomic<IoPriority> io_priority_{IoPriority::BestEffort};

    std::mutex thread_mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread thread_;
};

/**
 * @brief Apply an I/O scheduling class to the calling thread via ioprio_set
 */
auto apply_io_priority(IoPriority priority) -> std::expected<void, util::Error>;
