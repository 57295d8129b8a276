/**
 * @file ResourceMonitor.cpp
 * @brief Smoothed load tracking and the /proc sampler
 */

#include "monitor/ResourceMonitor.hpp"

#include "util/Logger.hpp"

#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <format>
#include <fstream>
#include <sstream>
#include <string>

namespace {

// linux/ioprio.h is not exported by every libc
constexpr int IOPRIO_WHO_PROCESS = 1;
constexpr int IOPRIO_CLASS_SHIFT = 13;
constexpr int IOPRIO_CLASS_BE = 2;
constexpr int IOPRIO_CLASS_IDLE = 3;
constexpr int IOPRIO_BE_DEFAULT_LEVEL = 4;

auto memory_factor(double used_percent) -> double {
    if (used_percent > 90.0) {
        return 0.5;
    }
    if (used_percent > 80.0) {
        return 0.7;
    }
    if (used_percent > 70.0) {
        return 0.8;
    }
    if (used_percent < 30.0) {
        return 1.2;
    }
    return 1.0;
}

auto cpu_factor(double cpu_percent) -> double {
    if (cpu_percent > 90.0) {
        return 0.6;
    }
    if (cpu_percent > 80.0) {
        return 0.8;
    }
    if (cpu_percent < 20.0) {
        return 1.2;
    }
    return 1.0;
}

auto read_error(const char* path) -> util::Error {
    return util::Error{util::ErrorKind::PermanentIO, std::format("cannot read {}", path)};
}

}  // namespace

auto ProcLoadSampler::sample() -> std::expected<LoadSample, util::Error> {
    LoadSample result;

    {
        std::ifstream stat("/proc/stat");
        std::string label;
        if (!(stat >> label) || label != "cpu") {
            return std::unexpected(read_error("/proc/stat"));
        }
        // user nice system idle iowait irq softirq steal
        uint64_t fields[8] = {};
        CpuTimes times;
        for (size_t i = 0; i < std::size(fields) && stat >> fields[i]; ++i) {
            times.total += fields[i];
        }
        times.busy = times.total - fields[3] - fields[4];
        if (previous_ && times.total > previous_->total) {
            const auto busy = static_cast<double>(times.busy - std::min(times.busy, previous_->busy));
            result.cpu_percent =
                100.0 * busy / static_cast<double>(times.total - previous_->total);
        }
        previous_ = times;
    }

    {
        std::ifstream meminfo("/proc/meminfo");
        std::string key;
        uint64_t value = 0;
        std::string unit;
        uint64_t total = 0;
        uint64_t available = 0;
        while (meminfo >> key >> value >> unit) {
            if (key == "MemTotal:") {
                total = value;
            } else if (key == "MemAvailable:") {
                available = value;
            }
        }
        if (total == 0) {
            return std::unexpected(read_error("/proc/meminfo"));
        }
        result.memory_used_percent =
            100.0 * (1.0 - static_cast<double>(available) / static_cast<double>(total));
    }

    // "some avg10=1.23 avg60=... avg300=... total=..."
    std::ifstream pressure("/proc/pressure/io");
    std::string line;
    if (pressure && std::getline(pressure, line)) {
        if (const auto pos = line.find("avg10="); pos != std::string::npos) {
            std::istringstream value(line.substr(pos + 6));
            double percent = 0.0;
            if (value >> percent) {
                result.io_pressure = std::clamp(percent / 100.0, 0.0, 1.0);
            }
        }
    }

    return result;
}

auto compute_recommendation(const LoadSample& load, const MonitorBounds& bounds)
    -> Recommendation {
    const auto scaled =
        static_cast<uint64_t>(static_cast<double>(bounds.base_chunk_size) *
                              memory_factor(load.memory_used_percent));
    auto chunk = std::clamp(scaled, bounds.min_chunk_size, bounds.max_chunk_size);
    chunk = std::max(chunk / config::CHUNK_ALIGNMENT * config::CHUNK_ALIGNMENT,
                     config::CHUNK_ALIGNMENT);

    const auto ceiling = std::max<uint32_t>(bounds.worker_ceiling, 1);
    const auto workers = static_cast<uint32_t>(static_cast<double>(ceiling) *
                                               cpu_factor(load.cpu_percent));

    return Recommendation{
        .chunk_size = chunk,
        .worker_count = std::clamp<uint32_t>(workers, 1, ceiling),
        .io_priority = load.io_pressure > 0.5 ? IoPriority::Idle : IoPriority::BestEffort,
    };
}

ResourceMonitor::ResourceMonitor(std::shared_ptr<ILoadSampler> sampler,
                                 const config::MonitorSettings& settings,
                                 const MonitorBounds& bounds)
    : sampler_(std::move(sampler)), settings_(settings), bounds_(bounds) {
    // Until the first sample, behave as under moderate load
    const auto initial = compute_recommendation(
        LoadSample{.cpu_percent = 50.0, .memory_used_percent = 50.0, .io_pressure = 0.0}, bounds_);
    chunk_size_.store(initial.chunk_size);
    worker_count_.store(initial.worker_count);
    io_priority_.store(initial.io_priority);
}

ResourceMonitor::~ResourceMonitor() {
    stop();
}

auto ResourceMonitor::recommend() const -> Recommendation {
    return Recommendation{
        .chunk_size = chunk_size_.load(std::memory_order_relaxed),
        .worker_count = worker_count_.load(std::memory_order_relaxed),
        .io_priority = io_priority_.load(std::memory_order_relaxed),
    };
}

void ResourceMonitor::publish(const Recommendation& recommendation) {
    chunk_size_.store(recommendation.chunk_size, std::memory_order_relaxed);
    worker_count_.store(recommendation.worker_count, std::memory_order_relaxed);
    io_priority_.store(recommendation.io_priority, std::memory_order_relaxed);
    LOG_INFO("ResourceMonitor",
             std::format("Recommendation changed: chunk {} bytes, {} workers, io {}",
                         recommendation.chunk_size, recommendation.worker_count,
                         io_priority_to_string(recommendation.io_priority)));
}

auto ResourceMonitor::update() -> std::expected<void, util::Error> {
    auto reading = sampler_->sample();
    if (!reading) {
        return std::unexpected(reading.error());
    }

    std::lock_guard lock(update_mutex_);
    if (!smoothed_) {
        smoothed_ = *reading;
    } else {
        const double alpha = std::clamp(settings_.smoothing, 0.0, 1.0);
        auto blend = [alpha](double previous, double current) {
            return alpha * current + (1.0 - alpha) * previous;
        };
        smoothed_->cpu_percent = blend(smoothed_->cpu_percent, reading->cpu_percent);
        smoothed_->memory_used_percent =
            blend(smoothed_->memory_used_percent, reading->memory_used_percent);
        smoothed_->io_pressure = blend(smoothed_->io_pressure, reading->io_pressure);
    }

    const auto next = compute_recommendation(*smoothed_, bounds_);
    if (next == recommend()) {
        candidate_.reset();
        candidate_count_ = 0;
        return {};
    }
    if (candidate_ && *candidate_ == next) {
        ++candidate_count_;
    } else {
        candidate_ = next;
        candidate_count_ = 1;
    }
    if (candidate_count_ >= std::max<uint32_t>(settings_.hysteresis_samples, 1)) {
        publish(next);
        candidate_.reset();
        candidate_count_ = 0;
    }
    return {};
}

void ResourceMonitor::start() {
    std::lock_guard lock(thread_mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    thread_ = std::thread([this] { sampling_loop(); });
}

void ResourceMonitor::stop() {
    {
        std::lock_guard lock(thread_mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ResourceMonitor::sampling_loop() {
    const auto interval = std::chrono::milliseconds(std::max<uint32_t>(settings_.sample_interval_ms, 10));
    bool warned = false;
    std::unique_lock lock(thread_mutex_);
    while (!stopping_) {
        lock.unlock();
        if (auto result = update(); !result && !warned) {
            LOG_WARNING("ResourceMonitor",
                        std::format("Load sampling failed: {}", result.error().message));
            warned = true;
        }
        lock.lock();
        wake_.wait_for(lock, interval, [this] { return stopping_; });
    }
}

auto apply_io_priority(IoPriority priority) -> std::expected<void, util::Error> {
    const int value = priority == IoPriority::Idle
        ? (IOPRIO_CLASS_IDLE << IOPRIO_CLASS_SHIFT)
        : (IOPRIO_CLASS_BE << IOPRIO_CLASS_SHIFT) | IOPRIO_BE_DEFAULT_LEVEL;
    // who = 0 addresses the calling thread
    if (::syscall(SYS_ioprio_set, IOPRIO_WHO_PROCESS, 0, value) != 0) {
        return std::unexpected(util::io_error("ioprio_set", errno));
    }
    return {};
}
