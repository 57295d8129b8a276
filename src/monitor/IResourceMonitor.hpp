/**
 * @file IResourceMonitor.hpp
 * @brief Load sampling and pacing recommendations
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <string_view>

/**
 * @struct LoadSample
 * @brief One reading of system load
 */
struct LoadSample {
    double cpu_percent = 0.0;          ///< Busy share of all CPUs since the previous reading
    double memory_used_percent = 0.0;  ///< 100 * (1 - MemAvailable / MemTotal)
    double io_pressure = 0.0;          ///< Share of time tasks stalled on I/O, 0..1
};

enum class IoPriority { BestEffort, Idle };

[[nodiscard]] inline auto io_priority_to_string(IoPriority priority) -> std::string_view {
    return priority == IoPriority::Idle ? "idle" : "best-effort";
}

/**
 * @struct Recommendation
 * @brief Pacing advice consumed at pass boundaries and dispatch decisions
 */
struct Recommendation {
    uint64_t chunk_size = 0;
    uint32_t worker_count = 1;
    IoPriority io_priority = IoPriority::BestEffort;

    auto operator==(const Recommendation&) const -> bool = default;
};

/**
 * @class ILoadSampler
 * @brief Source of raw load readings
 */
class ILoadSampler {
public:
    virtual ~ILoadSampler() = default;

    virtual auto sample() -> std::expected<LoadSample, util::Error> = 0;
};

/**
 * @class IResourceMonitor
 * @brief Cheap, lock-free access to the current recommendation
 */
class IResourceMonitor {
public:
    virtual ~IResourceMonitor() = default;

    [[nodiscard]] virtual auto recommend() const -> Recommendation = 0;
};
