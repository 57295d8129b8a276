/**
 * @file ITargetHandle.hpp
 * @brief Capability interfaces over an opened erasure target
 */

#pragma once

#include "models/JobTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>

/**
 * @class ITargetHandle
 * @brief Positional byte access to one target
 *
 * Offsets are logical: a directory target exposes its files laid end to end.
 */
class ITargetHandle {
public:
    virtual ~ITargetHandle() = default;

    virtual auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> = 0;

    virtual auto read_at(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Durability barrier: returns once written data is on stable storage
     */
    virtual auto sync() -> std::expected<void, util::Error> = 0;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Release the underlying descriptors, reporting close errors
     */
    virtual auto close() -> std::expected<void, util::Error> = 0;
};

/**
 * @class ITargetOpener
 * @brief Opens, measures and finalizes targets by variant
 */
class ITargetOpener {
public:
    virtual ~ITargetOpener() = default;

    /**
     * @brief Size a target at submission time
     */
    virtual auto probe_size(const TargetSpec& target) -> std::expected<uint64_t, util::Error> = 0;

    /**
     * @brief Open the target of @p job for reading and writing
     *
     * Fails with TargetChanged when the target no longer has the size
     * recorded in the job.
     */
    virtual auto open(const JobRecord& job)
        -> std::expected<std::unique_ptr<ITargetHandle>, util::Error> = 0;

    /**
     * @brief Check that a paused job's target still matches its record
     */
    virtual auto validate_for_resume(const JobRecord& job) -> std::expected<void, util::Error> = 0;

    /**
     * @brief Target-specific cleanup after a completed wipe
     */
    virtual auto finalize(const JobRecord& job) -> std::expected<void, util::Error> = 0;
};
