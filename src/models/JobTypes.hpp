/**
 * @file JobTypes.hpp
 * @brief Job record, pass plan and checkpoint types
 */

#pragma once

#include "models/TargetTypes.hpp"
#include "models/VerificationTypes.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

/**
 * @enum JobState
 * @brief Job lifecycle states
 *
 * Queued -> Running -> {Paused, Completed, Failed, Cancelled}
 * Paused -> {Running, Cancelled}
 * Queued -> Cancelled
 */
enum class JobState { Queued, Running, Paused, Completed, Failed, Cancelled };

[[nodiscard]] inline auto is_terminal(JobState state) -> bool {
    return state == JobState::Completed || state == JobState::Failed ||
           state == JobState::Cancelled;
}

[[nodiscard]] inline auto job_state_to_string(JobState state) -> std::string_view {
    switch (state) {
        case JobState::Queued:
            return "queued";
        case JobState::Running:
            return "running";
        case JobState::Paused:
            return "paused";
        case JobState::Completed:
            return "completed";
        case JobState::Failed:
            return "failed";
        case JobState::Cancelled:
            return "cancelled";
    }
    return "queued";
}

[[nodiscard]] inline auto job_state_from_string(std::string_view name) -> std::optional<JobState> {
    for (auto state : {JobState::Queued, JobState::Running, JobState::Paused, JobState::Completed,
                       JobState::Failed, JobState::Cancelled}) {
        if (job_state_to_string(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}

/**
 * @struct Checkpoint
 * @brief Last fully written and synced chunk boundary
 *
 * Ordering uses (pass_index, byte_offset) only; chunk_size records the
 * chunk size that produced the boundary so a mid-pass resume keeps the
 * same arithmetic.
 */
struct Checkpoint {
    uint32_t pass_index = 0;
    uint64_t byte_offset = 0;
    uint64_t chunk_size = 0;

    [[nodiscard]] auto position() const -> std::tuple<uint32_t, uint64_t> {
        return {pass_index, byte_offset};
    }

    auto operator==(const Checkpoint&) const -> bool = default;
};

[[nodiscard]] inline auto checkpoint_before(const Checkpoint& lhs, const Checkpoint& rhs) -> bool {
    return lhs.position() < rhs.position();
}

/**
 * @struct PassSpec
 * @brief One pass of a plan
 */
struct PassSpec {
    std::string method;      ///< Human-readable step name, e.g. "DoD 5220.22-M pass 2"
    std::string descriptor;  ///< Pattern descriptor understood by the pattern source
    uint32_t index = 0;
    uint64_t expected_bytes = 0;

    auto operator==(const PassSpec&) const -> bool = default;
};

/**
 * @struct JobRecord
 * @brief Persistent state of one erasure job
 *
 * Timestamps are microseconds since the Unix epoch.
 */
struct JobRecord {
    std::string id;
    TargetSpec target;
    uint64_t target_size = 0;
    std::string plan_name;
    std::vector<PassSpec> passes;
    JobState state = JobState::Queued;
    int32_t priority = 0;
    Checkpoint checkpoint;
    std::optional<std::string> depends_on;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::optional<int64_t> deadline;  ///< Absolute wall-clock limit, if any
    double active_seconds = 0.0;      ///< Running time accumulated over every run
    std::optional<util::Error> error;
    VerificationRequest verification;
    std::optional<DigestSet> before_digests;
    std::optional<VerificationResult> verification_result;
    std::vector<std::string> warnings;
    bool remove_after_wipe = true;
    bool interrupted = false;  ///< Paused by a helper shutdown or crash rather than by the operator

    auto operator==(const JobRecord&) const -> bool = default;
};

/**
 * @struct JobRequest
 * @brief Submission parameters, as sent by the CLI
 */
struct JobRequest {
    TargetKind kind = TargetKind::File;
    std::string path;
    std::string plan = "zero";
    int32_t priority = 0;
    std::optional<std::string> depends_on;
    VerificationLevel verify = VerificationLevel::Standard;
    std::vector<std::string> algorithms;       ///< Empty means the configured default
    std::optional<int64_t> deadline_seconds;   ///< Relative to submission
    bool keep = false;                         ///< Leave files in place after the wipe
};

/**
 * @struct JobFilter
 * @brief ListJobs filter; unset fields match everything
 */
struct JobFilter {
    std::optional<JobState> state;
};

/**
 * @struct JobSnapshot
 * @brief Read-only view of a job for reporting
 */
struct JobSnapshot {
    JobRecord record;
    std::optional<WipeProgress> progress;
};

/**
 * @struct PlanInfo
 * @brief Catalog entry describing a named pass plan
 */
struct PlanInfo {
    std::string name;
    std::string description;
    uint32_t pass_count = 0;
};
