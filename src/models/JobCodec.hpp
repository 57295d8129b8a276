/**
 * @file JobCodec.hpp
 * @brief GVariant encoding of job records and progress
 *
 * The same encoding is used by the job store on disk and by the helper's
 * D-Bus interface. Records are a versioned dictionary, "(ua{sv})", so new
 * keys can be added without breaking stored jobs.
 */

#pragma once

#include "models/JobTypes.hpp"
#include "util/Error.hpp"

#include <glib.h>

#include <cstdint>
#include <expected>

namespace codec {

inline constexpr uint32_t RECORD_FORMAT_VERSION = 1;
inline constexpr auto RECORD_TYPE = "(ua{sv})";
inline constexpr auto PROGRESS_TYPE = "(suutttxs)";
inline constexpr auto PLAN_TYPE = "(ssu)";

/// kind, path, plan, priority, depends-on or "", verify, algorithms, deadline seconds or -1, keep
inline constexpr auto REQUEST_TYPE = "(sssissasxb)";

/// record without window digests, has-progress, progress
inline constexpr auto SNAPSHOT_TYPE = "((ua{sv})b(suutttxs))";

/**
 * @brief Encode a job record
 * @param include_windows false drops per-window digests (listing and D-Bus)
 * @return A floating GVariant of RECORD_TYPE
 */
[[nodiscard]] auto job_to_variant(const JobRecord& record, bool include_windows = true)
    -> GVariant*;

/**
 * @brief Decode a job record; does not take ownership of @p value
 */
[[nodiscard]] auto job_from_variant(GVariant* value) -> std::expected<JobRecord, util::Error>;

[[nodiscard]] auto progress_to_variant(const WipeProgress& progress) -> GVariant*;
[[nodiscard]] auto progress_from_variant(GVariant* value) -> WipeProgress;

[[nodiscard]] auto request_to_variant(const JobRequest& request) -> GVariant*;

/**
 * @brief Decode a submission; rejects unknown target kinds and verification levels
 */
[[nodiscard]] auto request_from_variant(GVariant* value) -> std::expected<JobRequest, util::Error>;

[[nodiscard]] auto snapshot_to_variant(const JobSnapshot& snapshot) -> GVariant*;
[[nodiscard]] auto snapshot_from_variant(GVariant* value)
    -> std::expected<JobSnapshot, util::Error>;

[[nodiscard]] auto plan_to_variant(const PlanInfo& plan) -> GVariant*;
[[nodiscard]] auto plan_from_variant(GVariant* value) -> PlanInfo;

}  // namespace codec
