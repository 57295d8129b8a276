/**
 * @file JobCodec.cpp
 * @brief GVariant encoding of job records and progress
 */

#include "models/JobCodec.hpp"

#include "util/GLibPtr.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codec {

namespace {

auto new_string(std::string_view value) -> GVariant* {
    return g_variant_new_take_string(g_strndup(value.data(), value.size()));
}

void add_entry(GVariantBuilder* builder, const char* key, GVariant* value) {
    g_variant_builder_add(builder, "{sv}", key, value);
}

auto strings_to_variant(const std::vector<std::string>& values) -> GVariant* {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("as"));
    for (const auto& value : values) {
        g_variant_builder_add(&builder, "s", value.c_str());
    }
    return g_variant_builder_end(&builder);
}

auto strings_from_variant(GVariant* value) -> std::vector<std::string> {
    std::vector<std::string> result;
    GVariantIter iter;
    g_variant_iter_init(&iter, value);
    const gchar* item = nullptr;
    while (g_variant_iter_loop(&iter, "&s", &item)) {
        result.emplace_back(item);
    }
    return result;
}

auto u64s_to_variant(const std::vector<uint64_t>& values) -> GVariant* {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("at"));
    for (auto value : values) {
        g_variant_builder_add(&builder, "t", static_cast<guint64>(value));
    }
    return g_variant_builder_end(&builder);
}

auto u64s_from_variant(GVariant* value) -> std::vector<uint64_t> {
    gsize count = 0;
    const auto* data =
        static_cast<const guint64*>(g_variant_get_fixed_array(value, &count, sizeof(guint64)));
    if (data == nullptr || count == 0) {
        return {};
    }
    return {data, data + count};
}

auto digests_to_variant(const DigestSet& digests, bool include_windows) -> GVariant* {
    static const std::vector<uint64_t> no_values;

    GVariantBuilder algorithms;
    g_variant_builder_init(&algorithms, G_VARIANT_TYPE("a{s(sat)}"));
    for (const auto& [name, hex] : digests.combined) {
        const auto it = digests.window_digests.find(name);
        const auto& prefixes =
            (include_windows && it != digests.window_digests.end()) ? it->second : no_values;
        g_variant_builder_add(&algorithms, "{s(s@at)}", name.c_str(), hex.c_str(),
                              u64s_to_variant(prefixes));
    }

    return g_variant_new("(t@at@a{s(sat)})", static_cast<guint64>(digests.window_size),
                         u64s_to_variant(include_windows ? digests.windows : no_values),
                         g_variant_builder_end(&algorithms));
}

auto digests_from_variant(GVariant* value) -> DigestSet {
    DigestSet digests;
    guint64 window_size = 0;
    GVariant* windows = nullptr;
    GVariantIter* algorithms = nullptr;
    g_variant_get(value, "(t@ata{s(sat)})", &window_size, &windows, &algorithms);

    digests.window_size = window_size;
    digests.windows = u64s_from_variant(windows);
    g_variant_unref(windows);

    const gchar* name = nullptr;
    const gchar* hex = nullptr;
    GVariant* prefixes = nullptr;
    while (g_variant_iter_loop(algorithms, "{&s(&s@at)}", &name, &hex, &prefixes)) {
        digests.combined[name] = hex;
        digests.window_digests[name] = u64s_from_variant(prefixes);
    }
    g_variant_iter_free(algorithms);

    return digests;
}

auto verification_to_variant(const VerificationResult& result) -> GVariant* {
    GVariantBuilder algorithms;
    g_variant_builder_init(&algorithms, G_VARIANT_TYPE("a{s(ssbt)}"));
    for (const auto& [name, verdict] : result.algorithms) {
        g_variant_builder_add(&algorithms, "{s(ssbt)}", name.c_str(), verdict.before.c_str(),
                              verdict.after.c_str(), verdict.verified ? TRUE : FALSE,
                              static_cast<guint64>(verdict.unchanged_windows));
    }

    return g_variant_new("(@sbt@s@a{s(ssbt)})",
                         new_string(verification_level_to_string(result.level)),
                         result.verified ? TRUE : FALSE,
                         static_cast<guint64>(result.windows_checked), new_string(result.note),
                         g_variant_builder_end(&algorithms));
}

auto verification_from_variant(GVariant* value) -> VerificationResult {
    VerificationResult result;
    const gchar* level = nullptr;
    gboolean verified = FALSE;
    guint64 windows_checked = 0;
    const gchar* note = nullptr;
    GVariantIter* algorithms = nullptr;
    g_variant_get(value, "(&sbt&sa{s(ssbt)})", &level, &verified, &windows_checked, &note,
                  &algorithms);

    result.level = verification_level_from_string(level).value_or(VerificationLevel::None);
    result.verified = verified != FALSE;
    result.windows_checked = windows_checked;
    result.note = note;

    const gchar* name = nullptr;
    const gchar* before = nullptr;
    const gchar* after = nullptr;
    gboolean algo_verified = FALSE;
    guint64 unchanged = 0;
    while (g_variant_iter_loop(algorithms, "{&s(&s&sbt)}", &name, &before, &after,
                               &algo_verified, &unchanged)) {
        result.algorithms[name] = AlgorithmVerdict{.before = before,
                                                   .after = after,
                                                   .verified = algo_verified != FALSE,
                                                   .unchanged_windows = unchanged};
    }
    g_variant_iter_free(algorithms);

    return result;
}

auto lookup_string(GVariant* dict, const char* key) -> std::optional<std::string> {
    const gchar* value = nullptr;
    if (!g_variant_lookup(dict, key, "&s", &value)) {
        return std::nullopt;
    }
    return std::string(value);
}

auto malformed(std::string_view what) -> std::unexpected<util::Error> {
    return std::unexpected(
        util::Error{util::ErrorKind::InvalidArgument, std::format("malformed job record: {}", what)});
}

}  // namespace

auto job_to_variant(const JobRecord& record, bool include_windows) -> GVariant* {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a{sv}"));

    add_entry(&builder, "id", new_string(record.id));
    add_entry(&builder, "target-kind",
              new_string(target_kind_to_string(target_kind(record.target))));
    add_entry(&builder, "target-path", new_string(target_location(record.target)));
    if (const auto* free_space = std::get_if<FreeSpaceTarget>(&record.target)) {
        add_entry(&builder, "placeholder", new_string(free_space->placeholder));
    }
    add_entry(&builder, "target-size", g_variant_new_uint64(record.target_size));
    add_entry(&builder, "plan", new_string(record.plan_name));

    GVariantBuilder passes;
    g_variant_builder_init(&passes, G_VARIANT_TYPE("a(ssut)"));
    for (const auto& pass : record.passes) {
        g_variant_builder_add(&passes, "(ssut)", pass.method.c_str(), pass.descriptor.c_str(),
                              static_cast<guint32>(pass.index),
                              static_cast<guint64>(pass.expected_bytes));
    }
    add_entry(&builder, "passes", g_variant_builder_end(&passes));

    add_entry(&builder, "state", new_string(job_state_to_string(record.state)));
    add_entry(&builder, "priority", g_variant_new_int32(record.priority));
    add_entry(&builder, "checkpoint",
              g_variant_new("(utt)", static_cast<guint32>(record.checkpoint.pass_index),
                            static_cast<guint64>(record.checkpoint.byte_offset),
                            static_cast<guint64>(record.checkpoint.chunk_size)));
    if (record.depends_on) {
        add_entry(&builder, "depends-on", new_string(*record.depends_on));
    }
    add_entry(&builder, "created-at", g_variant_new_int64(record.created_at));
    add_entry(&builder, "updated-at", g_variant_new_int64(record.updated_at));
    if (record.deadline) {
        add_entry(&builder, "deadline", g_variant_new_int64(*record.deadline));
    }
    add_entry(&builder, "active-seconds", g_variant_new_double(record.active_seconds));
    if (record.error) {
        add_entry(&builder, "error",
                  g_variant_new("(@si@s)", new_string(record.error->message),
                                static_cast<gint32>(record.error->code),
                                new_string(util::kind_to_string(record.error->kind))));
    }
    add_entry(&builder, "verify-level",
              new_string(verification_level_to_string(record.verification.level)));
    add_entry(&builder, "verify-algorithms", strings_to_variant(record.verification.algorithms));
    if (record.before_digests) {
        add_entry(&builder, "before-digests",
                  digests_to_variant(*record.before_digests, include_windows));
    }
    if (record.verification_result) {
        add_entry(&builder, "verification", verification_to_variant(*record.verification_result));
    }
    add_entry(&builder, "warnings", strings_to_variant(record.warnings));
    add_entry(&builder, "remove-after", g_variant_new_boolean(record.remove_after_wipe));
    if (record.interrupted) {
        add_entry(&builder, "interrupted", g_variant_new_boolean(TRUE));
    }

    return g_variant_new("(ua{sv})", static_cast<guint32>(RECORD_FORMAT_VERSION), &builder);
}

auto job_from_variant(GVariant* value) -> std::expected<JobRecord, util::Error> {
    if (value == nullptr || !g_variant_is_of_type(value, G_VARIANT_TYPE(RECORD_TYPE))) {
        return malformed("unexpected type");
    }

    guint32 version = 0;
    GVariant* raw_dict = nullptr;
    g_variant_get(value, "(u@a{sv})", &version, &raw_dict);
    util::VariantPtr dict(raw_dict);

    if (version != RECORD_FORMAT_VERSION) {
        return malformed(std::format("unsupported version {}", version));
    }

    JobRecord record;

    auto id = lookup_string(dict.get(), "id");
    auto kind_name = lookup_string(dict.get(), "target-kind");
    auto location = lookup_string(dict.get(), "target-path");
    auto state_name = lookup_string(dict.get(), "state");
    if (!id || id->empty() || !kind_name || !location || !state_name) {
        return malformed("missing identity fields");
    }
    record.id = *id;

    auto kind = target_kind_from_string(*kind_name);
    if (!kind) {
        return malformed(std::format("unknown target kind '{}'", *kind_name));
    }
    switch (*kind) {
        case TargetKind::File:
            record.target = FileTarget{.path = *location};
            break;
        case TargetKind::Directory:
            record.target = DirectoryTarget{.path = *location};
            break;
        case TargetKind::FreeSpace:
            record.target = FreeSpaceTarget{
                .volume = *location,
                .placeholder = lookup_string(dict.get(), "placeholder").value_or("")};
            break;
        case TargetKind::Drive:
            record.target = DriveTarget{.device = *location};
            break;
    }

    auto state = job_state_from_string(*state_name);
    if (!state) {
        return malformed(std::format("unknown state '{}'", *state_name));
    }
    record.state = *state;

    guint64 target_size = 0;
    g_variant_lookup(dict.get(), "target-size", "t", &target_size);
    record.target_size = target_size;
    record.plan_name = lookup_string(dict.get(), "plan").value_or("");

    if (util::VariantPtr passes{g_variant_lookup_value(dict.get(), "passes",
                                                       G_VARIANT_TYPE("a(ssut)"))}) {
        GVariantIter iter;
        g_variant_iter_init(&iter, passes.get());
        const gchar* method = nullptr;
        const gchar* descriptor = nullptr;
        guint32 index = 0;
        guint64 expected = 0;
        while (g_variant_iter_loop(&iter, "(&s&sut)", &method, &descriptor, &index, &expected)) {
            record.passes.push_back(PassSpec{.method = method,
                                             .descriptor = descriptor,
                                             .index = index,
                                             .expected_bytes = expected});
        }
    }

    gint32 priority = 0;
    g_variant_lookup(dict.get(), "priority", "i", &priority);
    record.priority = priority;

    guint32 pass_index = 0;
    guint64 byte_offset = 0;
    guint64 chunk_size = 0;
    if (g_variant_lookup(dict.get(), "checkpoint", "(utt)", &pass_index, &byte_offset,
                         &chunk_size)) {
        record.checkpoint = Checkpoint{
            .pass_index = pass_index, .byte_offset = byte_offset, .chunk_size = chunk_size};
    }

    record.depends_on = lookup_string(dict.get(), "depends-on");

    gint64 timestamp = 0;
    if (g_variant_lookup(dict.get(), "created-at", "x", &timestamp)) {
        record.created_at = timestamp;
    }
    if (g_variant_lookup(dict.get(), "updated-at", "x", &timestamp)) {
        record.updated_at = timestamp;
    }
    if (g_variant_lookup(dict.get(), "deadline", "x", &timestamp)) {
        record.deadline = timestamp;
    }

    gdouble active = 0.0;
    g_variant_lookup(dict.get(), "active-seconds", "d", &active);
    record.active_seconds = active;

    const gchar* error_message = nullptr;
    gint32 error_code = 0;
    const gchar* error_kind = nullptr;
    if (g_variant_lookup(dict.get(), "error", "(&si&s)", &error_message, &error_code,
                         &error_kind)) {
        record.error = util::Error{util::kind_from_string(error_kind), error_message, error_code};
    }

    if (auto level_name = lookup_string(dict.get(), "verify-level")) {
        record.verification.level =
            verification_level_from_string(*level_name).value_or(VerificationLevel::None);
    }
    if (util::VariantPtr algorithms{
            g_variant_lookup_value(dict.get(), "verify-algorithms", G_VARIANT_TYPE("as"))}) {
        record.verification.algorithms = strings_from_variant(algorithms.get());
    }

    if (util::VariantPtr before{g_variant_lookup_value(dict.get(), "before-digests",
                                                       G_VARIANT_TYPE("(tata{s(sat)})"))}) {
        record.before_digests = digests_from_variant(before.get());
    }
    if (util::VariantPtr verification{g_variant_lookup_value(
            dict.get(), "verification", G_VARIANT_TYPE("(sbtsa{s(ssbt)})"))}) {
        record.verification_result = verification_from_variant(verification.get());
    }
    if (util::VariantPtr warnings{
            g_variant_lookup_value(dict.get(), "warnings", G_VARIANT_TYPE("as"))}) {
        record.warnings = strings_from_variant(warnings.get());
    }

    gboolean remove_after = TRUE;
    g_variant_lookup(dict.get(), "remove-after", "b", &remove_after);
    record.remove_after_wipe = remove_after != FALSE;

    gboolean interrupted = FALSE;
    g_variant_lookup(dict.get(), "interrupted", "b", &interrupted);
    record.interrupted = interrupted != FALSE;

    return record;
}

auto progress_to_variant(const WipeProgress& progress) -> GVariant* {
    return g_variant_new("(suutttxs)", progress.job_id.c_str(),
                         static_cast<guint32>(progress.current_pass),
                         static_cast<guint32>(progress.total_passes),
                         static_cast<guint64>(progress.bytes_done),
                         static_cast<guint64>(progress.pass_bytes),
                         static_cast<guint64>(progress.speed_bytes_per_sec),
                         static_cast<gint64>(progress.estimated_seconds_remaining),
                         progress.state.c_str());
}

auto progress_from_variant(GVariant* value) -> WipeProgress {
    const gchar* job_id = nullptr;
    guint32 current_pass = 0;
    guint32 total_passes = 0;
    guint64 bytes_done = 0;
    guint64 pass_bytes = 0;
    guint64 speed = 0;
    gint64 eta = -1;
    const gchar* state = nullptr;
    g_variant_get(value, "(&suutttx&s)", &job_id, &current_pass, &total_passes, &bytes_done,
                  &pass_bytes, &speed, &eta, &state);

    return WipeProgress{.job_id = job_id ? job_id : "",
                        .current_pass = current_pass,
                        .total_passes = total_passes,
                        .bytes_done = bytes_done,
                        .pass_bytes = pass_bytes,
                        .speed_bytes_per_sec = speed,
                        .estimated_seconds_remaining = eta,
                        .state = state ? state : ""};
}

auto request_to_variant(const JobRequest& request) -> GVariant* {
    return g_variant_new("(sssiss@asxb)", std::string(target_kind_to_string(request.kind)).c_str(),
                         request.path.c_str(), request.plan.c_str(),
                         static_cast<gint32>(request.priority),
                         request.depends_on.value_or("").c_str(),
                         std::string(verification_level_to_string(request.verify)).c_str(),
                         strings_to_variant(request.algorithms),
                         static_cast<gint64>(request.deadline_seconds.value_or(-1)),
                         request.keep ? TRUE : FALSE);
}

auto request_from_variant(GVariant* value) -> std::expected<JobRequest, util::Error> {
    if (value == nullptr || !g_variant_is_of_type(value, G_VARIANT_TYPE(REQUEST_TYPE))) {
        return std::unexpected(
            util::Error{util::ErrorKind::InvalidArgument, "malformed job request"});
    }

    const gchar* kind_name = nullptr;
    const gchar* path = nullptr;
    const gchar* plan = nullptr;
    gint32 priority = 0;
    const gchar* depends_on = nullptr;
    const gchar* verify_name = nullptr;
    GVariant* raw_algorithms = nullptr;
    gint64 deadline = -1;
    gboolean keep = FALSE;
    g_variant_get(value, "(&s&s&si&s&s@asxb)", &kind_name, &path, &plan, &priority, &depends_on,
                  &verify_name, &raw_algorithms, &deadline, &keep);
    util::VariantPtr algorithms(raw_algorithms);

    auto kind = target_kind_from_string(kind_name);
    if (!kind) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("unknown target kind '{}'", kind_name)});
    }
    auto verify = verification_level_from_string(verify_name);
    if (!verify) {
        return std::unexpected(util::Error{
            util::ErrorKind::InvalidArgument,
            std::format("unknown verification level '{}'", verify_name)});
    }

    JobRequest request{.kind = *kind,
                       .path = path,
                       .plan = plan,
                       .priority = priority,
                       .verify = *verify,
                       .algorithms = strings_from_variant(algorithms.get()),
                       .keep = keep != FALSE};
    if (depends_on[0] != '\0') {
        request.depends_on = depends_on;
    }
    if (deadline >= 0) {
        request.deadline_seconds = deadline;
    }
    return request;
}

auto snapshot_to_variant(const JobSnapshot& snapshot) -> GVariant* {
    const WipeProgress empty{.job_id = snapshot.record.id};
    return g_variant_new("(@(ua{sv})b@(suutttxs))", job_to_variant(snapshot.record, false),
                         snapshot.progress.has_value() ? TRUE : FALSE,
                         progress_to_variant(snapshot.progress.value_or(empty)));
}

auto snapshot_from_variant(GVariant* value) -> std::expected<JobSnapshot, util::Error> {
    if (value == nullptr || !g_variant_is_of_type(value, G_VARIANT_TYPE(SNAPSHOT_TYPE))) {
        return malformed("unexpected snapshot type");
    }

    GVariant* raw_record = nullptr;
    gboolean has_progress = FALSE;
    GVariant* raw_progress = nullptr;
    g_variant_get(value, "(@(ua{sv})b@(suutttxs))", &raw_record, &has_progress, &raw_progress);
    util::VariantPtr record_value(raw_record);
    util::VariantPtr progress_value(raw_progress);

    auto record = job_from_variant(record_value.get());
    if (!record) {
        return std::unexpected(record.error());
    }
    JobSnapshot snapshot{.record = std::move(*record)};
    if (has_progress) {
        snapshot.progress = progress_from_variant(progress_value.get());
    }
    return snapshot;
}

auto plan_to_variant(const PlanInfo& plan) -> GVariant* {
    return g_variant_new("(ssu)", plan.name.c_str(), plan.description.c_str(),
                         static_cast<guint32>(plan.pass_count));
}

auto plan_from_variant(GVariant* value) -> PlanInfo {
    const gchar* name = nullptr;
    const gchar* description = nullptr;
    guint32 pass_count = 0;
    g_variant_get(value, "(&s&su)", &name, &description, &pass_count);
    return PlanInfo{.name = name, .description = description, .pass_count = pass_count};
}

}  // namespace codec
