/**
 * @file FileJobStore.cpp
 * @brief Directory-backed job store
 */

#include "store/FileJobStore.hpp"

#include "models/JobCodec.hpp"
#include "util/GLibPtr.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <glib.h>
#include <glib/gstdio.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>
#include <tuple>

namespace {

constexpr auto RECORD_SUFFIX = ".job";
constexpr auto LOG_SUFFIX = ".ckpt";

auto store_error(std::string message, int code = 0) -> util::Error {
    return util::Error{util::ErrorKind::StoreUnavailable, std::move(message), code};
}

auto sync_directory(const std::filesystem::path& directory) -> std::expected<void, util::Error> {
    util::FileDescriptor fd(::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd) {
        return std::unexpected(store_error(
            std::format("open {}: {}", directory.string(), std::strerror(errno)), errno));
    }
    if (::fsync(fd.get()) != 0) {
        return std::unexpected(store_error(
            std::format("fsync {}: {}", directory.string(), std::strerror(errno)), errno));
    }
    return {};
}

auto parse_u64(std::string_view text, uint64_t& value) -> bool {
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    return ec == std::errc{} && ptr == end;
}

/**
 * @brief Parse one "pass offset chunk" log line
 */
auto parse_log_line(std::string_view line) -> std::optional<Checkpoint> {
    uint64_t fields[3] = {};
    for (auto& field : fields) {
        const auto space = line.find(' ');
        const auto token = line.substr(0, space);
        if (token.empty() || !parse_u64(token, field)) {
            return std::nullopt;
        }
        line = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);
    }
    if (!line.empty() || fields[0] > UINT32_MAX) {
        return std::nullopt;
    }
    return Checkpoint{.pass_index = static_cast<uint32_t>(fields[0]),
                      .byte_offset = fields[1],
                      .chunk_size = fields[2]};
}

}  // namespace

FileJobStore::FileJobStore(std::filesystem::path directory, uint32_t compact_every)
    : directory_(std::move(directory)), compact_every_(std::max<uint32_t>(compact_every, 1)) {}

auto FileJobStore::initialize() -> std::expected<void, util::Error> {
    if (g_mkdir_with_parents(directory_.c_str(), 0700) != 0) {
        const int err = errno;
        return std::unexpected(store_error(
            std::format("cannot create store directory {}: {}", directory_.string(),
                        std::strerror(err)),
            err));
    }
    if (::access(directory_.c_str(), W_OK) != 0) {
        const int err = errno;
        return std::unexpected(store_error(
            std::format("store directory {} not writable: {}", directory_.string(),
                        std::strerror(err)),
            err));
    }
    LOG_INFO("JobStore", std::format("Using job store at {}", directory_.string()));
    return {};
}

auto FileJobStore::record_path(const std::string& id) const -> std::filesystem::path {
    return directory_ / (id + RECORD_SUFFIX);
}

auto FileJobStore::log_path(const std::string& id) const -> std::filesystem::path {
    return directory_ / (id + LOG_SUFFIX);
}

auto FileJobStore::valid_id(const std::string& id) -> bool {
    return !id.empty() && std::ranges::all_of(id, [](char c) {
        return g_ascii_isalnum(c) || c == '-' || c == '_';
    });
}

auto FileJobStore::read_record(const std::string& id) const
    -> std::expected<JobRecord, util::Error> {
    const auto path = record_path(id);
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(path.c_str(), &contents, &length, &error)) {
        const bool missing = g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT);
        util::Error result = missing
            ? util::Error{util::ErrorKind::NotFound, std::format("unknown job {}", id)}
            : store_error(std::format("read {}: {}", path.string(), error->message));
        g_error_free(error);
        return std::unexpected(result);
    }

    // The variant takes ownership of contents
    auto value = util::adopt_variant(g_variant_new_from_data(
        G_VARIANT_TYPE(codec::RECORD_TYPE), contents, length, FALSE, g_free, contents));
    auto record = codec::job_from_variant(value.get());
    if (!record) {
        return std::unexpected(
            store_error(std::format("{}: {}", path.string(), record.error().message)));
    }
    return record;
}

auto FileJobStore::write_record(const JobRecord& record) const
    -> std::expected<void, util::Error> {
    auto value = util::adopt_variant(codec::job_to_variant(record, true));
    const auto path = record_path(record.id);
    GError* error = nullptr;
    if (!g_file_set_contents_full(
            path.c_str(), static_cast<const gchar*>(g_variant_get_data(value.get())),
            static_cast<gssize>(g_variant_get_size(value.get())),
            static_cast<GFileSetContentsFlags>(G_FILE_SET_CONTENTS_CONSISTENT |
                                               G_FILE_SET_CONTENTS_DURABLE),
            0600, &error)) {
        auto result = store_error(std::format("write {}: {}", path.string(), error->message));
        g_error_free(error);
        return std::unexpected(result);
    }
    return {};
}

auto FileJobStore::read_last_checkpoint(const std::string& id) const -> std::optional<Checkpoint> {
    std::ifstream input(log_path(id), std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const std::string data = buffer.str();

    // A record is complete only once its newline is on disk; a torn tail is ignored
    std::optional<Checkpoint> last;
    size_t start = 0;
    for (size_t newline = data.find('\n'); newline != std::string::npos;
         newline = data.find('\n', start)) {
        if (auto checkpoint = parse_log_line(std::string_view(data).substr(start, newline - start))) {
            if (!last || !checkpoint_before(*checkpoint, *last)) {
                last = checkpoint;
            }
        } else {
            LOG_WARNING("JobStore", std::format("Ignoring malformed checkpoint record for {}", id));
        }
        start = newline + 1;
    }
    return last;
}

auto FileJobStore::open_log(Entry& entry) const -> std::expected<void, util::Error> {
    if (entry.log_fd) {
        return {};
    }
    const auto path = log_path(entry.record.id);
    entry.log_fd.reset(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600));
    if (!entry.log_fd) {
        return std::unexpected(
            store_error(std::format("open {}: {}", path.string(), std::strerror(errno)), errno));
    }
    return {};
}

auto FileJobStore::acquire(const std::string& id) -> std::expected<EntryPtr, util::Error> {
    if (!valid_id(id)) {
        return std::unexpected(
            util::Error{util::ErrorKind::InvalidArgument, std::format("invalid job id '{}'", id)});
    }

    std::lock_guard lock(entries_mutex_);
    if (auto it = entries_.find(id); it != entries_.end()) {
        return it->second;
    }

    auto record = read_record(id);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (auto logged = read_last_checkpoint(id);
        logged && checkpoint_before(record->checkpoint, *logged)) {
        record->checkpoint = *logged;
    }

    auto entry = std::make_shared<Entry>();
    entry->record = std::move(*record);
    entries_.emplace(id, entry);
    return entry;
}

auto FileJobStore::compact(Entry& entry) -> std::expected<void, util::Error> {
    entry.record.updated_at = g_get_real_time();
    if (auto written = write_record(entry.record); !written) {
        return written;
    }
    // The record now holds the newest checkpoint, so the log can start over
    if (entry.log_fd) {
        if (::ftruncate(entry.log_fd.get(), 0) != 0 || ::fdatasync(entry.log_fd.get()) != 0) {
            return std::unexpected(store_error(
                std::format("truncate {}: {}", log_path(entry.record.id).string(),
                            std::strerror(errno)),
                errno));
        }
    }
    entry.log_records = 0;
    return {};
}

template <typename Fn>
auto FileJobStore::update(const std::string& id, Fn&& mutate) -> std::expected<void, util::Error> {
    auto entry = acquire(id);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    std::lock_guard lock((*entry)->mutex);
    const JobRecord previous = (*entry)->record;
    mutate((*entry)->record);
    if (auto result = compact(**entry); !result) {
        // Keep memory consistent with what is durable
        (*entry)->record = previous;
        return result;
    }
    return {};
}

auto FileJobStore::create(const JobRecord& record) -> std::expected<void, util::Error> {
    if (!valid_id(record.id)) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("invalid job id '{}'", record.id)});
    }

    std::lock_guard lock(entries_mutex_);
    if (entries_.contains(record.id) || std::filesystem::exists(record_path(record.id))) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidState,
                                           std::format("job {} already exists", record.id)});
    }

    auto entry = std::make_shared<Entry>();
    entry->record = record;
    if (entry->record.updated_at == 0) {
        entry->record.updated_at = entry->record.created_at;
    }
    if (auto written = write_record(entry->record); !written) {
        return written;
    }
    if (auto synced = sync_directory(directory_); !synced) {
        return synced;
    }
    entries_.emplace(record.id, std::move(entry));
    LOG_DEBUG("JobStore", std::format("Created job {}", record.id));
    return {};
}

auto FileJobStore::load(const std::string& id) -> std::expected<JobRecord, util::Error> {
    auto entry = acquire(id);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    std::lock_guard lock((*entry)->mutex);
    return (*entry)->record;
}

auto FileJobStore::save_checkpoint(const std::string& id, const Checkpoint& checkpoint)
    -> std::expected<void, util::Error> {
    auto acquired = acquire(id);
    if (!acquired) {
        return std::unexpected(acquired.error());
    }
    auto& entry = **acquired;
    std::lock_guard lock(entry.mutex);

    if (checkpoint_before(checkpoint, entry.record.checkpoint)) {
        return std::unexpected(util::Error{
            util::ErrorKind::InvalidState,
            std::format("checkpoint regression for {}: ({}, {}) precedes ({}, {})", id,
                        checkpoint.pass_index, checkpoint.byte_offset,
                        entry.record.checkpoint.pass_index, entry.record.checkpoint.byte_offset)});
    }

    if (auto opened = open_log(entry); !opened) {
        return opened;
    }
    const auto line = std::format("{} {} {}\n", checkpoint.pass_index, checkpoint.byte_offset,
                                  checkpoint.chunk_size);
    if (auto written = util::write_all(entry.log_fd.get(), line.data(), line.size()); !written) {
        return std::unexpected(store_error(
            std::format("append {}: {}", log_path(id).string(), written.error().message),
            written.error().code));
    }
    if (::fdatasync(entry.log_fd.get()) != 0) {
        return std::unexpected(store_error(
            std::format("fdatasync {}: {}", log_path(id).string(), std::strerror(errno)), errno));
    }

    entry.record.checkpoint = checkpoint;
    if (++entry.log_records >= compact_every_) {
        return compact(entry);
    }
    return {};
}

auto FileJobStore::set_state(const std::string& id, JobState state,
                             std::optional<util::Error> error)
    -> std::expected<void, util::Error> {
    auto result = update(id, [&](JobRecord& record) {
        record.state = state;
        record.error = std::move(error);
    });
    if (result) {
        LOG_DEBUG("JobStore", std::format("Job {} -> {}", id, job_state_to_string(state)));
    }
    return result;
}

auto FileJobStore::attach_before_digests(const std::string& id, const DigestSet& digests)
    -> std::expected<void, util::Error> {
    return update(id, [&](JobRecord& record) { record.before_digests = digests; });
}

auto FileJobStore::attach_verification(const std::string& id, const VerificationResult& result)
    -> std::expected<void, util::Error> {
    return update(id, [&](JobRecord& record) { record.verification_result = result; });
}

auto FileJobStore::record_warning(const std::string& id, const std::string& warning)
    -> std::expected<void, util::Error> {
    return update(id, [&](JobRecord& record) { record.warnings.push_back(warning); });
}

auto FileJobStore::add_active_time(const std::string& id, double seconds)
    -> std::expected<void, util::Error> {
    return update(id, [&](JobRecord& record) { record.active_seconds += seconds; });
}

auto FileJobStore::set_interrupted(const std::string& id, bool interrupted)
    -> std::expected<void, util::Error> {
    return update(id, [interrupted](JobRecord& record) { record.interrupted = interrupted; });
}

auto FileJobStore::list_jobs(const JobFilter& filter)
    -> std::expected<std::vector<JobRecord>, util::Error> {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(
            store_error(std::format("list {}: {}", directory_.string(), ec.message()), ec.value()));
    }

    std::vector<JobRecord> records;
    for (const auto& dirent : it) {
        const auto& path = dirent.path();
        if (path.extension() != RECORD_SUFFIX) {
            continue;
        }
        const auto id = path.stem().string();
        auto record = load(id);
        if (!record) {
            LOG_WARNING("JobStore", std::format("Skipping unreadable job record {}: {}",
                                                path.string(), record.error().message));
            continue;
        }
        if (filter.state && record->state != *filter.state) {
            continue;
        }
        records.push_back(std::move(*record));
    }

    std::ranges::sort(records, [](const JobRecord& lhs, const JobRecord& rhs) {
        return std::tie(lhs.created_at, lhs.id) < std::tie(rhs.created_at, rhs.id);
    });
    return records;
}

auto FileJobStore::delete_job(const std::string& id) -> std::expected<void, util::Error> {
    auto acquired = acquire(id);
    if (!acquired) {
        return std::unexpected(acquired.error());
    }
    {
        std::lock_guard lock((*acquired)->mutex);
        (*acquired)->log_fd.reset();
        if (g_unlink(record_path(id).c_str()) != 0 && errno != ENOENT) {
            return std::unexpected(store_error(
                std::format("unlink {}: {}", record_path(id).string(), std::strerror(errno)),
                errno));
        }
        if (g_unlink(log_path(id).c_str()) != 0 && errno != ENOENT) {
            LOG_WARNING("JobStore", std::format("Could not remove checkpoint log {}: {}",
                                                log_path(id).string(), std::strerror(errno)));
        }
    }
    {
        std::lock_guard lock(entries_mutex_);
        entries_.erase(id);
    }
    LOG_INFO("JobStore", std::format("Deleted job {}", id));
    return sync_directory(directory_);
}
