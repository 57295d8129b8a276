/**
 * @file FileJobStore.hpp
 * @brief Directory-backed job store
 *
 * Layout per job:
 * - <id>.job   GVariant record, replaced atomically and durably
 * - <id>.ckpt  append-only "pass offset chunk\n" log, fdatasync'd per record
 *
 * The log is folded into the record (then truncated) on every other
 * mutation and after compact_every checkpoint records.
 */

#pragma once

#include "store/IJobStore.hpp"
#include "util/FileDescriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>

class FileJobStore : public IJobStore {
public:
    FileJobStore(std::filesystem::path directory, uint32_t compact_every);
    ~FileJobStore() override = default;

    FileJobStore(const FileJobStore&) = delete;
    FileJobStore& operator=(const FileJobStore&) = delete;

    /**
     * @brief Create the store directory (mode 0700) if needed
     */
    [[nodiscard]] auto initialize() -> std::expected<void, util::Error>;

    auto create(const JobRecord& record) -> std::expected<void, util::Error> override;
    auto load(const std::string& id) -> std::expected<JobRecord, util::Error> override;
    auto save_checkpoint(const std::string& id, const Checkpoint& checkpoint)
        -> std::expected<void, util::Error> override;
    auto set_state(const std::string& id, JobState state, std::optional<util::Error> error)
        -> std::expected<void, util::Error> override;
    auto attach_before_digests(const std::string& id, const DigestSet& digests)
        -> std::expected<void, util::Error> override;
    auto attach_verification(const std::string& id, const VerificationResult& result)
        -> std::expected<void, util::Error> override;
    auto record_warning(const std::string& id, const std::string& warning)
        -> std::expected<void, util::Error> override;
    auto add_active_time(const std::string& id, double seconds)
        -> std::expected<void, util::Error> override;
    auto set_interrupted(const std::string& id, bool interrupted)
        -> std::expected<void, util::Error> override;
    auto list_jobs(const JobFilter& filter)
        -> std::expected<std::vector<JobRecord>, util::Error> override;
    auto delete_job(const std::string& id) -> std::expected<void, util::Error> override;

    [[nodiscard]] auto record_path(const std::string& id) const -> std::filesystem::path;
    [[nodiscard]] auto log_path(const std::string& id) const -> std::filesystem::path;

private:
    struct Entry {
        std::mutex mutex;
        JobRecord record;
        util::FileDescriptor log_fd;
        uint32_t log_records = 0;
    };

    using EntryPtr = std::shared_ptr<Entry>;

    [[nodiscard]] auto acquire(const std::string& id) -> std::expected<EntryPtr, util::Error>;

    /**
     * @brief Apply @p mutate to the record under the entry lock, then compact
     */
    template <typename Fn>
    auto update(const std::string& id, Fn&& mutate) -> std::expected<void, util::Error>;

    [[nodiscard]] auto read_record(const std::string& id) const
        -> std::expected<JobRecord, util::Error>;
    [[nodiscard]] auto write_record(const JobRecord& record) const
        -> std::expected<void, util::Error>;
    [[nodiscard]] auto read_last_checkpoint(const std::string& id) const
        -> std::optional<Checkpoint>;
    [[nodiscard]] auto open_log(Entry& entry) const -> std::expected<void, util::Error>;
    [[nodiscard]] auto compact(Entry& entry) -> std::expected<void, util::Error>;

    static auto valid_id(const std::string& id) -> bool;

    std::filesystem::path directory_;
    uint32_t compact_every_;
    std::mutex entries_mutex_;
    std::map<std::string, EntryPtr> entries_;
};
