/**
 * @file ConfigLoader.cpp
 * @brief INI-style configuration loading through GKeyFile
 */

#include "config/ConfigLoader.hpp"

#include "util/GLibPtr.hpp"
#include "verification/DigestAlgorithm.hpp"

#include <glib.h>

#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <utility>

namespace config {

namespace {

auto invalid(std::string_view group, std::string_view key, std::string_view reason)
    -> util::Error {
    return util::Error{util::ErrorKind::InvalidArgument,
                       std::format("config [{}] {}: {}", group, key, reason)};
}

/**
 * @brief Typed accessors over one loaded key file
 *
 * Each reader leaves the output untouched when the key is absent.
 */
class KeyFileReader {
public:
    explicit KeyFileReader(GKeyFile* key_file) : key_file_(key_file) {}

    auto read_size(const char* group, const char* key, uint64_t& out)
        -> std::expected<void, util::Error> {
        auto text = read_raw(group, key);
        if (!text) {
            return std::unexpected(text.error());
        }
        if (!text->has_value()) {
            return {};
        }
        auto value = parse_size(**text);
        if (!value) {
            return std::unexpected(invalid(group, key, value.error().message));
        }
        out = *value;
        return {};
    }

    auto read_uint(const char* group, const char* key, uint32_t& out)
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        const gint value = g_key_file_get_integer(key_file_, group, key, &error);
        if (error) {
            auto result = invalid(group, key, error->message);
            g_error_free(error);
            return std::unexpected(result);
        }
        if (value < 0) {
            return std::unexpected(invalid(group, key, "must not be negative"));
        }
        out = static_cast<uint32_t>(value);
        return {};
    }

    auto read_bool(const char* group, const char* key, bool& out)
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        const gboolean value = g_key_file_get_boolean(key_file_, group, key, &error);
        if (error) {
            auto result = invalid(group, key, error->message);
            g_error_free(error);
            return std::unexpected(result);
        }
        out = value != FALSE;
        return {};
    }

    auto read_double(const char* group, const char* key, double& out)
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        const gdouble value = g_key_file_get_double(key_file_, group, key, &error);
        if (error) {
            auto result = invalid(group, key, error->message);
            g_error_free(error);
            return std::unexpected(result);
        }
        out = value;
        return {};
    }

    auto read_string(const char* group, const char* key, std::string& out)
        -> std::expected<void, util::Error> {
        auto text = read_raw(group, key);
        if (!text) {
            return std::unexpected(text.error());
        }
        if (text->has_value()) {
            out = **text;
        }
        return {};
    }

    auto read_list(const char* group, const char* key, std::vector<std::string>& out)
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        gsize length = 0;
        gchar** values = g_key_file_get_string_list(key_file_, group, key, &length, &error);
        if (error) {
            auto result = invalid(group, key, error->message);
            g_error_free(error);
            return std::unexpected(result);
        }
        out.clear();
        for (gsize i = 0; i < length; ++i) {
            std::string value = g_strstrip(values[i]);
            if (!value.empty()) {
                out.push_back(std::move(value));
            }
        }
        g_strfreev(values);
        return {};
    }

private:
    // nullopt when the key is absent
    using RawResult = std::expected<std::optional<std::string>, util::Error>;

    auto has(const char* group, const char* key) const -> bool {
        return g_key_file_has_key(key_file_, group, key, nullptr) != FALSE;
    }

    auto read_raw(const char* group, const char* key) -> RawResult {
        if (!has(group, key)) {
            return std::optional<std::string>{};
        }
        GError* error = nullptr;
        util::GCharPtr value(g_key_file_get_string(key_file_, group, key, &error));
        if (error) {
            auto result = invalid(group, key, error->message);
            g_error_free(error);
            return std::unexpected(result);
        }
        std::string text = value ? g_strstrip(value.get()) : "";
        return std::optional<std::string>(std::move(text));
    }

    GKeyFile* key_file_;
};

auto read_all(GKeyFile* key_file) -> std::expected<EngineConfig, util::Error> {
    EngineConfig config;
    KeyFileReader reader(key_file);

    std::expected<void, util::Error> status;
    auto step = [&status](std::expected<void, util::Error> result) {
        if (status && !result) {
            status = std::move(result);
        }
    };

    step(reader.read_size("engine", "min_chunk_size", config.engine.min_chunk_size));
    step(reader.read_size("engine", "max_chunk_size", config.engine.max_chunk_size));
    step(reader.read_uint("engine", "sync_interval_chunks", config.engine.sync_interval_chunks));
    step(reader.read_uint("engine", "max_transient_retries", config.engine.max_transient_retries));
    step(reader.read_uint("engine", "retry_backoff_ms", config.engine.retry_backoff_ms));

    step(reader.read_uint("scheduler", "worker_ceiling", config.scheduler.worker_ceiling));
    step(reader.read_bool("scheduler", "auto_resume_interrupted",
                          config.scheduler.auto_resume_interrupted));
    step(reader.read_bool("scheduler", "remove_files_after_wipe",
                          config.scheduler.remove_files_after_wipe));

    step(reader.read_uint("monitor", "sample_interval_ms", config.monitor.sample_interval_ms));
    step(reader.read_size("monitor", "base_chunk_size", config.monitor.base_chunk_size));
    step(reader.read_double("monitor", "smoothing", config.monitor.smoothing));
    step(reader.read_uint("monitor", "hysteresis_samples", config.monitor.hysteresis_samples));

    std::string level_name;
    step(reader.read_string("verification", "level", level_name));
    if (status && !level_name.empty()) {
        auto level = verification_level_from_string(level_name);
        if (!level) {
            step(std::unexpected(invalid("verification", "level",
                                         std::format("unknown level '{}'", level_name))));
        } else {
            config.verification.level = *level;
        }
    }
    step(reader.read_list("verification", "algorithms", config.verification.algorithms));
    step(reader.read_double("verification", "sample_fraction",
                            config.verification.sample_fraction));
    step(reader.read_double("verification", "standard_fraction",
                            config.verification.standard_fraction));

    step(reader.read_string("store", "directory", config.store.directory));
    step(reader.read_uint("store", "compact_every", config.store.compact_every));

    step(reader.read_size("free_space", "reserve_bytes", config.free_space.reserve_bytes));

    step(reader.read_string("logging", "directory", config.logging.directory));
    std::string log_level;
    step(reader.read_string("logging", "level", log_level));
    if (status && !log_level.empty()) {
        auto level = util::Logger::parse_level(log_level);
        if (!level) {
            step(std::unexpected(
                invalid("logging", "level", std::format("unknown level '{}'", log_level))));
        } else {
            config.logging.level = *level;
        }
    }
    step(reader.read_bool("logging", "console", config.logging.console));

    if (!status) {
        return std::unexpected(status.error());
    }
    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

}  // namespace

auto parse_size(std::string_view text) -> std::expected<uint64_t, util::Error> {
    uint64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("invalid size '{}'", text)});
    }

    std::string suffix;
    for (const auto* p = ptr; p != end; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p))) {
            suffix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
        }
    }

    uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        multiplier = KiB;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        multiplier = MiB;
    } else if (suffix == "G" || suffix == "GB" || suffix == "GIB") {
        multiplier = 1024 * MiB;
    } else {
        return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                           std::format("invalid size suffix in '{}'", text)});
    }

    if (value > UINT64_MAX / multiplier) {
        return std::unexpected(
            util::Error{util::ErrorKind::InvalidArgument, std::format("size '{}' overflows", text)});
    }
    return value * multiplier;
}

auto validate(const EngineConfig& config) -> std::expected<void, util::Error> {
    const auto& engine = config.engine;
    if (engine.min_chunk_size < CHUNK_ALIGNMENT || engine.min_chunk_size % CHUNK_ALIGNMENT != 0) {
        return std::unexpected(
            invalid("engine", "min_chunk_size",
                    std::format("must be a non-zero multiple of {}", CHUNK_ALIGNMENT)));
    }
    if (engine.max_chunk_size < engine.min_chunk_size) {
        return std::unexpected(invalid("engine", "max_chunk_size", "smaller than min_chunk_size"));
    }
    if (engine.sync_interval_chunks == 0) {
        return std::unexpected(invalid("engine", "sync_interval_chunks", "must be at least 1"));
    }
    if (config.scheduler.worker_ceiling == 0) {
        return std::unexpected(invalid("scheduler", "worker_ceiling", "must be at least 1"));
    }
    if (config.monitor.smoothing <= 0.0 || config.monitor.smoothing > 1.0) {
        return std::unexpected(invalid("monitor", "smoothing", "must be in (0, 1]"));
    }
    if (config.monitor.base_chunk_size == 0) {
        return std::unexpected(invalid("monitor", "base_chunk_size", "must not be zero"));
    }
    if (config.monitor.sample_interval_ms == 0) {
        return std::unexpected(invalid("monitor", "sample_interval_ms", "must not be zero"));
    }
    const std::pair<std::string_view, double> fractions[] = {
        {"sample_fraction", config.verification.sample_fraction},
        {"standard_fraction", config.verification.standard_fraction},
    };
    for (const auto& [key, fraction] : fractions) {
        if (fraction <= 0.0 || fraction > 1.0) {
            return std::unexpected(invalid("verification", key, "must be in (0, 1]"));
        }
    }
    for (const auto& name : config.verification.algorithms) {
        if (!verification::is_supported_algorithm(name)) {
            return std::unexpected(invalid("verification", "algorithms",
                                           std::format("unsupported algorithm '{}'", name)));
        }
    }
    if (config.store.directory.empty()) {
        return std::unexpected(invalid("store", "directory", "must not be empty"));
    }
    if (config.store.compact_every == 0) {
        return std::unexpected(invalid("store", "compact_every", "must be at least 1"));
    }
    return {};
}

auto load_config(const std::filesystem::path& path) -> std::expected<EngineConfig, util::Error> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_INFO("Config", std::format("No config at {}, using defaults", path.string()));
        return EngineConfig{};
    }

    util::KeyFilePtr key_file(g_key_file_new());
    GError* error = nullptr;
    if (!g_key_file_load_from_file(key_file.get(), path.c_str(), G_KEY_FILE_NONE, &error)) {
        util::Error result{util::ErrorKind::InvalidArgument,
                           std::format("cannot parse {}: {}", path.string(),
                                       error ? error->message : "unknown error")};
        g_clear_error(&error);
        return std::unexpected(result);
    }

    auto config = read_all(key_file.get());
    if (config) {
        LOG_INFO("Config", std::format("Loaded {}", path.string()));
    }
    return config;
}

auto load_config_from_data(std::string_view data) -> std::expected<EngineConfig, util::Error> {
    util::KeyFilePtr key_file(g_key_file_new());
    GError* error = nullptr;
    if (!g_key_file_load_from_data(key_file.get(), data.data(), data.size(), G_KEY_FILE_NONE,
                                   &error)) {
        util::Error result{util::ErrorKind::InvalidArgument,
                           std::format("cannot parse config: {}",
                                       error ? error->message : "unknown error")};
        g_clear_error(&error);
        return std::unexpected(result);
    }
    return read_all(key_file.get());
}

}  // namespace config
