/**
 * @file GLibPtr.hpp
 * @brief unique_ptr aliases for GLib-owned objects
 */

#pragma once

#include <glib.h>

#include <memory>

namespace util {

struct VariantDeleter {
    void operator()(GVariant* value) const { g_variant_unref(value); }
};

struct KeyFileDeleter {
    void operator()(GKeyFile* key_file) const { g_key_file_free(key_file); }
};

struct ChecksumDeleter {
    void operator()(GChecksum* checksum) const { g_checksum_free(checksum); }
};

struct GFreeDeleter {
    void operator()(gpointer data) const { g_free(data); }
};

using VariantPtr = std::unique_ptr<GVariant, VariantDeleter>;
using KeyFilePtr = std::unique_ptr<GKeyFile, KeyFileDeleter>;
using ChecksumPtr = std::unique_ptr<GChecksum, ChecksumDeleter>;
using GCharPtr = std::unique_ptr<gchar, GFreeDeleter>;

/**
 * @brief Take ownership of a possibly floating variant
 */
[[nodiscard]] inline auto adopt_variant(GVariant* value) -> VariantPtr {
    return VariantPtr(value ? g_variant_ref_sink(value) : nullptr);
}

}  // namespace util
