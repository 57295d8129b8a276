/**
 * @file Verifier.cpp
 * @brief Before/after digest capture over sampled windows
 */

#include "verification/Verifier.hpp"

#include "util/GLibPtr.hpp"
#include "util/Logger.hpp"
#include "verification/DigestAlgorithm.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <random>
#include <set>

namespace verification {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

/**
 * @brief First 8 bytes of a digest, big-endian
 */
auto digest_prefix(GChecksum* checksum, std::vector<uint8_t>& scratch) -> uint64_t {
    gsize length = scratch.size();
    g_checksum_get_digest(checksum, scratch.data(), &length);
    uint64_t prefix = 0;
    for (gsize i = 0; i < std::min<gsize>(length, 8); ++i) {
        prefix = (prefix << 8) | scratch[i];
    }
    return prefix;
}

}  // namespace

auto window_count(uint64_t target_size, uint64_t window_size) -> uint64_t {
    if (window_size == 0) {
        return 0;
    }
    return (target_size + window_size - 1) / window_size;
}

auto sampling_seed(const std::string& job_id, VerificationLevel level) -> uint64_t {
    uint64_t hash = FNV_OFFSET_BASIS;
    auto mix = [&hash](std::string_view text) {
        for (unsigned char c : text) {
            hash ^= c;
            hash *= FNV_PRIME;
        }
    };
    mix(job_id);
    mix(":");
    mix(verification_level_to_string(level));
    return hash;
}

Verifier::Verifier(const config::VerificationSettings& settings) : settings_(settings) {}

auto Verifier::plan_windows(const std::string& job_id, VerificationLevel level,
                            uint64_t target_size, uint64_t window_size) const
    -> std::vector<uint64_t> {
    const uint64_t total = window_count(target_size, window_size);
    if (total == 0 || level == VerificationLevel::None) {
        return {};
    }

    std::vector<uint64_t> windows;
    if (level == VerificationLevel::Full) {
        windows.resize(total);
        for (uint64_t i = 0; i < total; ++i) {
            windows[i] = i;
        }
        return windows;
    }

    const double fraction =
        level == VerificationLevel::Sample ? settings_.sample_fraction : settings_.standard_fraction;
    const auto wanted = static_cast<uint64_t>(std::ceil(fraction * static_cast<double>(total)));
    const uint64_t count = std::clamp<uint64_t>(wanted, 1, total);

    // Floyd's algorithm: count distinct indices in [0, total) without a shuffle.
    // Raw engine output only; standard distributions differ between library vendors.
    std::mt19937_64 rng(sampling_seed(job_id, level));
    std::set<uint64_t> chosen;
    for (uint64_t j = total - count; j < total; ++j) {
        const uint64_t t = rng() % (j + 1);
        if (!chosen.insert(t).second) {
            chosen.insert(j);
        }
    }
    windows.assign(chosen.begin(), chosen.end());
    return windows;
}

auto Verifier::capture(ITargetHandle& target, const std::vector<std::string>& algorithms,
                       uint64_t window_size, const std::vector<uint64_t>& windows) const
    -> std::expected<DigestSet, util::Error> {
    struct AlgorithmState {
        std::string name;
        GChecksumType type;
        util::ChecksumPtr combined;
        std::vector<uint64_t> prefixes;
    };

    std::vector<AlgorithmState> states;
    size_t scratch_size = 0;
    for (const auto& name : algorithms) {
        auto type = checksum_type(name);
        if (!type) {
            return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                               std::format("unsupported digest algorithm '{}'", name)});
        }
        scratch_size = std::max(scratch_size, static_cast<size_t>(g_checksum_type_get_length(*type)));
        states.push_back(AlgorithmState{.name = name,
                                        .type = *type,
                                        .combined = util::ChecksumPtr(g_checksum_new(*type)),
                                        .prefixes = {}});
    }

    DigestSet result;
    result.window_size = window_size;
    result.windows = windows;

    std::vector<uint8_t> buffer(static_cast<size_t>(window_size));
    std::vector<uint8_t> scratch(scratch_size);
    const uint64_t size = target.size();
    for (const uint64_t window : windows) {
        const uint64_t offset = window * window_size;
        if (offset >= size) {
            return std::unexpected(util::Error{
                util::ErrorKind::TargetChanged,
                std::format("window {} lies beyond the end of the target", window)});
        }
        const auto length = static_cast<size_t>(std::min<uint64_t>(window_size, size - offset));
        std::span<uint8_t> bytes(buffer.data(), length);
        if (auto read = target.read_at(offset, bytes); !read) {
            return std::unexpected(read.error());
        }
        for (auto& state : states) {
            util::ChecksumPtr window_checksum(g_checksum_new(state.type));
            g_checksum_update(window_checksum.get(), bytes.data(), static_cast<gssize>(length));
            g_checksum_update(state.combined.get(), bytes.data(), static_cast<gssize>(length));
            state.prefixes.push_back(digest_prefix(window_checksum.get(), scratch));
        }
    }

    for (auto& state : states) {
        result.window_digests[state.name] = std::move(state.prefixes);
        result.combined[state.name] = g_checksum_get_string(state.combined.get());
    }
    return result;
}

auto Verifier::capture_before(ITargetHandle& target, const std::string& job_id,
                              const VerificationRequest& request, uint64_t window_size) const
    -> std::expected<DigestSet, util::Error> {
    const auto windows = plan_windows(job_id, request.level, target.size(), window_size);
    LOG_DEBUG("Verifier", std::format("Capturing {} of {} windows for job {} ({})",
                                      windows.size(), window_count(target.size(), window_size),
                                      job_id, verification_level_to_string(request.level)));
    return capture(target, request.algorithms, window_size, windows);
}

auto Verifier::capture_after(ITargetHandle& target, const DigestSet& before) const
    -> std::expected<DigestSet, util::Error> {
    std::vector<std::string> algorithms;
    algorithms.reserve(before.window_digests.size());
    for (const auto& [name, prefixes] : before.window_digests) {
        algorithms.push_back(name);
    }
    return capture(target, algorithms, before.window_size, before.windows);
}

auto Verifier::compare(const DigestSet& before, const DigestSet& after, VerificationLevel level)
    -> VerificationResult {
    VerificationResult result;
    result.level = level;
    result.windows_checked = before.windows.size();

    if (before.empty()) {
        result.note = "no windows sampled";
        return result;
    }
    if (before.windows != after.windows || before.window_size != after.window_size) {
        result.note = "before and after digests cover different windows";
        return result;
    }

    bool all_verified = true;
    for (const auto& [name, before_prefixes] : before.window_digests) {
        AlgorithmVerdict verdict;
        if (auto it = before.combined.find(name); it != before.combined.end()) {
            verdict.before = it->second;
        }
        if (auto it = after.combined.find(name); it != after.combined.end()) {
            verdict.after = it->second;
        }

        auto after_it = after.window_digests.find(name);
        if (after_it == after.window_digests.end() ||
            after_it->second.size() != before_prefixes.size()) {
            verdict.unchanged_windows = before_prefixes.size();
        } else {
            for (size_t i = 0; i < before_prefixes.size(); ++i) {
                if (before_prefixes[i] == after_it->second[i]) {
                    ++verdict.unchanged_windows;
                }
            }
        }
        verdict.verified = verdict.unchanged_windows == 0 && !verdict.after.empty() &&
                           verdict.before != verdict.after;
        all_verified = all_verified && verdict.verified;
        result.algorithms.emplace(name, std::move(verdict));
    }

    result.verified = !result.algorithms.empty() && all_verified;
    if (result.algorithms.empty()) {
        result.note = "no algorithm evaluated";
    }
    return result;
}

}  // namespace verification
