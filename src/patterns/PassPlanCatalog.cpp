/**
 * @file PassPlanCatalog.cpp
 * @brief Named pass plans built from pattern descriptors
 */

#include "patterns/PassPlanCatalog.hpp"

#include <format>
#include <string_view>

PassPlanCatalog::PassPlanCatalog(std::shared_ptr<IPatternSource> patterns)
    : patterns_(std::move(patterns)) {
    initialize_plans();
}

void PassPlanCatalog::add_plan(const std::string& name, std::string description,
                               const std::string& standard,
                               const std::vector<std::string>& descriptors) {
    PlanDefinition plan{.description = std::move(description), .steps = {}};
    const auto total = descriptors.size();
    for (size_t i = 0; i < total; ++i) {
        plan.steps.push_back(
            Step{.method = std::format("{} pass {}/{}", standard, i + 1, total),
                 .descriptor = descriptors[i]});
    }
    plans_[name] = std::move(plan);
}

void PassPlanCatalog::initialize_plans() {
    add_plan("zero", "Single pass of zeros", "Zero fill", {"zero"});
    add_plan("ones", "Single pass of ones (0xFF)", "Ones fill", {"ones"});
    add_plan("random", "Single pass of random data", "Random fill", {"random"});
    add_plan("nist-clear", "NIST SP 800-88 Clear, one pass of zeros", "NIST SP 800-88 Clear",
             {"zero"});
    add_plan("gost", "GOST R 50739-95, zeros then random data", "GOST R 50739-95",
             {"zero", "random"});
    add_plan("dod-3pass", "DoD 5220.22-M, zeros, ones, random data", "DoD 5220.22-M",
             {"zero", "ones", "random"});
    add_plan("dod-7pass", "DoD 5220.22-M ECE 7-pass variant", "DoD 5220.22-M ECE",
             {"zero", "ones", "random", "random", "zero", "ones", "random"});
    add_plan("hmg-is5-enhanced", "HMG IS5 Enhanced, zeros then two random passes",
             "HMG IS5 Enhanced", {"zero", "random", "random"});
    add_plan("schneier", "Bruce Schneier 7-pass, ones, zeros, five random passes", "Schneier",
             {"ones", "zero", "random", "random", "random", "random", "random"});
    add_plan("vsitr", "German VSITR 7-pass, alternating zeros and ones then random",
             "VSITR", {"zero", "ones", "zero", "ones", "zero", "ones", "random"});

    // 4 random, the 27 MFM/RLL patterns of the 1996 paper, 4 random
    add_plan("gutmann", "Peter Gutmann 35-pass method", "Gutmann",
             {"random",     "random",     "random",     "random",     "byte:55",
              "byte:AA",    "hex:924924", "hex:492492", "hex:249249", "byte:00",
              "byte:11",    "byte:22",    "byte:33",    "byte:44",    "byte:55",
              "byte:66",    "byte:77",    "byte:88",    "byte:99",    "byte:AA",
              "byte:BB",    "byte:CC",    "byte:DD",    "byte:EE",    "byte:FF",
              "hex:924924", "hex:492492", "hex:249249", "hex:6DB6DB", "hex:B6DB6D",
              "hex:DB6DB6", "random",     "random",     "random",     "random"});
}

auto PassPlanCatalog::build_plan(const std::string& name, uint64_t target_size) const
    -> std::expected<std::vector<PassSpec>, util::Error> {
    std::vector<Step> steps;

    if (name.starts_with(CUSTOM_PREFIX)) {
        std::string_view rest(name);
        rest.remove_prefix(CUSTOM_PREFIX.size());
        size_t index = 0;
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            auto descriptor = rest.substr(0, comma);
            if (descriptor.empty()) {
                return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                                   std::format("empty descriptor in '{}'", name)});
            }
            ++index;
            steps.push_back(Step{.method = std::format("Custom pass {}", index),
                                 .descriptor = std::string(descriptor)});
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        }
        if (steps.empty()) {
            return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                               "custom plan needs at least one descriptor"});
        }
    } else {
        auto it = plans_.find(name);
        if (it == plans_.end()) {
            return std::unexpected(util::Error{util::ErrorKind::InvalidArgument,
                                               std::format("unknown plan '{}'", name)});
        }
        steps = it->second.steps;
    }

    std::vector<PassSpec> passes;
    passes.reserve(steps.size());
    for (size_t i = 0; i < steps.size(); ++i) {
        if (auto valid = patterns_->validate(steps[i].descriptor); !valid) {
            return std::unexpected(valid.error());
        }
        passes.push_back(PassSpec{.method = std::move(steps[i].method),
                                  .descriptor = std::move(steps[i].descriptor),
                                  .index = static_cast<uint32_t>(i),
                                  .expected_bytes = target_size});
    }
    return passes;
}

auto PassPlanCatalog::list_plans() const -> std::vector<PlanInfo> {
    std::vector<PlanInfo> result;
    result.reserve(plans_.size());
    for (const auto& [name, plan] : plans_) {
        result.push_back(PlanInfo{.name = name,
                                  .description = plan.description,
                                  .pass_count = static_cast<uint32_t>(plan.steps.size())});
    }
    return result;
}

auto PassPlanCatalog::contains(const std::string& name) const -> bool {
    return plans_.contains(name);
}
