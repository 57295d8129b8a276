/**
 * @file PassPlanCatalog.hpp
 * @brief Named pass plans built from pattern descriptors
 */

#pragma once

#include "models/JobTypes.hpp"
#include "patterns/IPatternSource.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * @class PassPlanCatalog
 * @brief Maps plan names to ordered pass lists
 *
 * Pass order is exactly the order a standard prescribes and is never
 * rearranged. "custom:<d1>,<d2>,..." builds an ad hoc plan from explicit
 * descriptors, each checked against the pattern source.
 */
class PassPlanCatalog {
public:
    static constexpr std::string_view CUSTOM_PREFIX = "custom:";

    explicit PassPlanCatalog(std::shared_ptr<IPatternSource> patterns);

    /**
     * @brief Expand @p name into passes of @p target_size bytes each
     */
    [[nodiscard]] auto build_plan(const std::string& name, uint64_t target_size) const
        -> std::expected<std::vector<PassSpec>, util::Error>;

    [[nodiscard]] auto list_plans() const -> std::vector<PlanInfo>;

    [[nodiscard]] auto contains(const std::string& name) const -> bool;

private:
    struct Step {
        std::string method;
        std::string descriptor;
    };

    struct PlanDefinition {
        std::string description;
        std::vector<Step> steps;
    };

    void initialize_plans();
    void add_plan(const std::string& name, std::string description,
                  const std::string& standard, const std::vector<std::string>& descriptors);

    std::shared_ptr<IPatternSource> patterns_;
    std::map<std::string, PlanDefinition> plans_;
};
