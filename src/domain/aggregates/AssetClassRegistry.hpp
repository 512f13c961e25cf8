#pragma once

#include "domain/aggregates/AssetClassConfig.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace rcy::domain {

// Authoritative map of accepted asset classes.
//
// Transitions are computed without touching state (registered, with_rate,
// with_status, with_recycled all return the next config and throw on an
// illegal transition); store() then commits the result. Callers can persist
// the next config before committing it.
class AssetClassRegistry {
public:
    explicit AssetClassRegistry(Points max_points_per_unit);

    // Unregistered -> Active, or Inactive -> Active with a new rate.
    AssetClassConfig registered(const AssetClassId& class_id, Points points_per_unit,
                                Timestamp now) const;
    AssetClassConfig with_rate(const AssetClassId& class_id, Points points_per_unit) const;
    AssetClassConfig with_status(const AssetClassId& class_id, bool active) const;
    AssetClassConfig with_recycled(const AssetClassId& class_id) const;

    void store(const AssetClassConfig& config);

    void validate_rate(Points points_per_unit) const;

    // Queries
    std::optional<AssetClassConfig> find(const AssetClassId& class_id) const;
    const AssetClassConfig& get(const AssetClassId& class_id) const;
    bool is_registered(const AssetClassId& class_id) const;
    bool is_accepted(const AssetClassId& class_id) const;
    size_t active_count() const noexcept { return active_count_; }
    size_t registered_count() const noexcept { return classes_.size(); }
    std::vector<AssetClassConfig> configs() const;
    Points max_points_per_unit() const noexcept { return max_points_per_unit_; }

private:
    Points max_points_per_unit_;
    std::map<AssetClassId, AssetClassConfig> classes_;
    size_t active_count_{0};
};

} // namespace rcy::domain
