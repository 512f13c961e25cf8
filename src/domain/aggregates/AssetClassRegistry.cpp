#include "domain/aggregates/AssetClassRegistry.hpp"

#include "domain/errors/RecyclingError.hpp"

#include <string>

namespace rcy::domain {

AssetClassRegistry::AssetClassRegistry(Points max_points_per_unit)
    : max_points_per_unit_(max_points_per_unit) {
    if (max_points_per_unit_.is_zero()) {
        throw ValidationError("maximum points per unit must be positive");
    }
}

void AssetClassRegistry::validate_rate(Points points_per_unit) const {
    if (points_per_unit.is_zero()) {
        throw ValidationError("points per unit must be positive");
    }
    if (points_per_unit > max_points_per_unit_) {
        throw ValidationError(
            "points per unit " + std::to_string(points_per_unit.amount()) +
            " exceeds maximum " + std::to_string(max_points_per_unit_.amount()));
    }
}

AssetClassConfig AssetClassRegistry::registered(const AssetClassId& class_id,
                                                Points points_per_unit,
                                                Timestamp now) const {
    validate_rate(points_per_unit);

    auto it = classes_.find(class_id);
    if (it == classes_.end()) {
        return AssetClassConfig{class_id, points_per_unit, true, 0, now};
    }
    if (it->second.active) {
        throw AlreadyRegisteredError("asset class " + class_id.value() + " is already active");
    }

    // Reactivation keeps the original registration time and history counter
    auto next = it->second;
    next.points_per_unit = points_per_unit;
    next.active = true;
    return next;
}

AssetClassConfig AssetClassRegistry::with_rate(const AssetClassId& class_id,
                                               Points points_per_unit) const {
    auto next = get(class_id);
    validate_rate(points_per_unit);
    next.points_per_unit = points_per_unit;
    return next;
}

AssetClassConfig AssetClassRegistry::with_status(const AssetClassId& class_id, bool active) const {
    auto next = get(class_id);
    next.active = active;
    return next;
}

AssetClassConfig AssetClassRegistry::with_recycled(const AssetClassId& class_id) const {
    auto next = get(class_id);
    ++next.total_recycled;
    return next;
}

void AssetClassRegistry::store(const AssetClassConfig& config) {
    auto it = classes_.find(config.class_id);
    if (it == classes_.end()) {
        classes_.emplace(config.class_id, config);
        if (config.active) ++active_count_;
        return;
    }

    if (it->second.registered_at != config.registered_at) {
        throw std::logic_error(
            "registration time of asset class " + config.class_id.value() + " cannot change");
    }
    if (config.total_recycled < it->second.total_recycled) {
        throw std::logic_error(
            "recycled count of asset class " + config.class_id.value() + " cannot decrease");
    }

    if (it->second.active != config.active) {
        if (config.active) {
            ++active_count_;
        } else {
            --active_count_;
        }
    }
    it->second = config;
}

std::optional<AssetClassConfig> AssetClassRegistry::find(const AssetClassId& class_id) const {
    auto it = classes_.find(class_id);
    if (it != classes_.end()) return it->second;
    return std::nullopt;
}

const AssetClassConfig& AssetClassRegistry::get(const AssetClassId& class_id) const {
    auto it = classes_.find(class_id);
    if (it == classes_.end()) {
        throw NotRegisteredError("asset class " + class_id.value() + " was never registered");
    }
    return it->second;
}

bool AssetClassRegistry::is_registered(const AssetClassId& class_id) const {
    return classes_.count(class_id) > 0;
}

bool AssetClassRegistry::is_accepted(const AssetClassId& class_id) const {
    auto it = classes_.find(class_id);
    return it != classes_.end() && it->second.active;
}

std::vector<AssetClassConfig> AssetClassRegistry::configs() const {
    std::vector<AssetClassConfig> result;
    result.reserve(classes_.size());
    for (const auto& [id, config] : classes_) {
        result.push_back(config);
    }
    return result;
}

} // namespace rcy::domain
