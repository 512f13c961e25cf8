#pragma once

#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/Points.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>

namespace rcy::domain {

// Registration state of one asset class. Absence from the registry is the
// Unregistered state; once present a class only moves between active and
// inactive.
struct AssetClassConfig {
    AssetClassId class_id;
    Points points_per_unit;
    bool active;
    uint64_t total_recycled;
    Timestamp registered_at;

    bool operator==(const AssetClassConfig&) const = default;
};

} // namespace rcy::domain
