#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/Points.hpp"

namespace rcy::domain {

struct AssetClassRateUpdated : RecyclingEvent {
    AssetClassId class_id;
    Points old_points_per_unit;
    Points new_points_per_unit;
};

} // namespace rcy::domain
