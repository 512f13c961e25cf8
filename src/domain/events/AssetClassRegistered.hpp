#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/Points.hpp"

namespace rcy::domain {

struct AssetClassRegistered : RecyclingEvent {
    AssetClassId class_id;
    Points points_per_unit;
};

} // namespace rcy::domain
