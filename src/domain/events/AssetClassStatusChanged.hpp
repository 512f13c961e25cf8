#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/AssetClassId.hpp"

namespace rcy::domain {

struct AssetClassStatusChanged : RecyclingEvent {
    AssetClassId class_id;
    bool active;
};

} // namespace rcy::domain
