#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/ActorId.hpp"
#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/UnitId.hpp"

namespace rcy::domain {

struct EmergencyRescuePerformed : RecyclingEvent {
    AssetClassId class_id;
    UnitId unit_id;
    ActorId recipient;
};

} // namespace rcy::domain
