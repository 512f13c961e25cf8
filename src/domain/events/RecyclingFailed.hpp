#pragma once

#include "domain/errors/RecyclingError.hpp"
#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/ActorId.hpp"
#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/UnitId.hpp"

#include <string>

namespace rcy::domain {

// One failed item of a batch. The batch itself keeps going.
struct RecyclingFailed : RecyclingEvent {
    ActorId actor;
    AssetClassId class_id;
    UnitId unit_id;
    ErrorKind kind;
    std::string reason;
};

} // namespace rcy::domain
