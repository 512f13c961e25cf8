#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/AssetClassId.hpp"

namespace rcy::domain {

// Emitted by deactivate(); configuration and history are kept.
struct AssetClassRemoved : RecyclingEvent {
    AssetClassId class_id;
};

} // namespace rcy::domain
