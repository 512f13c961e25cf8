#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/ActorId.hpp"

namespace rcy::domain {

struct PauseStateChanged : RecyclingEvent {
    ActorId changed_by;
    bool paused;
};

} // namespace rcy::domain
