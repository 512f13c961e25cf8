#pragma once

#include "domain/events/RecyclingEvent.hpp"
#include "domain/value_objects/RecyclingRecord.hpp"

namespace rcy::domain {

struct RecyclingCompleted : RecyclingEvent {
    RecyclingRecord record;
};

} // namespace rcy::domain
