#pragma once

#include "domain/value_objects/Timestamp.hpp"

namespace rcy::domain {

struct RecyclingEvent {
    Timestamp timestamp;
};

} // namespace rcy::domain
