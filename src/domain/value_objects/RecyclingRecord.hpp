#pragma once

#include "domain/value_objects/ActorId.hpp"
#include "domain/value_objects/AssetClassId.hpp"
#include "domain/value_objects/DisposalMethod.hpp"
#include "domain/value_objects/Points.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/UnitId.hpp"

#include <cstdint>

namespace rcy::domain {

// One completed exchange. Created once, never updated.
struct RecyclingRecord {
    ActorId actor;
    AssetClassId asset_class;
    UnitId unit_id;
    Points points_generated;
    DisposalMethod method;
    Timestamp timestamp;
    uint64_t sequence_number;

    bool operator==(const RecyclingRecord&) const = default;
};

} // namespace rcy::domain
