#pragma once

#include "domain/events/RecyclingEventVariant.hpp"

#include <nlohmann/json.hpp>

namespace rcy::infrastructure {

class RecyclingEventSerializer {
public:
    // One flat JSON object per event, discriminated by "event_type".
    nlohmann::json to_json(const rcy::domain::RecyclingEventVariant& event) const;

    nlohmann::json to_json(const rcy::domain::RecyclingRecord& record) const;
};

} // namespace rcy::infrastructure
