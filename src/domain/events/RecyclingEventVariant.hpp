#pragma once

#include "domain/events/AssetClassRateUpdated.hpp"
#include "domain/events/AssetClassRegistered.hpp"
#include "domain/events/AssetClassRemoved.hpp"
#include "domain/events/AssetClassStatusChanged.hpp"
#include "domain/events/EmergencyRescuePerformed.hpp"
#include "domain/events/PauseStateChanged.hpp"
#include "domain/events/RecyclingCompleted.hpp"
#include "domain/events/RecyclingFailed.hpp"

#include <variant>

namespace rcy::domain {

using RecyclingEventVariant = std::variant<
    AssetClassRegistered,
    AssetClassRateUpdated,
    AssetClassStatusChanged,
    AssetClassRemoved,
    RecyclingCompleted,
    RecyclingFailed,
    EmergencyRescuePerformed,
    PauseStateChanged>;

} // namespace rcy::domain
