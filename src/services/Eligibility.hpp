#pragma once

#include "domain/aggregates/AssetClassRegistry.hpp"
#include "services/ExchangeGate.hpp"
#include "services/IAssetClassResolver.hpp"

#include <memory>

namespace rcy::services {

// Current owner of a unit; UnitNotFoundError if the query fails. When a gate
// is given the query runs as a collaborator call, so the collaborator cannot
// mutate the registry while answering.
rcy::domain::ActorId query_owner(const IAssetClass& collaborator,
                                 const rcy::domain::AssetClassId& class_id,
                                 const rcy::domain::UnitId& unit_id,
                                 ExchangeGate* gate = nullptr);

// Checks that the class is registered and active and that the caller owns
// the unit. Returns the collaborator that answered; throws NotActiveError,
// UnitNotFoundError or NotOwnerError otherwise.
std::shared_ptr<IAssetClass> require_eligible(const rcy::domain::AssetClassRegistry& registry,
                                              const IAssetClassResolver& resolver,
                                              const rcy::domain::ActorId& caller,
                                              const rcy::domain::AssetClassId& class_id,
                                              const rcy::domain::UnitId& unit_id,
                                              ExchangeGate* gate = nullptr);

} // namespace rcy::services
