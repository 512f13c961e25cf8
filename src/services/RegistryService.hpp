#pragma once

#include "domain/aggregates/AssetClassRegistry.hpp"
#include "repositories/ILedgerRepository.hpp"
#include "services/ExchangeGate.hpp"
#include "services/IAssetClassResolver.hpp"
#include "services/IAuthorizer.hpp"
#include "services/IClock.hpp"
#include "services/IRecyclingEventSink.hpp"

namespace rcy::services {

// Administrative surface of the registry. Every call is authorized first,
// persisted before it is committed in memory, and observed afterwards.
class RegistryService {
public:
    RegistryService(rcy::domain::AssetClassRegistry& registry,
                    rcy::repositories::ILedgerRepository& repo,
                    const IAssetClassResolver& resolver,
                    const IAuthorizer& authorizer,
                    ExchangeGate& gate,
                    IRecyclingEventSink& events,
                    const IClock& clock);

    rcy::domain::AssetClassConfig register_class(const rcy::domain::ActorId& caller,
                                                 const rcy::domain::AssetClassId& class_id,
                                                 rcy::domain::Points points_per_unit);

    rcy::domain::AssetClassConfig update_rate(const rcy::domain::ActorId& caller,
                                              const rcy::domain::AssetClassId& class_id,
                                              rcy::domain::Points points_per_unit);

    rcy::domain::AssetClassConfig set_active(const rcy::domain::ActorId& caller,
                                             const rcy::domain::AssetClassId& class_id,
                                             bool active);

    // The only removal path: the class stays registered, inactive.
    rcy::domain::AssetClassConfig deactivate(const rcy::domain::ActorId& caller,
                                             const rcy::domain::AssetClassId& class_id);

private:
    void commit(const rcy::domain::AssetClassConfig& config);

    rcy::domain::AssetClassRegistry& registry_;
    rcy::repositories::ILedgerRepository& repository_;
    const IAssetClassResolver& resolver_;
    const IAuthorizer& authorizer_;
    ExchangeGate& gate_;
    IRecyclingEventSink& events_;
    const IClock& clock_;
};

} // namespace rcy::services
