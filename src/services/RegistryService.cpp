#include "services/RegistryService.hpp"

#include "domain/errors/RecyclingError.hpp"

using namespace rcy::domain;

namespace rcy::services {

namespace {

// A probe that throws counts as a negative answer.
bool probe(const IAssetClass& collaborator, Capability capability) {
    try {
        return collaborator.supports(capability);
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

RegistryService::RegistryService(AssetClassRegistry& registry,
                                 rcy::repositories::ILedgerRepository& repo,
                                 const IAssetClassResolver& resolver,
                                 const IAuthorizer& authorizer,
                                 ExchangeGate& gate,
                                 IRecyclingEventSink& events,
                                 const IClock& clock)
    : registry_(registry)
    , repository_(repo)
    , resolver_(resolver)
    , authorizer_(authorizer)
    , gate_(gate)
    , events_(events)
    , clock_(clock) {}

AssetClassConfig RegistryService::register_class(const ActorId& caller,
                                                 const AssetClassId& class_id,
                                                 Points points_per_unit) {
    gate_.require_no_external_call("register");
    require_authorized(authorizer_, caller, AdminOperation::REGISTER_CLASS);

    auto collaborator = resolver_.resolve(class_id);
    if (!collaborator) {
        throw ValidationError("asset class " + class_id.value() + " does not resolve to a collaborator");
    }
    registry_.validate_rate(points_per_unit);
    bool can_query_owner = false;
    {
        auto external_call = gate_.begin_external_call("register");
        can_query_owner = probe(*collaborator, Capability::OWNERSHIP_QUERY);
    }
    if (!can_query_owner) {
        throw CapabilityMissingError(
            "asset class " + class_id.value() + " does not support " +
            to_string(Capability::OWNERSHIP_QUERY));
    }

    auto now = clock_.now();
    auto config = registry_.registered(class_id, points_per_unit, now);
    commit(config);

    publish_committed(events_, AssetClassRegistered{{now}, class_id, points_per_unit});
    return config;
}

AssetClassConfig RegistryService::update_rate(const ActorId& caller,
                                              const AssetClassId& class_id,
                                              Points points_per_unit) {
    gate_.require_no_external_call("update_rate");
    require_authorized(authorizer_, caller, AdminOperation::UPDATE_RATE);

    auto old_rate = registry_.get(class_id).points_per_unit;
    auto config = registry_.with_rate(class_id, points_per_unit);
    commit(config);

    publish_committed(events_,
                      AssetClassRateUpdated{{clock_.now()}, class_id, old_rate, points_per_unit});
    return config;
}

AssetClassConfig RegistryService::set_active(const ActorId& caller,
                                             const AssetClassId& class_id,
                                             bool active) {
    gate_.require_no_external_call("set_active");
    require_authorized(authorizer_, caller, AdminOperation::SET_ACTIVE);

    auto config = registry_.with_status(class_id, active);
    commit(config);

    publish_committed(events_, AssetClassStatusChanged{{clock_.now()}, class_id, active});
    return config;
}

AssetClassConfig RegistryService::deactivate(const ActorId& caller,
                                             const AssetClassId& class_id) {
    gate_.require_no_external_call("deactivate");
    require_authorized(authorizer_, caller, AdminOperation::DEACTIVATE);

    auto config = registry_.with_status(class_id, false);
    commit(config);

    publish_committed(events_, AssetClassRemoved{{clock_.now()}, class_id});
    return config;
}

void RegistryService::commit(const AssetClassConfig& config) {
    repository_.store_class_config(config);
    registry_.store(config);
}

} // namespace rcy::services
