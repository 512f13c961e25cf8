#include "services/Eligibility.hpp"

#include "domain/errors/RecyclingError.hpp"

using namespace rcy::domain;

namespace rcy::services {

namespace {

ActorId owner_or_not_found(const IAssetClass& collaborator, const AssetClassId& class_id,
                           const UnitId& unit_id) {
    try {
        return collaborator.owner_of(unit_id);
    } catch (const std::exception& e) {
        throw UnitNotFoundError("unit " + unit_id.to_string() + " of " + class_id.value() +
                                " could not be resolved: " + e.what());
    }
}

} // anonymous namespace

ActorId query_owner(const IAssetClass& collaborator, const AssetClassId& class_id,
                    const UnitId& unit_id, ExchangeGate* gate) {
    if (gate) {
        auto external_call = gate->begin_external_call("ownership query");
        return owner_or_not_found(collaborator, class_id, unit_id);
    }
    return owner_or_not_found(collaborator, class_id, unit_id);
}

std::shared_ptr<IAssetClass> require_eligible(const AssetClassRegistry& registry,
                                              const IAssetClassResolver& resolver,
                                              const ActorId& caller,
                                              const AssetClassId& class_id,
                                              const UnitId& unit_id,
                                              ExchangeGate* gate) {
    if (!registry.is_accepted(class_id)) {
        throw NotActiveError("asset class " + class_id.value() + " is not accepted");
    }

    auto collaborator = resolver.resolve(class_id);
    if (!collaborator) {
        throw UnitNotFoundError("asset class " + class_id.value() + " no longer resolves");
    }

    auto owner = query_owner(*collaborator, class_id, unit_id, gate);
    if (owner != caller) {
        throw NotOwnerError("unit " + unit_id.to_string() + " of " + class_id.value() +
                            " is not owned by " + caller.value());
    }
    return collaborator;
}

} // namespace rcy::services
