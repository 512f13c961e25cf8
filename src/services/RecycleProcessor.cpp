#include "services/RecycleProcessor.hpp"

#include "domain/errors/RecyclingError.hpp"
#include "services/Eligibility.hpp"

#include <stdexcept>
#include <string>

using namespace rcy::domain;

namespace rcy::services {

RecycleProcessor::RecycleProcessor(AssetClassRegistry& registry,
                                   RecyclingLedger& ledger,
                                   rcy::repositories::ILedgerRepository& repo,
                                   const IAssetClassResolver& resolver,
                                   const IAuthorizer& authorizer,
                                   ExchangeGate& gate,
                                   IRecyclingEventSink& events,
                                   const IClock& clock,
                                   ActorId custody)
    : registry_(registry)
    , ledger_(ledger)
    , repository_(repo)
    , resolver_(resolver)
    , authorizer_(authorizer)
    , gate_(gate)
    , events_(events)
    , clock_(clock)
    , custody_(std::move(custody)) {}

RecyclingRecord RecycleProcessor::recycle_by_destruction(const ActorId& caller,
                                                         const AssetClassId& class_id,
                                                         const UnitId& unit_id) {
    return recycle(caller, class_id, unit_id, DisposalMethod::DESTRUCTION);
}

RecyclingRecord RecycleProcessor::recycle_by_transfer(const ActorId& caller,
                                                      const AssetClassId& class_id,
                                                      const UnitId& unit_id) {
    return recycle(caller, class_id, unit_id, DisposalMethod::CUSTODIAL_TRANSFER);
}

RecyclingRecord RecycleProcessor::recycle(const ActorId& caller, const AssetClassId& class_id,
                                          const UnitId& unit_id, DisposalMethod method) {
    gate_.require_not_paused();
    auto scope = gate_.enter("recycle");
    return execute(caller, class_id, unit_id, method);
}

RecyclingRecord RecycleProcessor::recycle_in_scope(const ExchangeGate::Scope& /*scope*/,
                                                   const ActorId& caller,
                                                   const AssetClassId& class_id,
                                                   const UnitId& unit_id,
                                                   DisposalMethod method) {
    gate_.require_not_paused();
    return execute(caller, class_id, unit_id, method);
}

RecyclingRecord RecycleProcessor::execute(const ActorId& caller, const AssetClassId& class_id,
                                          const UnitId& unit_id, DisposalMethod method) {
    if (caller == custody_) {
        throw ValidationError("custodial holding cannot recycle units");
    }

    // Reads: class status, ownership, rate, time
    auto collaborator = require_eligible(registry_, resolver_, caller, class_id, unit_id, &gate_);
    auto points = registry_.get(class_id).points_per_unit;
    if (!ledger_.can_add(points)) {
        throw ValidationError("total points would overflow: " +
                              std::to_string(ledger_.total_points_generated().amount()) + " + " +
                              std::to_string(points.amount()));
    }
    auto now = clock_.now();

    // The one external call
    dispose(*collaborator, caller, class_id, unit_id, method);

    // Writes
    auto record = ledger_.next_record(caller, class_id, unit_id, points, method, now);
    commit(record);

    publish_committed(events_, RecyclingCompleted{{now}, record});
    return record;
}

void RecycleProcessor::dispose(IAssetClass& collaborator, const ActorId& caller,
                               const AssetClassId& class_id, const UnitId& unit_id,
                               DisposalMethod method) {
    const auto unit = "unit " + unit_id.to_string() + " of " + class_id.value();
    auto external_call = gate_.begin_external_call("recycle");

    if (method == DisposalMethod::CUSTODIAL_TRANSFER) {
        try {
            collaborator.transfer(caller, custody_, unit_id);
        } catch (const std::exception& e) {
            throw OperationFailedError("transfer of " + unit + " to custody failed: " + e.what());
        }
        return;
    }

    try {
        collaborator.destroy(unit_id);
    } catch (const std::exception& e) {
        throw OperationFailedError("destruction of " + unit + " failed (" + e.what() +
                                   "); recycle it by custodial transfer instead");
    }

    // The unit must be gone now
    bool still_resolves = true;
    try {
        (void)collaborator.owner_of(unit_id);
    } catch (const std::exception&) {
        still_resolves = false;
    }
    if (still_resolves) {
        throw PostconditionError(unit + " still exists after its destruction was reported");
    }
}

void RecycleProcessor::commit(const RecyclingRecord& record) {
    auto config = registry_.with_recycled(record.asset_class);
    repository_.append_record(record);
    ledger_.append(record);
    registry_.store(config);
}

void RecycleProcessor::pause(const ActorId& caller) {
    gate_.require_no_external_call("pause");
    require_authorized(authorizer_, caller, AdminOperation::PAUSE);
    if (gate_.pause()) {
        publish_committed(events_, PauseStateChanged{{clock_.now()}, caller, true});
    }
}

void RecycleProcessor::unpause(const ActorId& caller) {
    gate_.require_no_external_call("unpause");
    require_authorized(authorizer_, caller, AdminOperation::UNPAUSE);
    if (gate_.unpause()) {
        publish_committed(events_, PauseStateChanged{{clock_.now()}, caller, false});
    }
}

void RecycleProcessor::emergency_rescue(const ActorId& caller, const AssetClassId& class_id,
                                        const UnitId& unit_id, const ActorId& recipient) {
    gate_.require_no_external_call("emergency_rescue");
    require_authorized(authorizer_, caller, AdminOperation::EMERGENCY_RESCUE);
    auto scope = gate_.enter("emergency_rescue");

    if (recipient == custody_) {
        throw ValidationError("rescue recipient must differ from custodial holding");
    }
    auto collaborator = resolver_.resolve(class_id);
    if (!collaborator) {
        throw ValidationError("asset class " + class_id.value() + " does not resolve to a collaborator");
    }

    const auto unit = "unit " + unit_id.to_string() + " of " + class_id.value();
    auto owner = query_owner(*collaborator, class_id, unit_id, &gate_);
    if (owner != custody_) {
        throw NotOwnerError(unit + " is not in custodial holding");
    }

    auto now = clock_.now();
    {
        auto external_call = gate_.begin_external_call("emergency_rescue");
        try {
            collaborator->transfer(custody_, recipient, unit_id);
        } catch (const std::exception& e) {
            throw OperationFailedError("rescue of " + unit + " failed: " + e.what());
        }
    }

    publish_committed(events_, EmergencyRescuePerformed{{now}, class_id, unit_id, recipient});
}

} // namespace rcy::services
