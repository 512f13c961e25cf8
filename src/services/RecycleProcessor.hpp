#pragma once

#include "domain/aggregates/AssetClassRegistry.hpp"
#include "domain/aggregates/RecyclingLedger.hpp"
#include "repositories/ILedgerRepository.hpp"
#include "services/ExchangeGate.hpp"
#include "services/IAssetClassResolver.hpp"
#include "services/IAuthorizer.hpp"
#include "services/IClock.hpp"
#include "services/IRecyclingEventSink.hpp"

namespace rcy::services {

// Executes one exchange of one unit for points.
//
// Every exchange reads all state it needs (class status, ownership, rate,
// time), makes exactly one disposal call into the collaborator, and only
// then writes: repository first, then ledger and registry together.
class RecycleProcessor {
public:
    RecycleProcessor(rcy::domain::AssetClassRegistry& registry,
                     rcy::domain::RecyclingLedger& ledger,
                     rcy::repositories::ILedgerRepository& repo,
                     const IAssetClassResolver& resolver,
                     const IAuthorizer& authorizer,
                     ExchangeGate& gate,
                     IRecyclingEventSink& events,
                     const IClock& clock,
                     rcy::domain::ActorId custody);

    rcy::domain::RecyclingRecord recycle_by_destruction(const rcy::domain::ActorId& caller,
                                                        const rcy::domain::AssetClassId& class_id,
                                                        const rcy::domain::UnitId& unit_id);

    rcy::domain::RecyclingRecord recycle_by_transfer(const rcy::domain::ActorId& caller,
                                                     const rcy::domain::AssetClassId& class_id,
                                                     const rcy::domain::UnitId& unit_id);

    // Runs one exchange inside a scope the caller already holds (batch items).
    rcy::domain::RecyclingRecord recycle_in_scope(const ExchangeGate::Scope& scope,
                                                  const rcy::domain::ActorId& caller,
                                                  const rcy::domain::AssetClassId& class_id,
                                                  const rcy::domain::UnitId& unit_id,
                                                  rcy::domain::DisposalMethod method);

    // Admin controls
    void pause(const rcy::domain::ActorId& caller);
    void unpause(const rcy::domain::ActorId& caller);
    bool paused() const noexcept { return gate_.paused(); }

    // Moves a unit out of custodial holding. Works while paused.
    void emergency_rescue(const rcy::domain::ActorId& caller,
                          const rcy::domain::AssetClassId& class_id,
                          const rcy::domain::UnitId& unit_id,
                          const rcy::domain::ActorId& recipient);

    const rcy::domain::ActorId& custody() const noexcept { return custody_; }

private:
    rcy::domain::RecyclingRecord recycle(const rcy::domain::ActorId& caller,
                                         const rcy::domain::AssetClassId& class_id,
                                         const rcy::domain::UnitId& unit_id,
                                         rcy::domain::DisposalMethod method);

    rcy::domain::RecyclingRecord execute(const rcy::domain::ActorId& caller,
                                         const rcy::domain::AssetClassId& class_id,
                                         const rcy::domain::UnitId& unit_id,
                                         rcy::domain::DisposalMethod method);

    void dispose(IAssetClass& collaborator, const rcy::domain::ActorId& caller,
                 const rcy::domain::AssetClassId& class_id,
                 const rcy::domain::UnitId& unit_id, rcy::domain::DisposalMethod method);

    void commit(const rcy::domain::RecyclingRecord& record);

    rcy::domain::AssetClassRegistry& registry_;
    rcy::domain::RecyclingLedger& ledger_;
    rcy::repositories::ILedgerRepository& repository_;
    const IAssetClassResolver& resolver_;
    const IAuthorizer& authorizer_;
    ExchangeGate& gate_;
    IRecyclingEventSink& events_;
    const IClock& clock_;
    rcy::domain::ActorId custody_;
};

} // namespace rcy::services
