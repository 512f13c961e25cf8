#include "services/QueryService.hpp"

#include "domain/errors/RecyclingError.hpp"
#include "services/Eligibility.hpp"

#include <stdexcept>

using namespace rcy::domain;

namespace rcy::services {

QueryService::QueryService(const AssetClassRegistry& registry,
                           const RecyclingLedger& ledger,
                           const IAssetClassResolver& resolver,
                           const ExchangeGate& gate,
                           ActorId custody)
    : registry_(registry)
    , ledger_(ledger)
    , resolver_(resolver)
    , gate_(gate)
    , custody_(std::move(custody)) {}

std::optional<AssetClassConfig> QueryService::get_class_config(const AssetClassId& class_id) const {
    return registry_.find(class_id);
}

bool QueryService::is_accepted(const AssetClassId& class_id) const {
    return registry_.is_accepted(class_id);
}

std::vector<AssetClassId> QueryService::get_accepted_classes() const {
    std::vector<AssetClassId> result;
    for (const auto& config : registry_.configs()) {
        if (config.active) {
            result.push_back(config.class_id);
        }
    }
    return result;
}

Points QueryService::calculate_points(const AssetClassId& class_id, uint64_t quantity) const {
    const auto& config = registry_.get(class_id);
    try {
        return config.points_per_unit.times(quantity);
    } catch (const std::overflow_error& e) {
        throw ValidationError(std::string("quantity too large: ") + e.what());
    }
}

std::vector<RecyclingRecord> QueryService::get_history_for_actor(const ActorId& actor) const {
    return ledger_.history_for_actor(actor);
}

std::vector<RecyclingRecord> QueryService::get_history_for_class(const AssetClassId& class_id) const {
    return ledger_.history_for_class(class_id);
}

std::optional<RecyclingRecord> QueryService::get_record(uint64_t sequence_number) const {
    return ledger_.at(sequence_number);
}

size_t QueryService::get_actor_recycle_count(const ActorId& actor) const {
    return ledger_.recycle_count_for_actor(actor);
}

size_t QueryService::get_history_size() const {
    return ledger_.size();
}

RecyclingStats QueryService::get_stats() const {
    return RecyclingStats{
        ledger_.total_recyclings(),
        ledger_.total_points_generated(),
        registry_.active_count()
    };
}

Eligibility QueryService::can_recycle(const ActorId& actor, const AssetClassId& class_id,
                                      const UnitId& unit_id) const {
    if (gate_.paused()) {
        return {false, "paused"};
    }
    if (actor == custody_) {
        return {false, "custodial holding cannot recycle units"};
    }
    if (!registry_.is_registered(class_id)) {
        return {false, "asset class " + class_id.value() + " is not registered"};
    }
    try {
        (void)require_eligible(registry_, resolver_, actor, class_id, unit_id);
    } catch (const RecyclingError& e) {
        return {false, e.what()};
    }
    return {true, ""};
}

} // namespace rcy::services
