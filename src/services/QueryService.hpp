#pragma once

#include "domain/aggregates/AssetClassRegistry.hpp"
#include "domain/aggregates/RecyclingLedger.hpp"
#include "services/ExchangeGate.hpp"
#include "services/IAssetClassResolver.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rcy::services {

struct RecyclingStats {
    uint64_t total_recyclings;
    rcy::domain::Points total_points_generated;
    size_t active_class_count;
};

struct Eligibility {
    bool eligible;
    std::string reason;   // Empty when eligible
};

// Side-effect-free reads over the registry and the ledger.
class QueryService {
public:
    QueryService(const rcy::domain::AssetClassRegistry& registry,
                 const rcy::domain::RecyclingLedger& ledger,
                 const IAssetClassResolver& resolver,
                 const ExchangeGate& gate,
                 rcy::domain::ActorId custody);

    std::optional<rcy::domain::AssetClassConfig> get_class_config(
        const rcy::domain::AssetClassId& class_id) const;
    bool is_accepted(const rcy::domain::AssetClassId& class_id) const;
    std::vector<rcy::domain::AssetClassId> get_accepted_classes() const;

    // rate * quantity at the current rate. NotRegisteredError for unknown
    // classes, ValidationError if the product overflows.
    rcy::domain::Points calculate_points(const rcy::domain::AssetClassId& class_id,
                                         uint64_t quantity) const;

    std::vector<rcy::domain::RecyclingRecord> get_history_for_actor(
        const rcy::domain::ActorId& actor) const;
    std::vector<rcy::domain::RecyclingRecord> get_history_for_class(
        const rcy::domain::AssetClassId& class_id) const;
    std::optional<rcy::domain::RecyclingRecord> get_record(uint64_t sequence_number) const;
    size_t get_actor_recycle_count(const rcy::domain::ActorId& actor) const;
    size_t get_history_size() const;

    RecyclingStats get_stats() const;

    // Same checks a recycle would make before disposal, reported as a value.
    Eligibility can_recycle(const rcy::domain::ActorId& actor,
                            const rcy::domain::AssetClassId& class_id,
                            const rcy::domain::UnitId& unit_id) const;

    bool is_paused() const noexcept { return gate_.paused(); }

private:
    const rcy::domain::AssetClassRegistry& registry_;
    const rcy::domain::RecyclingLedger& ledger_;
    const IAssetClassResolver& resolver_;
    const ExchangeGate& gate_;
    rcy::domain::ActorId custody_;
};

} // namespace rcy::services
