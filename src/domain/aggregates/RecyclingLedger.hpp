#pragma once

#include "domain/value_objects/RecyclingRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace rcy::domain {

// Append-only audit trail of completed exchanges.
//
// Running totals and the actor/class indices are maintained at append time,
// so history queries never scan the whole ledger.
class RecyclingLedger {
public:
    // Builds the record that would be appended next (sequence numbers start at 1).
    RecyclingRecord next_record(ActorId actor, AssetClassId asset_class, UnitId unit_id,
                                Points points, DisposalMethod method,
                                Timestamp timestamp) const;

    // Throws if the sequence number is not the next one or the running
    // total would overflow; nothing is modified in that case.
    void append(const RecyclingRecord& record);

    // Queries
    const std::vector<RecyclingRecord>& records() const noexcept { return records_; }
    std::optional<RecyclingRecord> at(uint64_t sequence_number) const;
    std::vector<RecyclingRecord> history_for_actor(const ActorId& actor) const;
    std::vector<RecyclingRecord> history_for_class(const AssetClassId& asset_class) const;
    size_t recycle_count_for_actor(const ActorId& actor) const;
    size_t recycle_count_for_class(const AssetClassId& asset_class) const;

    // False if adding points to the running total would overflow.
    bool can_add(Points points) const noexcept;

    uint64_t total_recyclings() const noexcept { return records_.size(); }
    Points total_points_generated() const noexcept { return total_points_; }
    uint64_t next_sequence_number() const noexcept { return records_.size() + 1; }
    size_t size() const noexcept { return records_.size(); }

private:
    std::vector<RecyclingRecord> collect(const std::vector<size_t>& positions) const;

    std::vector<RecyclingRecord> records_;
    std::map<ActorId, std::vector<size_t>> by_actor_;
    std::map<AssetClassId, std::vector<size_t>> by_class_;
    Points total_points_{0};
};

} // namespace rcy::domain
