#include "domain/aggregates/RecyclingLedger.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace rcy::domain {

RecyclingRecord RecyclingLedger::next_record(ActorId actor, AssetClassId asset_class,
                                             UnitId unit_id, Points points,
                                             DisposalMethod method,
                                             Timestamp timestamp) const {
    return RecyclingRecord{std::move(actor), std::move(asset_class), unit_id, points,
                           method, timestamp, next_sequence_number()};
}

void RecyclingLedger::append(const RecyclingRecord& record) {
    if (record.sequence_number != next_sequence_number()) {
        throw std::logic_error(
            "Ledger expected sequence number " + std::to_string(next_sequence_number()) +
            ", got: " + std::to_string(record.sequence_number));
    }

    // Compute the new total first so an overflow leaves the ledger untouched
    Points new_total = total_points_ + record.points_generated;

    size_t position = records_.size();
    auto& actor_positions = by_actor_[record.actor];
    auto& class_positions = by_class_[record.asset_class];
    actor_positions.reserve(actor_positions.size() + 1);
    class_positions.reserve(class_positions.size() + 1);
    records_.reserve(records_.size() + 1);

    records_.push_back(record);
    actor_positions.push_back(position);
    class_positions.push_back(position);
    total_points_ = new_total;
}

bool RecyclingLedger::can_add(Points points) const noexcept {
    return points.amount() <= std::numeric_limits<uint64_t>::max() - total_points_.amount();
}

std::optional<RecyclingRecord> RecyclingLedger::at(uint64_t sequence_number) const {
    if (sequence_number == 0 || sequence_number > records_.size()) return std::nullopt;
    return records_[sequence_number - 1];
}

std::vector<RecyclingRecord> RecyclingLedger::history_for_actor(const ActorId& actor) const {
    auto it = by_actor_.find(actor);
    if (it == by_actor_.end()) return {};
    return collect(it->second);
}

std::vector<RecyclingRecord> RecyclingLedger::history_for_class(
    const AssetClassId& asset_class) const {
    auto it = by_class_.find(asset_class);
    if (it == by_class_.end()) return {};
    return collect(it->second);
}

size_t RecyclingLedger::recycle_count_for_actor(const ActorId& actor) const {
    auto it = by_actor_.find(actor);
    return it == by_actor_.end() ? 0 : it->second.size();
}

size_t RecyclingLedger::recycle_count_for_class(const AssetClassId& asset_class) const {
    auto it = by_class_.find(asset_class);
    return it == by_class_.end() ? 0 : it->second.size();
}

std::vector<RecyclingRecord> RecyclingLedger::collect(const std::vector<size_t>& positions) const {
    std::vector<RecyclingRecord> result;
    result.reserve(positions.size());
    for (auto position : positions) {
        result.push_back(records_[position]);
    }
    return result;
}

} // namespace rcy::domain
