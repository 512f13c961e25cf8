#include "infrastructure/RecyclingEventSerializer.hpp"

#include <type_traits>
#include <variant>

using json = nlohmann::json;
using namespace rcy::domain;

namespace rcy::infrastructure {

namespace {

json header(const char* event_type, const RecyclingEvent& event) {
    return json{
        {"event_type", event_type},
        {"timestamp_ms", event.timestamp.milliseconds()},
        {"timestamp", event.timestamp.iso8601()},
    };
}

} // anonymous namespace

json RecyclingEventSerializer::to_json(const RecyclingRecord& record) const {
    return json{
        {"actor", record.actor.value()},
        {"asset_class", record.asset_class.value()},
        {"unit_id", record.unit_id.value()},
        {"points_generated", record.points_generated.amount()},
        {"method", rcy::domain::to_string(record.method)},
        {"timestamp_ms", record.timestamp.milliseconds()},
        {"sequence_number", record.sequence_number},
    };
}

json RecyclingEventSerializer::to_json(const RecyclingEventVariant& event) const {
    return std::visit([this](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AssetClassRegistered>) {
            auto obj = header("class_registered", e);
            obj["asset_class"] = e.class_id.value();
            obj["points_per_unit"] = e.points_per_unit.amount();
            return obj;
        } else if constexpr (std::is_same_v<T, AssetClassRateUpdated>) {
            auto obj = header("class_rate_updated", e);
            obj["asset_class"] = e.class_id.value();
            obj["old_points_per_unit"] = e.old_points_per_unit.amount();
            obj["new_points_per_unit"] = e.new_points_per_unit.amount();
            return obj;
        } else if constexpr (std::is_same_v<T, AssetClassStatusChanged>) {
            auto obj = header("class_status_changed", e);
            obj["asset_class"] = e.class_id.value();
            obj["active"] = e.active;
            return obj;
        } else if constexpr (std::is_same_v<T, AssetClassRemoved>) {
            auto obj = header("class_removed", e);
            obj["asset_class"] = e.class_id.value();
            return obj;
        } else if constexpr (std::is_same_v<T, RecyclingCompleted>) {
            auto obj = header("recycling_completed", e);
            obj["record"] = to_json(e.record);
            return obj;
        } else if constexpr (std::is_same_v<T, RecyclingFailed>) {
            auto obj = header("recycling_failed", e);
            obj["actor"] = e.actor.value();
            obj["asset_class"] = e.class_id.value();
            obj["unit_id"] = e.unit_id.value();
            obj["error"] = rcy::domain::to_string(e.kind);
            obj["reason"] = e.reason;
            return obj;
        } else if constexpr (std::is_same_v<T, EmergencyRescuePerformed>) {
            auto obj = header("emergency_rescue", e);
            obj["asset_class"] = e.class_id.value();
            obj["unit_id"] = e.unit_id.value();
            obj["recipient"] = e.recipient.value();
            return obj;
        } else {
            static_assert(std::is_same_v<T, PauseStateChanged>);
            auto obj = header(e.paused ? "paused" : "unpaused", e);
            obj["changed_by"] = e.changed_by.value();
            return obj;
        }
    }, event);
}

} // namespace rcy::infrastructure
