#include "infrastructure/ScriptRunner.hpp"

#include "infrastructure/SimpleAssetClass.hpp"

#include <memory>
#include <string>
#include <type_traits>

using json = nlohmann::json;
using namespace rcy::domain;

namespace rcy::infrastructure {

namespace {

json config_to_json(const AssetClassConfig& config) {
    return json{
        {"asset_class", config.class_id.value()},
        {"points_per_unit", config.points_per_unit.amount()},
        {"active", config.active},
        {"total_recycled", config.total_recycled},
        {"registered_at_ms", config.registered_at.milliseconds()},
    };
}

} // anonymous namespace

ScriptRunner::ScriptRunner(AssetClassDirectory& directory,
                           rcy::services::RegistryService& registry,
                           rcy::services::RecycleProcessor& processor,
                           rcy::services::BatchCoordinator& batches,
                           const rcy::services::QueryService& queries,
                           std::ostream& out)
    : directory_(directory)
    , registry_(registry)
    , processor_(processor)
    , batches_(batches)
    , queries_(queries)
    , out_(out) {}

ScriptSummary ScriptRunner::run(std::istream& script) {
    ScriptSummary summary{0, 0};
    std::string line;
    size_t line_number = 0;

    while (std::getline(script, line)) {
        ++line_number;
        try {
            auto command = parser_.parse_line(line);
            if (!command) continue;
            ++summary.executed;
            auto result = execute(*command);
            out_ << "[script] " << line_number << " ok " << result.dump() << std::endl;
        } catch (const std::exception& e) {
            ++summary.failed;
            out_ << "[script] " << line_number << " error " << e.what() << std::endl;
        }
    }

    return summary;
}

json ScriptRunner::execute(const Command& command) {
    return std::visit([this](const auto& cmd) -> json {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, DeployClassCommand>) {
            directory_.bind(AssetClassId(cmd.class_id),
                            std::make_shared<SimpleAssetClass>(cmd.supports_destruction));
            return json{{"deployed", cmd.class_id}};
        } else if constexpr (std::is_same_v<T, MintCommand>) {
            auto collaborator = std::dynamic_pointer_cast<SimpleAssetClass>(
                directory_.resolve(AssetClassId(cmd.class_id)));
            if (!collaborator) {
                throw std::invalid_argument("no deployed class " + cmd.class_id);
            }
            collaborator->mint(UnitId(cmd.unit_id), ActorId(cmd.owner));
            return json{{"minted", cmd.unit_id}, {"owner", cmd.owner}};
        } else if constexpr (std::is_same_v<T, RegisterCommand>) {
            return config_to_json(registry_.register_class(
                ActorId(cmd.caller), AssetClassId(cmd.class_id), Points(cmd.points_per_unit)));
        } else if constexpr (std::is_same_v<T, UpdateRateCommand>) {
            return config_to_json(registry_.update_rate(
                ActorId(cmd.caller), AssetClassId(cmd.class_id), Points(cmd.points_per_unit)));
        } else if constexpr (std::is_same_v<T, SetActiveCommand>) {
            return config_to_json(registry_.set_active(
                ActorId(cmd.caller), AssetClassId(cmd.class_id), cmd.active));
        } else if constexpr (std::is_same_v<T, DeactivateCommand>) {
            return config_to_json(registry_.deactivate(ActorId(cmd.caller), AssetClassId(cmd.class_id)));
        } else if constexpr (std::is_same_v<T, PauseCommand>) {
            if (cmd.paused) {
                processor_.pause(ActorId(cmd.caller));
            } else {
                processor_.unpause(ActorId(cmd.caller));
            }
            return json{{"paused", processor_.paused()}};
        } else if constexpr (std::is_same_v<T, RecycleCommand>) {
            ActorId caller(cmd.caller);
            AssetClassId class_id(cmd.class_id);
            auto record = cmd.destroy
                ? processor_.recycle_by_destruction(caller, class_id, UnitId(cmd.unit_id))
                : processor_.recycle_by_transfer(caller, class_id, UnitId(cmd.unit_id));
            return serializer_.to_json(record);
        } else if constexpr (std::is_same_v<T, RecycleBatchCommand>) {
            std::vector<AssetClassId> class_ids;
            std::vector<UnitId> unit_ids;
            for (const auto& id : cmd.class_ids) class_ids.emplace_back(id);
            for (auto id : cmd.unit_ids) unit_ids.emplace_back(id);
            auto outcome = batches_.recycle_batch(ActorId(cmd.caller), class_ids, unit_ids, cmd.destroy);
            return json{
                {"total_points", outcome.total_points.amount()},
                {"succeeded", outcome.succeeded()},
                {"failed", outcome.failed()},
            };
        } else if constexpr (std::is_same_v<T, RescueCommand>) {
            processor_.emergency_rescue(ActorId(cmd.caller), AssetClassId(cmd.class_id),
                                        UnitId(cmd.unit_id), ActorId(cmd.recipient));
            return json{{"rescued", cmd.unit_id}, {"to", cmd.recipient}};
        } else if constexpr (std::is_same_v<T, StatsCommand>) {
            auto stats = queries_.get_stats();
            return json{
                {"total_recyclings", stats.total_recyclings},
                {"total_points_generated", stats.total_points_generated.amount()},
                {"active_classes", stats.active_class_count},
                {"paused", queries_.is_paused()},
            };
        } else if constexpr (std::is_same_v<T, HistoryCommand>) {
            std::vector<RecyclingRecord> records;
            if (cmd.actor) {
                records = queries_.get_history_for_actor(ActorId(*cmd.actor));
            } else if (cmd.class_id) {
                records = queries_.get_history_for_class(AssetClassId(*cmd.class_id));
            } else {
                throw std::invalid_argument("history needs 'actor' or 'class'");
            }
            auto result = json::array();
            for (const auto& record : records) {
                result.push_back(serializer_.to_json(record));
            }
            return result;
        } else {
            static_assert(std::is_same_v<T, CanRecycleCommand>);
            auto eligibility = queries_.can_recycle(ActorId(cmd.actor), AssetClassId(cmd.class_id),
                                                    UnitId(cmd.unit_id));
            return json{{"eligible", eligibility.eligible}, {"reason", eligibility.reason}};
        }
    }, command);
}

} // namespace rcy::infrastructure
