#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rcy::infrastructure {

// Script commands carry raw strings; ids are validated when executed.

struct DeployClassCommand {
    std::string class_id;
    bool supports_destruction;
};

struct MintCommand {
    std::string class_id;
    uint64_t unit_id;
    std::string owner;
};

struct RegisterCommand {
    std::string caller;
    std::string class_id;
    uint64_t points_per_unit;
};

struct UpdateRateCommand {
    std::string caller;
    std::string class_id;
    uint64_t points_per_unit;
};

struct SetActiveCommand {
    std::string caller;
    std::string class_id;
    bool active;
};

struct DeactivateCommand {
    std::string caller;
    std::string class_id;
};

struct PauseCommand {
    std::string caller;
    bool paused;
};

struct RecycleCommand {
    std::string caller;
    std::string class_id;
    uint64_t unit_id;
    bool destroy;
};

struct RecycleBatchCommand {
    std::string caller;
    std::vector<std::string> class_ids;
    std::vector<uint64_t> unit_ids;
    std::vector<bool> destroy;
};

struct RescueCommand {
    std::string caller;
    std::string class_id;
    uint64_t unit_id;
    std::string recipient;
};

struct StatsCommand {};

struct HistoryCommand {
    std::optional<std::string> actor;
    std::optional<std::string> class_id;
};

struct CanRecycleCommand {
    std::string actor;
    std::string class_id;
    uint64_t unit_id;
};

using Command = std::variant<
    DeployClassCommand,
    MintCommand,
    RegisterCommand,
    UpdateRateCommand,
    SetActiveCommand,
    DeactivateCommand,
    PauseCommand,
    RecycleCommand,
    RecycleBatchCommand,
    RescueCommand,
    StatsCommand,
    HistoryCommand,
    CanRecycleCommand>;

} // namespace rcy::infrastructure
