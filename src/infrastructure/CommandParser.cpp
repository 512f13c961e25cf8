#include "infrastructure/CommandParser.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace rcy::infrastructure {

namespace {

const json& field(const json& obj, const char* name) {
    if (!obj.contains(name)) {
        throw std::invalid_argument(std::string("missing field '") + name + "'");
    }
    return obj[name];
}

std::string string_field(const json& obj, const char* name) {
    const auto& value = field(obj, name);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("field '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

uint64_t uint_field(const json& obj, const char* name) {
    const auto& value = field(obj, name);
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument(std::string("field '") + name + "' must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

bool bool_field(const json& obj, const char* name, bool fallback) {
    if (!obj.contains(name)) return fallback;
    if (!obj[name].is_boolean()) {
        throw std::invalid_argument(std::string("field '") + name + "' must be a boolean");
    }
    return obj[name].get<bool>();
}

std::optional<std::string> optional_string(const json& obj, const char* name) {
    if (!obj.contains(name)) return std::nullopt;
    return string_field(obj, name);
}

RecycleBatchCommand parse_batch(const json& obj) {
    RecycleBatchCommand cmd{string_field(obj, "caller"), {}, {}, {}};
    const auto& items = field(obj, "items");
    if (!items.is_array()) {
        throw std::invalid_argument("field 'items' must be an array");
    }
    for (const auto& item : items) {
        cmd.class_ids.push_back(string_field(item, "class"));
        cmd.unit_ids.push_back(uint_field(item, "unit"));
        cmd.destroy.push_back(bool_field(item, "destroy", true));
    }
    return cmd;
}

} // anonymous namespace

std::optional<Command> CommandParser::parse_line(const std::string& line) const {
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
        return std::nullopt;
    }

    auto obj = json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        throw std::invalid_argument("not a JSON object: " + line);
    }

    auto command = string_field(obj, "command");

    if (command == "deploy_class") {
        return DeployClassCommand{string_field(obj, "class"), bool_field(obj, "destructible", true)};
    } else if (command == "mint") {
        return MintCommand{string_field(obj, "class"), uint_field(obj, "unit"),
                           string_field(obj, "owner")};
    } else if (command == "register") {
        return RegisterCommand{string_field(obj, "caller"), string_field(obj, "class"),
                               uint_field(obj, "points")};
    } else if (command == "update_rate") {
        return UpdateRateCommand{string_field(obj, "caller"), string_field(obj, "class"),
                                 uint_field(obj, "points")};
    } else if (command == "set_active") {
        return SetActiveCommand{string_field(obj, "caller"), string_field(obj, "class"),
                                bool_field(obj, "active", true)};
    } else if (command == "deactivate") {
        return DeactivateCommand{string_field(obj, "caller"), string_field(obj, "class")};
    } else if (command == "pause") {
        return PauseCommand{string_field(obj, "caller"), true};
    } else if (command == "unpause") {
        return PauseCommand{string_field(obj, "caller"), false};
    } else if (command == "recycle") {
        return RecycleCommand{string_field(obj, "caller"), string_field(obj, "class"),
                              uint_field(obj, "unit"), bool_field(obj, "destroy", true)};
    } else if (command == "recycle_batch") {
        return parse_batch(obj);
    } else if (command == "rescue") {
        return RescueCommand{string_field(obj, "caller"), string_field(obj, "class"),
                             uint_field(obj, "unit"), string_field(obj, "to")};
    } else if (command == "stats") {
        return StatsCommand{};
    } else if (command == "history") {
        return HistoryCommand{optional_string(obj, "actor"), optional_string(obj, "class")};
    } else if (command == "can_recycle") {
        return CanRecycleCommand{string_field(obj, "actor"), string_field(obj, "class"),
                                 uint_field(obj, "unit")};
    }

    throw std::invalid_argument("unknown command: " + command);
}

} // namespace rcy::infrastructure
