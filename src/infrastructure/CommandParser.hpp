#pragma once

#include "infrastructure/Commands.hpp"

#include <optional>
#include <string>

namespace rcy::infrastructure {

class CommandParser {
public:
    // Parse one line of a JSON-lines script, e.g.
    //   {"command": "recycle", "caller": "alice", "class": "C", "unit": 7, "destroy": true}
    // Blank lines and lines starting with '#' yield nullopt. Malformed JSON,
    // unknown commands and missing fields throw std::invalid_argument.
    std::optional<Command> parse_line(const std::string& line) const;
};

} // namespace rcy::infrastructure
