#pragma once

#include "infrastructure/AssetClassDirectory.hpp"
#include "infrastructure/CommandParser.hpp"
#include "infrastructure/RecyclingEventSerializer.hpp"
#include "services/BatchCoordinator.hpp"
#include "services/QueryService.hpp"
#include "services/RecycleProcessor.hpp"
#include "services/RegistryService.hpp"

#include <cstddef>
#include <istream>
#include <ostream>

namespace rcy::infrastructure {

struct ScriptSummary {
    size_t executed;
    size_t failed;
};

// Executes a JSON-lines command script against the services, printing one
// tagged result line per command. A failing command is reported and the
// script continues.
class ScriptRunner {
public:
    ScriptRunner(AssetClassDirectory& directory,
                 rcy::services::RegistryService& registry,
                 rcy::services::RecycleProcessor& processor,
                 rcy::services::BatchCoordinator& batches,
                 const rcy::services::QueryService& queries,
                 std::ostream& out);

    ScriptSummary run(std::istream& script);

    // Returns the command's result as JSON; throws on failure.
    nlohmann::json execute(const Command& command);

private:
    AssetClassDirectory& directory_;
    rcy::services::RegistryService& registry_;
    rcy::services::RecycleProcessor& processor_;
    rcy::services::BatchCoordinator& batches_;
    const rcy::services::QueryService& queries_;
    std::ostream& out_;
    CommandParser parser_;
    RecyclingEventSerializer serializer_;
};

} // namespace rcy::infrastructure
