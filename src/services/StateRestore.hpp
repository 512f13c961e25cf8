#pragma once

#include "domain/aggregates/AssetClassRegistry.hpp"
#include "domain/aggregates/RecyclingLedger.hpp"
#include "repositories/ILedgerRepository.hpp"

#include <cstddef>

namespace rcy::services {

struct RestoreSummary {
    size_t classes;
    size_t records;
};

// Rebuilds an empty registry and ledger from a repository. Records are
// replayed in sequence order and each class's recycled count is re-derived
// from the replayed ledger rather than trusted from the stored config.
RestoreSummary restore_state(const rcy::repositories::ILedgerRepository& repo,
                             rcy::domain::AssetClassRegistry& registry,
                             rcy::domain::RecyclingLedger& ledger);

} // namespace rcy::services
