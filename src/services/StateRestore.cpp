#include "services/StateRestore.hpp"

#include <algorithm>
#include <stdexcept>

using namespace rcy::domain;

namespace rcy::services {

RestoreSummary restore_state(const rcy::repositories::ILedgerRepository& repo,
                             AssetClassRegistry& registry,
                             RecyclingLedger& ledger) {
    if (registry.registered_count() != 0 || ledger.size() != 0) {
        throw std::logic_error("restore_state requires an empty registry and ledger");
    }

    auto records = repo.get_records_since(0);
    std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        return a.sequence_number < b.sequence_number;
    });
    for (const auto& record : records) {
        ledger.append(record);
    }

    auto configs = repo.get_class_configs();
    for (auto config : configs) {
        config.total_recycled = ledger.recycle_count_for_class(config.class_id);
        registry.store(config);
    }

    for (const auto& record : ledger.records()) {
        if (!registry.is_registered(record.asset_class)) {
            throw std::runtime_error(
                "ledger references unknown asset class " + record.asset_class.value());
        }
    }

    return RestoreSummary{configs.size(), records.size()};
}

} // namespace rcy::services
