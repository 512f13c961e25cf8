#pragma once

#include "domain/aggregates/AssetClassConfig.hpp"
#include "domain/value_objects/RecyclingRecord.hpp"

#include <cstdint>
#include <vector>

namespace rcy::repositories {

class ILedgerRepository {
public:
    // Record storage (source of truth for the ledger)
    virtual void append_record(const rcy::domain::RecyclingRecord& record) = 0;
    virtual std::vector<rcy::domain::RecyclingRecord> get_records_since(
        uint64_t sequence_number) const = 0;

    // Registry storage (latest config per class)
    virtual void store_class_config(const rcy::domain::AssetClassConfig& config) = 0;
    virtual std::vector<rcy::domain::AssetClassConfig> get_class_configs() const = 0;

    virtual ~ILedgerRepository() = default;
};

} // namespace rcy::repositories
