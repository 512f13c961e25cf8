#pragma once

#include "repositories/ILedgerRepository.hpp"

#include <map>
#include <vector>

namespace rcy::repositories {

class InMemoryLedgerRepository : public rcy::repositories::ILedgerRepository {
public:
    void append_record(const rcy::domain::RecyclingRecord& record) override {
        records_.push_back(record);
    }

    std::vector<rcy::domain::RecyclingRecord> get_records_since(
        uint64_t sequence_number) const override {
        std::vector<rcy::domain::RecyclingRecord> result;
        for (const auto& record : records_) {
            if (record.sequence_number > sequence_number) {
                result.push_back(record);
            }
        }
        return result;
    }

    void store_class_config(const rcy::domain::AssetClassConfig& config) override {
        configs_.insert_or_assign(config.class_id, config);
    }

    std::vector<rcy::domain::AssetClassConfig> get_class_configs() const override {
        std::vector<rcy::domain::AssetClassConfig> result;
        for (const auto& [id, config] : configs_) {
            result.push_back(config);
        }
        return result;
    }

    // Test helpers
    size_t record_count() const { return records_.size(); }
    const std::vector<rcy::domain::RecyclingRecord>& records() const { return records_; }
    bool has_class_config(const rcy::domain::AssetClassId& class_id) const {
        return configs_.count(class_id) > 0;
    }

private:
    std::vector<rcy::domain::RecyclingRecord> records_;
    std::map<rcy::domain::AssetClassId, rcy::domain::AssetClassConfig> configs_;
};

} // namespace rcy::repositories
