#pragma once

#include "config/Settings.hpp"
#include "repositories/ILedgerRepository.hpp"

#include <arrow/filesystem/api.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rcy::repositories::pq {

// Ledger storage on an Arrow filesystem.
//
// Records are buffered and written in batches to
//   records/<yyyy-mm-dd>/records_<HH>_<first_seq>_<last_seq>.parquet
// The registry is small and rewritten whole to registry/asset_classes.parquet
// on every change.
class ParquetLedgerRepository : public rcy::repositories::ILedgerRepository {
public:
    ParquetLedgerRepository(std::shared_ptr<arrow::fs::FileSystem> fs,
                            const rcy::config::StorageSettings& settings);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    ~ParquetLedgerRepository() override;

    // ILedgerRepository
    void append_record(const rcy::domain::RecyclingRecord& record) override;
    std::vector<rcy::domain::RecyclingRecord> get_records_since(
        uint64_t sequence_number) const override;
    void store_class_config(const rcy::domain::AssetClassConfig& config) override;
    std::vector<rcy::domain::AssetClassConfig> get_class_configs() const override;

    // Writes any buffered records now.
    void flush();

private:
    void flush_locked();
    void write_records(const std::string& path,
                       const std::vector<rcy::domain::RecyclingRecord>& records);
    void write_class_configs();

    std::vector<rcy::domain::RecyclingRecord> read_records_from_disk(uint64_t min_sequence) const;
    std::map<rcy::domain::AssetClassId, rcy::domain::AssetClassConfig> read_class_configs() const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    rcy::config::StorageSettings settings_;
    mutable std::mutex mutex_;

    std::vector<rcy::domain::RecyclingRecord> record_buffer_;
    std::map<rcy::domain::AssetClassId, rcy::domain::AssetClassConfig> configs_;

    static constexpr const char* kRecordsDir = "records";
    static constexpr const char* kRegistryFile = "registry/asset_classes.parquet";
};

} // namespace rcy::repositories::pq
