#include "repositories/parquet/ParquetLedgerRepository.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>
#include <arrow/filesystem/localfs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace rcy::domain;

namespace rcy::repositories::pq {

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

template <typename T>
T unwrap(arrow::Result<T> result, const std::string& what) {
    check(result.status(), what);
    return std::move(result).ValueOrDie();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Filename stem "records_<HH>_<first>_<last>" -> last, or 0 if it does not parse
uint64_t last_sequence_in_name(const std::string& path) {
    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = filename.rfind('.');
    if (dot != std::string::npos) filename = filename.substr(0, dot);

    auto last_underscore = filename.rfind('_');
    if (last_underscore == std::string::npos) return 0;
    auto digits = filename.substr(last_underscore + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) return 0;
    return std::stoull(digits);
}

std::shared_ptr<arrow::Table> read_table(arrow::fs::FileSystem& fs, const std::string& path) {
    auto infile = unwrap(fs.OpenInputFile(path), "open " + path);
    auto reader = unwrap(::parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(infile)),
        "read " + path);

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "read " + path);
    return unwrap(table->CombineChunks(), "combine " + path);
}

void write_table(arrow::fs::FileSystem& fs, const std::string& path,
                 const arrow::Table& table) {
    auto outfile = unwrap(fs.OpenOutputStream(path), "open " + path);
    check(::parquet::arrow::WriteTable(table, arrow::default_memory_pool(), outfile,
                                       std::max<int64_t>(1, table.num_rows())),
          "write " + path);
    check(outfile->Close(), "close " + path);
}

template <typename ArrayT>
std::shared_ptr<ArrayT> column(const arrow::Table& table, int index) {
    return std::static_pointer_cast<ArrayT>(table.column(index)->chunk(0));
}

} // namespace

ParquetLedgerRepository::ParquetLedgerRepository(
    std::shared_ptr<arrow::fs::FileSystem> fs,
    const rcy::config::StorageSettings& settings)
    : fs_(std::move(fs))
    , settings_(settings) {
    configs_ = read_class_configs();
}

ParquetLedgerRepository::~ParquetLedgerRepository() {
    std::lock_guard lock(mutex_);
    try {
        flush_locked();
    } catch (const std::exception& e) {
        std::cerr << "[storage] Final flush failed, " << record_buffer_.size()
                  << " records not written: " << e.what() << std::endl;
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetLedgerRepository::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "create " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

void ParquetLedgerRepository::append_record(const RecyclingRecord& record) {
    std::lock_guard lock(mutex_);

    record_buffer_.push_back(record);
    if (record_buffer_.size() >= static_cast<size_t>(std::max(1, settings_.write_buffer_size))) {
        try {
            flush_locked();
        } catch (const std::exception&) {
            // The caller will not commit this record, so neither do we
            record_buffer_.pop_back();
            throw;
        }
    }
}

void ParquetLedgerRepository::flush() {
    std::lock_guard lock(mutex_);
    flush_locked();
}

void ParquetLedgerRepository::flush_locked() {
    if (record_buffer_.empty()) return;

    const auto& first = record_buffer_.front();
    std::string dir = std::string(kRecordsDir) + "/" + first.timestamp.date_string();
    check(fs_->CreateDir(dir, /*recursive=*/true), "create " + dir);

    std::string path = dir + "/records_" + first.timestamp.hour_string() + "_" +
        std::to_string(first.sequence_number) + "_" +
        std::to_string(record_buffer_.back().sequence_number) + ".parquet";

    write_records(path, record_buffer_);
    record_buffer_.clear();
}

void ParquetLedgerRepository::write_records(const std::string& path,
                                            const std::vector<RecyclingRecord>& records) {
    arrow::UInt64Builder seq_builder, unit_builder, points_builder;
    arrow::StringBuilder actor_builder, class_builder;
    arrow::UInt8Builder method_builder;
    arrow::Int64Builder timestamp_builder;

    for (const auto& record : records) {
        check(seq_builder.Append(record.sequence_number), "append sequence_number");
        check(actor_builder.Append(record.actor.value()), "append actor");
        check(class_builder.Append(record.asset_class.value()), "append asset_class");
        check(unit_builder.Append(record.unit_id.value()), "append unit_id");
        check(points_builder.Append(record.points_generated.amount()), "append points_generated");
        check(method_builder.Append(static_cast<uint8_t>(record.method)), "append method");
        check(timestamp_builder.Append(record.timestamp.milliseconds()), "append timestamp_ms");
    }

    std::shared_ptr<arrow::Array> arr_seq, arr_actor, arr_class, arr_unit, arr_points, arr_method, arr_ts;
    check(seq_builder.Finish(&arr_seq), "finish sequence_number");
    check(actor_builder.Finish(&arr_actor), "finish actor");
    check(class_builder.Finish(&arr_class), "finish asset_class");
    check(unit_builder.Finish(&arr_unit), "finish unit_id");
    check(points_builder.Finish(&arr_points), "finish points_generated");
    check(method_builder.Finish(&arr_method), "finish method");
    check(timestamp_builder.Finish(&arr_ts), "finish timestamp_ms");

    auto table = arrow::Table::Make(ParquetSchemas::recycling_record_schema(),
        {arr_seq, arr_actor, arr_class, arr_unit, arr_points, arr_method, arr_ts});
    write_table(*fs_, path, *table);
}

// --- Read path ---

std::vector<RecyclingRecord> ParquetLedgerRepository::get_records_since(
    uint64_t sequence_number) const {
    std::lock_guard lock(mutex_);

    auto result = read_records_from_disk(sequence_number);
    for (const auto& record : record_buffer_) {
        if (record.sequence_number > sequence_number) {
            result.push_back(record);
        }
    }

    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.sequence_number < b.sequence_number;
    });
    return result;
}

std::vector<RecyclingRecord> ParquetLedgerRepository::read_records_from_disk(
    uint64_t min_sequence) const {
    std::vector<RecyclingRecord> result;

    arrow::fs::FileSelector selector;
    selector.base_dir = kRecordsDir;
    selector.allow_not_found = true;
    selector.recursive = true;
    auto listing = unwrap(fs_->GetFileInfo(selector), "list records");

    for (const auto& file_info : listing) {
        if (file_info.type() != arrow::fs::FileType::File) continue;
        if (!ends_with(file_info.path(), ".parquet")) continue;

        // Skip files that end before the requested sequence
        auto last_seq = last_sequence_in_name(file_info.path());
        if (last_seq != 0 && last_seq <= min_sequence) continue;

        auto table = read_table(*fs_, file_info.path());
        if (table->num_rows() == 0) continue;

        auto seq_col = column<arrow::UInt64Array>(*table, 0);
        auto actor_col = column<arrow::StringArray>(*table, 1);
        auto class_col = column<arrow::StringArray>(*table, 2);
        auto unit_col = column<arrow::UInt64Array>(*table, 3);
        auto points_col = column<arrow::UInt64Array>(*table, 4);
        auto method_col = column<arrow::UInt8Array>(*table, 5);
        auto ts_col = column<arrow::Int64Array>(*table, 6);

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            uint64_t seq = seq_col->Value(i);
            if (seq <= min_sequence) continue;

            result.push_back(RecyclingRecord{
                ActorId(actor_col->GetString(i)),
                AssetClassId(class_col->GetString(i)),
                UnitId(unit_col->Value(i)),
                Points(points_col->Value(i)),
                static_cast<DisposalMethod>(method_col->Value(i)),
                Timestamp(ts_col->Value(i)),
                seq
            });
        }
    }

    return result;
}

// --- Registry storage ---

void ParquetLedgerRepository::store_class_config(const AssetClassConfig& config) {
    std::lock_guard lock(mutex_);

    auto previous = configs_;
    configs_.insert_or_assign(config.class_id, config);
    try {
        write_class_configs();
    } catch (const std::exception&) {
        configs_ = std::move(previous);
        throw;
    }
}

std::vector<AssetClassConfig> ParquetLedgerRepository::get_class_configs() const {
    std::lock_guard lock(mutex_);

    std::vector<AssetClassConfig> result;
    result.reserve(configs_.size());
    for (const auto& [id, config] : configs_) {
        result.push_back(config);
    }
    return result;
}

void ParquetLedgerRepository::write_class_configs() {
    arrow::StringBuilder class_builder;
    arrow::UInt64Builder rate_builder, recycled_builder;
    arrow::BooleanBuilder active_builder;
    arrow::Int64Builder registered_builder;

    for (const auto& [id, config] : configs_) {
        check(class_builder.Append(config.class_id.value()), "append asset_class");
        check(rate_builder.Append(config.points_per_unit.amount()), "append points_per_unit");
        check(active_builder.Append(config.active), "append active");
        check(recycled_builder.Append(config.total_recycled), "append total_recycled");
        check(registered_builder.Append(config.registered_at.milliseconds()), "append registered_at_ms");
    }

    std::shared_ptr<arrow::Array> arr_class, arr_rate, arr_active, arr_recycled, arr_registered;
    check(class_builder.Finish(&arr_class), "finish asset_class");
    check(rate_builder.Finish(&arr_rate), "finish points_per_unit");
    check(active_builder.Finish(&arr_active), "finish active");
    check(recycled_builder.Finish(&arr_recycled), "finish total_recycled");
    check(registered_builder.Finish(&arr_registered), "finish registered_at_ms");

    auto table = arrow::Table::Make(ParquetSchemas::asset_class_schema(),
        {arr_class, arr_rate, arr_active, arr_recycled, arr_registered});

    std::string registry_file = kRegistryFile;
    check(fs_->CreateDir(registry_file.substr(0, registry_file.rfind('/')), /*recursive=*/true),
          "create registry directory");
    write_table(*fs_, registry_file, *table);
}

std::map<AssetClassId, AssetClassConfig> ParquetLedgerRepository::read_class_configs() const {
    std::map<AssetClassId, AssetClassConfig> result;

    auto file_info = unwrap(fs_->GetFileInfo(kRegistryFile), "stat registry");
    if (file_info.type() == arrow::fs::FileType::NotFound) {
        return result;
    }

    auto table = read_table(*fs_, kRegistryFile);
    if (table->num_rows() == 0) return result;

    auto class_col = column<arrow::StringArray>(*table, 0);
    auto rate_col = column<arrow::UInt64Array>(*table, 1);
    auto active_col = column<arrow::BooleanArray>(*table, 2);
    auto recycled_col = column<arrow::UInt64Array>(*table, 3);
    auto registered_col = column<arrow::Int64Array>(*table, 4);

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        AssetClassId class_id(class_col->GetString(i));
        result.insert_or_assign(class_id, AssetClassConfig{
            class_id,
            Points(rate_col->Value(i)),
            active_col->Value(i),
            recycled_col->Value(i),
            Timestamp(registered_col->Value(i))
        });
    }

    return result;
}

} // namespace rcy::repositories::pq
