#include "repositories/parquet/ParquetSchemas.hpp"

namespace rcy::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::recycling_record_schema() {
    return arrow::schema({
        arrow::field("sequence_number", arrow::uint64()),
        arrow::field("actor", arrow::utf8()),
        arrow::field("asset_class", arrow::utf8()),
        arrow::field("unit_id", arrow::uint64()),
        arrow::field("points_generated", arrow::uint64()),
        arrow::field("method", arrow::uint8()),
        arrow::field("timestamp_ms", arrow::int64()),
    });
}

std::shared_ptr<arrow::Schema> ParquetSchemas::asset_class_schema() {
    return arrow::schema({
        arrow::field("asset_class", arrow::utf8()),
        arrow::field("points_per_unit", arrow::uint64()),
        arrow::field("active", arrow::boolean()),
        arrow::field("total_recycled", arrow::uint64()),
        arrow::field("registered_at_ms", arrow::int64()),
    });
}

} // namespace rcy::repositories::pq
