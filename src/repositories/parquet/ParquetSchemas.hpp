#pragma once

#include <arrow/api.h>

namespace rcy::repositories::pq {

class ParquetSchemas {
public:
    // Ledger record files
    static std::shared_ptr<arrow::Schema> recycling_record_schema();

    // Registry file (one row per asset class)
    static std::shared_ptr<arrow::Schema> asset_class_schema();
};

} // namespace rcy::repositories::pq
