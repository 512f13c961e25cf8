#pragma once

#include "domain/errors/RecyclingError.hpp"
#include "services/RecycleProcessor.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace rcy::services {

struct BatchItemSuccess {
    rcy::domain::RecyclingRecord record;
};

struct BatchItemFailure {
    rcy::domain::ErrorKind kind;
    std::string reason;
};

using BatchItemResult = std::variant<BatchItemSuccess, BatchItemFailure>;

struct BatchOutcome {
    rcy::domain::Points total_points{0};
    std::vector<BatchItemResult> results;   // One per input item, in input order

    size_t succeeded() const;
    size_t failed() const;
};

// Runs up to kMaxBatchSize exchanges in one call. Items are processed in
// input order; a failing item is reported and skipped, never unwinding
// earlier items or stopping later ones.
class BatchCoordinator {
public:
    static constexpr size_t kMaxBatchSize = 50;

    BatchCoordinator(RecycleProcessor& processor, ExchangeGate& gate,
                     IRecyclingEventSink& events, const IClock& clock);

    BatchOutcome recycle_batch(const rcy::domain::ActorId& caller,
                               const std::vector<rcy::domain::AssetClassId>& class_ids,
                               const std::vector<rcy::domain::UnitId>& unit_ids,
                               const std::vector<bool>& use_destruction);

private:
    void report_failure(const rcy::domain::ActorId& caller,
                        const rcy::domain::AssetClassId& class_id,
                        const rcy::domain::UnitId& unit_id,
                        BatchItemFailure failure, BatchOutcome& outcome);

    RecycleProcessor& processor_;
    ExchangeGate& gate_;
    IRecyclingEventSink& events_;
    const IClock& clock_;
};

} // namespace rcy::services
