#include "services/BatchCoordinator.hpp"

#include <algorithm>

using namespace rcy::domain;

namespace rcy::services {

size_t BatchOutcome::succeeded() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(), [](const auto& r) {
        return std::holds_alternative<BatchItemSuccess>(r);
    }));
}

size_t BatchOutcome::failed() const {
    return results.size() - succeeded();
}

BatchCoordinator::BatchCoordinator(RecycleProcessor& processor, ExchangeGate& gate,
                                   IRecyclingEventSink& events, const IClock& clock)
    : processor_(processor)
    , gate_(gate)
    , events_(events)
    , clock_(clock) {}

BatchOutcome BatchCoordinator::recycle_batch(const ActorId& caller,
                                             const std::vector<AssetClassId>& class_ids,
                                             const std::vector<UnitId>& unit_ids,
                                             const std::vector<bool>& use_destruction) {
    if (class_ids.size() != unit_ids.size() || class_ids.size() != use_destruction.size()) {
        throw ValidationError("batch sequences differ in length: " +
                              std::to_string(class_ids.size()) + " classes, " +
                              std::to_string(unit_ids.size()) + " units, " +
                              std::to_string(use_destruction.size()) + " flags");
    }
    if (class_ids.empty()) {
        throw ValidationError("batch is empty");
    }
    if (class_ids.size() > kMaxBatchSize) {
        throw ValidationError("batch of " + std::to_string(class_ids.size()) +
                              " exceeds the limit of " + std::to_string(kMaxBatchSize));
    }

    gate_.require_not_paused();
    auto scope = gate_.enter("recycle_batch");

    BatchOutcome outcome;
    outcome.results.reserve(class_ids.size());

    for (size_t i = 0; i < class_ids.size(); ++i) {
        auto method = use_destruction[i] ? DisposalMethod::DESTRUCTION
                                         : DisposalMethod::CUSTODIAL_TRANSFER;
        try {
            auto record = processor_.recycle_in_scope(scope, caller, class_ids[i], unit_ids[i], method);
            outcome.total_points += record.points_generated;
            outcome.results.push_back(BatchItemSuccess{std::move(record)});
        } catch (const RecyclingError& e) {
            report_failure(caller, class_ids[i], unit_ids[i], {e.kind(), e.what()}, outcome);
        } catch (const std::exception& e) {
            report_failure(caller, class_ids[i], unit_ids[i],
                           {ErrorKind::OPERATION_FAILED, e.what()}, outcome);
        }
    }

    return outcome;
}

void BatchCoordinator::report_failure(const ActorId& caller, const AssetClassId& class_id,
                                      const UnitId& unit_id, BatchItemFailure failure,
                                      BatchOutcome& outcome) {
    publish_committed(events_, RecyclingFailed{{clock_.now()}, caller, class_id, unit_id,
                                               failure.kind, failure.reason});
    outcome.results.push_back(std::move(failure));
}

} // namespace rcy::services
