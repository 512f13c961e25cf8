#include "support/EngineTest.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace rcy::domain;
using namespace rcy::test_support;

class RecycleProcessorTest : public EngineTest {
protected:
    AssetClassId tickets{"tickets"};
    AssetClassId badges{"badges"};
};

// --- Recycle by destruction ---

TEST_F(RecycleProcessorTest, DestructionRemovesUnitAndRecords) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    clock.set(7000);

    auto record = processor.recycle_by_destruction(alice, tickets, UnitId(1));

    EXPECT_EQ(record.actor, alice);
    EXPECT_EQ(record.asset_class, tickets);
    EXPECT_EQ(record.unit_id, UnitId(1));
    EXPECT_EQ(record.points_generated, Points(100));
    EXPECT_EQ(record.method, DisposalMethod::DESTRUCTION);
    EXPECT_EQ(record.timestamp, Timestamp(7000));
    EXPECT_EQ(record.sequence_number, 1);

    EXPECT_FALSE(collaborator->exists(UnitId(1)));
    EXPECT_EQ(ledger.total_recyclings(), 1);
    EXPECT_EQ(ledger.total_points_generated(), Points(100));
    EXPECT_EQ(registry.get(tickets).total_recycled, 1);
    ASSERT_EQ(repo.record_count(), 1);
    EXPECT_EQ(repo.records()[0], record);

    auto completed = events.of_type<RecyclingCompleted>();
    ASSERT_EQ(completed.size(), 1);
    EXPECT_EQ(completed[0].record, record);
}

TEST_F(RecycleProcessorTest, DestructionNotSupportedIsOperationFailed) {
    auto collaborator = deploy_registered("tickets", 100, false);
    collaborator->mint(UnitId(1), alice);

    try {
        processor.recycle_by_destruction(alice, tickets, UnitId(1));
        FAIL() << "expected OperationFailedError";
    } catch (const OperationFailedError& e) {
        EXPECT_NE(std::string(e.what()).find("custodial transfer"), std::string::npos);
    }

    EXPECT_EQ(collaborator->owner_of(UnitId(1)), alice);
    EXPECT_EQ(ledger.size(), 0);
    EXPECT_EQ(repo.record_count(), 0);
}

TEST_F(RecycleProcessorTest, DestructionThatLeavesUnitIsPostconditionFailure) {
    auto collaborator = deploy_registered<LyingDestroyAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), PostconditionError);

    EXPECT_EQ(ledger.size(), 0);
    EXPECT_EQ(ledger.total_points_generated(), Points::zero());
    EXPECT_EQ(registry.get(tickets).total_recycled, 0);
    EXPECT_TRUE(events.of_type<RecyclingCompleted>().empty());
}

// --- Recycle by custodial transfer ---

TEST_F(RecycleProcessorTest, TransferMovesUnitToCustody) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    auto record = processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_EQ(record.method, DisposalMethod::CUSTODIAL_TRANSFER);
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), custody);
    EXPECT_EQ(ledger.total_points_generated(), Points(100));
}

TEST_F(RecycleProcessorTest, TransferWorksForClassWithoutDestruction) {
    auto collaborator = deploy_registered("tickets", 100, false);
    collaborator->mint(UnitId(1), alice);

    EXPECT_NO_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)));
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), custody);
}

TEST_F(RecycleProcessorTest, RefusedTransferIsOperationFailed) {
    auto collaborator = deploy_registered<RefusingTransferAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    EXPECT_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)), OperationFailedError);
    EXPECT_EQ(ledger.size(), 0);
}

TEST_F(RecycleProcessorTest, UnitCannotBeRecycledTwice) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)), NotOwnerError);
    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), NotOwnerError);
    EXPECT_EQ(ledger.total_recyclings(), 1);
}

TEST_F(RecycleProcessorTest, CustodyCannotRecycleHeldUnits) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_THROW(processor.recycle_by_transfer(custody, tickets, UnitId(1)), ValidationError);
    EXPECT_THROW(processor.recycle_by_destruction(custody, tickets, UnitId(1)), ValidationError);
    EXPECT_EQ(ledger.total_recyclings(), 1);
}

// --- Eligibility failures ---

TEST_F(RecycleProcessorTest, NonOwnerIsRejected) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    try {
        processor.recycle_by_destruction(bob, tickets, UnitId(1));
        FAIL() << "expected NotOwnerError";
    } catch (const NotOwnerError& e) {
        EXPECT_NE(std::string(e.what()).find("not owner"), std::string::npos);
    }
    EXPECT_TRUE(collaborator->exists(UnitId(1)));
}

TEST_F(RecycleProcessorTest, UnregisteredClassIsNotActive) {
    auto collaborator = deploy("tickets");
    collaborator->mint(UnitId(1), alice);

    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), NotActiveError);
}

TEST_F(RecycleProcessorTest, InactiveClassIsRejected) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    registry_service.set_active(admin, tickets, false);

    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), NotActiveError);
    EXPECT_TRUE(collaborator->exists(UnitId(1)));
}

TEST_F(RecycleProcessorTest, MissingUnitIsUnitNotFound) {
    deploy_registered("tickets", 100);
    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(99)), UnitNotFoundError);
}

TEST_F(RecycleProcessorTest, UnboundCollaboratorIsUnitNotFound) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    directory.unbind(tickets);

    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), UnitNotFoundError);
}

// --- Rate semantics ---

TEST_F(RecycleProcessorTest, RateChangeIsNotRetroactive) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->mint(UnitId(2), alice);

    auto first = processor.recycle_by_destruction(alice, tickets, UnitId(1));
    registry_service.update_rate(admin, tickets, Points(40));
    auto second = processor.recycle_by_destruction(alice, tickets, UnitId(2));

    EXPECT_EQ(first.points_generated, Points(100));
    EXPECT_EQ(second.points_generated, Points(40));
    EXPECT_EQ(ledger.at(1)->points_generated, Points(100));
    EXPECT_EQ(ledger.total_points_generated(), Points(140));
}

TEST_F(RecycleProcessorTest, TotalsStayFoldsOfLedger) {
    auto t = deploy_registered("tickets", 100);
    auto b = deploy_registered("badges", 7);
    t->mint(UnitId(1), alice);
    t->mint(UnitId(2), bob);
    b->mint(UnitId(1), alice);

    processor.recycle_by_destruction(alice, tickets, UnitId(1));
    processor.recycle_by_transfer(bob, tickets, UnitId(2));
    processor.recycle_by_transfer(alice, badges, UnitId(1));

    Points sum = Points::zero();
    for (const auto& record : ledger.records()) sum += record.points_generated;
    EXPECT_EQ(sum, ledger.total_points_generated());
    EXPECT_EQ(ledger.total_recyclings(), ledger.records().size());
    EXPECT_EQ(registry.get(tickets).total_recycled, 2);
    EXPECT_EQ(registry.get(badges).total_recycled, 1);
}

TEST_F(RecycleProcessorTest, TotalOverflowIsRejectedBeforeDisposal) {
    AssetClassRegistry big_registry{Points(std::numeric_limits<uint64_t>::max())};
    rcy::services::RegistryService big_registry_service{
        big_registry, repo, directory, authorizer, gate, events, clock};
    rcy::services::RecycleProcessor big_processor{
        big_registry, ledger, repo, directory, authorizer, gate, events, clock, custody};

    auto collaborator = deploy("tickets");
    collaborator->mint(UnitId(1), alice);
    collaborator->mint(UnitId(2), alice);
    big_registry_service.register_class(admin, tickets,
                                        Points(std::numeric_limits<uint64_t>::max()));

    big_processor.recycle_by_destruction(alice, tickets, UnitId(1));
    EXPECT_THROW(big_processor.recycle_by_destruction(alice, tickets, UnitId(2)), ValidationError);

    EXPECT_TRUE(collaborator->exists(UnitId(2)));
    EXPECT_EQ(ledger.total_recyclings(), 1);
}

// --- Persistence ---

TEST_F(RecycleProcessorTest, RepositoryFailureLeavesNoRecord) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    repo.fail_appends = true;

    EXPECT_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)), std::runtime_error);
    EXPECT_EQ(ledger.size(), 0);
    EXPECT_EQ(registry.get(tickets).total_recycled, 0);
    EXPECT_FALSE(gate.exchange_in_progress());
}

TEST_F(RecycleProcessorTest, FailingEventSinkDoesNotUndoExchange) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    events.fail_publishes = true;

    auto record = processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_EQ(record.points_generated, Points(100));
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), custody);
    EXPECT_EQ(ledger.total_recyclings(), 1);
    EXPECT_EQ(repo.record_count(), 1);
    EXPECT_EQ(registry.get(tickets).total_recycled, 1);
    EXPECT_FALSE(gate.exchange_in_progress());
}

TEST_F(RecycleProcessorTest, FailingEventSinkDoesNotUndoPause) {
    events.fail_publishes = true;

    EXPECT_NO_THROW(processor.pause(admin));
    EXPECT_TRUE(processor.paused());
}

// --- Pause ---

TEST_F(RecycleProcessorTest, PauseBlocksExchanges) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    processor.pause(admin);
    EXPECT_TRUE(processor.paused());
    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), PausedError);
    EXPECT_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)), PausedError);
    EXPECT_TRUE(collaborator->exists(UnitId(1)));

    processor.unpause(admin);
    EXPECT_NO_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)));
}

TEST_F(RecycleProcessorTest, PauseDoesNotBlockAdministration) {
    deploy_registered("tickets", 100);
    deploy("badges");
    processor.pause(admin);

    EXPECT_NO_THROW(registry_service.update_rate(admin, tickets, Points(50)));
    EXPECT_NO_THROW(registry_service.register_class(admin, badges, Points(5)));
    EXPECT_NO_THROW(registry_service.deactivate(admin, tickets));
}

TEST_F(RecycleProcessorTest, PauseRequiresAdmin) {
    EXPECT_THROW(processor.pause(alice), AuthorizationError);
    EXPECT_FALSE(processor.paused());

    processor.pause(admin);
    EXPECT_THROW(processor.unpause(alice), AuthorizationError);
    EXPECT_TRUE(processor.paused());
}

TEST_F(RecycleProcessorTest, PauseIsIdempotentAndEmitsOnChangeOnly) {
    processor.pause(admin);
    processor.pause(admin);
    processor.unpause(admin);
    processor.unpause(admin);

    auto changes = events.of_type<PauseStateChanged>();
    ASSERT_EQ(changes.size(), 2);
    EXPECT_TRUE(changes[0].paused);
    EXPECT_EQ(changes[0].changed_by, admin);
    EXPECT_FALSE(changes[1].paused);
}

// --- Emergency rescue ---

TEST_F(RecycleProcessorTest, RescueMovesUnitOutOfCustody) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));

    processor.emergency_rescue(admin, tickets, UnitId(1), bob);

    EXPECT_EQ(collaborator->owner_of(UnitId(1)), bob);
    // Rescue is not an exchange
    EXPECT_EQ(ledger.total_recyclings(), 1);

    auto rescues = events.of_type<EmergencyRescuePerformed>();
    ASSERT_EQ(rescues.size(), 1);
    EXPECT_EQ(rescues[0].recipient, bob);
    EXPECT_EQ(rescues[0].unit_id, UnitId(1));
}

TEST_F(RecycleProcessorTest, RescueWorksWhilePaused) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));
    processor.pause(admin);

    EXPECT_NO_THROW(processor.emergency_rescue(admin, tickets, UnitId(1), bob));
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), bob);
}

TEST_F(RecycleProcessorTest, RescueWorksForDeactivatedClass) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));
    registry_service.deactivate(admin, tickets);

    EXPECT_NO_THROW(processor.emergency_rescue(admin, tickets, UnitId(1), bob));
}

TEST_F(RecycleProcessorTest, RescueRequiresAdmin) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_THROW(processor.emergency_rescue(bob, tickets, UnitId(1), bob), AuthorizationError);
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), custody);
}

TEST_F(RecycleProcessorTest, RescueOfUnitNotInCustodyFails) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    EXPECT_THROW(processor.emergency_rescue(admin, tickets, UnitId(1), bob), NotOwnerError);
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), alice);
}

TEST_F(RecycleProcessorTest, RescueToCustodyIsRejected) {
    auto collaborator = deploy_registered("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_THROW(processor.emergency_rescue(admin, tickets, UnitId(1), custody), ValidationError);
}

TEST_F(RecycleProcessorTest, FailedRescueTransferIsOperationFailed) {
    auto collaborator = deploy_registered<RefusingTransferAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), custody);

    EXPECT_THROW(processor.emergency_rescue(admin, tickets, UnitId(1), bob), OperationFailedError);
    EXPECT_TRUE(events.of_type<EmergencyRescuePerformed>().empty());
}

// --- Reentrancy ---

TEST_F(RecycleProcessorTest, CollaboratorCannotReenterRecycle) {
    auto collaborator = deploy_registered<ReentrantAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->mint(UnitId(2), alice);
    collaborator->hook = [&] { processor.recycle_by_destruction(alice, tickets, UnitId(2)); };

    processor.recycle_by_destruction(alice, tickets, UnitId(1));

    ASSERT_TRUE(collaborator->hook_error.has_value());
    EXPECT_EQ(*collaborator->hook_error, ErrorKind::REENTRANCY);
    EXPECT_EQ(ledger.total_recyclings(), 1);
    EXPECT_TRUE(collaborator->exists(UnitId(2)));
}

TEST_F(RecycleProcessorTest, CollaboratorCannotChangeRateMidExchange) {
    auto collaborator = deploy_registered<ReentrantAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->hook = [&] { registry_service.update_rate(admin, tickets, Points(9999)); };

    auto record = processor.recycle_by_transfer(alice, tickets, UnitId(1));

    ASSERT_TRUE(collaborator->hook_error.has_value());
    EXPECT_EQ(*collaborator->hook_error, ErrorKind::REENTRANCY);
    EXPECT_EQ(record.points_generated, Points(100));
    EXPECT_EQ(registry.get(tickets).points_per_unit, Points(100));
}

TEST_F(RecycleProcessorTest, CollaboratorCannotPauseMidExchange) {
    auto collaborator = deploy_registered<ReentrantAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->hook = [&] { processor.pause(admin); };

    processor.recycle_by_destruction(alice, tickets, UnitId(1));

    ASSERT_TRUE(collaborator->hook_error.has_value());
    EXPECT_EQ(*collaborator->hook_error, ErrorKind::REENTRANCY);
    EXPECT_FALSE(processor.paused());
}

TEST_F(RecycleProcessorTest, GuardsAreReleasedAfterFailure) {
    auto collaborator = deploy_registered<LyingDestroyAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);

    EXPECT_THROW(processor.recycle_by_destruction(alice, tickets, UnitId(1)), PostconditionError);
    EXPECT_FALSE(gate.exchange_in_progress());
    EXPECT_FALSE(gate.external_call_in_progress());
    EXPECT_NO_THROW(processor.recycle_by_transfer(alice, tickets, UnitId(1)));
}

TEST_F(RecycleProcessorTest, OwnershipQueryCannotChangeRate) {
    auto collaborator = deploy_registered<QueryHookAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->hook = [&] { registry_service.update_rate(admin, tickets, Points(10000)); };

    auto record = processor.recycle_by_transfer(alice, tickets, UnitId(1));

    EXPECT_EQ(collaborator->hook_calls, 1);
    EXPECT_EQ(collaborator->hook_errors, std::vector<ErrorKind>{ErrorKind::REENTRANCY});
    EXPECT_EQ(record.points_generated, Points(100));
    EXPECT_EQ(registry.get(tickets).points_per_unit, Points(100));
}

TEST_F(RecycleProcessorTest, OwnershipQueryCannotDeactivateClass) {
    auto collaborator = deploy_registered<QueryHookAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), alice);
    collaborator->hook = [&] { registry_service.deactivate(admin, tickets); };

    processor.recycle_by_destruction(alice, tickets, UnitId(1));

    // Eligibility check and the post-destruction check both query the owner
    EXPECT_EQ(collaborator->hook_calls, 2);
    EXPECT_EQ(collaborator->hook_errors,
              (std::vector<ErrorKind>{ErrorKind::REENTRANCY, ErrorKind::REENTRANCY}));
    EXPECT_TRUE(registry.is_accepted(tickets));
    EXPECT_EQ(ledger.total_recyclings(), 1);
    EXPECT_FALSE(gate.external_call_in_progress());
}

TEST_F(RecycleProcessorTest, RescueOwnershipQueryCannotChangeRegistry) {
    auto collaborator = deploy_registered<QueryHookAssetClass>("tickets", 100);
    collaborator->mint(UnitId(1), custody);
    collaborator->hook = [&] { registry_service.set_active(admin, tickets, false); };

    processor.emergency_rescue(admin, tickets, UnitId(1), bob);

    EXPECT_EQ(collaborator->hook_errors, std::vector<ErrorKind>{ErrorKind::REENTRANCY});
    EXPECT_TRUE(registry.is_accepted(tickets));
    collaborator->hook = nullptr;
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), bob);
}
