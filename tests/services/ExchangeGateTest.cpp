#include "services/ExchangeGate.hpp"

#include "domain/errors/RecyclingError.hpp"

#include <gtest/gtest.h>

using namespace rcy::domain;
using rcy::services::ExchangeGate;

TEST(ExchangeGate, StartsIdleAndUnpaused) {
    ExchangeGate gate;
    EXPECT_FALSE(gate.paused());
    EXPECT_FALSE(gate.exchange_in_progress());
    EXPECT_FALSE(gate.external_call_in_progress());
}

TEST(ExchangeGate, ScopeIsReleasedOnDestruction) {
    ExchangeGate gate;
    {
        auto scope = gate.enter("recycle");
        EXPECT_TRUE(gate.exchange_in_progress());
    }
    EXPECT_FALSE(gate.exchange_in_progress());
}

TEST(ExchangeGate, NestedScopeIsRejected) {
    ExchangeGate gate;
    auto scope = gate.enter("recycle_batch");
    EXPECT_THROW((void)gate.enter("recycle"), ReentrancyError);
    EXPECT_TRUE(gate.exchange_in_progress());
}

TEST(ExchangeGate, ScopeIsReleasedWhenBodyThrows) {
    ExchangeGate gate;
    try {
        auto scope = gate.enter("recycle");
        throw std::runtime_error("collaborator failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(gate.exchange_in_progress());
    EXPECT_NO_THROW((void)gate.enter("recycle"));
}

TEST(ExchangeGate, ExternalCallBlocksAdminMutations) {
    ExchangeGate gate;
    {
        auto call = gate.begin_external_call("recycle");
        EXPECT_THROW(gate.require_no_external_call("update_rate"), ReentrancyError);
        EXPECT_THROW((void)gate.begin_external_call("recycle"), ReentrancyError);
    }
    EXPECT_NO_THROW(gate.require_no_external_call("update_rate"));
}

TEST(ExchangeGate, PauseAndUnpauseReportChanges) {
    ExchangeGate gate;
    EXPECT_TRUE(gate.pause());
    EXPECT_FALSE(gate.pause());
    EXPECT_TRUE(gate.paused());
    EXPECT_THROW(gate.require_not_paused(), PausedError);

    EXPECT_TRUE(gate.unpause());
    EXPECT_FALSE(gate.unpause());
    EXPECT_NO_THROW(gate.require_not_paused());
}
