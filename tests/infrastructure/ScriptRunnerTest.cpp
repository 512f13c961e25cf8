#include "infrastructure/ScriptRunner.hpp"

#include "support/EngineTest.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace rcy::domain;
using namespace rcy::test_support;
using rcy::infrastructure::ScriptRunner;

class ScriptRunnerTest : public EngineTest {
protected:
    std::ostringstream out;
    ScriptRunner runner{directory, registry_service, processor, batches, queries, out};

    rcy::infrastructure::ScriptSummary run(const std::string& script) {
        std::istringstream in(script);
        return runner.run(in);
    }
};

TEST_F(ScriptRunnerTest, RunsEndToEndScenario) {
    auto summary = run(R"(# set up two classes
{"command": "deploy_class", "class": "tickets"}
{"command": "deploy_class", "class": "badges", "destructible": false}
{"command": "mint", "class": "tickets", "unit": 1, "owner": "alice"}
{"command": "mint", "class": "tickets", "unit": 2, "owner": "bob"}
{"command": "mint", "class": "badges", "unit": 1, "owner": "alice"}
{"command": "register", "caller": "admin", "class": "tickets", "points": 100}
{"command": "register", "caller": "admin", "class": "badges", "points": 5}

{"command": "recycle", "caller": "alice", "class": "tickets", "unit": 1}
{"command": "recycle_batch", "caller": "alice", "items": [{"class": "badges", "unit": 1, "destroy": false}, {"class": "tickets", "unit": 2}]}
{"command": "stats"}
)");

    EXPECT_EQ(summary.executed, 10);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_EQ(ledger.total_recyclings(), 2);
    EXPECT_EQ(ledger.total_points_generated(), Points(105));

    auto output = out.str();
    EXPECT_NE(output.find("[script] 11 ok {\"failed\":1,\"succeeded\":1,\"total_points\":5}"),
              std::string::npos);
    EXPECT_NE(output.find("\"total_recyclings\":2"), std::string::npos);
}

TEST_F(ScriptRunnerTest, FailingCommandIsReportedAndScriptContinues) {
    auto summary = run(R"({"command": "deploy_class", "class": "tickets"}
{"command": "register", "caller": "mallory", "class": "tickets", "points": 100}
{"command": "register", "caller": "admin", "class": "tickets", "points": 100}
)");

    EXPECT_EQ(summary.executed, 3);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_NE(out.str().find("[script] 2 error not authorized: mallory may not perform register"),
              std::string::npos);
    EXPECT_TRUE(registry.is_accepted(AssetClassId("tickets")));
}

TEST_F(ScriptRunnerTest, ParseErrorsCountAsFailures) {
    auto summary = run("{bad json\n{\"command\": \"stats\"}\n");

    EXPECT_EQ(summary.executed, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_NE(out.str().find("[script] 1 error"), std::string::npos);
}

TEST_F(ScriptRunnerTest, PauseRescueAndHistory) {
    run(R"({"command": "deploy_class", "class": "tickets"}
{"command": "mint", "class": "tickets", "unit": 1, "owner": "alice"}
{"command": "register", "caller": "admin", "class": "tickets", "points": 100}
{"command": "recycle", "caller": "alice", "class": "tickets", "unit": 1, "destroy": false}
{"command": "pause", "caller": "admin"}
{"command": "rescue", "caller": "admin", "class": "tickets", "unit": 1, "to": "alice"}
)");

    EXPECT_TRUE(processor.paused());
    auto collaborator = directory.resolve(AssetClassId("tickets"));
    EXPECT_EQ(collaborator->owner_of(UnitId(1)), alice);

    auto history = runner.execute(rcy::infrastructure::HistoryCommand{"alice", std::nullopt});
    ASSERT_TRUE(history.is_array());
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0]["method"], "custodial_transfer");
}

TEST_F(ScriptRunnerTest, MintIntoUnknownClassFails) {
    EXPECT_THROW(runner.execute(rcy::infrastructure::MintCommand{"nope", 1, "alice"}),
                 std::invalid_argument);
}

TEST_F(ScriptRunnerTest, HistoryNeedsAFilter) {
    EXPECT_THROW(runner.execute(rcy::infrastructure::HistoryCommand{}), std::invalid_argument);
}

TEST_F(ScriptRunnerTest, CanRecycleReportsEligibility) {
    run(R"({"command": "deploy_class", "class": "tickets"}
{"command": "mint", "class": "tickets", "unit": 1, "owner": "alice"}
{"command": "register", "caller": "admin", "class": "tickets", "points": 100}
)");

    auto yes = runner.execute(rcy::infrastructure::CanRecycleCommand{"alice", "tickets", 1});
    EXPECT_EQ(yes["eligible"], true);

    auto no = runner.execute(rcy::infrastructure::CanRecycleCommand{"bob", "tickets", 1});
    EXPECT_EQ(no["eligible"], false);
}
