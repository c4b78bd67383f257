#include <gtest/gtest.h>

#include "core/recon_config.hpp"
#include "core/recon_engine.hpp"
#include "tests/harness/scenario_builder.hpp"
#include "tests/harness/scenario_runner.hpp"

using namespace test;
using core::MatchStrategy;
using core::OutcomeKind;

// ===== Scenario A: PO match, quantities agree =====
TEST(ReconEngine, PoMatchOk) {
    auto scenario = ReconScenarioBuilder()
        .supply_po("100", "50")
        .demand_po("100", "50");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok()) << result.run.message;
    EXPECT_EQ(result.kind(0), OutcomeKind::Ok);
    EXPECT_EQ(result.strategy(0), MatchStrategy::PoOnly);
    EXPECT_EQ(core::status_text(result.record(0).outcome), "Ok (PO Match)");
}

// ===== Scenario B: job last-4 agrees, more available than requested =====
// A Job+PO key always carries the PO, so the PO-only pass reaches this record
// first; the classification is the same either way.
TEST(ReconEngine, JobLast4ScenarioLessShipment) {
    auto scenario = ReconScenarioBuilder()
        .supply("J0001", "200", "", "", "80")
        .demand("X0001", "200", "", "", "50");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok()) << result.run.message;
    EXPECT_EQ(result.kind(0), OutcomeKind::LessShipment);
    EXPECT_EQ(result.strategy(0), MatchStrategy::PoOnly);
    EXPECT_EQ(core::status_text(result.record(0).outcome), "Less Shipment (PO Match: 80 vs 50)");
    EXPECT_EQ(result.run.counters.rejected_overwrites, 0u);
}

// ===== Scenario C: Style+Color fallback, less available than requested =====
TEST(ReconEngine, StyleColorOverShipment) {
    auto scenario = ReconScenarioBuilder()
        .supply("J1111", "P1", "S1", "Red", "10")
        .demand("J2222", "P2", "S1", "Red", "30");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok()) << result.run.message;
    EXPECT_EQ(result.kind(0), OutcomeKind::OverShipment);
    EXPECT_EQ(result.strategy(0), MatchStrategy::StyleColor);
    EXPECT_EQ(core::status_text(result.record(0).outcome), "Over Shipment (Style+Color: 10 vs 30)");
}

// ===== Scenario D: nothing matches =====
TEST(ReconEngine, NoMatchFound) {
    auto scenario = ReconScenarioBuilder()
        .supply("J1111", "P1", "S1", "Red", "10")
        .demand("J2222", "P2", "S2", "Blue", "30");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok());
    EXPECT_EQ(result.kind(0), OutcomeKind::NoMatchFound);
    EXPECT_EQ(result.strategy(0), MatchStrategy::None);
    EXPECT_EQ(result.run.summary.count(OutcomeKind::NoMatchFound), 1u);
}

// ===== Scenario E: buyer-specific requested without a buyer column =====
TEST(ReconEngine, BuyerModeFallsBackToStandard) {
    auto config = core::default_recon_config();
    config.buyer_specific = true;
    config.flagged_buyers = {"ACME"};

    auto scenario = ReconScenarioBuilder()
        .supply_po("100", "50")
        .demand_po("100", "50")
        .demand_po("999", "1");

    auto result = run_scenario(scenario, config);

    ASSERT_TRUE(result.run.ok());
    EXPECT_TRUE(result.run.counters.buyer_mode_disabled);
    EXPECT_EQ(result.sink.notes.size(), 1u);
    EXPECT_EQ(result.strategy(0), MatchStrategy::PoOnly);
    EXPECT_EQ(result.kind(1), OutcomeKind::NoMatchFound);
    EXPECT_EQ(result.run.summary.count(OutcomeKind::NoMatchBuyer), 0u);
}

// Absent key -> NoMatchFound; present key with only blank/zero supply -> NoShipment.
TEST(ReconEngine, AbsentAndZeroAreNotConflated) {
    auto scenario = ReconScenarioBuilder()
        .supply_po("BLANK", "")
        .supply_po("BLANK", "")
        .supply_po("ZERO", "0")
        .supply_po("JUNK", "n/a")
        .demand_po("BLANK", "10")
        .demand_po("ZERO", "10")
        .demand_po("JUNK", "10")
        .demand_po("MISSING", "10");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok());
    EXPECT_EQ(result.kind(0), OutcomeKind::NoShipment);
    EXPECT_EQ(result.kind(1), OutcomeKind::NoShipment);
    EXPECT_EQ(result.kind(2), OutcomeKind::NoShipment);
    EXPECT_EQ(result.strategy(0), MatchStrategy::PoOnly);
    EXPECT_EQ(core::status_text(result.record(0).outcome), "No Shipment (PO Match)");
    EXPECT_EQ(result.kind(3), OutcomeKind::NoMatchFound);
}

TEST(ReconEngine, AggregatesAcrossRowsIncludingBlanks) {
    auto scenario = ReconScenarioBuilder()
        .supply_po("100", "20")
        .supply_po("100", "")
        .supply_po("100", "30")
        .demand_po("100", "50");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok());
    EXPECT_EQ(result.kind(0), OutcomeKind::Ok);
    ASSERT_TRUE(result.record(0).outcome.available.has_value());
    EXPECT_DOUBLE_EQ(*result.record(0).outcome.available, 50.0);
}

TEST(ReconEngine, KeysAreCaseAndWhitespaceInsensitive) {
    auto scenario = ReconScenarioBuilder()
        .supply(" j0001 ", " po-7 ", "s1", "red", "12")
        .demand("J0001", "PO-7", " S1", "RED ", "12");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok());
    EXPECT_EQ(result.kind(0), OutcomeKind::Ok);
    EXPECT_EQ(result.strategy(0), MatchStrategy::PoOnly);
}

TEST(ReconEngine, MissingColumnsIsFatalAndProducesNothing) {
    core::Table source;
    source.headers = {"Job No", "PO Number"};
    source.rows = {{"J1", "1"}};
    core::Table target;
    target.headers = {"Job No", "PO Number", "Style Ref No", "Color"};
    target.rows = {{"J1", "1", "S", "C"}};

    RecordingProgressSink sink;
    const auto run = core::run_recon(source, target, core::default_recon_config(), sink);

    EXPECT_FALSE(run.ok());
    EXPECT_EQ(run.error, core::ReconError::MissingColumns);
    EXPECT_NE(run.message.find("Missing columns in source: exfactoryqty, stylerefno, color"), std::string::npos);
    EXPECT_NE(run.message.find("Missing columns in target: shipqty"), std::string::npos);
    EXPECT_TRUE(run.demand.records.empty());
    EXPECT_EQ(run.summary.total, 0u);
    EXPECT_TRUE(sink.passes.empty());
}

TEST(ReconEngine, LabelCountsSumToBatchSize) {
    auto scenario = ReconScenarioBuilder()
        .supply("J0001", "100", "S1", "RED", "50")
        .supply("J0002", "200", "S2", "BLUE", "")
        .supply("J0003", "300", "S3", "GREEN", "5")
        .demand("J0001", "100", "S1", "RED", "50")
        .demand("J0002", "200", "S2", "BLUE", "10")
        .demand("J0003", "300", "S3", "GREEN", "9")
        .demand("J0004", "400", "S3", "GREEN", "1")
        .demand("J0005", "500", "S9", "PINK", "1")
        .demand("", "", "", "", "");

    auto result = run_scenario(scenario);

    ASSERT_TRUE(result.run.ok());
    const auto& s = result.run.summary;
    EXPECT_EQ(s.total, scenario.demand_count());
    EXPECT_TRUE(s.consistent());
    EXPECT_EQ(s.count(OutcomeKind::Ok), 1u);
    EXPECT_EQ(s.count(OutcomeKind::NoShipment), 1u);
    EXPECT_EQ(s.count(OutcomeKind::OverShipment), 1u);
    EXPECT_EQ(s.count(OutcomeKind::LessShipment), 1u);
    EXPECT_EQ(s.count(OutcomeKind::NoMatchFound), 2u);
    EXPECT_EQ(s.count(MatchStrategy::PoOnly), 3u);
    EXPECT_EQ(s.count(MatchStrategy::StyleColor), 1u);
}

TEST(ReconEngine, RepeatedRunsAreIdentical) {
    auto config = core::default_recon_config();
    config.buyer_specific = true;
    config.flagged_buyers = {"ACME"};

    auto scenario = ReconScenarioBuilder()
        .with_buyer_column()
        .supply("J0001", "100", "S1", "RED", "50")
        .supply("J0002", "200", "S2", "BLUE", "7")
        .demand("J0001", "100", "S1", "RED", "40", "ACME")
        .demand("J0002", "200", "S2", "BLUE", "7", "")
        .demand("J0009", "900", "S1", "RED", "1", "other");

    const auto first = run_scenario(scenario, config);
    const auto second = run_scenario(scenario, config);

    ASSERT_TRUE(first.run.ok());
    ASSERT_TRUE(second.run.ok());
    EXPECT_EQ(first.run.summary, second.run.summary);
    ASSERT_EQ(first.run.demand.records.size(), second.run.demand.records.size());
    for (std::size_t i = 0; i < first.run.demand.records.size(); ++i) {
        const auto& a = first.record(i).outcome;
        const auto& b = second.record(i).outcome;
        EXPECT_EQ(a.kind, b.kind);
        EXPECT_EQ(a.strategy, b.strategy);
        EXPECT_EQ(a.available, b.available);
        EXPECT_EQ(a.requested, b.requested);
    }
}
