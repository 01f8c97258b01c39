// ============================================================================
// GOVERNOR UNIT TESTS
// ============================================================================
// Tick orchestration, mode transitions, presets and enable switch
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/governor/governor.hpp>
#include <tickgovernor/core/diagnostics/buffered_diagnostic_sink.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace TickGovernor;

namespace {

class CountingSink : public DispatchSink {
public:
    void dispatch(const std::string& event_name, const EventArgs&) override {
        names.push_back(event_name);
    }
    std::vector<std::string> names;
};

class CountingTarget : public UpdateTarget {
public:
    void update() override { ++updates; }
    int updates = 0;
};

AppConfig::AppConfiguration testConfig() {
    AppConfig::AppConfiguration config;
    config.app_name = "GovernorTest";
    config.version = "1.0.0";
    config.coalescer.events.push_back({"UNIT_HEALTH", 50.0, CoalescerPriority::HIGH});
    config.coalescer.events.push_back({"PLAYER_TARGET_CHANGED", 0.0, CoalescerPriority::CRITICAL});
    return config;
}

} // namespace

class GovernorTest : public ::testing::Test {
protected:
    void loadBudget() {
        for (int i = 0; i < 30; ++i) governor.budget().recordCycle(20.0);
    }

    ManualClock clock;
    BufferedDiagnosticSink diagnostics;
    CountingSink sink;
    Governor governor{testConfig(), clock, diagnostics, sink};
};

// ============================================================================
// CONSTRUCTION
// ============================================================================

TEST_F(GovernorTest, RegistersConfiguredEvents) {
    EXPECT_EQ(governor.coalescer().getCoalescedEvents(),
              (std::vector<std::string>{"PLAYER_TARGET_CHANGED", "UNIT_HEALTH"}));
    EXPECT_DOUBLE_EQ(governor.coalescer().getEventDelay("UNIT_HEALTH"), 50.0);
}

TEST_F(GovernorTest, SubsystemsFollowConfiguration) {
    EXPECT_DOUBLE_EQ(governor.budget().getTargetCycleTime(), 16.67);
    EXPECT_EQ(governor.scheduler().getBatchSize(), 10u);
    EXPECT_DOUBLE_EQ(governor.coalescer().getCoalesceInterval(CoalescerPriority::HIGH), 15.0);
    EXPECT_DOUBLE_EQ(governor.coalescer().getCoalesceInterval(CoalescerPriority::CRITICAL), 0.0);
    EXPECT_EQ(governor.currentPreset(), "Medium");
    EXPECT_EQ(governor.getMode(), GovernorMode::NORMAL);
}

// ============================================================================
// TICK
// ============================================================================

TEST_F(GovernorTest, FirstMeasuredTickOnlyPrimes) {
    EXPECT_FALSE(governor.tick());
    EXPECT_EQ(governor.budget().getStatistics().cycles_recorded, 0u);

    clock.advanceMs(16.0);
    EXPECT_TRUE(governor.tick());

    auto stats = governor.budget().getStatistics();
    EXPECT_EQ(stats.cycles_recorded, 1u);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 16.0);
    EXPECT_EQ(governor.tickCount(), 1u);
}

TEST_F(GovernorTest, TickDrivesSchedulerAndCoalescer) {
    auto target = std::make_shared<CountingTarget>();
    governor.scheduler().markPending(target);
    governor.coalescer().submit("COMBAT_LOG", EventArgs{int64_t{1}});

    governor.tick(5.0);

    EXPECT_EQ(target->updates, 1);
    EXPECT_EQ(sink.names, (std::vector<std::string>{"COMBAT_LOG"}));
    EXPECT_FALSE(governor.scheduler().isActive());
}

// ============================================================================
// MODE
// ============================================================================

TEST_F(GovernorTest, ModeTransitionFlushesPendingWork) {
    loadBudget();

    int health_updates = 0;
    governor.coalescer().registerCoalesced("UNIT_AURA", 50.0, makeEventHandler(
        [&health_updates](const std::string&, const EventArgs&) { ++health_updates; }),
        CoalescerPriority::LOW);
    governor.coalescer().submit("UNIT_AURA");  // Postponed by the budget

    auto target = std::make_shared<CountingTarget>();
    governor.scheduler().markPending(target, SchedulerPriority::LOW);
    governor.scheduler().runCycle();           // LOW is not affordable
    ASSERT_EQ(target->updates, 0);
    ASSERT_EQ(health_updates, 0);

    EXPECT_TRUE(governor.setMode(GovernorMode::CRITICAL));
    EXPECT_EQ(governor.getMode(), GovernorMode::CRITICAL);
    EXPECT_EQ(health_updates, 1);
    EXPECT_EQ(target->updates, 1);
    EXPECT_EQ(governor.coalescer().pendingCount(), 0u);

    EXPECT_EQ(diagnostics.countFor(Severity::INFO), 1u);
    auto recent = diagnostics.getRecent(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].component, "Governor");
}

TEST_F(GovernorTest, SameModeIsNoop) {
    EXPECT_FALSE(governor.setMode(GovernorMode::NORMAL));
    EXPECT_EQ(diagnostics.totalAccepted(), 0u);
}

// ============================================================================
// PRESETS & ENABLE
// ============================================================================

TEST_F(GovernorTest, ApplyPresetRetunesSubsystems) {
    EXPECT_EQ(governor.applyPreset("High"), "High");

    EXPECT_DOUBLE_EQ(governor.budget().getTargetCycleTime(), 14.0);
    EXPECT_EQ(governor.scheduler().getBatchSize(), 20u);
    EXPECT_DOUBLE_EQ(governor.coalescer().getCoalesceInterval(CoalescerPriority::HIGH), 10.0);
    EXPECT_DOUBLE_EQ(governor.coalescer().getCoalesceInterval(CoalescerPriority::MEDIUM), 20.0);
    EXPECT_DOUBLE_EQ(governor.coalescer().getCoalesceInterval(CoalescerPriority::LOW), 30.0);
    EXPECT_EQ(governor.currentPreset(), "High");
}

TEST_F(GovernorTest, UnknownPresetAppliesMedium) {
    governor.applyPreset("Ultra");
    EXPECT_EQ(governor.applyPreset("Cinematic"), "Medium");
    EXPECT_EQ(governor.scheduler().getBatchSize(), 10u);
    EXPECT_DOUBLE_EQ(governor.budget().getTargetCycleTime(), 16.67);
}

TEST_F(GovernorTest, DisableSwitchesBothSubsystems) {
    governor.setEnabled(false);
    EXPECT_FALSE(governor.isEnabled());
    EXPECT_FALSE(governor.scheduler().isEnabled());
    EXPECT_FALSE(governor.coalescer().isEnabled());

    governor.coalescer().submit("UNIT_HEALTH");
    EXPECT_EQ(sink.names, (std::vector<std::string>{"UNIT_HEALTH"}));
    EXPECT_FALSE(governor.scheduler().markPending(std::make_shared<CountingTarget>()));

    governor.setEnabled(true);
    EXPECT_TRUE(governor.scheduler().isEnabled());
    EXPECT_TRUE(governor.coalescer().isEnabled());
}

// ============================================================================
// ANALYSIS
// ============================================================================

TEST_F(GovernorTest, AnalyzeReflectsLiveStatistics) {
    for (int i = 0; i < 30; ++i) governor.tick(25.0);

    auto report = governor.analyze(AnalysisScope::FRAME);
    EXPECT_EQ(report.scope, AnalysisScope::FRAME);
    EXPECT_EQ(report.health, HealthLevel::DEGRADED);
    EXPECT_NO_THROW(governor.logReport());
}
