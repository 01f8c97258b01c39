// ============================================================================
// DIAGNOSTIC SINK UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/diagnostics/buffered_diagnostic_sink.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace TickGovernor;

// ============================================================================
// BUFFERED SINK
// ============================================================================

TEST(BufferedDiagnosticSinkTest, StoresNewestFirst) {
    BufferedDiagnosticSink sink;
    sink.report("BudgetTracker", "first", Severity::INFO);
    sink.report("EventCoalescer", "second", Severity::WARNING);

    auto recent = sink.getRecent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "second");
    EXPECT_EQ(recent[0].sequence, 2u);
    EXPECT_EQ(recent[1].component, "BudgetTracker");
}

TEST(BufferedDiagnosticSinkTest, DropsOldestAtCapacity) {
    BufferedDiagnosticSink sink(2);
    sink.report("A", "1", Severity::INFO);
    sink.report("A", "2", Severity::INFO);
    sink.report("A", "3", Severity::INFO);

    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(sink.totalAccepted(), 3u);
    EXPECT_EQ(sink.getRecent(5).back().message, "2");
}

TEST(BufferedDiagnosticSinkTest, SeverityAndComponentFilters) {
    BufferedDiagnosticSink sink(100, Severity::WARNING);
    sink.report("A", "ignored", Severity::INFO);
    sink.report("A", "kept", Severity::ERROR);
    EXPECT_EQ(sink.totalAccepted(), 1u);
    EXPECT_EQ(sink.countFor(Severity::ERROR), 1u);
    EXPECT_EQ(sink.countFor(Severity::INFO), 0u);

    sink.setComponentFilter({"BatchScheduler"});
    sink.report("A", "filtered", Severity::ERROR);
    sink.report("BatchScheduler", "kept", Severity::WARNING);
    EXPECT_EQ(sink.countComponent("BatchScheduler"), 1u);
    EXPECT_EQ(sink.totalAccepted(), 2u);

    sink.setMinSeverity(Severity::DEBUG);
    sink.report("BatchScheduler", "debug", Severity::DEBUG);
    EXPECT_EQ(sink.countFor(Severity::DEBUG), 1u);
}

TEST(BufferedDiagnosticSinkTest, ClearKeepsTotals) {
    BufferedDiagnosticSink sink;
    sink.report("A", "x", Severity::WARNING);
    sink.clear();

    EXPECT_EQ(sink.size(), 0u);
    EXPECT_EQ(sink.totalAccepted(), 1u);
    EXPECT_EQ(sink.countFor(Severity::WARNING), 1u);
}

// ============================================================================
// CALLBACK & COMPOSITE SINKS
// ============================================================================

TEST(CompositeDiagnosticSinkTest, FansOutAndIsolatesFailures) {
    auto buffered = std::make_shared<BufferedDiagnosticSink>();
    auto throwing = std::make_shared<CallbackDiagnosticSink>(
        [](const std::string&, const std::string&, Severity) { throw std::runtime_error("sink down"); },
        "ThrowingSink");
    std::string seen;
    auto callback = std::make_shared<CallbackDiagnosticSink>(
        [&seen](const std::string& component, const std::string& message, Severity) {
            seen = component + ": " + message;
        });

    CompositeDiagnosticSink composite;
    composite.addSink(buffered);
    composite.addSink(throwing);
    composite.addSink(callback);
    composite.addSink(nullptr);
    EXPECT_EQ(composite.size(), 3u);

    EXPECT_NO_THROW(composite.report("EventBus", "handler failed", Severity::ERROR));
    EXPECT_EQ(buffered->countFor(Severity::ERROR), 1u);
    EXPECT_EQ(seen, "EventBus: handler failed");
}

TEST(DiagnosticSinkTest, SeverityNames) {
    EXPECT_EQ(std::string(severityString(Severity::WARNING)), "WARNING");
    EXPECT_EQ(std::string(severityString(Severity::ERROR)), "ERROR");

    NullDiagnosticSink null_sink;
    EXPECT_NO_THROW(null_sink.report("A", "dropped", Severity::ERROR));
    EXPECT_EQ(std::string(null_sink.name()), "NullDiagnosticSink");
}
