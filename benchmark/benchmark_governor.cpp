// ============================================================================
// GOVERNOR HOT-PATH BENCHMARK
// ============================================================================
// Measures the per-call cost of the three per-cycle paths:
//   recordCycle(), markPending()+runCycle(), submit()+tick()
// Usage: ./benchmark_governor [iterations]

#include <iostream>
#include <vector>
#include <chrono>
#include <memory>
#include <string>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/coalescer/event_coalescer.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <tickgovernor/core/scheduler/batch_scheduler.hpp>
#include <tickgovernor/core/utils/clock.hpp>

using namespace std;
using namespace TickGovernor;

namespace {

class CountingSink : public DispatchSink {
public:
    void dispatch(const string&, const EventArgs&) override { ++count; }
    uint64_t count = 0;
};

class NoopTarget : public UpdateTarget {
public:
    void update() override { ++updates; }
    uint64_t updates = 0;
};

void printResult(const char* name, size_t ops, uint64_t elapsed_ns) {
    double per_op = ops > 0 ? static_cast<double>(elapsed_ns) / static_cast<double>(ops) : 0.0;
    double throughput = elapsed_ns > 0 ? ops / (elapsed_ns / 1e9) / 1e6 : 0.0;
    cout << "  " << name << ":\n";
    cout << "    Ops: " << ops << "\n";
    cout << "    Per op: " << per_op << " ns\n";
    cout << "    Throughput: " << throughput << "M ops/sec\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    size_t iterations = (argc > 1) ? static_cast<size_t>(strtoull(argv[1], nullptr, 10)) : 1'000'000;
    if (iterations == 0) iterations = 1'000'000;

    SteadyClock wall;
    NullDiagnosticSink diagnostics;

    cout << "============================================================\n";
    cout << "TickGovernor benchmark (" << iterations << " iterations)\n";
    cout << "============================================================\n";

    // --- BudgetTracker::recordCycle ---
    {
        BudgetTracker tracker(diagnostics);
        uint64_t start = wall.nowNs();
        for (size_t i = 0; i < iterations; ++i) {
            tracker.recordCycle(8.0 + static_cast<double>(i % 17));
        }
        uint64_t end = wall.nowNs();
        printResult("recordCycle", iterations, end - start);
        cout << "    Mean: " << tracker.currentMean() << " ms\n";
    }

    // --- BatchScheduler mark + run ---
    {
        ManualClock clock;
        BudgetTracker tracker(diagnostics);
        BatchScheduler scheduler(tracker, clock, diagnostics);

        vector<shared_ptr<NoopTarget>> targets;
        for (int i = 0; i < 64; ++i) targets.push_back(make_shared<NoopTarget>());

        size_t rounds = iterations / targets.size();
        uint64_t start = wall.nowNs();
        for (size_t r = 0; r < rounds; ++r) {
            for (size_t i = 0; i < targets.size(); ++i) {
                scheduler.markPending(targets[i], clampSchedulerPriority(static_cast<int>(i % 4) + 1));
            }
            while (scheduler.isActive()) {
                clock.advanceMs(1.0);
                scheduler.runCycle();
            }
        }
        uint64_t end = wall.nowNs();
        printResult("markPending+runCycle", rounds * targets.size(), end - start);
        cout << "    Batches: " << scheduler.getStatistics().batches_run << "\n";
    }

    // --- EventCoalescer submit + tick ---
    {
        ManualClock clock;
        BudgetTracker tracker(diagnostics);
        CountingSink sink;
        EventCoalescer coalescer(tracker, clock, sink, diagnostics);

        uint64_t delivered = 0;
        auto handler = makeEventHandler([&delivered](const string&, const EventArgs&) { ++delivered; });
        coalescer.registerCoalesced("UNIT_HEALTH", 50.0, handler, CoalescerPriority::HIGH);

        uint64_t start = wall.nowNs();
        for (size_t i = 0; i < iterations; ++i) {
            coalescer.submit("UNIT_HEALTH", EventArgs{static_cast<int64_t>(i)});
            coalescer.submit("UNIT_AURA", CoalescerPriority::LOW, EventArgs{static_cast<int64_t>(i)});
            if (i % 16 == 0) {
                clock.advanceMs(16.0);
                coalescer.tick();
            }
        }
        coalescer.flush();
        uint64_t end = wall.nowNs();

        auto stats = coalescer.getStatistics();
        printResult("submit+tick", iterations * 2, end - start);
        cout << "    Registered deliveries: " << delivered << "\n";
        cout << "    Ad-hoc deliveries: " << sink.count << "\n";
        cout << "    Savings: " << stats.savings_percent << "%\n";
    }

    return 0;
}
