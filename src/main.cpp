#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <tickgovernor/core/config/loader.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <tickgovernor/core/events/event_bus.hpp>
#include <tickgovernor/core/governor/governor.hpp>
#include <tickgovernor/core/scheduler/update_target.hpp>
#include <tickgovernor/core/utils/clock.hpp>

using namespace TickGovernor;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    spdlog::info("Signal {} received, stopping simulation...", signum);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("TickGovernor demo starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Simulated consumer objects
// ============================================================================

// Legacy shape with updateHealth()/updatePower(): wrapped by makeUpdateTarget()
struct UnitFrame {
    explicit UnitFrame(int id_) : id(id_) {}
    void updateHealth() { ++health_updates; }
    void updatePower() { ++power_updates; }

    int id;
    uint64_t health_updates = 0;
    uint64_t power_updates = 0;
};

// Native target
class NameplateTarget : public UpdateTarget {
public:
    void update() override { ++updates_; }
    const char* name() const override { return "NameplateTarget"; }
    uint64_t updates() const { return updates_; }

private:
    uint64_t updates_ = 0;
};

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: governor borrows everything above it
    std::unique_ptr<SteadyClock> clock;
    std::unique_ptr<LoggingDiagnosticSink> diagnostics;
    std::unique_ptr<EventBus> eventBus;
    std::unique_ptr<Governor> governor;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;
    c.clock = std::make_unique<SteadyClock>();
    c.diagnostics = std::make_unique<LoggingDiagnosticSink>();
    c.eventBus = std::make_unique<EventBus>(*c.diagnostics);
    c.governor = std::make_unique<Governor>(config, *c.clock, *c.diagnostics, *c.eventBus);
    return c;
}

static void runSimulation(Components& c, int cycles) {
    auto& governor = *c.governor;

    std::vector<std::shared_ptr<UnitFrame>> frames;
    for (int i = 0; i < 40; ++i) {
        frames.push_back(std::make_shared<UnitFrame>(i));
    }
    auto nameplate = std::make_shared<NameplateTarget>();

    uint64_t aura_deliveries = 0;
    governor.coalescer().registerCoalesced(
        "UNIT_AURA", 50.0,
        makeEventHandler([&aura_deliveries](const std::string&, const EventArgs&) { ++aura_deliveries; },
                         "AuraHandler"),
        CoalescerPriority::MEDIUM);

    uint64_t combat_log = 0;
    c.eventBus->subscribe("COMBAT_LOG",
                          makeEventHandler([&combat_log](const std::string&, const EventArgs&) { ++combat_log; },
                                           "CombatLogHandler"));

    std::mt19937 rng(42);
    std::normal_distribution<double> calm(9.0, 2.0);
    std::normal_distribution<double> busy(21.0, 4.0);

    for (int cycle = 0; cycle < cycles && g_running.load(std::memory_order_acquire); ++cycle) {
        // Cycles 300..599 simulate a heavy phase
        bool heavy = cycle >= 300 && cycle < 600;
        if (cycle == 300) governor.setMode(GovernorMode::CRITICAL);
        if (cycle == 600) governor.setMode(GovernorMode::NORMAL);

        for (int burst = 0; burst < 8; ++burst) {
            governor.coalescer().submit("UNIT_AURA", EventArgs{int64_t{cycle}, int64_t{burst}});
        }
        governor.coalescer().submit("COMBAT_LOG", CoalescerPriority::LOW, EventArgs{int64_t{cycle}});

        auto& frame = frames[static_cast<size_t>(cycle) % frames.size()];
        governor.scheduler().markPending(frame, heavy ? SchedulerPriority::LOW : SchedulerPriority::MEDIUM);
        governor.scheduler().markPending(nameplate, SchedulerPriority::HIGH);

        governor.budget().deferOrRun([](void*) {}, heavy ? BudgetPriority::LOW : BudgetPriority::MEDIUM);

        double elapsed = heavy ? busy(rng) : calm(rng);
        governor.tick(elapsed > 0.0 ? elapsed : 0.0);
    }

    governor.coalescer().flush();
    governor.scheduler().runCycle(true);

    spdlog::info("Simulation done: aura deliveries={} combat log deliveries={} nameplate updates={}",
                 aura_deliveries, combat_log, nameplate->updates());
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("Configuration loaded successfully: {} v{} (preset {})",
                     config.app_name, config.version, config.preset);

        auto components = initializeComponents(config);
        runSimulation(components, 900);
        components.governor->logReport();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("TickGovernor demo terminated gracefully");
    return EXIT_SUCCESS;
}
