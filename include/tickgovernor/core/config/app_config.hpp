#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <tickgovernor/core/coalescer/coalescer_priority.hpp>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct BudgetConfig {
    double target_cycle_ms = 16.67;
    size_t history_size = 100;
    size_t max_deferred_per_priority = 200;
    size_t max_drain_per_cycle = 5;
};

struct SchedulerConfig {
    bool enabled = true;
    size_t batch_size = 10;
    double decay_interval_ms = 5000.0;
};

// Registered at start-up with a logging handler
struct CoalescedEventConfig {
    std::string name;
    double delay_ms = 50.0;
    TickGovernor::CoalescerPriority priority = TickGovernor::CoalescerPriority::MEDIUM;
};

struct CoalescerConfig {
    bool enabled = true;
    // Ad-hoc flush intervals; CRITICAL always dispatches immediately
    double high_interval_ms = 15.0;
    double medium_interval_ms = 30.0;
    double low_interval_ms = 45.0;
    std::vector<CoalescedEventConfig> events;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    std::string preset = "Medium";

    LoggingConfig logging;
    BudgetConfig budget;
    SchedulerConfig scheduler;
    CoalescerConfig coalescer;
};

} // namespace AppConfig
