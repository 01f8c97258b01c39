#include <tickgovernor/core/config/loader.hpp>
#include <tickgovernor/core/config/presets.hpp>
#include <tickgovernor/core/coalescer/event_coalescer.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

using namespace AppConfig;

namespace {

// ============================================================================
// Field helpers
// ============================================================================

YAML::Node requireField(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required field: " + path);
    }
    return node;
}

template <typename T>
T readScalar(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw std::runtime_error("Invalid type for '" + path + "': expected a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for '" + path + "': " + e.what());
    }
}

template <typename T>
void readOptional(const YAML::Node& parent, const char* key, const std::string& path, T& out) {
    YAML::Node node = parent[key];
    if (node && !node.IsNull()) {
        out = readScalar<T>(node, path);
    }
}

size_t readCount(const YAML::Node& parent, const char* key, const std::string& path,
                 size_t current, long long minimum) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return current;
    }
    long long value = readScalar<long long>(node, path);
    if (value < minimum) {
        throw std::runtime_error("Invalid value for '" + path + "': " + std::to_string(value) +
                                 " (minimum " + std::to_string(minimum) + ")");
    }
    return static_cast<size_t>(value);
}

void requirePositive(double value, const std::string& path) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::runtime_error("Invalid value for '" + path + "': must be > 0");
    }
}

void requireNonNegative(double value, const std::string& path) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        throw std::runtime_error("Invalid value for '" + path + "': must be >= 0");
    }
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

TickGovernor::CoalescerPriority parsePriority(const YAML::Node& node, const std::string& path) {
    std::string raw = readScalar<std::string>(node, path);
    std::string name = toLower(raw);
    if (name == "critical" || name == "1") return TickGovernor::CoalescerPriority::CRITICAL;
    if (name == "high" || name == "2")     return TickGovernor::CoalescerPriority::HIGH;
    if (name == "medium" || name == "3")   return TickGovernor::CoalescerPriority::MEDIUM;
    if (name == "low" || name == "4")      return TickGovernor::CoalescerPriority::LOW;
    throw std::runtime_error("Invalid value for '" + path + "': unknown priority '" + raw + "'");
}

// ============================================================================
// Sections
// ============================================================================

void parseLogging(const YAML::Node& root, LoggingConfig& logging) {
    YAML::Node node = root["logging"];
    if (!node) return;

    readOptional(node, "level", "logging.level", logging.level);
    static const std::array<const char*, 7> LEVELS{
        {"trace", "debug", "info", "warn", "error", "critical", "off"}};
    std::string level = toLower(logging.level);
    if (std::find_if(LEVELS.begin(), LEVELS.end(),
                     [&level](const char* l) { return level == l; }) == LEVELS.end()) {
        throw std::runtime_error("Invalid value for 'logging.level': " + logging.level);
    }
    logging.level = level;
}

void parseBudget(const YAML::Node& root, BudgetConfig& budget) {
    YAML::Node node = root["budget"];
    if (!node) return;

    readOptional(node, "target_cycle_ms", "budget.target_cycle_ms", budget.target_cycle_ms);
    requirePositive(budget.target_cycle_ms, "budget.target_cycle_ms");

    budget.history_size = readCount(node, "history_size", "budget.history_size", budget.history_size, 1);
    budget.max_deferred_per_priority = readCount(node, "max_deferred_per_priority",
                                                 "budget.max_deferred_per_priority",
                                                 budget.max_deferred_per_priority, 1);
    budget.max_drain_per_cycle = readCount(node, "max_drain_per_cycle", "budget.max_drain_per_cycle",
                                           budget.max_drain_per_cycle, 1);
}

void parseScheduler(const YAML::Node& root, SchedulerConfig& scheduler) {
    YAML::Node node = root["scheduler"];
    if (!node) return;

    readOptional(node, "enabled", "scheduler.enabled", scheduler.enabled);
    scheduler.batch_size = readCount(node, "batch_size", "scheduler.batch_size", scheduler.batch_size, 2);
    readOptional(node, "decay_interval_ms", "scheduler.decay_interval_ms", scheduler.decay_interval_ms);
    requirePositive(scheduler.decay_interval_ms, "scheduler.decay_interval_ms");
}

void parseCoalescer(const YAML::Node& root, CoalescerConfig& coalescer) {
    YAML::Node node = root["coalescer"];
    if (!node) return;

    readOptional(node, "enabled", "coalescer.enabled", coalescer.enabled);

    YAML::Node intervals = node["intervals_ms"];
    if (intervals) {
        if (!intervals.IsMap()) {
            throw std::runtime_error("Invalid type for 'coalescer.intervals_ms': expected a map");
        }
        readOptional(intervals, "high", "coalescer.intervals_ms.high", coalescer.high_interval_ms);
        readOptional(intervals, "medium", "coalescer.intervals_ms.medium", coalescer.medium_interval_ms);
        readOptional(intervals, "low", "coalescer.intervals_ms.low", coalescer.low_interval_ms);
        requireNonNegative(coalescer.high_interval_ms, "coalescer.intervals_ms.high");
        requireNonNegative(coalescer.medium_interval_ms, "coalescer.intervals_ms.medium");
        requireNonNegative(coalescer.low_interval_ms, "coalescer.intervals_ms.low");
    }

    YAML::Node events = node["events"];
    if (!events) return;
    if (!events.IsSequence()) {
        throw std::runtime_error("Invalid type for 'coalescer.events': expected a list");
    }

    for (size_t i = 0; i < events.size(); ++i) {
        const std::string path = "coalescer.events[" + std::to_string(i) + "]";
        const YAML::Node& entry = events[i];
        if (!entry.IsMap()) {
            throw std::runtime_error("Invalid type for '" + path + "': expected a map");
        }

        CoalescedEventConfig event;
        event.name = readScalar<std::string>(requireField(entry, "name", path + ".name"), path + ".name");
        if (event.name.empty()) {
            throw std::runtime_error("Invalid value for '" + path + ".name': empty");
        }
        readOptional(entry, "delay_ms", path + ".delay_ms", event.delay_ms);
        if (!(event.delay_ms >= 0.0) || event.delay_ms > TickGovernor::EventCoalescer::MAX_DELAY_MS) {
            throw std::runtime_error("Invalid value for '" + path + ".delay_ms': must be in [0, 500]");
        }
        if (entry["priority"]) {
            event.priority = parsePriority(entry["priority"], path + ".priority");
        }
        coalescer.events.push_back(std::move(event));
    }
}

} // namespace

// ============================================================================
// ConfigLoader
// ============================================================================

AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream probe(filepath);
    if (!probe.good()) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config '" + filepath + "': " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid config '" + filepath + "': top level must be a map");
    }

    AppConfiguration config;
    config.app_name = readScalar<std::string>(requireField(root, "app_name", "app_name"), "app_name");
    config.version = readScalar<std::string>(requireField(root, "version", "version"), "version");

    std::string preset = TickGovernor::DEFAULT_PRESET;
    readOptional(root, "preset", "preset", preset);
    TickGovernor::applyPresetTo(TickGovernor::resolvePreset(preset), config);

    parseLogging(root, config.logging);
    parseBudget(root, config.budget);
    parseScheduler(root, config.scheduler);
    parseCoalescer(root, config.coalescer);

    spdlog::debug("[ConfigLoader] Loaded '{}': preset={} target={:.2f}ms batch={} events={}",
                  filepath, config.preset, config.budget.target_cycle_ms,
                  config.scheduler.batch_size, config.coalescer.events.size());
    return config;
}
