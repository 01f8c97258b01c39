#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include <tickgovernor/core/coalescer/coalescer_priority.hpp>
#include <tickgovernor/core/config/app_config.hpp>

namespace TickGovernor {

/**
 * @struct PresetSettings
 * @brief One named quality/performance trade-off
 *
 * | preset | coalesce interval | batch size | target cycle |
 * |--------|-------------------|------------|--------------|
 * | Low    | 50 ms             | 2          | 25.00 ms     |
 * | Medium | 30 ms             | 10         | 16.67 ms     |
 * | High   | 20 ms             | 20         | 14.00 ms     |
 * | Ultra  | 10 ms             | 40         | 10.00 ms     |
 */
struct PresetSettings {
    const char* name;
    double coalesce_interval_ms;
    size_t batch_size;
    double target_cycle_ms;
};

constexpr const char* DEFAULT_PRESET = "Medium";

// Exact, case-sensitive lookup
std::optional<PresetSettings> findPreset(const std::string& name);

// Like findPreset(), but unknown or empty names fall back to Medium with a warning
PresetSettings resolvePreset(const std::string& name);

std::vector<std::string> presetNames();

/**
 * @brief Per-priority ad-hoc intervals derived from a preset interval
 * CRITICAL = 0, HIGH = max(5, i*0.5), MEDIUM = i, LOW = i*1.5
 */
std::array<double, COALESCER_PRIORITY_LEVELS> presetIntervals(double coalesce_interval_ms);

/**
 * @brief Overwrite the preset-controlled fields of a configuration
 */
void applyPresetTo(const PresetSettings& preset, AppConfig::AppConfiguration& config);

} // namespace TickGovernor
