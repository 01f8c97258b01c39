#include <tickgovernor/core/config/presets.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace TickGovernor {

namespace {

constexpr std::array<PresetSettings, 4> PRESETS{{
    {"Low",    50.0,  2, 25.00},
    {"Medium", 30.0, 10, 16.67},
    {"High",   20.0, 20, 14.00},
    {"Ultra",  10.0, 40, 10.00},
}};

} // namespace

std::optional<PresetSettings> findPreset(const std::string& name) {
    for (const auto& preset : PRESETS) {
        if (name == preset.name) {
            return preset;
        }
    }
    return std::nullopt;
}

PresetSettings resolvePreset(const std::string& name) {
    if (auto preset = findPreset(name)) {
        return *preset;
    }
    spdlog::warn("[Presets] Unknown preset '{}', defaulting to {}", name, DEFAULT_PRESET);
    return *findPreset(DEFAULT_PRESET);
}

std::vector<std::string> presetNames() {
    std::vector<std::string> names;
    for (const auto& preset : PRESETS) {
        names.emplace_back(preset.name);
    }
    return names;
}

std::array<double, COALESCER_PRIORITY_LEVELS> presetIntervals(double coalesce_interval_ms) {
    return {{
        0.0,
        std::max(5.0, coalesce_interval_ms * 0.5),
        coalesce_interval_ms,
        coalesce_interval_ms * 1.5,
    }};
}

void applyPresetTo(const PresetSettings& preset, AppConfig::AppConfiguration& config) {
    auto intervals = presetIntervals(preset.coalesce_interval_ms);
    config.preset = preset.name;
    config.budget.target_cycle_ms = preset.target_cycle_ms;
    config.scheduler.batch_size = preset.batch_size;
    config.coalescer.high_interval_ms = intervals[coalescerSlot(CoalescerPriority::HIGH)];
    config.coalescer.medium_interval_ms = intervals[coalescerSlot(CoalescerPriority::MEDIUM)];
    config.coalescer.low_interval_ms = intervals[coalescerSlot(CoalescerPriority::LOW)];
}

} // namespace TickGovernor
