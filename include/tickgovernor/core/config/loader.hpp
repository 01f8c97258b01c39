#pragma once
#include <tickgovernor/core/config/app_config.hpp>
#include <string>

/**
 * Loads and validates the YAML configuration.
 *
 * The preset is applied first; explicit keys then override it.
 * Throws std::runtime_error on a missing file, malformed YAML, a missing
 * required field, a wrong type or an out-of-range value. An unknown preset
 * name is not an error: it falls back to Medium with a warning.
 */
class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
