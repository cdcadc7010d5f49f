/**
 * Settings.hpp - Process configuration, loaded once at startup
 *
 * File layout (all keys optional):
 *   { "pipeline": { "confidence_threshold": 0.7, "fallback_threshold": 0.5 },
 *     "llm": { "model": "gpt-4o-mini", "temperature": 0.0, "max_tokens": 100,
 *              "connect_timeout_ms": 2000, "read_timeout_ms": 5000 } }
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ev {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct LlmSettings {
    std::string model = "gpt-4o-mini";
    double temperature = 0.0;
    int max_tokens = 100;
    int connect_timeout_ms = 2000;
    int read_timeout_ms = 5000;
};

struct Settings {
    double confidence_threshold = 0.7;
    double fallback_threshold = 0.5;
    LlmSettings llm;
};

// ~/.config/ev/config.json, or empty when HOME is unset
std::string defaultConfigPath();

// A missing file yields the defaults; an unreadable or invalid one throws ConfigError.
Settings loadSettings(const std::string& path);

Settings parseSettings(const std::string& json_text);

std::string describeSettings(const Settings& settings);

} // namespace ev
