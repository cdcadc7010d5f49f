/**
 * Settings.cpp - Process configuration, loaded once at startup
 */

#include "ev/Settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace ev {

namespace {

double readThreshold(const json& section, const char* key, double fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_number()) {
        throw ConfigError(std::string(key) + " must be a number");
    }
    double threshold = value.get<double>();
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw ConfigError(std::string(key) + " must be within [0, 1]");
    }
    return threshold;
}

int readPositiveInt(const json& section, const char* key, int fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_number_integer() || value.get<int>() <= 0) {
        throw ConfigError(std::string(key) + " must be a positive integer");
    }
    return value.get<int>();
}

} // anonymous namespace

std::string defaultConfigPath() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return (std::filesystem::path(home) / ".config" / "ev" / "config.json").string();
}

Settings parseSettings(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }
    
    Settings settings;
    
    if (root.contains("pipeline")) {
        const auto& pipeline = root["pipeline"];
        if (!pipeline.is_object()) {
            throw ConfigError("'pipeline' must be an object");
        }
        settings.confidence_threshold =
            readThreshold(pipeline, "confidence_threshold", settings.confidence_threshold);
        settings.fallback_threshold =
            readThreshold(pipeline, "fallback_threshold", settings.fallback_threshold);
    }
    
    if (root.contains("llm")) {
        const auto& llm = root["llm"];
        if (!llm.is_object()) {
            throw ConfigError("'llm' must be an object");
        }
        if (llm.contains("model")) {
            if (!llm["model"].is_string() || llm["model"].get<std::string>().empty()) {
                throw ConfigError("model must be a non-empty string");
            }
            settings.llm.model = llm["model"].get<std::string>();
        }
        if (llm.contains("temperature")) {
            if (!llm["temperature"].is_number() || llm["temperature"].get<double>() < 0.0) {
                throw ConfigError("temperature must be a non-negative number");
            }
            settings.llm.temperature = llm["temperature"].get<double>();
        }
        settings.llm.max_tokens = readPositiveInt(llm, "max_tokens", settings.llm.max_tokens);
        settings.llm.connect_timeout_ms =
            readPositiveInt(llm, "connect_timeout_ms", settings.llm.connect_timeout_ms);
        settings.llm.read_timeout_ms =
            readPositiveInt(llm, "read_timeout_ms", settings.llm.read_timeout_ms);
    }
    
    return settings;
}

Settings loadSettings(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::debug("No config file at '{}', using defaults", path);
        return Settings{};
    }
    
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("cannot read config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    
    Settings settings = parseSettings(buffer.str());
    spdlog::debug("Loaded config from {}", path);
    return settings;
}

std::string describeSettings(const Settings& settings) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "  Confidence threshold: " << settings.confidence_threshold << "\n"
        << "  Fallback threshold:   " << settings.fallback_threshold << "\n"
        << "  Model:                " << settings.llm.model << "\n"
        << "  Temperature:          " << settings.llm.temperature << "\n"
        << "  Max tokens:           " << settings.llm.max_tokens << "\n"
        << "  Connect timeout:      " << settings.llm.connect_timeout_ms << " ms\n"
        << "  Read timeout:         " << settings.llm.read_timeout_ms << " ms\n";
    return out.str();
}

} // namespace ev
