/**
 * test_settings.cpp - Unit tests for configuration loading
 */

#include "ev/Settings.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

bool rejected(const std::string& json_text) {
    try {
        ev::parseSettings(json_text);
    } catch (const ev::ConfigError&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    ev::Settings settings;
    
    assert(settings.confidence_threshold == 0.7);
    assert(settings.fallback_threshold == 0.5);
    assert(settings.llm.model == "gpt-4o-mini");
    assert(settings.llm.max_tokens == 100);
    
    auto empty = ev::parseSettings("{}");
    assert(empty.confidence_threshold == 0.7);
    assert(empty.fallback_threshold == 0.5);
    
    std::cout << "[PASS] test_defaults\n";
}

void test_parse_full_config() {
    auto settings = ev::parseSettings(R"({
        "pipeline": {"confidence_threshold": 0.8, "fallback_threshold": 0.4},
        "llm": {"model": "gpt-4o", "temperature": 0.2, "max_tokens": 64,
                "connect_timeout_ms": 500, "read_timeout_ms": 1500}
    })");
    
    assert(settings.confidence_threshold == 0.8);
    assert(settings.fallback_threshold == 0.4);
    assert(settings.llm.model == "gpt-4o");
    assert(settings.llm.temperature == 0.2);
    assert(settings.llm.max_tokens == 64);
    assert(settings.llm.connect_timeout_ms == 500);
    assert(settings.llm.read_timeout_ms == 1500);
    
    std::cout << "[PASS] test_parse_full_config\n";
}

void test_thresholds_are_independent() {
    auto settings = ev::parseSettings(R"({"pipeline": {"fallback_threshold": 0.9}})");
    
    assert(settings.fallback_threshold == 0.9);
    assert(settings.confidence_threshold == 0.7);
    
    std::cout << "[PASS] test_thresholds_are_independent\n";
}

void test_invalid_values_rejected() {
    assert(rejected("not json"));
    assert(rejected("[]"));
    assert(rejected(R"({"pipeline": {"confidence_threshold": 1.5}})"));
    assert(rejected(R"({"pipeline": {"fallback_threshold": -0.1}})"));
    assert(rejected(R"({"pipeline": {"confidence_threshold": "high"}})"));
    assert(rejected(R"({"pipeline": 3})"));
    assert(rejected(R"({"llm": {"max_tokens": 0}})"));
    assert(rejected(R"({"llm": {"read_timeout_ms": 2.5}})"));
    assert(rejected(R"({"llm": {"model": ""}})"));
    
    std::cout << "[PASS] test_invalid_values_rejected\n";
}

void test_load_from_file() {
    auto dir = std::filesystem::temp_directory_path() / "ev_settings_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "config.json";
    
    {
        std::ofstream file(path);
        file << R"({"pipeline": {"confidence_threshold": 0.75}})";
    }
    
    auto settings = ev::loadSettings(path.string());
    assert(settings.confidence_threshold == 0.75);
    assert(settings.fallback_threshold == 0.5);
    
    auto missing = ev::loadSettings((dir / "missing.json").string());
    assert(missing.confidence_threshold == 0.7);
    
    std::filesystem::remove_all(dir);
    
    std::cout << "[PASS] test_load_from_file\n";
}

void test_describe_settings() {
    auto text = ev::describeSettings(ev::Settings{});
    
    assert(text.find("0.70") != std::string::npos);
    assert(text.find("0.50") != std::string::npos);
    assert(text.find("gpt-4o-mini") != std::string::npos);
    
    std::cout << "[PASS] test_describe_settings\n";
}

int main() {
    std::cout << "Running Settings tests...\n\n";
    
    test_defaults();
    test_parse_full_config();
    test_thresholds_are_independent();
    test_invalid_values_rejected();
    test_load_from_file();
    test_describe_settings();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
