/**
 * test_fallback_manager.cpp - Unit tests for FallbackManager
 */

#include "ev/CommandValidator.hpp"
#include "ev/FallbackManager.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using ev::Action;
using ev::Magnitude;
using ev::ParseSource;
using ev::RobotCommand;

namespace {

// Returns a fixed reply, or throws when none is set
class FakeSemanticParser : public ev::SemanticParser {
public:
    explicit FakeSemanticParser(std::optional<RobotCommand> reply = std::nullopt)
        : reply_(reply) {}
    
    RobotCommand parse(const std::string& text) override {
        ++calls;
        last_text = text;
        if (!reply_) {
            throw ev::SemanticParseError("API down");
        }
        return *reply_;
    }
    
    int calls = 0;
    std::string last_text;
    
private:
    std::optional<RobotCommand> reply_;
};

// Fails with something other than SemanticParseError
class BrokenSemanticParser : public ev::SemanticParser {
public:
    RobotCommand parse(const std::string& text) override {
        return RobotCommand(Action::MOVE_UP, std::nullopt, 7.0, text);
    }
};

// Throws a value that is not a std::exception
class ThrowingIntParser : public ev::SemanticParser {
public:
    RobotCommand parse(const std::string&) override {
        throw 42;
    }
};

ev::FallbackManager makeOfflineManager() {
    return ev::FallbackManager(nullptr);
}

} // anonymous namespace

void test_semantic_accepted() {
    FakeSemanticParser semantic(RobotCommand(Action::MOVE_UP, Magnitude::SMALL, 0.95, "move up a little"));
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("move up a little");
    
    assert(result.source == ParseSource::SEMANTIC);
    assert(result.command.action() == Action::MOVE_UP);
    assert(result.command.magnitude() == Magnitude::SMALL);
    assert(result.command.confidence() == 0.95);
    assert(semantic.calls == 1);
    assert(semantic.last_text == "move up a little");
    
    std::cout << "[PASS] test_semantic_accepted\n";
}

void test_semantic_failure_falls_back_to_patterns() {
    FakeSemanticParser semantic;
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("retract");
    
    assert(result.source == ParseSource::DETERMINISTIC);
    assert(result.command.action() == Action::RETRACT);
    assert(result.command.magnitude() == Magnitude::MID);
    assert(result.command.confidence() == 0.6);
    assert(semantic.calls == 1);
    
    std::cout << "[PASS] test_semantic_failure_falls_back_to_patterns\n";
}

void test_low_semantic_confidence_falls_back() {
    FakeSemanticParser semantic(RobotCommand(Action::MOVE_RIGHT, std::nullopt, 0.3, "nudge left"));
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("nudge left");
    
    assert(result.source == ParseSource::DETERMINISTIC);
    assert(result.command.action() == Action::MOVE_LEFT);
    assert(result.command.magnitude() == Magnitude::SMALL);
    
    std::cout << "[PASS] test_low_semantic_confidence_falls_back\n";
}

void test_total_failure_returns_safe_stop() {
    FakeSemanticParser semantic;
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("how are you today");
    
    assert(result.source == ParseSource::FAILED);
    assert(result.command.action() == Action::STOP);
    assert(result.command.confidence() == 0.0);
    assert(!result.command.magnitude());
    assert(result.command.rawText() == "how are you today");
    
    std::cout << "[PASS] test_total_failure_returns_safe_stop\n";
}

void test_low_confidence_and_no_pattern_returns_safe_stop() {
    FakeSemanticParser semantic(RobotCommand(Action::MOVE_UP, std::nullopt, 0.1, "the weather is nice"));
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("the weather is nice");
    
    assert(result.source == ParseSource::FAILED);
    assert(result.command.isStop());
    
    std::cout << "[PASS] test_low_confidence_and_no_pattern_returns_safe_stop\n";
}

void test_acceptance_threshold_is_inclusive() {
    FakeSemanticParser semantic(RobotCommand(Action::MOVE_DOWN, std::nullopt, 0.5, "go lower"));
    ev::FallbackManager fallback(&semantic, 0.5);
    
    auto result = fallback.parseWithFallback("go lower");
    assert(result.source == ParseSource::SEMANTIC);
    
    std::cout << "[PASS] test_acceptance_threshold_is_inclusive\n";
}

void test_selected_yet_rejected_by_validator() {
    FakeSemanticParser semantic(RobotCommand(Action::MOVE_LEFT, std::nullopt, 0.6, "go left"));
    ev::FallbackManager fallback(&semantic, 0.5);
    ev::CommandValidator validator(0.7);
    
    auto result = fallback.parseWithFallback("go left");
    assert(result.source == ParseSource::SEMANTIC);
    
    auto verdict = validator.validate(result.command);
    assert(!verdict.accepted);
    assert(verdict.reason == "confidence 0.60 < 0.70");
    
    std::cout << "[PASS] test_selected_yet_rejected_by_validator\n";
}

void test_unexpected_exception_falls_back() {
    BrokenSemanticParser semantic;
    ev::FallbackManager fallback(&semantic);
    
    auto result = fallback.parseWithFallback("go up");
    
    assert(result.source == ParseSource::DETERMINISTIC);
    assert(result.command.action() == Action::MOVE_UP);
    
    std::cout << "[PASS] test_unexpected_exception_falls_back\n";
}

void test_non_standard_exception_falls_back() {
    ThrowingIntParser semantic;
    ev::FallbackManager fallback(&semantic);
    
    auto matched = fallback.parseWithFallback("retract");
    assert(matched.source == ParseSource::DETERMINISTIC);
    assert(matched.command.action() == Action::RETRACT);
    
    auto unmatched = fallback.parseWithFallback("how are you today");
    assert(unmatched.source == ParseSource::FAILED);
    assert(unmatched.command.isStop());
    assert(unmatched.command.confidence() == 0.0);
    
    std::cout << "[PASS] test_non_standard_exception_falls_back\n";
}

void test_long_whitespace_utterance() {
    FakeSemanticParser semantic;
    ev::FallbackManager fallback(&semantic);
    const std::string gap(200000, ' ');
    
    auto stop = fallback.parseWithFallback("don't" + gap + "move");
    assert(stop.source == ParseSource::DETERMINISTIC);
    assert(stop.command.isStop());
    
    auto blank = fallback.parseWithFallback(gap);
    assert(blank.source == ParseSource::FAILED);
    assert(blank.command.isStop());
    assert(blank.command.confidence() == 0.0);
    
    std::cout << "[PASS] test_long_whitespace_utterance\n";
}

void test_manager_owns_pattern_parser() {
    // The manager outlives the scope it was built in
    auto fallback = makeOfflineManager();
    
    auto result = fallback.parseWithFallback("nudge left");
    assert(result.source == ParseSource::DETERMINISTIC);
    assert(result.command.action() == Action::MOVE_LEFT);
    assert(result.command.magnitude() == Magnitude::SMALL);
    
    std::cout << "[PASS] test_manager_owns_pattern_parser\n";
}

void test_offline_mode() {
    ev::FallbackManager fallback(nullptr);
    
    auto matched = fallback.parseWithFallback("stop going left");
    assert(matched.source == ParseSource::DETERMINISTIC);
    assert(matched.command.isStop());
    assert(matched.command.confidence() == 0.6);
    
    auto unmatched = fallback.parseWithFallback("hello");
    assert(unmatched.source == ParseSource::FAILED);
    
    std::cout << "[PASS] test_offline_mode\n";
}

void test_no_retry_between_calls() {
    FakeSemanticParser semantic;
    ev::FallbackManager fallback(&semantic);
    
    fallback.parseWithFallback("retract");
    fallback.parseWithFallback("how are you today");
    fallback.parseWithFallback("rotate left");
    
    assert(semantic.calls == 3);
    
    std::cout << "[PASS] test_no_retry_between_calls\n";
}

void test_source_names() {
    assert(ev::toString(ParseSource::SEMANTIC) == "semantic");
    assert(ev::toString(ParseSource::DETERMINISTIC) == "deterministic");
    assert(ev::toString(ParseSource::FAILED) == "failed");
    
    std::cout << "[PASS] test_source_names\n";
}

void test_invalid_acceptance_threshold() {
    bool threw = false;
    try {
        ev::FallbackManager fallback(nullptr, -0.1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    
    std::cout << "[PASS] test_invalid_acceptance_threshold\n";
}

int main() {
    std::cout << "Running FallbackManager tests...\n\n";
    
    test_semantic_accepted();
    test_semantic_failure_falls_back_to_patterns();
    test_low_semantic_confidence_falls_back();
    test_total_failure_returns_safe_stop();
    test_low_confidence_and_no_pattern_returns_safe_stop();
    test_acceptance_threshold_is_inclusive();
    test_selected_yet_rejected_by_validator();
    test_unexpected_exception_falls_back();
    test_non_standard_exception_falls_back();
    test_long_whitespace_utterance();
    test_manager_owns_pattern_parser();
    test_offline_mode();
    test_no_retry_between_calls();
    test_source_names();
    test_invalid_acceptance_threshold();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
