/**
 * FallbackManager.cpp - Semantic-first parsing with deterministic fallback
 */

#include "ev/FallbackManager.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace ev {

std::string toString(ParseSource source) {
    switch (source) {
        case ParseSource::SEMANTIC:
            return "semantic";
        case ParseSource::DETERMINISTIC:
            return "deterministic";
        case ParseSource::FAILED:
        default:
            return "failed";
    }
}

FallbackManager::FallbackManager(SemanticParser* semantic, double acceptance_threshold)
    : semantic_(semantic),
      acceptance_threshold_(acceptance_threshold) {
    if (!(acceptance_threshold >= 0.0 && acceptance_threshold <= 1.0)) {
        throw std::invalid_argument("fallback acceptance threshold must be within [0, 1]");
    }
}

FallbackResult FallbackManager::parseWithFallback(const std::string& text) const {
    // Single attempt; retries belong to the semantic parser itself
    if (semantic_ != nullptr) {
        try {
            RobotCommand command = semantic_->parse(text);
            if (command.confidence() >= acceptance_threshold_) {
                spdlog::info("Semantic parsed '{}' -> {}", text, command.describe());
                return {command, ParseSource::SEMANTIC};
            }
            spdlog::warn("Semantic confidence {:.2f} < {:.2f} for '{}', trying patterns",
                         command.confidence(), acceptance_threshold_, text);
        } catch (const std::exception& e) {
            spdlog::warn("Semantic parser failed for '{}': {}, trying patterns", text, e.what());
        } catch (...) {
            spdlog::warn("Semantic parser failed for '{}' with a non-standard exception, trying patterns", text);
        }
    } else {
        spdlog::debug("No semantic parser configured, using patterns for '{}'", text);
    }
    
    try {
        auto command = deterministic_.parse(text);
        if (command) {
            spdlog::info("Patterns parsed '{}' -> {}", text, command->describe());
            return {*command, ParseSource::DETERMINISTIC};
        }
        spdlog::warn("No pattern matched '{}'", text);
    } catch (const std::exception& e) {
        spdlog::warn("Pattern parser failed for '{}': {}", text, e.what());
    }
    
    spdlog::error("All parsers failed for '{}', returning safe STOP", text);
    return {RobotCommand(Action::STOP, std::nullopt, 0.0, text), ParseSource::FAILED};
}

} // namespace ev
