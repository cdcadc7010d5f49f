/**
 * Pipeline.cpp - Utterance text to validated command, handed to the robot bridge
 */

#include "ev/Pipeline.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace ev {

Pipeline::Pipeline(const FallbackManager& fallback, const CommandValidator& validator,
                   ExecutionBridge* bridge)
    : fallback_(fallback), validator_(validator), bridge_(bridge) {}

PipelineResult Pipeline::processText(const std::string& text) {
    auto start = std::chrono::steady_clock::now();
    FallbackResult parsed = fallback_.parseWithFallback(text);
    auto elapsed = std::chrono::steady_clock::now() - start;
    double latency_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    
    ValidationResult verdict = validator_.validate(parsed.command);
    if (!verdict.accepted) {
        spdlog::warn("Rejected {} from {} tier: {}", parsed.command.describe(),
                     toString(parsed.source), verdict.reason);
    }
    
    if (bridge_ != nullptr) {
        bridge_->execute(parsed.command, verdict.accepted, verdict.reason);
    }
    
    return {text, parsed.command, parsed.source, verdict.accepted, verdict.reason, latency_ms};
}

} // namespace ev
