/**
 * Pipeline.hpp - Utterance text to validated command, handed to the robot bridge
 */

#pragma once

#include "ev/CommandValidator.hpp"
#include "ev/FallbackManager.hpp"
#include "ev/RobotCommand.hpp"

#include <string>

namespace ev {

// Receives every processed command, accepted or not. Whether a rejected
// command is dropped or surfaced to the operator is up to the bridge.
class ExecutionBridge {
public:
    virtual ~ExecutionBridge() = default;
    virtual void execute(const RobotCommand& command, bool accepted, const std::string& reason) = 0;
};

struct PipelineResult {
    std::string text;
    RobotCommand command;
    ParseSource source;
    bool accepted;
    std::string reason;
    double latency_parse_ms;
};

class Pipeline {
public:
    Pipeline(const FallbackManager& fallback, const CommandValidator& validator,
             ExecutionBridge* bridge = nullptr);
    
    PipelineResult processText(const std::string& text);
    
private:
    const FallbackManager& fallback_;
    const CommandValidator& validator_;
    ExecutionBridge* bridge_;
};

} // namespace ev
