/**
 * CommandParser.hpp - Deterministic pattern parser for spoken commands
 *
 * Offline fallback tier. Matches are checked in safety order:
 *   1. STOP cues (always win over directions in the same utterance)
 *   2. Rotation (before plain left/right)
 *   3. Directions in fixed priority: up, down, left, right, forward, retract
 * Every match carries CONFIDENCE, which is deliberately below the default
 * validation threshold.
 */

#pragma once

#include "ev/RobotCommand.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ev {

class CommandParser {
public:
    static constexpr double CONFIDENCE = 0.6;
    
    CommandParser();
    ~CommandParser();
    
    // Returns std::nullopt when no pattern applies. Never throws on input.
    std::optional<RobotCommand> parse(const std::string& text) const;
    
    // Magnitude cue in the utterance, MID when none is spoken.
    Magnitude resolveMagnitude(const std::string& text) const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ev
