/**
 * RobotCommand.hpp - Canonical command schema for the endoscope assistant
 *
 * Every parser tier produces a RobotCommand and every downstream consumer
 * (validator, execution bridge) reads one. Instances are immutable once built.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ev {

enum class Action {
    MOVE_FORWARD,
    RETRACT,
    MOVE_LEFT,
    MOVE_RIGHT,
    MOVE_UP,
    MOVE_DOWN,
    ROTATE_LEFT,
    ROTATE_RIGHT,
    STOP
};

enum class Magnitude {
    SMALL,  // 2 mm
    MID,    // 4 mm
    BIG     // 6 mm
};

// Raised when a command would break the schema. Never coerced.
class SchemaViolation : public std::invalid_argument {
public:
    explicit SchemaViolation(const std::string& what) : std::invalid_argument(what) {}
};

extern const char* const CAMERA_FRAME;

double magnitudeToMm(Magnitude magnitude);

std::string toString(Action action);
std::string toString(Magnitude magnitude);

Action actionFromString(const std::string& literal);
Magnitude magnitudeFromString(const std::string& literal);

class RobotCommand {
public:
    RobotCommand(Action action,
                 std::optional<Magnitude> magnitude,
                 double confidence,
                 const std::string& raw_text,
                 std::optional<double> value_mm = std::nullopt);
    
    // STOP with full confidence, for explicit operator stops.
    static RobotCommand createStop(const std::string& raw_text);
    
    // Decode the wire object a semantic parser emits.
    static RobotCommand fromJson(const nlohmann::json& wire, const std::string& raw_text);
    
    Action action() const { return action_; }
    std::optional<Magnitude> magnitude() const { return magnitude_; }
    const std::string& frame() const { return frame_; }
    double confidence() const { return confidence_; }
    std::optional<double> valueMm() const { return value_mm_; }
    const std::string& rawText() const { return raw_text_; }
    
    bool isStop() const { return action_ == Action::STOP; }
    
    nlohmann::json toJson() const;
    std::string describe() const;
    
    bool operator==(const RobotCommand& other) const;
    bool operator!=(const RobotCommand& other) const { return !(*this == other); }
    
private:
    Action action_;
    std::optional<Magnitude> magnitude_;
    std::string frame_;
    double confidence_;
    std::optional<double> value_mm_;
    std::string raw_text_;
};

} // namespace ev
