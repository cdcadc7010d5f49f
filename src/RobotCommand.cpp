/**
 * RobotCommand.cpp - Canonical command schema for the endoscope assistant
 */

#include "ev/RobotCommand.hpp"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace ev {

const char* const CAMERA_FRAME = "CAMERA";

namespace {

constexpr std::array<double, 3> MAGNITUDE_MM = {2.0, 4.0, 6.0};

const std::array<std::pair<Action, const char*>, 9> ACTION_NAMES = {{
    {Action::MOVE_FORWARD, "MOVE_FORWARD"},
    {Action::RETRACT, "RETRACT"},
    {Action::MOVE_LEFT, "MOVE_LEFT"},
    {Action::MOVE_RIGHT, "MOVE_RIGHT"},
    {Action::MOVE_UP, "MOVE_UP"},
    {Action::MOVE_DOWN, "MOVE_DOWN"},
    {Action::ROTATE_LEFT, "ROTATE_LEFT"},
    {Action::ROTATE_RIGHT, "ROTATE_RIGHT"},
    {Action::STOP, "STOP"},
}};

const std::array<std::pair<Magnitude, const char*>, 3> MAGNITUDE_NAMES = {{
    {Magnitude::SMALL, "SMALL"},
    {Magnitude::MID, "MID"},
    {Magnitude::BIG, "BIG"},
}};

std::string formatNumber(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

} // anonymous namespace

double magnitudeToMm(Magnitude magnitude) {
    return MAGNITUDE_MM[static_cast<size_t>(magnitude)];
}

std::string toString(Action action) {
    for (const auto& entry : ACTION_NAMES) {
        if (entry.first == action) {
            return entry.second;
        }
    }
    throw SchemaViolation("action out of range: " + std::to_string(static_cast<int>(action)));
}

std::string toString(Magnitude magnitude) {
    for (const auto& entry : MAGNITUDE_NAMES) {
        if (entry.first == magnitude) {
            return entry.second;
        }
    }
    throw SchemaViolation("magnitude out of range: " + std::to_string(static_cast<int>(magnitude)));
}

Action actionFromString(const std::string& literal) {
    for (const auto& entry : ACTION_NAMES) {
        if (literal == entry.second) {
            return entry.first;
        }
    }
    throw SchemaViolation("unknown action '" + literal + "'");
}

Magnitude magnitudeFromString(const std::string& literal) {
    for (const auto& entry : MAGNITUDE_NAMES) {
        if (literal == entry.second) {
            return entry.first;
        }
    }
    throw SchemaViolation("unknown magnitude '" + literal + "'");
}

RobotCommand::RobotCommand(Action action,
                           std::optional<Magnitude> magnitude,
                           double confidence,
                           const std::string& raw_text,
                           std::optional<double> value_mm)
    : action_(action),
      magnitude_(magnitude),
      frame_(CAMERA_FRAME),
      confidence_(confidence),
      value_mm_(value_mm),
      raw_text_(raw_text) {
    
    // Written so that NaN fails as well
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        throw SchemaViolation("confidence " + std::to_string(confidence) + " outside [0, 1]");
    }
    
    if (action_ == Action::STOP) {
        magnitude_.reset();
        value_mm_.reset();
        return;
    }
    
    if (value_mm_ && (!std::isfinite(*value_mm_) || *value_mm_ < 0.0)) {
        throw SchemaViolation("value_mm must be a finite non-negative distance");
    }
    
    if (!magnitude_) {
        magnitude_ = Magnitude::MID;
    }
    if (!value_mm_) {
        value_mm_ = magnitudeToMm(*magnitude_);
    }
}

RobotCommand RobotCommand::createStop(const std::string& raw_text) {
    return RobotCommand(Action::STOP, std::nullopt, 1.0, raw_text);
}

RobotCommand RobotCommand::fromJson(const json& wire, const std::string& raw_text) {
    if (!wire.is_object()) {
        throw SchemaViolation("command must be a JSON object");
    }
    
    for (const auto& item : wire.items()) {
        const auto& key = item.key();
        if (key != "action" && key != "magnitude" && key != "confidence" && key != "frame") {
            throw SchemaViolation("unexpected field '" + key + "'");
        }
    }
    
    if (!wire.contains("action") || !wire["action"].is_string()) {
        throw SchemaViolation("'action' must be a string");
    }
    if (!wire.contains("confidence") || !wire["confidence"].is_number()) {
        throw SchemaViolation("'confidence' must be a number");
    }
    
    Action action = actionFromString(wire["action"].get<std::string>());
    
    std::optional<Magnitude> magnitude;
    if (wire.contains("magnitude") && !wire["magnitude"].is_null()) {
        if (!wire["magnitude"].is_string()) {
            throw SchemaViolation("'magnitude' must be a string or null");
        }
        magnitude = magnitudeFromString(wire["magnitude"].get<std::string>());
    }
    
    if (wire.contains("frame")) {
        if (!wire["frame"].is_string() || wire["frame"].get<std::string>() != CAMERA_FRAME) {
            throw SchemaViolation(std::string("'frame' must be \"") + CAMERA_FRAME + "\"");
        }
    }
    
    return RobotCommand(action, magnitude, wire["confidence"].get<double>(), raw_text);
}

json RobotCommand::toJson() const {
    json out = {
        {"action", toString(action_)},
        {"magnitude", nullptr},
        {"frame", frame_},
        {"confidence", confidence_},
        {"value_mm", nullptr},
        {"raw_text", raw_text_}
    };
    if (magnitude_) {
        out["magnitude"] = toString(*magnitude_);
    }
    if (value_mm_) {
        out["value_mm"] = *value_mm_;
    }
    return out;
}

std::string RobotCommand::describe() const {
    std::ostringstream out;
    out << toString(action_);
    if (magnitude_) {
        out << "/" << toString(*magnitude_);
    }
    if (value_mm_) {
        out << " (" << formatNumber(*value_mm_, 1) << "mm)";
    }
    out << " conf=" << formatNumber(confidence_, 2);
    return out.str();
}

bool RobotCommand::operator==(const RobotCommand& other) const {
    return action_ == other.action_ &&
           magnitude_ == other.magnitude_ &&
           frame_ == other.frame_ &&
           confidence_ == other.confidence_ &&
           value_mm_ == other.value_mm_ &&
           raw_text_ == other.raw_text_;
}

} // namespace ev
