/**
 * CommandParser.cpp - Deterministic pattern parser for spoken commands
 */

#include "ev/CommandParser.hpp"

#include <cctype>
#include <regex>
#include <utility>
#include <vector>

namespace ev {

namespace {

std::regex wordPattern(const std::string& alternatives) {
    return std::regex("\\b(" + alternatives + ")\\b", std::regex::ECMAScript | std::regex::icase);
}

// Lower-cased, with every whitespace run collapsed to one space. std::regex
// recurses per character a \s+ consumes, so long runs must never reach it.
std::string normalize(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    bool in_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!in_space) {
                lower.push_back(' ');
            }
            in_space = true;
            continue;
        }
        in_space = false;
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    return lower;
}

} // anonymous namespace

struct CommandParser::Impl {
    const std::regex stop_re = wordPattern("stop|halt|freeze|hold|don'?t\\s+move");
    
    // counter-clockwise has to be tried before clockwise
    const std::regex rotate_left_re =
        wordPattern("rotate\\s+left|twist\\s+left|turn\\s+left|counter[- ]?clockwise");
    const std::regex rotate_right_re =
        wordPattern("rotate\\s+right|twist\\s+right|turn\\s+right|clockwise");
    
    // Order is the tie-break for utterances naming several directions
    const std::vector<std::pair<std::regex, Action>> directions = {
        {wordPattern("up|raise|higher"), Action::MOVE_UP},
        {wordPattern("down|lower"), Action::MOVE_DOWN},
        {wordPattern("left"), Action::MOVE_LEFT},
        {wordPattern("right"), Action::MOVE_RIGHT},
        {wordPattern("forward|advance|push|deeper"), Action::MOVE_FORWARD},
        {wordPattern("back|retract|pull|withdraw"), Action::RETRACT},
    };
    
    const std::regex small_re = wordPattern("a\\s+little|slightly|tiny|nudge|bit|smidge");
    const std::regex big_re = wordPattern("a\\s+lot|big|far|much|significantly|way");
    
    bool matches(const std::regex& pattern, const std::string& lower) const {
        return std::regex_search(lower, pattern);
    }
    
    Magnitude magnitude(const std::string& lower) const {
        if (matches(small_re, lower)) {
            return Magnitude::SMALL;
        }
        if (matches(big_re, lower)) {
            return Magnitude::BIG;
        }
        return Magnitude::MID;
    }
};

CommandParser::CommandParser() : impl_(std::make_unique<Impl>()) {}

CommandParser::~CommandParser() = default;

std::optional<RobotCommand> CommandParser::parse(const std::string& text) const {
    const std::string lower = normalize(text);
    
    if (impl_->matches(impl_->stop_re, lower)) {
        return RobotCommand(Action::STOP, std::nullopt, CONFIDENCE, text);
    }
    
    if (impl_->matches(impl_->rotate_left_re, lower)) {
        return RobotCommand(Action::ROTATE_LEFT, impl_->magnitude(lower), CONFIDENCE, text);
    }
    if (impl_->matches(impl_->rotate_right_re, lower)) {
        return RobotCommand(Action::ROTATE_RIGHT, impl_->magnitude(lower), CONFIDENCE, text);
    }
    
    for (const auto& direction : impl_->directions) {
        if (impl_->matches(direction.first, lower)) {
            return RobotCommand(direction.second, impl_->magnitude(lower), CONFIDENCE, text);
        }
    }
    
    return std::nullopt;
}

Magnitude CommandParser::resolveMagnitude(const std::string& text) const {
    return impl_->magnitude(normalize(text));
}

} // namespace ev
