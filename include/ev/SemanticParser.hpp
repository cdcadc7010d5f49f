/**
 * SemanticParser.hpp - Contract for the model-backed parsing tier
 */

#pragma once

#include "ev/RobotCommand.hpp"

#include <stdexcept>
#include <string>

namespace ev {

// Transport, HTTP, timeout or malformed-reply failure of a semantic parser.
class SemanticParseError : public std::runtime_error {
public:
    explicit SemanticParseError(const std::string& what) : std::runtime_error(what) {}
};

class SemanticParser {
public:
    virtual ~SemanticParser() = default;
    
    // Throws SemanticParseError on any failure. Implementations own their
    // retry and timeout policy.
    virtual RobotCommand parse(const std::string& text) = 0;
};

// Decode a model reply into a command. Text around the outermost JSON
// object (markdown fences, stray prose) is ignored.
RobotCommand decodeSemanticReply(const std::string& content, const std::string& raw_text);

} // namespace ev
