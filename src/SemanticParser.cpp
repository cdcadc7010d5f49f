/**
 * SemanticParser.cpp - Reply decoding shared by semantic parser implementations
 */

#include "ev/SemanticParser.hpp"

#include <nlohmann/json.hpp>

namespace ev {

RobotCommand decodeSemanticReply(const std::string& content, const std::string& raw_text) {
    size_t start = content.find('{');
    size_t end = content.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        throw SemanticParseError("reply contains no JSON object");
    }
    
    nlohmann::json wire;
    try {
        wire = nlohmann::json::parse(content.substr(start, end - start + 1));
    } catch (const nlohmann::json::exception& e) {
        throw SemanticParseError(std::string("JSON parse error: ") + e.what());
    }
    
    try {
        return RobotCommand::fromJson(wire, raw_text);
    } catch (const SchemaViolation& e) {
        throw SemanticParseError(std::string("schema violation: ") + e.what());
    }
}

} // namespace ev
