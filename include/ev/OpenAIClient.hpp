/**
 * OpenAIClient.hpp - Semantic parser backed by the OpenAI Chat Completions API
 */

#pragma once

#include "ev/SemanticParser.hpp"
#include "ev/Settings.hpp"

#include <memory>
#include <string>

namespace ev {

class OpenAIClient : public SemanticParser {
public:
    OpenAIClient(const std::string& api_key, const LlmSettings& settings);
    ~OpenAIClient() override;
    
    // One request per call. Timeouts come from LlmSettings and surface as
    // SemanticParseError like every other failure.
    RobotCommand parse(const std::string& text) override;
    
    // Validate API key and model by listing the model
    bool validate(std::string& error_message);
    
    static std::string getPromptVersion();
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ev
