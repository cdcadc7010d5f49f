/**
 * OpenAIClient.cpp - Semantic parser backed by the OpenAI Chat Completions API
 *
 * Uses cpp-httplib for HTTPS and asks for json_object output so the reply
 * can be decoded straight into a RobotCommand.
 */

#include "ev/OpenAIClient.hpp"

#include <chrono>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace ev {

static const std::string OPENAI_API_BASE = "api.openai.com";
static const std::string PROMPT_VERSION = "v1.0";

static const std::string SYSTEM_PROMPT =
    "You convert a surgeon's spoken instruction for an endoscope-holding robot "
    "into one JSON object.\n\n"
    "Respond with ONLY a JSON object with exactly these fields:\n"
    "- \"action\": one of MOVE_FORWARD, RETRACT, MOVE_LEFT, MOVE_RIGHT, MOVE_UP, "
    "MOVE_DOWN, ROTATE_LEFT, ROTATE_RIGHT, STOP\n"
    "- \"magnitude\": one of SMALL, MID, BIG, or null for STOP\n"
    "- \"confidence\": number from 0.0 to 1.0, how sure you are this is a robot command\n"
    "- \"frame\": always \"CAMERA\"\n\n"
    "Magnitude cues:\n"
    "- SMALL (2mm): a little, slightly, tiny, just a bit, nudge, smidge\n"
    "- MID (4mm): no qualifier, or some\n"
    "- BIG (6mm): a lot, big, far, significantly, much, way\n\n"
    "Synonyms:\n"
    "- MOVE_FORWARD: advance, push in, go deeper, forward, go in\n"
    "- RETRACT: retract, pull back, withdraw, pull out, back out\n"
    "- MOVE_LEFT: left, go left\n"
    "- MOVE_RIGHT: right, go right\n"
    "- MOVE_UP: up, go up, raise\n"
    "- MOVE_DOWN: down, go down, lower\n"
    "- ROTATE_LEFT: rotate left, twist left, turn left, counter-clockwise\n"
    "- ROTATE_RIGHT: rotate right, twist right, turn right, clockwise\n"
    "- STOP: stop, hold, freeze, don't move, halt\n\n"
    "Rules:\n"
    "1. Without a magnitude qualifier use MID.\n"
    "2. STOP always has \"magnitude\": null.\n"
    "3. If the input is not a robot command, set confidence below 0.5.\n"
    "4. \"frame\" is always \"CAMERA\".";

struct OpenAIClient::Impl {
    std::string api_key;
    LlmSettings settings;
    std::unique_ptr<httplib::SSLClient> client;
    
    Impl(const std::string& key, const LlmSettings& llm)
        : api_key(key), settings(llm) {
        client = std::make_unique<httplib::SSLClient>(OPENAI_API_BASE);
        client->set_bearer_token_auth(api_key);
        client->set_connection_timeout(std::chrono::milliseconds(settings.connect_timeout_ms));
        client->set_read_timeout(std::chrono::milliseconds(settings.read_timeout_ms));
        client->set_write_timeout(std::chrono::milliseconds(settings.read_timeout_ms));
    }
    
    json buildRequest(const std::string& text) const {
        return {
            {"model", settings.model},
            {"temperature", settings.temperature},
            {"max_tokens", settings.max_tokens},
            {"response_format", {{"type", "json_object"}}},
            {"messages", json::array({
                {{"role", "system"}, {"content", SYSTEM_PROMPT}},
                {{"role", "user"}, {"content", "Parse this spoken command: " + text}}
            })}
        };
    }
    
    std::string sendRequest(const std::string& text) {
        auto res = client->Post("/v1/chat/completions", buildRequest(text).dump(), "application/json");
        
        if (!res) {
            throw SemanticParseError("Network error: " + httplib::to_string(res.error()));
        }
        
        if (res->status != 200) {
            std::string error = "API error: HTTP " + std::to_string(res->status);
            json error_json = json::parse(res->body, nullptr, false);
            if (!error_json.is_discarded() && error_json.contains("error") &&
                error_json["error"].contains("message") && error_json["error"]["message"].is_string()) {
                error += " - " + error_json["error"]["message"].get<std::string>();
            }
            throw SemanticParseError(error);
        }
        
        json res_json = json::parse(res->body, nullptr, false);
        if (res_json.is_discarded() ||
            !res_json.contains("choices") ||
            !res_json["choices"].is_array() ||
            res_json["choices"].empty() ||
            !res_json["choices"][0].contains("message") ||
            !res_json["choices"][0]["message"].contains("content") ||
            !res_json["choices"][0]["message"]["content"].is_string()) {
            throw SemanticParseError("Invalid response structure");
        }
        
        return res_json["choices"][0]["message"]["content"].get<std::string>();
    }
};

OpenAIClient::OpenAIClient(const std::string& api_key, const LlmSettings& settings)
    : impl_(std::make_unique<Impl>(api_key, settings)) {}

OpenAIClient::~OpenAIClient() = default;

std::string OpenAIClient::getPromptVersion() {
    return PROMPT_VERSION;
}

RobotCommand OpenAIClient::parse(const std::string& text) {
    auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };
    
    try {
        std::string content = impl_->sendRequest(text);
        RobotCommand command = decodeSemanticReply(content, text);
        spdlog::info("OpenAI parsed '{}' -> {} ({:.0f}ms)", text, command.describe(), elapsedMs());
        return command;
    } catch (const SemanticParseError& e) {
        spdlog::warn("OpenAI parse failed for '{}' ({:.0f}ms): {}", text, elapsedMs(), e.what());
        throw;
    }
}

bool OpenAIClient::validate(std::string& error_message) {
    auto res = impl_->client->Get("/v1/models/" + impl_->settings.model);
    if (!res) {
        error_message = "Network error: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        error_message = "API error: HTTP " + std::to_string(res->status);
        return false;
    }
    return true;
}

} // namespace ev
