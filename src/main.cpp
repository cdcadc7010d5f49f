/**
 * main.cpp - Endovox CLI entry point
 *
 * Usage:
 *   ev "move up a little"                 # Parse one utterance
 *   ev --console                          # Interactive text mode
 *   ev --offline "nudge left"             # Pattern tier only, no network
 *   ev --json "retract"                   # Machine-readable result
 *   ev --auth                             # Store API key securely
 */

#include "ev/CommandParser.hpp"
#include "ev/CommandValidator.hpp"
#include "ev/FallbackManager.hpp"
#include "ev/OpenAIClient.hpp"
#include "ev/Pipeline.hpp"
#include "ev/Settings.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <termios.h>
#include <unistd.h>

#include <libsecret/secret.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

const std::string API_KEY_PLACEHOLDER = "your-api-key-here";

// libsecret schema for storing the API key
const SecretSchema EV_API_SCHEMA = {
    "com.endovox.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"type", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

std::string getFromKeyring(const std::string& type) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &EV_API_SCHEMA,
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        spdlog::debug("Keyring lookup failed: {}", error->message);
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool storeInKeyring(const std::string& type, const std::string& value, const std::string& label) {
    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &EV_API_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        value.c_str(),
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        std::cerr << RED << "Error saving: " << error->message << RESET << "\n";
        g_error_free(error);
        return false;
    }

    return success == TRUE;
}

bool usableKey(const std::string& key) {
    return !key.empty() && key != API_KEY_PLACEHOLDER;
}

std::string getApiKey() {
    // 1. Keyring
    std::string key = getFromKeyring("api_key");
    if (usableKey(key)) {
        return key;
    }

    // 2. Environment
    const char* env_key = std::getenv("OPENAI_API_KEY");
    if (env_key && strlen(env_key) > 0 && usableKey(env_key)) {
        return env_key;
    }

    // 3. Plain file
    const char* home = std::getenv("HOME");
    if (home) {
        std::filesystem::path key_path = std::filesystem::path(home) / ".config" / "ev" / "api_key";
        if (std::filesystem::exists(key_path)) {
            std::ifstream file(key_path);
            std::getline(file, key);
            if (usableKey(key)) {
                return key;
            }
        }
    }

    return "";
}

void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("ev");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void printUsage() {
    std::cout << BOLD << "Endovox" << RESET << " - spoken command interpreter for the endoscope robot\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  ev \"utterance\"                   Parse one utterance\n"
              << "  ev --console                    Interactive text mode\n"
              << "  ev --offline ...                Pattern parser only (no API calls)\n"
              << "  ev --json ...                   Print the result as JSON\n"
              << "  ev --config-file <path> ...     Use another config file\n"
              << "  ev --verbose ...                Debug logging\n"
              << "  ev --auth                       Store API key securely\n"
              << "  ev --config list                Show effective configuration\n"
              << "  ev --help                       Show this help\n\n"
              << BOLD << "Examples:" << RESET << "\n"
              << "  ev \"move up a little\"\n"
              << "  ev --offline \"stop going left\"\n"
              << "  ev --json \"rotate right slightly\"\n";
}

// Prints what the robot bridge would receive
class ConsoleBridge : public ev::ExecutionBridge {
public:
    void execute(const ev::RobotCommand& command, bool accepted, const std::string& reason) override {
        std::cout << "  Action:     " << ev::toString(command.action()) << "\n";
        std::cout << "  Magnitude:  " << (command.magnitude() ? ev::toString(*command.magnitude()) : "None");
        if (command.valueMm()) {
            std::cout << " (" << std::fixed << std::setprecision(1) << *command.valueMm() << "mm)";
        }
        std::cout << "\n";
        std::cout << "  Confidence: " << std::fixed << std::setprecision(2) << command.confidence() << "\n";
        if (accepted) {
            std::cout << "  Valid:      " << GREEN << "yes" << RESET << "\n";
        } else {
            std::cout << "  Valid:      " << RED << "no - " << reason << RESET << "\n";
        }
    }
};

void printResult(const ev::PipelineResult& result, bool as_json) {
    if (as_json) {
        nlohmann::json out = {
            {"text", result.text},
            {"command", result.command.toJson()},
            {"source", ev::toString(result.source)},
            {"valid", result.accepted},
            {"message", result.reason},
            {"latency_parse_ms", result.latency_parse_ms}
        };
        std::cout << out.dump(2) << "\n";
        return;
    }

    std::cout << "  Source:     " << CYAN << ev::toString(result.source) << RESET << "\n";
    std::cout << "  Latency:    Parse=" << std::fixed << std::setprecision(1)
              << result.latency_parse_ms << "ms\n\n";
}

std::string readHiddenLine() {
    struct termios old_term, new_term;
    tcgetattr(STDIN_FILENO, &old_term);
    new_term = old_term;
    new_term.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &new_term);

    std::string line;
    std::getline(std::cin, line);

    tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    std::cout << "\n";
    return line;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 0;
    }

    std::string first_arg = argv[1];

    if (first_arg == "--help" || first_arg == "-h") {
        printUsage();
        return 0;
    }

    // Parse all flags first (in any order)
    bool offline = false;
    bool as_json = false;
    bool verbose = false;
    bool console = false;
    std::string config_path = ev::defaultConfigPath();
    int arg_idx = 1;

    while (arg_idx < argc) {
        std::string arg = argv[arg_idx];

        if (arg == "--offline") {
            offline = true;
            arg_idx++;
        }
        else if (arg == "--json") {
            as_json = true;
            arg_idx++;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
            arg_idx++;
        }
        else if (arg == "--console") {
            console = true;
            arg_idx++;
        }
        else if (arg == "--config-file") {
            arg_idx++;
            if (arg_idx >= argc) {
                std::cerr << RED << "Usage: ev --config-file <path> ..." << RESET << "\n";
                return 1;
            }
            config_path = argv[arg_idx];
            arg_idx++;
        }
        else if (arg == "--auth" || arg == "--config") {
            // handled below, once logging and settings exist
            break;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << RED << "Error: Unknown flag '" << arg << "'" << RESET << "\n";
            std::cerr << "Valid flags: --offline, --json, --verbose, --console, --config-file, --config, --auth, --help\n";
            return 1;
        }
        else {
            // Not a flag, stop parsing flags
            break;
        }
    }

    setupLogging(verbose);

    ev::Settings settings;
    try {
        settings = ev::loadSettings(config_path);
    } catch (const ev::ConfigError& e) {
        std::cerr << RED << "Config error: " << e.what() << RESET << "\n";
        return 1;
    }

    std::string command_arg = arg_idx < argc ? argv[arg_idx] : "";

    if (command_arg == "--auth") {
        if (arg_idx + 1 != argc) {
            std::cerr << RED << "Error: --auth takes no arguments." << RESET << "\n";
            return 1;
        }

        std::cout << "Paste your OpenAI API key (hidden input): ";
        std::cout.flush();
        std::string new_key = readHiddenLine();

        if (!usableKey(new_key)) {
            std::cerr << RED << "Error: Empty API key." << RESET << "\n";
            return 1;
        }

        std::cout << "Validating API key...\n";
        ev::OpenAIClient test_client(new_key, settings.llm);
        std::string error_msg;
        if (!test_client.validate(error_msg)) {
            std::cerr << RED << "Error: Invalid API key - " << error_msg << RESET << "\n";
            return 1;
        }

        if (storeInKeyring("api_key", new_key, "Endovox API Key")) {
            std::cout << GREEN << "API key validated and saved!" << RESET << "\n";
            return 0;
        }
        return 1;
    }

    if (command_arg == "--config") {
        if (arg_idx + 2 != argc || std::string(argv[arg_idx + 1]) != "list") {
            std::cerr << RED << "Usage: ev [--config-file <path>] --config list" << RESET << "\n";
            return 1;
        }
        std::cout << BOLD << "Current Configuration:" << RESET << "\n"
                  << "  Config file:          " << config_path << "\n"
                  << ev::describeSettings(settings)
                  << "  Prompt version:       " << ev::OpenAIClient::getPromptVersion() << "\n"
                  << "  API key:              " << (getApiKey().empty() ? "not set" : "set") << "\n";
        return 0;
    }

    if (!console && arg_idx >= argc) {
        std::cerr << RED << "Error: No utterance provided." << RESET << "\n";
        printUsage();
        return 1;
    }

    std::unique_ptr<ev::OpenAIClient> semantic;
    if (!offline) {
        std::string api_key = getApiKey();
        if (api_key.empty()) {
            std::cerr << YELLOW << "API key not configured, running pattern parser only." << RESET << "\n";
            std::cerr << "Configure with: ev --auth\n";
        } else {
            semantic = std::make_unique<ev::OpenAIClient>(api_key, settings.llm);
        }
    }

    ev::CommandValidator validator(settings.confidence_threshold);
    ev::FallbackManager fallback(semantic.get(), settings.fallback_threshold);
    ConsoleBridge bridge;
    ev::Pipeline pipeline(fallback, validator, as_json ? nullptr : &bridge);

    if (console) {
        std::cout << BOLD << "Endovox Text Console" << RESET << "\n";
        std::cout << "Type a command, or 'quit' to exit\n\n";

        std::string line;
        while (true) {
            std::cout << CYAN << "ev > " << RESET;
            std::cout.flush();

            if (!std::getline(std::cin, line)) {
                break;  // EOF
            }

            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\n\r"));
            line.erase(line.find_last_not_of(" \t\n\r") + 1);

            if (line.empty()) continue;

            if (line == "exit" || line == "quit") {
                std::cout << "Goodbye!\n";
                break;
            }

            printResult(pipeline.processText(line), as_json);
        }
        return 0;
    }

    std::string utterance;
    for (int i = arg_idx; i < argc; ++i) {
        if (i > arg_idx) utterance += " ";
        utterance += argv[i];
    }

    auto result = pipeline.processText(utterance);
    printResult(result, as_json);
    return result.accepted ? 0 : 2;
}
