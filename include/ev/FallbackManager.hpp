/**
 * FallbackManager.hpp - Semantic-first parsing with deterministic fallback
 *
 * Order: semantic parser, then CommandParser, then a zero-confidence STOP.
 * parseWithFallback() never throws and always returns a schema-valid command.
 */

#pragma once

#include "ev/CommandParser.hpp"
#include "ev/RobotCommand.hpp"
#include "ev/SemanticParser.hpp"

#include <string>

namespace ev {

enum class ParseSource {
    SEMANTIC,
    DETERMINISTIC,
    FAILED
};

std::string toString(ParseSource source);

struct FallbackResult {
    RobotCommand command;
    ParseSource source;
};

class FallbackManager {
public:
    static constexpr double DEFAULT_ACCEPTANCE_THRESHOLD = 0.5;
    
    // semantic may be null, which runs the deterministic tier only. It is not
    // owned and must outlive the manager.
    // acceptance_threshold picks the tier; it is unrelated to the validator's.
    explicit FallbackManager(SemanticParser* semantic,
                             double acceptance_threshold = DEFAULT_ACCEPTANCE_THRESHOLD);
    
    FallbackResult parseWithFallback(const std::string& text) const;
    
    double acceptanceThreshold() const { return acceptance_threshold_; }
    
private:
    SemanticParser* semantic_;
    CommandParser deterministic_;
    double acceptance_threshold_;
};

} // namespace ev
