/**
 * CommandValidator.hpp - Decides whether a parsed command is safe to execute
 */

#pragma once

#include "ev/RobotCommand.hpp"

#include <string>

namespace ev {

struct ValidationResult {
    bool accepted;
    std::string reason;  // "ok" when accepted
};

class CommandValidator {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.7;
    
    explicit CommandValidator(double confidence_threshold = DEFAULT_THRESHOLD);
    
    // STOP is always accepted. Anything else needs confidence >= threshold.
    ValidationResult validate(const RobotCommand& command) const;
    
    double threshold() const { return threshold_; }
    
private:
    double threshold_;
};

} // namespace ev
