/**
 * CommandValidator.cpp - Decides whether a parsed command is safe to execute
 */

#include "ev/CommandValidator.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ev {

CommandValidator::CommandValidator(double confidence_threshold)
    : threshold_(confidence_threshold) {
    if (!(confidence_threshold >= 0.0 && confidence_threshold <= 1.0)) {
        throw std::invalid_argument("confidence threshold must be within [0, 1]");
    }
}

ValidationResult CommandValidator::validate(const RobotCommand& command) const {
    // Refusing a stop is the unsafe failure, so it skips the confidence check
    if (command.isStop()) {
        return {true, "ok"};
    }
    
    if (command.confidence() < threshold_) {
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(2)
               << "confidence " << command.confidence() << " < " << threshold_;
        return {false, reason.str()};
    }
    
    return {true, "ok"};
}

} // namespace ev
