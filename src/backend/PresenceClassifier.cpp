// File: PresenceClassifier.cpp
// Description: Implements duration bucketing by token count.

#include "backend/PresenceClassifier.hpp"

#include "backend/Errors.hpp"
#include "backend/TextUtils.hpp"
#include "backend/TimeClassifier.hpp"

#include <vector>

namespace backend {

DurationCategory PresenceClassifier::classify(const std::string& durationText) const {
    const std::vector<std::string> tokens = splitWhitespace(durationText);

    if (tokens.size() == 2) {
        return DurationCategory::Minimal;
    }
    if (tokens.size() == 4) {
        const int seconds = parseClockTime(std::vector<std::string>{tokens[0], tokens[2]});
        return seconds > kFullPresenceThresholdSeconds ? DurationCategory::Full
                                                       : DurationCategory::Partial;
    }
    if (tokens.size() >= 6) {
        return DurationCategory::Full;
    }
    throw FatalInputError("Unrecognized duration '" + durationText + "' (" +
                          std::to_string(tokens.size()) + " tokens).");
}

}  // namespace backend
