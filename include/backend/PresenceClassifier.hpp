// File: PresenceClassifier.hpp
// Description: Declares the classifier that buckets the platform's free-text
//              stay duration ("12 minutes 30 seconds") into a coarse category.

#pragma once

#include "backend/Attendance.hpp"

#include <string>

namespace backend {

class PresenceClassifier {
public:
    // Stays longer than this many seconds count as full presence.
    static constexpr int kFullPresenceThresholdSeconds = 1800;

    // Throws FatalInputError when the token count is not 2, 4 or 6+.
    DurationCategory classify(const std::string& durationText) const;
};

}  // namespace backend
