// File: TimeClassifier.cpp
// Description: Implements clock parsing and table-driven period and lateness
//              classification.

#include "backend/TimeClassifier.hpp"

#include "backend/Errors.hpp"
#include "backend/TextUtils.hpp"

#include <cctype>
#include <climits>
#include <stdexcept>

namespace backend {

namespace {

int parseClockPart(const std::string& token, const char* partName) {
    if (token.empty()) {
        throw FatalInputError(std::string("Empty ") + partName + " in clock time.");
    }
    std::size_t start = 0;
    if (token[0] == '+' || token[0] == '-') {
        start = 1;
    }
    if (start == token.size()) {
        throw FatalInputError(std::string("Cannot parse ") + partName + " value '" + token + "'.");
    }
    for (std::size_t i = start; i < token.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(token[i])) == 0) {
            throw FatalInputError(std::string("Cannot parse ") + partName + " value '" + token +
                                  "'.");
        }
    }
    try {
        return std::stoi(token);
    } catch (const std::out_of_range&) {
        throw FatalInputError(std::string(partName) + " value '" + token + "' is out of range.");
    }
}

int checkedTotal(long long total, const std::vector<std::string>& tokens) {
    if (total > INT_MAX || total < INT_MIN) {
        throw FatalInputError("Clock time '" + join(tokens, ":") + "' is out of range.");
    }
    return static_cast<int>(total);
}

}  // namespace

int parseClockTime(const std::vector<std::string>& tokens) {
    if (tokens.size() == 3) {
        const long long hours = parseClockPart(tokens[0], "hours");
        const long long minutes = parseClockPart(tokens[1], "minutes");
        const long long seconds = parseClockPart(tokens[2], "seconds");
        return checkedTotal(seconds + hours * 3600 + minutes * 60, tokens);
    }
    if (tokens.size() == 2) {
        const long long minutes = parseClockPart(tokens[0], "minutes");
        const long long seconds = parseClockPart(tokens[1], "seconds");
        return checkedTotal(seconds + minutes * 60, tokens);
    }
    throw FatalInputError("Clock time must have 2 or 3 parts, got " +
                          std::to_string(tokens.size()) + ": '" + join(tokens, ":") + "'.");
}

int parseClockTime(const std::string& text) {
    return parseClockTime(split(text, ':'));
}

DateTimeField splitDateTime(const std::string& field) {
    const std::vector<std::string> parts = split(field, ',');
    if (parts.size() < 2) {
        throw FatalInputError("Expected 'date, time' but got '" + field + "'.");
    }
    DateTimeField result;
    result.date = parts[0];
    result.time = removeAll(parts[1], ' ');
    return result;
}

std::optional<std::size_t> TimeIntervalClassifier::periodWindow(int seconds) const {
    for (std::size_t i = 0; i < kPeriodWindows.size(); ++i) {
        if (kPeriodWindows[i].contains(seconds)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> TimeIntervalClassifier::latenessWindow(int seconds) const {
    for (std::size_t i = kLatenessWindows.size(); i > 0; --i) {
        if (kLatenessWindows[i - 1].contains(seconds)) {
            return i - 1;
        }
    }
    return std::nullopt;
}

std::string TimeIntervalClassifier::classifySlot(int seconds) const {
    if (const auto index = periodWindow(seconds)) {
        return kPeriodWindows[*index].label;
    }
    return kConsultationSlot;
}

Lateness TimeIntervalClassifier::classifyLateness(int seconds) const {
    return latenessWindow(seconds).has_value() ? Lateness::Late : Lateness::OnTime;
}

}  // namespace backend
