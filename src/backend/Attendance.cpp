// File: Attendance.cpp
// Description: Implements status derivation and display labels for the
//              attendance domain model.

#include "backend/Attendance.hpp"

namespace backend {

AttendanceStatus presenceForDuration(DurationCategory category) noexcept {
    return category == DurationCategory::Full ? AttendanceStatus::Present
                                              : AttendanceStatus::PartiallyPresent;
}

bool isConsultation(const ReportHeader& header) {
    return header.timeSlot == kConsultationSlot;
}

std::string toString(Lateness lateness) {
    switch (lateness) {
        case Lateness::OnTime:
            return "On time";
        case Lateness::Late:
            return "Late";
    }
    return "On time";
}

std::string toString(DurationCategory category) {
    switch (category) {
        case DurationCategory::Minimal:
            return "Minimal presence";
        case DurationCategory::Partial:
            return "Partial presence";
        case DurationCategory::Full:
            return "Full presence";
    }
    return "Minimal presence";
}

std::string toString(AttendanceStatus status) {
    switch (status) {
        case AttendanceStatus::Present:
            return "Present";
        case AttendanceStatus::PartiallyPresent:
            return "Partially present";
        case AttendanceStatus::Absent:
            return "Absent";
    }
    return "Absent";
}

}  // namespace backend
