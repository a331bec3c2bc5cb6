// File: Attendance.hpp
// Description: Declares the attendance domain model shared by the classifiers,
//              the reconciler and the report writer.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace backend {

inline const std::string kGuestGroup = "Guest";
inline const std::string kConsultationSlot = "Consultation";
inline const std::string kDefaultMeetingTitle = "Untitled meeting";

enum class Lateness { OnTime, Late };

enum class DurationCategory { Minimal, Partial, Full };

enum class AttendanceStatus { Present, PartiallyPresent, Absent };

struct AttendanceRecord {
    std::string group;
    std::string fullName;  // empty marks a record dropped at assembly
    std::optional<Lateness> lateness;
    std::optional<DurationCategory> durationCategory;
    AttendanceStatus presence{AttendanceStatus::Absent};
};

struct ReportHeader {
    std::string title{kDefaultMeetingTitle};
    std::string date;
    std::string timeSlot{kConsultationSlot};
};

struct AttendanceReport {
    ReportHeader header;
    std::vector<AttendanceRecord> members;
};

// Present for a full stay, partially present for anything shorter.
AttendanceStatus presenceForDuration(DurationCategory category) noexcept;

bool isConsultation(const ReportHeader& header);

std::string toString(Lateness lateness);
std::string toString(DurationCategory category);
std::string toString(AttendanceStatus status);

}  // namespace backend
