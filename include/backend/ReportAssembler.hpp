// File: ReportAssembler.hpp
// Description: Declares the final ordering step: drops unnamed records and
//              sorts by group, then by full name.

#pragma once

#include "backend/Attendance.hpp"

#include <vector>

namespace backend {

class ReportAssembler {
public:
    // Sorts by name, then stable-sorts by group. Records with an empty name
    // are removed first.
    std::vector<AttendanceRecord> sort(std::vector<AttendanceRecord> members) const;

    // Same ordering through a single (group, fullName) comparator.
    std::vector<AttendanceRecord> sortByComparator(std::vector<AttendanceRecord> members) const;

    static void dropUnnamed(std::vector<AttendanceRecord>& members);
};

}  // namespace backend
