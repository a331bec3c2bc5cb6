// File: ReportAssembler.cpp
// Description: Implements the two-pass group/name ordering.

#include "backend/ReportAssembler.hpp"

#include <algorithm>

namespace backend {

void ReportAssembler::dropUnnamed(std::vector<AttendanceRecord>& members) {
    members.erase(std::remove_if(members.begin(), members.end(),
                                 [](const AttendanceRecord& record) {
                                     return record.fullName.empty();
                                 }),
                  members.end());
}

std::vector<AttendanceRecord> ReportAssembler::sort(std::vector<AttendanceRecord> members) const {
    dropUnnamed(members);
    std::sort(members.begin(), members.end(),
              [](const AttendanceRecord& lhs, const AttendanceRecord& rhs) {
                  return lhs.fullName < rhs.fullName;
              });
    std::stable_sort(members.begin(), members.end(),
                     [](const AttendanceRecord& lhs, const AttendanceRecord& rhs) {
                         return lhs.group < rhs.group;
                     });
    return members;
}

std::vector<AttendanceRecord> ReportAssembler::sortByComparator(
    std::vector<AttendanceRecord> members) const {
    dropUnnamed(members);
    std::stable_sort(members.begin(), members.end(),
                     [](const AttendanceRecord& lhs, const AttendanceRecord& rhs) {
                         if (lhs.group != rhs.group) {
                             return lhs.group < rhs.group;
                         }
                         return lhs.fullName < rhs.fullName;
                     });
    return members;
}

}  // namespace backend
