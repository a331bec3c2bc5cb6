// File: RosterReconciler.hpp
// Description: Declares the reconciler that records roster members of the
//              attending groups who never joined the meeting.

#pragma once

#include "backend/Attendance.hpp"
#include "backend/Roster.hpp"

#include <set>
#include <string>
#include <vector>

namespace backend {

class RosterReconciler {
public:
    explicit RosterReconciler(const GroupLookup& lookup);

    // Returns observed followed by one Absent record per roster member of an
    // observed group whose name matches no observed record exactly. Absentees
    // come in ascending name order.
    std::vector<AttendanceRecord> reconcile(const std::vector<AttendanceRecord>& observed,
                                            const std::vector<RosterEntry>& roster) const;

    // Groups of the records that actually attended. Absent records are ignored.
    static std::set<std::string> observedGroups(const std::vector<AttendanceRecord>& observed);

private:
    const GroupLookup& m_lookup;
};

}  // namespace backend
