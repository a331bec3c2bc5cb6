// File: RosterReconciler.cpp
// Description: Implements set reconciliation between observed participants
//              and the roster.

#include "backend/RosterReconciler.hpp"

#include <map>
#include <utility>

namespace backend {

RosterReconciler::RosterReconciler(const GroupLookup& lookup) : m_lookup(lookup) {}

std::set<std::string> RosterReconciler::observedGroups(
    const std::vector<AttendanceRecord>& observed) {
    std::set<std::string> groups;
    for (const AttendanceRecord& record : observed) {
        // Synthesized absentees carry the roster lookup group, which may differ
        // from the group they were reconciled under.
        if (record.presence != AttendanceStatus::Absent) {
            groups.insert(record.group);
        }
    }
    return groups;
}

std::vector<AttendanceRecord> RosterReconciler::reconcile(
    const std::vector<AttendanceRecord>& observed,
    const std::vector<RosterEntry>& roster) const {
    const std::set<std::string> groups = observedGroups(observed);

    std::map<std::string, bool> seen;
    for (const RosterEntry& entry : roster) {
        if (groups.count(entry.group) != 0) {
            seen.emplace(entry.fullName, false);
        }
    }

    for (const AttendanceRecord& record : observed) {
        const auto it = seen.find(record.fullName);
        if (it != seen.end()) {
            it->second = true;
        }
    }

    std::vector<AttendanceRecord> result = observed;
    for (const auto& [fullName, wasSeen] : seen) {
        if (wasSeen) {
            continue;
        }
        AttendanceRecord absentee;
        absentee.fullName = fullName;
        absentee.group = m_lookup.lookupGroup(fullName);
        absentee.presence = AttendanceStatus::Absent;
        result.push_back(std::move(absentee));
    }
    return result;
}

}  // namespace backend
