// File: Roster.cpp
// Description: Implements roster loading and the linear-scan group lookup.

#include "backend/Roster.hpp"

#include "backend/Attendance.hpp"
#include "backend/DelimitedText.hpp"
#include "backend/Errors.hpp"
#include "backend/TextUtils.hpp"

#include <algorithm>
#include <utility>

namespace backend {

Roster::Roster(std::vector<RosterEntry> entries) : m_entries(std::move(entries)) {}

std::string Roster::lookupGroup(const std::string& fullName) const {
    const auto it = std::find_if(m_entries.begin(), m_entries.end(),
                                 [&](const RosterEntry& entry) { return entry.fullName == fullName; });
    if (it == m_entries.end()) {
        return kGuestGroup;
    }
    return it->group;
}

const std::vector<RosterEntry>& Roster::entries() const noexcept {
    return m_entries;
}

std::size_t Roster::size() const noexcept {
    return m_entries.size();
}

bool Roster::empty() const noexcept {
    return m_entries.empty();
}

Roster parseRoster(const std::string& content) {
    const std::string text = startsWithUtf8Bom(content) ? content.substr(3) : content;
    const std::vector<DelimitedRow> rows = parseDelimited(text, ',');

    std::vector<RosterEntry> entries;
    entries.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const DelimitedRow& row = rows[i];
        if (row.size() < 2) {
            throw FatalInputError("Roster row " + std::to_string(i + 1) +
                                  " must hold a full name and a group, got " +
                                  std::to_string(row.size()) + " field(s).");
        }
        entries.push_back(RosterEntry{row[0], row[1]});
    }
    return Roster(std::move(entries));
}

Roster loadRosterFile(const std::filesystem::path& path) {
    return parseRoster(readFileBytes(path));
}

}  // namespace backend
