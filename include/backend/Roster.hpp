// File: Roster.hpp
// Description: Declares the roster of expected participants and the group
//              lookup abstraction the pipeline resolves groups through.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace backend {

struct RosterEntry {
    std::string fullName;
    std::string group;
};

class GroupLookup {
public:
    virtual ~GroupLookup() = default;

    // Group of the first entry named fullName, or kGuestGroup.
    virtual std::string lookupGroup(const std::string& fullName) const = 0;
};

// Immutable for the lifetime of a run; shared by const reference.
class Roster : public GroupLookup {
public:
    Roster() = default;
    explicit Roster(std::vector<RosterEntry> entries);

    std::string lookupGroup(const std::string& fullName) const override;

    const std::vector<RosterEntry>& entries() const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

private:
    std::vector<RosterEntry> m_entries;
};

// Parses "fullName,group" rows. Quoted fields follow CSV rules; a UTF-8 BOM
// and blank lines are skipped. Throws FatalInputError on a short row.
Roster parseRoster(const std::string& content);

// Throws FatalInputError when the file cannot be read.
Roster loadRosterFile(const std::filesystem::path& path);

}  // namespace backend
