// File: IdentityParser.hpp
// Description: Declares the display-name normalizer that reorders name tokens
//              into "Last First Middle" and picks up group codes typed into
//              the name.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace backend {

struct ParsedIdentity {
    std::string canonicalName;
    std::string embeddedGroup;  // empty when the name carries no group code
};

class IdentityParser {
public:
    IdentityParser();
    explicit IdentityParser(std::vector<std::string> groupPrefixes);

    // Returns std::nullopt when the name has fewer than two tokens; such a
    // registration cannot be recovered and the row must be dropped.
    std::optional<ParsedIdentity> parse(const std::string& rawDisplayName) const;

    bool isGuestMarker(const std::string& token) const;
    bool isGroupToken(const std::string& token) const;

    const std::vector<std::string>& groupPrefixes() const noexcept;

    static std::vector<std::string> defaultGroupPrefixes();

private:
    std::vector<std::string> m_groupPrefixes;
};

}  // namespace backend
