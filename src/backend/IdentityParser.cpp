// File: IdentityParser.cpp
// Description: Implements display-name tokenizing, token rotation, guest
//              marker removal and embedded group detection.

#include "backend/IdentityParser.hpp"

#include "backend/TextUtils.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace backend {

namespace {

const std::vector<std::string>& guestMarkers() {
    static const std::vector<std::string> markers{"(guest)", "(гость)"};
    return markers;
}

std::string stripParentheses(const std::string& token) {
    return removeAll(removeAll(token, '('), ')');
}

}  // namespace

IdentityParser::IdentityParser() : m_groupPrefixes(defaultGroupPrefixes()) {}

IdentityParser::IdentityParser(std::vector<std::string> groupPrefixes)
    : m_groupPrefixes(std::move(groupPrefixes)) {
    for (std::string& prefix : m_groupPrefixes) {
        prefix = toLowerUtf8(trim(prefix));
    }
}

std::vector<std::string> IdentityParser::defaultGroupPrefixes() {
    return {"мп", "мт", "мк", "мн"};
}

const std::vector<std::string>& IdentityParser::groupPrefixes() const noexcept {
    return m_groupPrefixes;
}

bool IdentityParser::isGuestMarker(const std::string& token) const {
    const std::string lowered = toLowerUtf8(token);
    const auto& markers = guestMarkers();
    return std::find(markers.begin(), markers.end(), lowered) != markers.end();
}

bool IdentityParser::isGroupToken(const std::string& token) const {
    const std::string head = token.substr(0, token.find('-'));
    const std::string candidate = removeAll(toLowerUtf8(head), '(');
    if (candidate.empty()) {
        return false;
    }
    return std::find(m_groupPrefixes.begin(), m_groupPrefixes.end(), candidate) !=
           m_groupPrefixes.end();
}

std::optional<ParsedIdentity> IdentityParser::parse(const std::string& rawDisplayName) const {
    std::vector<std::string> tokens = splitWhitespace(rawDisplayName);
    if (tokens.size() < 2) {
        return std::nullopt;
    }

    // "First Middle Last" -> "Last First Middle"; tokens past the third stay.
    const std::size_t rotated = std::min<std::size_t>(tokens.size(), 3);
    std::rotate(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(rotated - 1),
                tokens.begin() + static_cast<std::ptrdiff_t>(rotated));

    ParsedIdentity identity;
    std::vector<std::string> kept;
    kept.reserve(tokens.size());
    for (std::string& token : tokens) {
        if (isGuestMarker(token)) {
            continue;
        }
        if (isGroupToken(token)) {
            token = stripParentheses(token);
            identity.embeddedGroup = token;
        }
        kept.push_back(token);
    }

    identity.canonicalName = join(kept, " ");
    return identity;
}

}  // namespace backend
