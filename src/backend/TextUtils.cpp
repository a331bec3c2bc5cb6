// File: TextUtils.cpp
// Description: Implements the shared string helpers.

#include "backend/TextUtils.hpp"

#include <cctype>
#include <cstdint>

namespace backend {

namespace {

constexpr std::uint32_t kReplacementChar = 0xFFFD;

void appendUtf8(std::string& out, std::uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

bool isHighSurrogate(std::uint32_t unit) {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool isLowSurrogate(std::uint32_t unit) {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

}  // namespace

std::string trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return input.substr(start, end - start);
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(input[i]);
        // U+00A0 no-break space is a separator too.
        const bool noBreakSpace =
            ch == 0xC2 && i + 1 < input.size() && static_cast<unsigned char>(input[i + 1]) == 0xA0;
        if (std::isspace(ch) != 0 || noBreakSpace) {
            if (noBreakSpace) {
                ++i;
            }
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(input[i]);
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = input.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(input.substr(start));
            break;
        }
        parts.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

std::string toLowerUtf8(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        const auto byte = static_cast<unsigned char>(input[i]);
        if (byte < 0x80) {
            out.push_back(static_cast<char>(std::tolower(byte)));
            continue;
        }
        // Cyrillic capitals are two-byte sequences D0 80..D0 AF.
        if (byte == 0xD0 && i + 1 < input.size()) {
            const auto next = static_cast<unsigned char>(input[i + 1]);
            if (next >= 0x90 && next <= 0x9F) {
                // А..П -> а..п
                out.push_back(static_cast<char>(0xD0));
                out.push_back(static_cast<char>(next + 0x20));
                ++i;
                continue;
            }
            if (next >= 0xA0 && next <= 0xAF) {
                // Р..Я -> р..я
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(next - 0x20));
                ++i;
                continue;
            }
            if (next >= 0x80 && next <= 0x8F) {
                // Ѐ..Џ -> ѐ..џ
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(next + 0x10));
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(byte));
    }
    return out;
}

std::string removeAll(std::string input, char target) {
    std::string out;
    out.reserve(input.size());
    for (const char ch : input) {
        if (ch != target) {
            out.push_back(ch);
        }
    }
    return out;
}

bool startsWithUtf8Bom(const std::string& bytes) {
    return bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF &&
           static_cast<unsigned char>(bytes[1]) == 0xBB &&
           static_cast<unsigned char>(bytes[2]) == 0xBF;
}

std::string decodeUtf16(const std::string& bytes) {
    bool bigEndian = false;
    std::size_t pos = 0;
    if (bytes.size() >= 2) {
        const auto b0 = static_cast<unsigned char>(bytes[0]);
        const auto b1 = static_cast<unsigned char>(bytes[1]);
        if (b0 == 0xFF && b1 == 0xFE) {
            pos = 2;
        } else if (b0 == 0xFE && b1 == 0xFF) {
            bigEndian = true;
            pos = 2;
        }
    }

    const auto readUnit = [&](std::size_t at) -> std::uint32_t {
        const auto lo = static_cast<unsigned char>(bytes[at]);
        const auto hi = static_cast<unsigned char>(bytes[at + 1]);
        return bigEndian ? static_cast<std::uint32_t>((lo << 8) | hi)
                         : static_cast<std::uint32_t>((hi << 8) | lo);
    };

    std::string out;
    out.reserve(bytes.size());
    while (pos + 1 < bytes.size()) {
        const std::uint32_t unit = readUnit(pos);
        pos += 2;
        if (isHighSurrogate(unit)) {
            if (pos + 1 < bytes.size() && isLowSurrogate(readUnit(pos))) {
                const std::uint32_t low = readUnit(pos);
                pos += 2;
                appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                appendUtf8(out, kReplacementChar);
            }
            continue;
        }
        if (isLowSurrogate(unit)) {
            appendUtf8(out, kReplacementChar);
            continue;
        }
        appendUtf8(out, unit);
    }
    if (pos < bytes.size()) {
        appendUtf8(out, kReplacementChar);
    }
    return out;
}

}  // namespace backend
