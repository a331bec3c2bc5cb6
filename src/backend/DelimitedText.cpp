// File: DelimitedText.cpp
// Description: Implements the delimited-text reader and writer.

#include "backend/DelimitedText.hpp"

#include "backend/Errors.hpp"

#include <fstream>
#include <iterator>

namespace backend {

namespace {

std::string previewLine(const std::string& text, std::size_t lineStart) {
    constexpr std::size_t kMaxPreview = 160;
    std::size_t end = text.find('\n', lineStart);
    if (end == std::string::npos) {
        end = text.size();
    }
    std::string line = text.substr(lineStart, end - lineStart);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.size() > kMaxPreview) {
        line = line.substr(0, kMaxPreview) + "...";
    }
    return line;
}

bool rowIsBlank(const DelimitedRow& row) {
    return row.size() == 1 && row.front().empty();
}

}  // namespace

std::vector<DelimitedRow> parseDelimited(const std::string& text, char delimiter) {
    std::vector<DelimitedRow> rows;
    DelimitedRow row;
    std::string field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;
    std::size_t lineNumber = 1;
    std::size_t lineStart = 0;
    std::size_t rowLine = 1;
    std::size_t rowStart = 0;

    const auto fail = [&](const std::string& reason) {
        throw FatalInputError(reason + " at line " + std::to_string(rowLine) + ": " +
                              previewLine(text, rowStart));
    };

    const auto finishRow = [&]() {
        row.push_back(field);
        field.clear();
        fieldWasQuoted = false;
        if (!rowIsBlank(row)) {
            rows.push_back(row);
        }
        row.clear();
        rowLine = lineNumber;
        rowStart = lineStart;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++lineNumber;
                    lineStart = i + 1;
                }
                field.push_back(c);
            }
            continue;
        }

        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        if (c == '\n') {
            ++lineNumber;
            lineStart = i + 1;
            finishRow();
            continue;
        }
        if (c == delimiter) {
            row.push_back(field);
            field.clear();
            fieldWasQuoted = false;
            continue;
        }
        if (fieldWasQuoted) {
            fail("Unexpected text after closing quote");
        }
        if (c == '"') {
            if (!field.empty()) {
                fail("Bare quote in unquoted field");
            }
            inQuotes = true;
            fieldWasQuoted = true;
            continue;
        }
        field.push_back(c);
    }

    if (inQuotes) {
        fail("Unterminated quoted field");
    }
    if (!field.empty() || !row.empty() || fieldWasQuoted) {
        finishRow();
    }
    return rows;
}

std::string formatDelimitedField(const std::string& field, char delimiter) {
    bool needsQuotes = !field.empty() && (field.front() == ' ' || field.front() == '\t');
    if (!needsQuotes) {
        for (const char c : field) {
            if (c == delimiter || c == '"' || c == '\r' || c == '\n') {
                needsQuotes = true;
                break;
            }
        }
    }
    if (!needsQuotes) {
        return field;
    }

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (const char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatDelimitedRow(const DelimitedRow& row, char delimiter) {
    std::string line;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line.push_back(delimiter);
        }
        line += formatDelimitedField(row[i], delimiter);
    }
    return line;
}

std::string readFileBytes(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open()) {
        throw FatalInputError("Failed to open file: " + path.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw FatalInputError("Failed to read file: " + path.string());
    }
    return bytes;
}

}  // namespace backend
